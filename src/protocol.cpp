#include "protocol.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

#include <limits>

using json = nlohmann::json;

namespace {

constexpr std::size_t kDedupPrefixBytes = 100;

struct PacketTypeName {
  PacketType type;
  const char* wire;
};

constexpr PacketTypeName kPacketTypeNames[] = {
  {PacketType::Announce,      "device_announce"},
  {PacketType::Discover,      "device_discovery"},
  {PacketType::Heartbeat,     "device_heartbeat"},
  {PacketType::DeviceInfo,    "device_info"},
  {PacketType::ClipboardData, "clipboard_data"},
};

bool packet_type_from_name(const std::string& name, PacketType& out) {
  for(const auto& entry : kPacketTypeNames) {
    if(name == entry.wire) {
      out = entry.type;
      return true;
    }
  }
  return false;
}

bool read_port(const json& obj, const char* key, uint16_t& out, std::string& error) {
  auto it = obj.find(key);
  if(it == obj.end() || it->is_null()) return true;
  if(!it->is_number_unsigned() || it->get<uint64_t>() > std::numeric_limits<uint16_t>::max()) {
    error = std::string("field '") + key + "' is not a port number";
    return false;
  }
  out = static_cast<uint16_t>(it->get<uint64_t>());
  return true;
}

bool read_optional_string(const json& obj, const char* key, std::string& out, std::string& error) {
  auto it = obj.find(key);
  if(it == obj.end() || it->is_null()) return true;
  if(!it->is_string()) {
    error = std::string("field '") + key + "' is not a string";
    return false;
  }
  out = it->get<std::string>();
  return true;
}

json presence_to_json(const PresenceData& presence) {
  return json{{"platform", presence.platform},
              {"transport_port", presence.transport_port}};
}

json device_info_to_json(const DeviceInfoData& info) {
  return json{
    {"platform", info.platform},
    {"transport_port", info.transport_port},
    {"device_info", {
      {"name", info.name},
      {"ip_address", info.ip},
      {"platform", info.platform}
    }}
  };
}

json clipboard_to_json(const ClipboardPayload& payload) {
  json j;
  j["type"] = clipboard_kind_name(payload.kind);
  j["timestamp"] = payload.timestamp;
  j["device_name"] = payload.device_name;
  if(payload.kind == ClipboardKind::Image) {
    j["content"] = base64_encode(payload.content);
  } else {
    if(!is_valid_utf8(payload.content)) {
      throw CodecError("clipboard text is not valid UTF-8");
    }
    j["content"] = payload.content;
  }
  return j;
}

bool presence_from_json(const json& data, PresenceData& out, std::string& error) {
  if(!data.is_object()) {
    error = "presence data is not an object";
    return false;
  }
  return read_optional_string(data, "platform", out.platform, error) &&
         read_port(data, "transport_port", out.transport_port, error);
}

bool device_info_from_json(const json& data, DeviceInfoData& out, std::string& error) {
  if(!data.is_object()) {
    error = "device_info data is not an object";
    return false;
  }
  if(!read_optional_string(data, "platform", out.platform, error)) return false;
  if(!read_port(data, "transport_port", out.transport_port, error)) return false;
  auto nested = data.find("device_info");
  if(nested == data.end() || nested->is_null()) return true;
  if(!nested->is_object()) {
    error = "device_info.device_info is not an object";
    return false;
  }
  return read_optional_string(*nested, "name", out.name, error) &&
         read_optional_string(*nested, "ip_address", out.ip, error) &&
         read_optional_string(*nested, "platform", out.platform, error);
}

bool clipboard_from_json(const json& data, ClipboardPayload& out, std::string& error) {
  if(!data.is_object()) {
    error = "clipboard data is not an object";
    return false;
  }
  for(const char* field : {"content", "type", "timestamp", "device_name"}) {
    if(!data.contains(field)) {
      error = std::string("clipboard data is missing '") + field + "'";
      return false;
    }
  }
  const auto& type = data.at("type");
  const auto& content = data.at("content");
  const auto& timestamp = data.at("timestamp");
  const auto& device_name = data.at("device_name");
  if(!type.is_string() || !content.is_string() ||
     !timestamp.is_number() || !device_name.is_string()) {
    error = "clipboard data has a field of the wrong type";
    return false;
  }

  ClipboardPayload payload;
  const auto kind = type.get<std::string>();
  if(kind == "text") {
    payload.kind = ClipboardKind::Text;
    payload.content = content.get<std::string>();
  } else if(kind == "image") {
    payload.kind = ClipboardKind::Image;
    if(!base64_decode(content.get<std::string>(), payload.content)) {
      error = "image content is not valid base64";
      return false;
    }
  } else {
    error = "unknown clipboard type '" + kind + "'";
    return false;
  }
  payload.timestamp = timestamp.get<double>();
  payload.device_name = device_name.get<std::string>();
  out = std::move(payload);
  return true;
}

Packet make_packet(PacketType type, const DeviceIdentity& self, PacketData data) {
  Packet p;
  p.type = type;
  p.sender_name = self.name;
  p.sender_ip = self.ip;
  p.timestamp = unix_time_now();
  p.data = std::move(data);
  return p;
}

} // namespace

const char* packet_type_name(PacketType type) {
  for(const auto& entry : kPacketTypeNames) {
    if(entry.type == type) return entry.wire;
  }
  return "unknown";
}

bool is_presence_packet(PacketType type) {
  return type == PacketType::Announce ||
         type == PacketType::Discover ||
         type == PacketType::Heartbeat ||
         type == PacketType::DeviceInfo;
}

const char* clipboard_kind_name(ClipboardKind kind) {
  return kind == ClipboardKind::Image ? "image" : "text";
}

bool operator==(const PresenceData& a, const PresenceData& b) {
  return a.platform == b.platform && a.transport_port == b.transport_port;
}

bool operator==(const DeviceInfoData& a, const DeviceInfoData& b) {
  return a.name == b.name && a.ip == b.ip &&
         a.platform == b.platform && a.transport_port == b.transport_port;
}

bool operator==(const ClipboardPayload& a, const ClipboardPayload& b) {
  return a.kind == b.kind && a.content == b.content &&
         a.timestamp == b.timestamp && a.device_name == b.device_name;
}

bool operator==(const Packet& a, const Packet& b) {
  return a.type == b.type && a.sender_name == b.sender_name &&
         a.sender_ip == b.sender_ip && a.timestamp == b.timestamp &&
         a.data == b.data;
}

std::string encode_packet(const Packet& packet) {
  json j;
  j["packet_type"] = packet_type_name(packet.type);
  j["sender_name"] = packet.sender_name;
  j["sender_ip"] = packet.sender_ip;
  j["timestamp"] = packet.timestamp;

  switch(packet.type) {
    case PacketType::Announce:
    case PacketType::Discover:
    case PacketType::Heartbeat:
      if(const auto* presence = packet.presence()) {
        j["data"] = presence_to_json(*presence);
      } else if(std::holds_alternative<std::monostate>(packet.data)) {
        j["data"] = nullptr;
      } else {
        throw CodecError(std::string(packet_type_name(packet.type)) + " carries non-presence data");
      }
      break;
    case PacketType::DeviceInfo:
      if(!packet.device_info()) throw CodecError("device_info packet without device data");
      j["data"] = device_info_to_json(*packet.device_info());
      break;
    case PacketType::ClipboardData:
      if(!packet.clipboard()) throw CodecError("clipboard_data packet without payload");
      j["data"] = clipboard_to_json(*packet.clipboard());
      break;
  }
  try {
    return j.dump();
  } catch(const json::type_error& e) {
    throw CodecError(e.what());
  }
}

bool decode_packet(const std::string& bytes, Packet& out, std::string& error) {
  error.clear();
  json j = json::parse(bytes, nullptr, false);
  if(j.is_discarded()) {
    error = "not a JSON document";
    return false;
  }
  if(!j.is_object()) {
    error = "packet is not a JSON object";
    return false;
  }

  try {
    auto type_it = j.find("packet_type");
    if(type_it == j.end() || !type_it->is_string()) {
      error = "missing packet_type";
      return false;
    }
    Packet packet;
    if(!packet_type_from_name(type_it->get<std::string>(), packet.type)) {
      error = "unknown packet_type '" + type_it->get<std::string>() + "'";
      return false;
    }

    auto name_it = j.find("sender_name");
    auto ip_it = j.find("sender_ip");
    auto ts_it = j.find("timestamp");
    if(name_it == j.end() || !name_it->is_string() ||
       ip_it == j.end() || !ip_it->is_string() ||
       ts_it == j.end() || !ts_it->is_number()) {
      error = "missing sender_name, sender_ip or timestamp";
      return false;
    }
    packet.sender_name = name_it->get<std::string>();
    packet.sender_ip = ip_it->get<std::string>();
    packet.timestamp = ts_it->get<double>();

    static const json kNull;
    auto data_it = j.find("data");
    const json& data = (data_it == j.end()) ? kNull : *data_it;

    switch(packet.type) {
      case PacketType::Announce:
      case PacketType::Discover:
      case PacketType::Heartbeat: {
        // null data stays empty so it encodes back to null
        if(data.is_null()) break;
        PresenceData presence;
        if(!presence_from_json(data, presence, error)) return false;
        packet.data = std::move(presence);
        break;
      }
      case PacketType::DeviceInfo: {
        DeviceInfoData info;
        info.name = packet.sender_name;
        info.ip = packet.sender_ip;
        if(!device_info_from_json(data, info, error)) return false;
        packet.data = std::move(info);
        break;
      }
      case PacketType::ClipboardData: {
        ClipboardPayload payload;
        if(!clipboard_from_json(data, payload, error)) return false;
        packet.data = std::move(payload);
        break;
      }
    }
    out = std::move(packet);
    return true;
  } catch(const json::exception& e) {
    error = e.what();
    return false;
  }
}

Packet make_announce(const DeviceIdentity& self, uint16_t transport_port) {
  return make_packet(PacketType::Announce, self, PresenceData{self.platform, transport_port});
}

Packet make_discover(const DeviceIdentity& self, uint16_t transport_port) {
  return make_packet(PacketType::Discover, self, PresenceData{self.platform, transport_port});
}

Packet make_heartbeat(const DeviceIdentity& self, uint16_t transport_port) {
  return make_packet(PacketType::Heartbeat, self, PresenceData{self.platform, transport_port});
}

Packet make_device_info(const DeviceIdentity& self, uint16_t transport_port) {
  return make_packet(PacketType::DeviceInfo, self,
                     DeviceInfoData{self.name, self.ip, self.platform, transport_port});
}

Packet make_clipboard_packet(const DeviceIdentity& self, ClipboardPayload payload) {
  return make_packet(PacketType::ClipboardData, self, std::move(payload));
}

std::string dedup_key(const std::string& sender_id, const ClipboardPayload& payload) {
  return fmt::format("{}:{:.6f}:{}",
                     sender_id,
                     payload.timestamp,
                     sha256_hex(payload.content.substr(0, kDedupPrefixBytes)));
}
