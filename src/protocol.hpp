#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>

// protocol.hpp - wire packets exchanged between clipboard sync nodes.
//
// Every packet is one JSON object:
//   { "packet_type": "...", "sender_name": "...", "sender_ip": "...",
//     "timestamp": <seconds since epoch>, "data": {...} | null }

enum class PacketType {
  Announce,
  Discover,
  Heartbeat,
  DeviceInfo,
  ClipboardData
};

const char* packet_type_name(PacketType type);
bool is_presence_packet(PacketType type);

enum class ClipboardKind { Text, Image };

const char* clipboard_kind_name(ClipboardKind kind);

struct DeviceIdentity {
  std::string name;
  std::string ip;
  std::string platform = "Unknown";

  std::string id() const { return name + "@" + ip; }
};

// Payload of announce, discover and heartbeat packets. A presence packet whose
// data is null carries std::monostate; readers treat that as platform
// "Unknown" on port 0.
struct PresenceData {
  std::string platform = "Unknown";
  uint16_t transport_port = 0;
};

struct DeviceInfoData {
  std::string name;
  std::string ip;
  std::string platform = "Unknown";
  uint16_t transport_port = 0;
};

// Text content is UTF-8; image content is raw bytes (base64 only on the wire).
struct ClipboardPayload {
  ClipboardKind kind = ClipboardKind::Text;
  std::string content;
  double timestamp = 0.0;
  std::string device_name;
};

using PacketData = std::variant<std::monostate, PresenceData, DeviceInfoData, ClipboardPayload>;

struct Packet {
  PacketType type = PacketType::Announce;
  std::string sender_name;
  std::string sender_ip;
  double timestamp = 0.0;
  PacketData data;

  std::string sender_id() const { return sender_name + "@" + sender_ip; }
  const ClipboardPayload* clipboard() const { return std::get_if<ClipboardPayload>(&data); }
  const PresenceData* presence() const { return std::get_if<PresenceData>(&data); }
  const DeviceInfoData* device_info() const { return std::get_if<DeviceInfoData>(&data); }
};

bool operator==(const PresenceData& a, const PresenceData& b);
bool operator==(const DeviceInfoData& a, const DeviceInfoData& b);
bool operator==(const ClipboardPayload& a, const ClipboardPayload& b);
bool operator==(const Packet& a, const Packet& b);
inline bool operator!=(const Packet& a, const Packet& b) { return !(a == b); }

class CodecError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Throws CodecError when text content is not valid UTF-8 or the data variant
// does not match the packet type.
std::string encode_packet(const Packet& packet);

// Never throws. On failure `out` is left untouched and `error` says why.
bool decode_packet(const std::string& bytes, Packet& out, std::string& error);

Packet make_announce(const DeviceIdentity& self, uint16_t transport_port);
Packet make_discover(const DeviceIdentity& self, uint16_t transport_port);
Packet make_heartbeat(const DeviceIdentity& self, uint16_t transport_port);
Packet make_device_info(const DeviceIdentity& self, uint16_t transport_port);
Packet make_clipboard_packet(const DeviceIdentity& self, ClipboardPayload payload);

// Key under which a received clipboard message is remembered for duplicate
// suppression: sender, payload timestamp and a hash of the content prefix.
std::string dedup_key(const std::string& sender_id, const ClipboardPayload& payload);
