#include "transport.hpp"

#include <stdexcept>

#include "settings_manager.hpp"

const char* transport_kind_name(TransportKind kind) {
  return kind == TransportKind::WebSocket ? "websocket" : "udp";
}

TransportKind parse_transport_kind(const std::string& name) {
  auto lowered = SettingsManager::to_lower(SettingsManager::trim_copy(name));
  if(lowered == "udp" || lowered == "broadcast") return TransportKind::Udp;
  if(lowered == "websocket" || lowered == "ws") return TransportKind::WebSocket;
  throw std::invalid_argument("unknown transport '" + name + "' (expected udp or websocket)");
}
