#pragma once
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

#include "protocol.hpp"

// Receives every decoded packet a transport accepts from the network, minus
// the node's own packets. Called on the transport's receive thread.
class PacketSink {
public:
  virtual ~PacketSink() = default;
  virtual void on_packet(const Packet& packet) = 0;
};

class TransportError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

enum class TransportKind { Udp, WebSocket };

const char* transport_kind_name(TransportKind kind);
// Accepts "udp" and "websocket" (also "ws"); throws std::invalid_argument.
TransportKind parse_transport_kind(const std::string& name);

// A way of exchanging packets with peers on the LAN.
class Transport {
public:
  virtual ~Transport() = default;

  // Throws TransportError when the transport cannot bind.
  virtual void start() = 0;
  // Idempotent. Background work is joined with a bounded wait.
  virtual void stop() = 0;

  virtual void broadcast(const Packet& packet) = 0;
  virtual void announce() = 0;
  virtual void discover() = 0;

  // The sink receives clipboard packets and, where the transport forwards
  // them, presence packets too. Null detaches.
  virtual void set_sink(PacketSink* sink) = 0;
  virtual uint16_t bound_port() const = 0;
  virtual TransportKind kind() const = 0;
};
