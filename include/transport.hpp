#ifndef UDSONIP_TRANSPORT_HPP
#define UDSONIP_TRANSPORT_HPP

/**
 * @file transport.hpp
 * @brief Link abstractions consumed by ConnectionBridge and DiscoveryEngine
 *
 * TransportLink carries addressed diagnostic frames over one physical
 * connection (DoIP over TCP in production, a scripted double in tests).
 * DatagramLink carries connectionless broadcast/unicast traffic used for
 * vehicle discovery.
 */

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "udsonip.hpp"

namespace udsonip {

// One addressed frame received from the gateway
struct Frame {
  LogicalAddress source{0};
  LogicalAddress target{0};
  std::vector<uint8_t> payload;
};

class TransportLink {
public:
  virtual ~TransportLink() = default;

  // Establish the physical link; calling open() on an open link reopens it
  virtual Result<void> open() = 0;
  // Idempotent
  virtual void close() = 0;
  virtual bool is_open() const = 0;

  // Send one frame addressed to target. Errors: TransportError, AddressRejected
  virtual Result<void> send(LogicalAddress target, const std::vector<uint8_t>& payload) = 0;

  // Wait up to timeout for the next frame. Timeout if nothing arrived;
  // a zero timeout polls without blocking.
  virtual Result<Frame> receive(std::chrono::milliseconds timeout) = 0;
};

// One received datagram
struct Datagram {
  std::string source_ip;
  uint16_t source_port{0};
  std::vector<uint8_t> bytes;
};

class DatagramLink {
public:
  virtual ~DatagramLink() = default;

  virtual Result<void> broadcast(uint16_t port, const std::vector<uint8_t>& bytes) = 0;
  virtual Result<void> send_to(const std::string& ip, uint16_t port, const std::vector<uint8_t>& bytes) = 0;
  virtual Result<Datagram> receive(std::chrono::milliseconds timeout) = 0;
  virtual void close() = 0;
};

class DatagramLinkFactory {
public:
  virtual ~DatagramLinkFactory() = default;

  // Open a datagram socket bound to bind_port (0 = ephemeral)
  virtual Result<std::unique_ptr<DatagramLink>> open(uint16_t bind_port) = 0;
};

} // namespace udsonip

#endif // UDSONIP_TRANSPORT_HPP
