#ifndef UDSONIP_DOIP_SOCKET_HPP
#define UDSONIP_DOIP_SOCKET_HPP

/**
 * @file doip_socket.hpp
 * @brief POSIX socket links speaking DoIP (ISO 13400-2)
 *
 * TcpLink: TransportLink over one TCP_DATA connection to a DoIP entity.
 *   open() = connect (bounded by LinkConfig::connect_timeout) + routing
 *   activation. send() waits for the diagnostic message ACK/NACK; diagnostic
 *   messages that arrive before the ACK are queued for receive(). Alive check
 *   requests are answered transparently.
 *
 * UdpLink: DatagramLink bound to a local UDP port with SO_BROADCAST enabled,
 *   used for vehicle identification requests and announcements.
 *
 * Neither class is internally synchronized; ConnectionBridge serializes all
 * access to its TransportLink.
 */

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <vector>
#include "config.hpp"
#include "doip.hpp"
#include "transport.hpp"

namespace udsonip {
namespace doip {

class TcpLink : public TransportLink {
public:
  explicit TcpLink(LinkConfig cfg) : cfg_(std::move(cfg)) {}
  ~TcpLink() override;

  // Non-copyable
  TcpLink(const TcpLink&) = delete;
  TcpLink& operator=(const TcpLink&) = delete;

  Result<void> open() override;
  void close() override;
  bool is_open() const override { return fd_ >= 0; }

  Result<void> send(LogicalAddress target, const std::vector<uint8_t>& payload) override;
  Result<Frame> receive(std::chrono::milliseconds timeout) override;

  const LinkConfig& config() const { return cfg_; }

  /// Logical address of the DoIP entity reported by routing activation
  /// (0 before activation or with routing_activation disabled)
  LogicalAddress entity_address() const { return entity_address_; }

private:
  Result<void> connect_socket();
  Result<void> activate_routing();
  Result<void> write_message(uint16_t payload_type, const std::vector<uint8_t>& payload);

  // Next complete DoIP message from the stream. Timeout leaves partial data
  // buffered in rx_buf_; TransportError on hangup or an unparseable header.
  Result<Message> read_message(std::chrono::milliseconds timeout);
  void answer_alive_check();
  void close_socket();

  LinkConfig cfg_;
  int fd_{-1};
  std::vector<uint8_t> rx_buf_;
  std::deque<Frame> pending_;     // diagnostic messages received while waiting for an ACK
  LogicalAddress entity_address_{0};
};

class UdpLink : public DatagramLink {
public:
  UdpLink(int fd, std::string broadcast_address)
    : fd_(fd), broadcast_address_(std::move(broadcast_address)) {}
  ~UdpLink() override;

  UdpLink(const UdpLink&) = delete;
  UdpLink& operator=(const UdpLink&) = delete;

  Result<void> broadcast(uint16_t port, const std::vector<uint8_t>& bytes) override;
  Result<void> send_to(const std::string& ip, uint16_t port, const std::vector<uint8_t>& bytes) override;
  Result<Datagram> receive(std::chrono::milliseconds timeout) override;
  void close() override;

  /// Locally bound port (useful after binding port 0)
  uint16_t local_port() const;

private:
  int fd_{-1};
  std::string broadcast_address_;
};

class UdpLinkFactory : public DatagramLinkFactory {
public:
  explicit UdpLinkFactory(std::string broadcast_address = "255.255.255.255")
    : broadcast_address_(std::move(broadcast_address)) {}

  Result<std::unique_ptr<DatagramLink>> open(uint16_t bind_port) override;

  // Same as open() but keeps the concrete type (local_port() access)
  Result<std::unique_ptr<UdpLink>> open_udp(uint16_t bind_port);

private:
  std::string broadcast_address_;
};

} // namespace doip
} // namespace udsonip

#endif // UDSONIP_DOIP_SOCKET_HPP
