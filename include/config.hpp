#ifndef UDSONIP_CONFIG_HPP
#define UDSONIP_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Configuration structures for links, bridges and discovery
 *
 * All fields carry defaults suitable for a DoIP gateway on the local
 * network (ISO 13400-2 Table 39: TCP_DATA / UDP_DISCOVERY port 13400).
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "udsonip.hpp"
#include "uds.hpp"

namespace udsonip {

constexpr uint16_t kDoipPort = 13400;
constexpr uint8_t kDoipDefaultProtocolVersion = 0x02;  // ISO 13400-2:2012

// TCP link to one DoIP gateway
struct LinkConfig {
  std::string host;
  uint16_t tcp_port = kDoipPort;
  LogicalAddress source_address = kDefaultTesterAddress;  // tester address
  uint8_t protocol_version = kDoipDefaultProtocolVersion;
  uint8_t activation_type = 0x00;                          // 0x00 default, 0x01 WWH-OBD
  std::chrono::milliseconds connect_timeout = std::chrono::milliseconds(2000);
  std::chrono::milliseconds ack_timeout = std::chrono::milliseconds(2000);  // routing activation + diag ACK
  bool routing_activation = true;
};

struct BridgeConfig {
  uds::Timings timings{};
  std::optional<LogicalAddress> initial_target;   // bound at construction if the policy allows it
  std::vector<LogicalAddress> allowed_targets;    // empty = any address
  LogicalAddress source_address = kDefaultTesterAddress;
  bool auto_reconnect = false;                    // synchronous reopen on Error
};

struct DiscoveryConfig {
  std::string broadcast_address = "255.255.255.255";
  uint16_t discovery_port = kDoipPort;     // destination of vehicle identification requests
  uint16_t announcement_port = kDoipPort;  // local port for vehicle announcements
  uint8_t protocol_version = kDoipDefaultProtocolVersion;
  std::chrono::milliseconds poll_slice = std::chrono::milliseconds(50);
};

} // namespace udsonip

#endif // UDSONIP_CONFIG_HPP
