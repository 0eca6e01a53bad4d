#ifndef UDSONIP_DISCOVERY_HPP
#define UDSONIP_DISCOVERY_HPP

/**
 * @file discovery.hpp
 * @brief DoIP entity discovery (ISO 13400-2 Section 7.3 vehicle identification)
 *
 * Two ways a DoIP entity makes itself known, both carried by payload type
 * 0x0004 with the same layout:
 * - Vehicle identification response: answer to a 0x0001 request we sent
 *   (broadcast or unicast) to UDP port 13400.
 * - Vehicle announcement: sent unsolicited by an entity after power-up,
 *   received on the announcement port.
 *
 * discover() runs both activities concurrently for one time window and
 * returns a snapshot deduplicated by (source IP, logical address), first
 * seen wins, sorted by logical address then IP.
 */

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include "config.hpp"
#include "connection_bridge.hpp"
#include "transport.hpp"
#include "udsonip.hpp"

namespace udsonip {

enum class DiscoveryOrigin : uint8_t {
  Response,      // reply to our vehicle identification request
  Announcement   // unsolicited vehicle announcement
};

const char* to_string(DiscoveryOrigin o);

struct DiscoveryRecord {
  std::string source_ip;
  LogicalAddress logical_address{0};
  std::string vin;
  std::array<uint8_t, 6> eid{};
  std::array<uint8_t, 6> gid{};
  uint8_t further_action{0};
  std::optional<uint8_t> vin_gid_status;
  DiscoveryOrigin origin{DiscoveryOrigin::Response};

  // "ECU(192.168.1.10 @ 0x00E0)"
  std::string describe() const;

  /**
   * @brief Open a bridge to this entity, targeted at its logical address
   *
   * link.host is replaced by source_ip; bridge.initial_target by
   * logical_address and bridge.source_address by link.source_address.
   */
  Result<std::unique_ptr<ConnectionBridge>> connect(LinkConfig link = {}, BridgeConfig bridge = {}) const;
};

using DiscoverySnapshot = std::vector<DiscoveryRecord>;

// Thread-safe collector shared by the discovery activities
class DiscoveryAccumulator {
public:
  // false if (source_ip, logical_address) was already recorded
  bool add(DiscoveryRecord record);
  DiscoverySnapshot snapshot() const;
  size_t size() const;

private:
  mutable std::mutex mutex_;
  std::vector<DiscoveryRecord> records_;
  std::set<std::pair<std::string, LogicalAddress>> seen_;
};

// IPv4 block for scan()
struct Ipv4Network {
  uint32_t network{0};   // host byte order, host bits cleared
  uint8_t prefix{32};

  // Usable host addresses (network and broadcast excluded below /31)
  std::vector<std::string> hosts() const;
};

// "a.b.c.d/n" with 16 <= n <= 32 (no suffix = /32); AddressRejected otherwise
Result<Ipv4Network> parse_cidr(const std::string& cidr);

// Datagram -> record; Malformed for anything that is not a valid 0x0004 message
Result<DiscoveryRecord> parse_discovery_datagram(const Datagram& d, DiscoveryOrigin origin);

enum class DiscoveryState : uint8_t {
  Idle,
  Listening,
  Closed
};

class DiscoveryEngine {
public:
  // Plain UDP sockets (doip::UdpLinkFactory) on cfg.broadcast_address
  explicit DiscoveryEngine(DiscoveryConfig cfg = {});
  DiscoveryEngine(std::unique_ptr<DatagramLinkFactory> factory, DiscoveryConfig cfg = {});

  DiscoveryEngine(const DiscoveryEngine&) = delete;
  DiscoveryEngine& operator=(const DiscoveryEngine&) = delete;

  /**
   * @brief Broadcast probe + announcement listening for one window
   *
   * Zero responses is a successful empty snapshot. TransportError if either
   * socket can not be opened. Both sockets are closed before returning.
   * Concurrent calls are serialized.
   */
  Result<DiscoverySnapshot> discover(std::chrono::milliseconds timeout);

  // Unicast request to one entity; first valid response wins, Timeout if none
  Result<DiscoveryRecord> query_entity(const std::string& ip, std::chrono::milliseconds timeout);

  // Unicast request to every host of an IPv4 block, responses collected for the window
  Result<DiscoverySnapshot> scan(const std::string& cidr, std::chrono::milliseconds timeout);

  DiscoveryState state() const;
  const DiscoveryConfig& config() const { return cfg_; }

private:
  using Clock = std::chrono::steady_clock;

  // Receive until deadline; a receive failure ends this activity only
  void collect(DatagramLink& link, DiscoveryOrigin origin,
               Clock::time_point deadline, DiscoveryAccumulator& acc) const;
  void set_state(DiscoveryState s);

  std::unique_ptr<DatagramLinkFactory> factory_;
  DiscoveryConfig cfg_;
  std::mutex run_mutex_;              // one discovery activity at a time
  mutable std::mutex state_mutex_;
  DiscoveryState state_{DiscoveryState::Idle};
};

} // namespace udsonip

#endif // UDSONIP_DISCOVERY_HPP
