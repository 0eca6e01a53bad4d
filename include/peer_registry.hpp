#ifndef UDSONIP_PEER_REGISTRY_HPP
#define UDSONIP_PEER_REGISTRY_HPP

/**
 * @file peer_registry.hpp
 * @brief Named peers (ECUs) sharing one ConnectionBridge
 *
 * Usage:
 *   PeerRegistry registry(bridge);
 *   registry.register_peer("engine", 0x00E0);
 *   registry.register_peer("transmission", 0x00E1);
 *
 *   auto engine = registry.scope("engine", std::chrono::seconds(2));
 *   if (engine) {
 *     uds::Client client(engine.value);
 *     auto vin = client.read_data_by_identifier(0xF190);
 *   } // previous target restored, hold released
 *
 * A PeerScope must be used and released on the thread that created it.
 */

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "connection_bridge.hpp"
#include "uds.hpp"
#include "udsonip.hpp"

namespace udsonip {

enum class RegisterMode : uint8_t {
  Replace,    // re-registration overwrites the address
  Exclusive   // re-registration fails DuplicateName
};

struct PeerEntry {
  std::string name;
  LogicalAddress address{0};
};

/**
 * @brief Exclusive, scoped access to one peer on a shared bridge
 *
 * Entry (done by PeerRegistry::scope): hold acquired, previous target
 * recorded, bridge retargeted. Exit (release() or destructor): previous
 * target restored, hold released. The hold is released on every exit path.
 */
class PeerScope : public uds::Channel {
public:
  PeerScope() = default;
  ~PeerScope() override;

  PeerScope(PeerScope&& other) noexcept;
  PeerScope& operator=(PeerScope&& other) noexcept;
  PeerScope(const PeerScope&) = delete;
  PeerScope& operator=(const PeerScope&) = delete;

  Result<uds::ServiceResponse> request(const uds::ServiceRequest& req,
                                       std::chrono::milliseconds timeout) override;

  /// Restore the previous target and release the hold. Returns the restore
  /// failure, if any (NotConnected when the bridge was closed meanwhile).
  /// Further calls are no-ops.
  Result<void> release();

  bool active() const { return active_; }
  const std::string& name() const { return name_; }
  LogicalAddress address() const { return address_; }

private:
  friend class PeerRegistry;
  PeerScope(ConnectionBridge* bridge, std::string name, LogicalAddress address,
            std::optional<LogicalAddress> previous)
    : bridge_(bridge), name_(std::move(name)), address_(address),
      previous_(previous), active_(true) {}

  ConnectionBridge* bridge_{nullptr};
  std::string name_;
  LogicalAddress address_{0};
  std::optional<LogicalAddress> previous_;
  bool active_{false};
};

class PeerRegistry {
public:
  explicit PeerRegistry(ConnectionBridge& bridge) : bridge_(bridge) {}

  Result<void> register_peer(const std::string& name, LogicalAddress address,
                             RegisterMode mode = RegisterMode::Replace);

  // false if the name was not registered
  bool remove_peer(const std::string& name);

  std::optional<LogicalAddress> lookup(const std::string& name) const;
  std::vector<PeerEntry> peers() const;   // sorted by name
  size_t size() const;

  /**
   * @brief Enter exclusive access to a registered peer
   *
   * Waits FIFO up to timeout for the bridge. Errors: UnknownPeer (bridge
   * untouched), ReentrantAcquisition, BusyTimeout, NotConnected, or the
   * retarget error (hold released before returning).
   */
  Result<PeerScope> scope(const std::string& name, std::chrono::milliseconds timeout);

  ConnectionBridge& bridge() { return bridge_; }

private:
  ConnectionBridge& bridge_;
  mutable std::mutex mutex_;   // guards peers_ only
  std::map<std::string, LogicalAddress> peers_;
};

} // namespace udsonip

#endif // UDSONIP_PEER_REGISTRY_HPP
