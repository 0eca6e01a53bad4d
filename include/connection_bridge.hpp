#ifndef UDSONIP_CONNECTION_BRIDGE_HPP
#define UDSONIP_CONNECTION_BRIDGE_HPP

/**
 * @file connection_bridge.hpp
 * @brief One physical DoIP connection shared by many logical peers
 *
 * The bridge owns a TransportLink (the gateway connection) and a
 * ProtocolCodec (UDS). The outgoing logical target can be rebound at any
 * time with retarget() without touching the physical link.
 *
 * EXCLUSIVE HOLD:
 * - acquire()/release() give one thread exclusive use of the bridge (state
 *   Busy). Waiters are served in FIFO order (ticket queue).
 * - A thread that already holds the bridge and calls acquire() again gets
 *   ReentrantAcquisition immediately.
 * - request() and retarget() take an implicit hold when the caller is not
 *   the holder: request() waits up to its timeout, retarget() does not wait.
 *
 * FAILURE MODEL:
 * - A TransportError from the link moves the bridge to Error. While in
 *   Error every operation fails NotConnected until open() succeeds, unless
 *   BridgeConfig::auto_reconnect is set, in which case the operation that
 *   observes Error reconnects synchronously first.
 *
 * Thread-safe. Lock order: io_mutex_ before mutex_.
 */

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include "config.hpp"
#include "transport.hpp"
#include "uds.hpp"
#include "udsonip.hpp"

namespace udsonip {

class PeerScope;

class ConnectionBridge : public uds::Channel {
public:
  ConnectionBridge(std::unique_ptr<TransportLink> link,
                   std::unique_ptr<uds::ProtocolCodec> codec,
                   BridgeConfig cfg = {});
  ~ConnectionBridge() override;

  ConnectionBridge(const ConnectionBridge&) = delete;
  ConnectionBridge& operator=(const ConnectionBridge&) = delete;

  // Establish or re-establish the physical link (Disconnected/Error -> Idle).
  // When called by the holder the bridge stays Busy.
  Result<void> open();

  // Release the physical link. Idempotent; never fails.
  void close();

  /**
   * @brief Rebind the outgoing logical target
   *
   * Errors:
   * - NotConnected: Disconnected, or Error without a successful auto reconnect
   * - AddressRejected: 0x0000, the tester's own address, or not in allowed_targets
   * - BusyTimeout: another thread holds the bridge
   */
  Result<void> retarget(LogicalAddress address);

  /**
   * @brief Send one request to the current target and wait for its reply
   *
   * Stale frames are drained before sending. NRC 0x78 (response pending)
   * extends the deadline by Timings::p2_star. A suppress_response request
   * completes once sent (empty response payload).
   */
  Result<uds::ServiceResponse> request(const uds::ServiceRequest& req,
                                       std::chrono::milliseconds timeout) override;

  // Exclusive hold, FIFO fair. timeout bounds the wait for the hold.
  Result<void> acquire(std::chrono::milliseconds timeout);
  void release();

  ConnectionState state() const;
  std::optional<LogicalAddress> current_target() const;
  bool held() const;
  bool held_by_current_thread() const;

  const BridgeConfig& config() const { return cfg_; }
  void set_timings(const uds::Timings& t);

private:
  friend class PeerScope;

  // Target write used by PeerScope on exit. Fails NotConnected only when the
  // bridge has been closed; an Error bridge still gets its target restored.
  Result<void> restore_target(std::optional<LogicalAddress> previous);

  Result<void> check_policy(LogicalAddress address) const;

  // Requires mutex_ held. Reconnects an Error bridge when auto_reconnect is
  // enabled (drops and retakes the lock); NotConnected otherwise.
  Result<void> ensure_connected_locked(std::unique_lock<std::mutex>& lk);

  Result<void> acquire_locked(std::unique_lock<std::mutex>& lk, std::chrono::milliseconds timeout);
  void release_locked();

  Result<uds::ServiceResponse> transact(const uds::ServiceRequest& req,
                                        LogicalAddress target,
                                        std::chrono::milliseconds timeout);
  void mark_error(const Error& e);

  std::unique_ptr<TransportLink> link_;
  std::unique_ptr<uds::ProtocolCodec> codec_;
  BridgeConfig cfg_;

  mutable std::mutex mutex_;      // state_, target_, holder, waiters_
  std::condition_variable cv_;
  std::mutex io_mutex_;           // serializes link_ access

  ConnectionState state_{ConnectionState::Disconnected};
  std::optional<LogicalAddress> target_;
  bool held_{false};
  std::thread::id holder_{};
  std::deque<uint64_t> waiters_;
  uint64_t next_ticket_{0};
};

} // namespace udsonip

#endif // UDSONIP_CONNECTION_BRIDGE_HPP
