#include "connection_bridge.hpp"
#include "logging.hpp"
#include <algorithm>

namespace udsonip {

namespace {
using Clock = std::chrono::steady_clock;

// Upper bound on stale frames discarded before one request
constexpr int kMaxDrainFrames = 64;
}

ConnectionBridge::ConnectionBridge(std::unique_ptr<TransportLink> link,
                                   std::unique_ptr<uds::ProtocolCodec> codec,
                                   BridgeConfig cfg)
  : link_(std::move(link)), codec_(std::move(codec)), cfg_(std::move(cfg)) {
  if (cfg_.initial_target) {
    auto r = check_policy(*cfg_.initial_target);
    if (r.ok) {
      target_ = cfg_.initial_target;
    } else {
      LOG_BRIDGE_WARN("Initial target ignored: {}", r.error.describe());
    }
  }
}

ConnectionBridge::~ConnectionBridge() {
  close();
}

// ============================================================================
// Lifecycle
// ============================================================================

Result<void> ConnectionBridge::open() {
  std::lock_guard<std::mutex> io(io_mutex_);
  auto r = link_->open();

  std::lock_guard<std::mutex> lk(mutex_);
  if (!r.ok) {
    // A failed reopen leaves the previous link torn down
    if (state_ != ConnectionState::Disconnected) {
      state_ = ConnectionState::Error;
    }
    LOG_BRIDGE_WARN("Open failed: {}", r.error.describe());
    return r;
  }

  state_ = held_ ? ConnectionState::Busy : ConnectionState::Idle;
  LOG_BRIDGE_INFO("Bridge open, state {}", to_string(state_));
  cv_.notify_all();
  return Result<void>::success();
}

void ConnectionBridge::close() {
  std::lock_guard<std::mutex> io(io_mutex_);
  link_->close();

  std::lock_guard<std::mutex> lk(mutex_);
  if (state_ != ConnectionState::Disconnected) {
    LOG_BRIDGE_INFO("Bridge closed");
  }
  state_ = ConnectionState::Disconnected;
  // Waiters for the hold fail NotConnected
  cv_.notify_all();
}

Result<void> ConnectionBridge::ensure_connected_locked(std::unique_lock<std::mutex>& lk) {
  switch (state_) {
    case ConnectionState::Idle:
    case ConnectionState::Busy:
      return Result<void>::success();
    case ConnectionState::Disconnected:
      return Result<void>::failure(Errc::NotConnected, "bridge is closed");
    case ConnectionState::Error:
      break;
  }

  if (!cfg_.auto_reconnect) {
    return Result<void>::failure(Errc::NotConnected, "connection failed, open() required");
  }

  LOG_BRIDGE_INFO("Connection in Error state, reconnecting");

  // Respect lock order: io before state
  lk.unlock();
  std::unique_lock<std::mutex> io(io_mutex_);
  lk.lock();

  if (state_ == ConnectionState::Disconnected) {
    return Result<void>::failure(Errc::NotConnected, "bridge closed during reconnect");
  }
  if (state_ != ConnectionState::Error) {
    return Result<void>::success();  // reopened by someone else meanwhile
  }

  // close() needs io_mutex_, so the state can not change while connecting
  lk.unlock();
  auto r = link_->open();
  lk.lock();

  if (!r.ok) {
    LOG_BRIDGE_ERROR("Reconnect failed: {}", r.error.describe());
    return Result<void>::failure(Errc::NotConnected, "reconnect failed: " + r.error.describe());
  }
  state_ = held_ ? ConnectionState::Busy : ConnectionState::Idle;
  LOG_BRIDGE_INFO("Reconnected");
  return Result<void>::success();
}

void ConnectionBridge::mark_error(const Error& e) {
  // io_mutex_ is held by the caller
  link_->close();

  std::lock_guard<std::mutex> lk(mutex_);
  if (state_ != ConnectionState::Disconnected) {
    state_ = ConnectionState::Error;
  }
  LOG_BRIDGE_ERROR("Transport failure: {}", e.describe());
}

// ============================================================================
// Exclusive hold
// ============================================================================

Result<void> ConnectionBridge::acquire_locked(std::unique_lock<std::mutex>& lk,
                                              std::chrono::milliseconds timeout) {
  const auto me = std::this_thread::get_id();
  if (held_ && holder_ == me) {
    return Result<void>::failure(Errc::ReentrantAcquisition, "bridge already held by this thread");
  }
  if (state_ == ConnectionState::Disconnected) {
    return Result<void>::failure(Errc::NotConnected, "bridge is closed");
  }

  const uint64_t ticket = next_ticket_++;
  waiters_.push_back(ticket);

  const bool granted = cv_.wait_until(lk, Clock::now() + timeout, [&] {
    return state_ == ConnectionState::Disconnected ||
           (!held_ && waiters_.front() == ticket);
  });

  if (!granted || state_ == ConnectionState::Disconnected) {
    waiters_.erase(std::find(waiters_.begin(), waiters_.end(), ticket));
    cv_.notify_all();  // the next ticket may now be at the front
    if (granted) {
      return Result<void>::failure(Errc::NotConnected, "bridge closed while waiting");
    }
    return Result<void>::failure(Errc::BusyTimeout, "bridge hold not granted within " +
                                 std::to_string(timeout.count()) + " ms");
  }

  waiters_.pop_front();
  held_ = true;
  holder_ = me;
  if (state_ == ConnectionState::Idle) {
    state_ = ConnectionState::Busy;
  }
  return Result<void>::success();
}

void ConnectionBridge::release_locked() {
  held_ = false;
  holder_ = std::thread::id();
  if (state_ == ConnectionState::Busy) {
    state_ = ConnectionState::Idle;
  }
  cv_.notify_all();
}

Result<void> ConnectionBridge::acquire(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lk(mutex_);
  auto r = acquire_locked(lk, timeout);
  if (!r.ok) return r;

  r = ensure_connected_locked(lk);
  if (!r.ok) {
    release_locked();
  }
  return r;
}

void ConnectionBridge::release() {
  std::lock_guard<std::mutex> lk(mutex_);
  if (!held_) return;
  if (holder_ != std::this_thread::get_id()) {
    LOG_BRIDGE_WARN("Hold released by a thread other than the holder");
  }
  release_locked();
}

// ============================================================================
// Targeting
// ============================================================================

Result<void> ConnectionBridge::check_policy(LogicalAddress address) const {
  if (address == 0x0000) {
    return Result<void>::failure(Errc::AddressRejected, "0x0000 is not a valid target");
  }
  if (address == cfg_.source_address) {
    return Result<void>::failure(Errc::AddressRejected,
                                 format_address(address) + " is the tester's own address");
  }
  if (!cfg_.allowed_targets.empty() &&
      std::find(cfg_.allowed_targets.begin(), cfg_.allowed_targets.end(), address) == cfg_.allowed_targets.end()) {
    return Result<void>::failure(Errc::AddressRejected,
                                 format_address(address) + " is not an allowed target");
  }
  return Result<void>::success();
}

Result<void> ConnectionBridge::retarget(LogicalAddress address) {
  std::unique_lock<std::mutex> lk(mutex_);

  const bool implicit = !(held_ && holder_ == std::this_thread::get_id());
  if (implicit) {
    // Never wait: retargeting under someone else's hold is a caller bug
    auto r = acquire_locked(lk, std::chrono::milliseconds(0));
    if (!r.ok) return r;
  }

  auto r = ensure_connected_locked(lk);
  if (r.ok) {
    r = check_policy(address);
  }
  if (r.ok) {
    LOG_BRIDGE_DEBUG("Target {} -> {}", target_ ? format_address(*target_) : std::string("none"),
                     format_address(address));
    target_ = address;
  }

  if (implicit) {
    release_locked();
  }
  return r;
}

Result<void> ConnectionBridge::restore_target(std::optional<LogicalAddress> previous) {
  std::lock_guard<std::mutex> lk(mutex_);
  if (state_ == ConnectionState::Disconnected) {
    return Result<void>::failure(Errc::NotConnected, "bridge closed before target restore");
  }
  target_ = previous;
  return Result<void>::success();
}

// ============================================================================
// Requests
// ============================================================================

Result<uds::ServiceResponse> ConnectionBridge::request(const uds::ServiceRequest& req,
                                                       std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lk(mutex_);

  const bool implicit = !(held_ && holder_ == std::this_thread::get_id());
  if (implicit) {
    auto r = acquire_locked(lk, timeout);
    if (!r.ok) {
      return Result<uds::ServiceResponse>::failure(r.error);
    }
  }

  auto c = ensure_connected_locked(lk);
  if (!c.ok || !target_) {
    if (implicit) release_locked();
    if (!c.ok) return Result<uds::ServiceResponse>::failure(c.error);
    return Result<uds::ServiceResponse>::failure(Errc::AddressRejected, "no target address bound");
  }
  const LogicalAddress target = *target_;
  lk.unlock();

  auto res = transact(req, target, timeout);

  if (implicit) {
    lk.lock();
    release_locked();
  }
  return res;
}

Result<uds::ServiceResponse> ConnectionBridge::transact(const uds::ServiceRequest& req,
                                                        LogicalAddress target,
                                                        std::chrono::milliseconds timeout) {
  std::lock_guard<std::mutex> io(io_mutex_);

  uds::Timings timings;
  {
    std::lock_guard<std::mutex> lk(mutex_);
    if (state_ == ConnectionState::Disconnected) {
      return Result<uds::ServiceResponse>::failure(Errc::NotConnected, "bridge is closed");
    }
    timings = cfg_.timings;
  }

  // Replies to earlier, timed-out requests must not be taken for ours
  for (int i = 0; i < kMaxDrainFrames; ++i) {
    auto stale = link_->receive(std::chrono::milliseconds(0));
    if (stale.ok) {
      LOG_BRIDGE_DEBUG("Discarding stale frame from {}: {}", format_address(stale.value.source),
                       uds::to_hex(stale.value.payload));
      continue;
    }
    if (stale.error.code == Errc::Timeout) break;
    mark_error(stale.error);
    return Result<uds::ServiceResponse>::failure(stale.error);
  }

  const auto tx = codec_->encode(req);
  LOG_BRIDGE_DEBUG("TX -> {}: {}", format_address(target), uds::to_hex(tx));

  auto s = link_->send(target, tx);
  if (!s.ok) {
    if (s.error.code == Errc::TransportError) {
      mark_error(s.error);
    }
    return Result<uds::ServiceResponse>::failure(s.error);
  }

  if (req.suppress_response) {
    uds::ServiceResponse rsp;
    rsp.sid = req.sid;
    return Result<uds::ServiceResponse>::success(std::move(rsp));
  }

  const auto sent_at = Clock::now();
  const auto pending_cap = sent_at + std::max(timeout, timings.pending_limit);
  auto deadline = sent_at + timeout;
  for (;;) {
    const auto now = Clock::now();
    if (now >= deadline) {
      LOG_BRIDGE_DEBUG("No response from {} for SID 0x{:02X}", format_address(target), req.sid);
      return Result<uds::ServiceResponse>::failure(Errc::Timeout,
          "no response from " + format_address(target));
    }

    auto f = link_->receive(std::chrono::ceil<std::chrono::milliseconds>(deadline - now));
    if (!f.ok) {
      if (f.error.code == Errc::Timeout) continue;  // re-check deadline
      if (f.error.code == Errc::TransportError) {
        mark_error(f.error);
      }
      return Result<uds::ServiceResponse>::failure(f.error);
    }

    if (f.value.source != target) {
      LOG_BRIDGE_WARN("Reply from {} while targeting {}, attributed to {}",
                      format_address(f.value.source), format_address(target), format_address(target));
    }
    LOG_BRIDGE_DEBUG("RX <- {}: {}", format_address(f.value.source), uds::to_hex(f.value.payload));

    auto d = codec_->decode(f.value.payload);
    if (!d.ok) {
      if (d.error.code == Errc::NegativeResponse &&
          d.error.nrc == static_cast<uint8_t>(uds::NegativeResponseCode::ResponsePending)) {
        // RCR-RP: the server needs up to P2* more, never past the pending cap
        const auto now_rp = Clock::now();
        if (now_rp >= pending_cap) {
          LOG_BRIDGE_WARN("{} still pending after {} ms, giving up", format_address(target),
                          std::chrono::duration_cast<std::chrono::milliseconds>(now_rp - sent_at).count());
          return Result<uds::ServiceResponse>::failure(Errc::Timeout,
              "response pending limit exceeded for " + format_address(target));
        }
        deadline = std::min(now_rp + timings.p2_star, pending_cap);
        continue;
      }
      return Result<uds::ServiceResponse>::failure(d.error);
    }

    if (d.value.sid != req.sid) {
      return Result<uds::ServiceResponse>::failure(Errc::Malformed,
          "response SID does not match request");
    }
    return d;
  }
}

// ============================================================================
// Observers
// ============================================================================

ConnectionState ConnectionBridge::state() const {
  std::lock_guard<std::mutex> lk(mutex_);
  return state_;
}

std::optional<LogicalAddress> ConnectionBridge::current_target() const {
  std::lock_guard<std::mutex> lk(mutex_);
  return target_;
}

bool ConnectionBridge::held() const {
  std::lock_guard<std::mutex> lk(mutex_);
  return held_;
}

bool ConnectionBridge::held_by_current_thread() const {
  std::lock_guard<std::mutex> lk(mutex_);
  return held_ && holder_ == std::this_thread::get_id();
}

void ConnectionBridge::set_timings(const uds::Timings& t) {
  std::lock_guard<std::mutex> lk(mutex_);
  cfg_.timings = t;
}

} // namespace udsonip
