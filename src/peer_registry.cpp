#include "peer_registry.hpp"
#include "logging.hpp"

namespace udsonip {

// ============================================================================
// PeerScope
// ============================================================================

PeerScope::~PeerScope() {
  // Restore failures are logged by release()
  release();
}

PeerScope::PeerScope(PeerScope&& other) noexcept
  : bridge_(other.bridge_), name_(std::move(other.name_)), address_(other.address_),
    previous_(other.previous_), active_(other.active_) {
  other.bridge_ = nullptr;
  other.active_ = false;
}

PeerScope& PeerScope::operator=(PeerScope&& other) noexcept {
  if (this != &other) {
    release();
    bridge_ = other.bridge_;
    name_ = std::move(other.name_);
    address_ = other.address_;
    previous_ = other.previous_;
    active_ = other.active_;
    other.bridge_ = nullptr;
    other.active_ = false;
  }
  return *this;
}

Result<uds::ServiceResponse> PeerScope::request(const uds::ServiceRequest& req,
                                                std::chrono::milliseconds timeout) {
  if (!active_ || !bridge_) {
    return Result<uds::ServiceResponse>::failure(Errc::NotConnected, "scope already released");
  }
  return bridge_->request(req, timeout);
}

Result<void> PeerScope::release() {
  if (!active_ || !bridge_) {
    return Result<void>::success();
  }
  active_ = false;

  Result<void> r = Result<void>::success();
  if (previous_) {
    r = bridge_->restore_target(previous_);
    if (!r.ok) {
      LOG_REGISTRY_ERROR("Scope '{}' could not restore target {}: {}", name_,
                         format_address(*previous_), r.error.describe());
    }
  }

  bridge_->release();
  LOG_REGISTRY_DEBUG("Scope '{}' ({}) released", name_, format_address(address_));
  return r;
}

// ============================================================================
// PeerRegistry
// ============================================================================

Result<void> PeerRegistry::register_peer(const std::string& name, LogicalAddress address,
                                         RegisterMode mode) {
  std::lock_guard<std::mutex> lk(mutex_);
  auto it = peers_.find(name);
  if (it != peers_.end()) {
    if (mode == RegisterMode::Exclusive) {
      return Result<void>::failure(Errc::DuplicateName, "peer '" + name + "' already registered");
    }
    LOG_REGISTRY_INFO("Peer '{}' re-registered: {} -> {}", name,
                      format_address(it->second), format_address(address));
    it->second = address;
    return Result<void>::success();
  }

  peers_.emplace(name, address);
  LOG_REGISTRY_INFO("Registered peer '{}' at {}", name, format_address(address));
  return Result<void>::success();
}

bool PeerRegistry::remove_peer(const std::string& name) {
  std::lock_guard<std::mutex> lk(mutex_);
  if (peers_.erase(name) == 0) {
    return false;
  }
  LOG_REGISTRY_INFO("Removed peer '{}'", name);
  return true;
}

std::optional<LogicalAddress> PeerRegistry::lookup(const std::string& name) const {
  std::lock_guard<std::mutex> lk(mutex_);
  auto it = peers_.find(name);
  if (it == peers_.end()) return std::nullopt;
  return it->second;
}

std::vector<PeerEntry> PeerRegistry::peers() const {
  std::lock_guard<std::mutex> lk(mutex_);
  std::vector<PeerEntry> out;
  out.reserve(peers_.size());
  for (const auto& p : peers_) {
    out.push_back(PeerEntry{p.first, p.second});
  }
  return out;
}

size_t PeerRegistry::size() const {
  std::lock_guard<std::mutex> lk(mutex_);
  return peers_.size();
}

Result<PeerScope> PeerRegistry::scope(const std::string& name, std::chrono::milliseconds timeout) {
  auto address = lookup(name);
  if (!address) {
    return Result<PeerScope>::failure(Errc::UnknownPeer, "no peer named '" + name + "'");
  }

  auto held = bridge_.acquire(timeout);
  if (!held.ok) {
    LOG_REGISTRY_DEBUG("Scope '{}' not entered: {}", name, held.error.describe());
    return Result<PeerScope>::failure(held.error);
  }

  const auto previous = bridge_.current_target();
  auto r = bridge_.retarget(*address);
  if (!r.ok) {
    bridge_.release();
    LOG_REGISTRY_WARN("Scope '{}' retarget to {} failed: {}", name, format_address(*address),
                      r.error.describe());
    return Result<PeerScope>::failure(r.error);
  }

  LOG_REGISTRY_DEBUG("Scope '{}' entered ({})", name, format_address(*address));
  return Result<PeerScope>::success(PeerScope(&bridge_, name, *address, previous));
}

} // namespace udsonip
