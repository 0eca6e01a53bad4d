#include "discovery.hpp"
#include "doip.hpp"
#include "doip_socket.hpp"
#include "logging.hpp"
#include <arpa/inet.h>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <thread>

namespace udsonip {

const char* to_string(DiscoveryOrigin o) {
  switch (o) {
    case DiscoveryOrigin::Response:     return "response";
    case DiscoveryOrigin::Announcement: return "announcement";
  }
  return "unknown";
}

// ============================================================================
// DiscoveryRecord
// ============================================================================

std::string DiscoveryRecord::describe() const {
  return "ECU(" + source_ip + " @ " + format_address(logical_address) + ")";
}

Result<std::unique_ptr<ConnectionBridge>> DiscoveryRecord::connect(LinkConfig link, BridgeConfig bridge) const {
  using R = Result<std::unique_ptr<ConnectionBridge>>;

  link.host = source_ip;
  bridge.initial_target = logical_address;
  bridge.source_address = link.source_address;

  auto out = std::make_unique<ConnectionBridge>(std::make_unique<doip::TcpLink>(link),
                                                std::make_unique<uds::UdsCodec>(), bridge);
  if (out->current_target() != std::optional<LogicalAddress>(logical_address)) {
    return R::failure(Errc::AddressRejected, format_address(logical_address) + " rejected by bridge policy");
  }

  auto r = out->open();
  if (!r.ok) {
    return R::failure(r.error);
  }
  LOG_DISCOVERY_INFO("Connected to {}", describe());
  return R::success(std::move(out));
}

// ============================================================================
// DiscoveryAccumulator
// ============================================================================

bool DiscoveryAccumulator::add(DiscoveryRecord record) {
  std::lock_guard<std::mutex> lk(mutex_);
  if (!seen_.insert(std::make_pair(record.source_ip, record.logical_address)).second) {
    return false;
  }
  records_.push_back(std::move(record));
  return true;
}

DiscoverySnapshot DiscoveryAccumulator::snapshot() const {
  std::lock_guard<std::mutex> lk(mutex_);
  DiscoverySnapshot out = records_;
  std::sort(out.begin(), out.end(), [](const DiscoveryRecord& a, const DiscoveryRecord& b) {
    if (a.logical_address != b.logical_address) return a.logical_address < b.logical_address;
    return a.source_ip < b.source_ip;
  });
  return out;
}

size_t DiscoveryAccumulator::size() const {
  std::lock_guard<std::mutex> lk(mutex_);
  return records_.size();
}

// ============================================================================
// CIDR
// ============================================================================

std::vector<std::string> Ipv4Network::hosts() const {
  std::vector<std::string> out;
  const uint32_t size = prefix >= 32 ? 1u : (1u << (32 - prefix));
  uint32_t first = network;
  uint32_t last = network + (size - 1);
  if (prefix < 31) {
    ++first;  // network address
    --last;   // broadcast address
  }

  out.reserve(last - first + 1);
  char buf[INET_ADDRSTRLEN];
  for (uint32_t a = first; ; ++a) {
    std::snprintf(buf, sizeof(buf), "%u.%u.%u.%u",
                  (a >> 24) & 0xFF, (a >> 16) & 0xFF, (a >> 8) & 0xFF, a & 0xFF);
    out.emplace_back(buf);
    if (a == last) break;
  }
  return out;
}

Result<Ipv4Network> parse_cidr(const std::string& cidr) {
  const auto slash = cidr.find('/');
  const std::string ip = cidr.substr(0, slash);

  long prefix = 32;
  if (slash != std::string::npos) {
    const std::string bits = cidr.substr(slash + 1);
    char* end = nullptr;
    prefix = std::strtol(bits.c_str(), &end, 10);
    if (bits.empty() || end == nullptr || *end != '\0') {
      return Result<Ipv4Network>::failure(Errc::AddressRejected, "invalid prefix in '" + cidr + "'");
    }
  }
  if (prefix < 16 || prefix > 32) {
    return Result<Ipv4Network>::failure(Errc::AddressRejected, "prefix must be between /16 and /32");
  }

  struct in_addr addr;
  if (::inet_pton(AF_INET, ip.c_str(), &addr) != 1) {
    return Result<Ipv4Network>::failure(Errc::AddressRejected, "invalid IPv4 address '" + ip + "'");
  }

  const uint32_t mask = prefix == 32 ? 0xFFFFFFFFu : ~((1u << (32 - prefix)) - 1);
  Ipv4Network net;
  net.network = ntohl(addr.s_addr) & mask;
  net.prefix = static_cast<uint8_t>(prefix);
  return Result<Ipv4Network>::success(net);
}

// ============================================================================
// Datagram parsing
// ============================================================================

Result<DiscoveryRecord> parse_discovery_datagram(const Datagram& d, DiscoveryOrigin origin) {
  auto msg = doip::decode_frame(d.bytes);
  if (!msg.ok) {
    return Result<DiscoveryRecord>::failure(msg.error);
  }
  if (msg.value.payload_type != doip::kVehicleIdentificationResponse) {
    return Result<DiscoveryRecord>::failure(Errc::Malformed, "not a vehicle identification response");
  }
  auto info = doip::parse_vehicle_identification(msg.value.payload);
  if (!info.ok) {
    return Result<DiscoveryRecord>::failure(info.error);
  }

  DiscoveryRecord rec;
  rec.source_ip = d.source_ip;
  rec.logical_address = info.value.logical_address;
  rec.vin = std::move(info.value.vin);
  rec.eid = info.value.eid;
  rec.gid = info.value.gid;
  rec.further_action = info.value.further_action;
  rec.vin_gid_status = info.value.vin_gid_status;
  rec.origin = origin;
  return Result<DiscoveryRecord>::success(std::move(rec));
}

// ============================================================================
// DiscoveryEngine
// ============================================================================

DiscoveryEngine::DiscoveryEngine(DiscoveryConfig cfg)
  : factory_(std::make_unique<doip::UdpLinkFactory>(cfg.broadcast_address)), cfg_(std::move(cfg)) {}

DiscoveryEngine::DiscoveryEngine(std::unique_ptr<DatagramLinkFactory> factory, DiscoveryConfig cfg)
  : factory_(std::move(factory)), cfg_(std::move(cfg)) {}

DiscoveryState DiscoveryEngine::state() const {
  std::lock_guard<std::mutex> lk(state_mutex_);
  return state_;
}

void DiscoveryEngine::set_state(DiscoveryState s) {
  std::lock_guard<std::mutex> lk(state_mutex_);
  state_ = s;
}

void DiscoveryEngine::collect(DatagramLink& link, DiscoveryOrigin origin,
                              Clock::time_point deadline, DiscoveryAccumulator& acc) const {
  for (;;) {
    const auto now = Clock::now();
    if (now >= deadline) return;
    const auto slice = std::min(cfg_.poll_slice,
        std::chrono::ceil<std::chrono::milliseconds>(deadline - now));

    auto r = link.receive(slice);
    if (!r.ok) {
      if (r.error.code == Errc::Timeout) continue;
      LOG_DISCOVERY_WARN("Stopping {} collection: {}", to_string(origin), r.error.describe());
      return;
    }

    auto msg = doip::decode_frame(r.value.bytes);
    if (msg.ok && msg.value.payload_type != doip::kVehicleIdentificationResponse) {
      // Our own request echoed back, or unrelated DoIP traffic
      continue;
    }

    auto rec = parse_discovery_datagram(r.value, origin);
    if (!rec.ok) {
      LOG_DISCOVERY_WARN("Dropping malformed datagram from {}: {}", r.value.source_ip, rec.error.message);
      continue;
    }

    const std::string what = rec.value.describe();
    if (acc.add(std::move(rec.value))) {
      LOG_DISCOVERY_INFO("Found {} ({})", what, to_string(origin));
    }
  }
}

Result<DiscoverySnapshot> DiscoveryEngine::discover(std::chrono::milliseconds timeout) {
  std::lock_guard<std::mutex> run(run_mutex_);

  auto probe = factory_->open(0);
  if (!probe.ok) {
    LOG_DISCOVERY_ERROR("Probe socket: {}", probe.error.describe());
    return Result<DiscoverySnapshot>::failure(Errc::TransportError, probe.error.message);
  }
  auto listener = factory_->open(cfg_.announcement_port);
  if (!listener.ok) {
    probe.value->close();
    LOG_DISCOVERY_ERROR("Announcement socket: {}", listener.error.describe());
    return Result<DiscoverySnapshot>::failure(Errc::TransportError, listener.error.message);
  }

  set_state(DiscoveryState::Listening);
  LOG_DISCOVERY_DEBUG("Discovery window {} ms", timeout.count());

  const auto deadline = Clock::now() + timeout;
  DiscoveryAccumulator acc;
  DatagramLink& probe_link = *probe.value;
  DatagramLink& listen_link = *listener.value;

  std::thread active([&] {
    auto sent = probe_link.broadcast(cfg_.discovery_port,
                                     doip::build_vehicle_identification_request(cfg_.protocol_version));
    if (!sent.ok) {
      LOG_DISCOVERY_WARN("Vehicle identification request not sent: {}", sent.error.describe());
      return;
    }
    collect(probe_link, DiscoveryOrigin::Response, deadline, acc);
  });
  std::thread passive([&] {
    collect(listen_link, DiscoveryOrigin::Announcement, deadline, acc);
  });

  active.join();
  passive.join();

  probe_link.close();
  listen_link.close();
  set_state(DiscoveryState::Closed);

  auto snapshot = acc.snapshot();
  LOG_DISCOVERY_INFO("Discovery finished: {} entit{}", snapshot.size(), snapshot.size() == 1 ? "y" : "ies");
  return Result<DiscoverySnapshot>::success(std::move(snapshot));
}

Result<DiscoveryRecord> DiscoveryEngine::query_entity(const std::string& ip, std::chrono::milliseconds timeout) {
  std::lock_guard<std::mutex> run(run_mutex_);

  auto probe = factory_->open(0);
  if (!probe.ok) {
    return Result<DiscoveryRecord>::failure(Errc::TransportError, probe.error.message);
  }
  DatagramLink& link = *probe.value;

  auto sent = link.send_to(ip, cfg_.discovery_port, doip::build_vehicle_identification_request(cfg_.protocol_version));
  if (!sent.ok) {
    link.close();
    return Result<DiscoveryRecord>::failure(sent.error);
  }

  set_state(DiscoveryState::Listening);
  const auto deadline = Clock::now() + timeout;
  Result<DiscoveryRecord> found = Result<DiscoveryRecord>::failure(Errc::Timeout,
      "no vehicle identification response from " + ip);

  for (;;) {
    const auto now = Clock::now();
    if (now >= deadline) break;
    auto r = link.receive(std::min(cfg_.poll_slice,
        std::chrono::ceil<std::chrono::milliseconds>(deadline - now)));
    if (!r.ok) {
      if (r.error.code == Errc::Timeout) continue;
      found = Result<DiscoveryRecord>::failure(r.error);
      break;
    }
    auto rec = parse_discovery_datagram(r.value, DiscoveryOrigin::Response);
    if (rec.ok) {
      found = std::move(rec);
      break;
    }
    LOG_DISCOVERY_DEBUG("Ignoring datagram from {}: {}", r.value.source_ip, rec.error.message);
  }

  link.close();
  set_state(DiscoveryState::Closed);
  return found;
}

Result<DiscoverySnapshot> DiscoveryEngine::scan(const std::string& cidr, std::chrono::milliseconds timeout) {
  auto net = parse_cidr(cidr);
  if (!net.ok) {
    return Result<DiscoverySnapshot>::failure(net.error);
  }

  std::lock_guard<std::mutex> run(run_mutex_);

  auto probe = factory_->open(0);
  if (!probe.ok) {
    return Result<DiscoverySnapshot>::failure(Errc::TransportError, probe.error.message);
  }
  DatagramLink& link = *probe.value;

  set_state(DiscoveryState::Listening);
  const auto deadline = Clock::now() + timeout;
  const auto hosts = net.value.hosts();
  const auto request = doip::build_vehicle_identification_request(cfg_.protocol_version);
  LOG_DISCOVERY_INFO("Scanning {} ({} hosts)", cidr, hosts.size());

  DiscoveryAccumulator acc;
  std::thread sender([&] {
    for (const auto& host : hosts) {
      if (Clock::now() >= deadline) break;
      auto sent = link.send_to(host, cfg_.discovery_port, request);
      if (!sent.ok) {
        LOG_DISCOVERY_DEBUG("Request to {} not sent: {}", host, sent.error.describe());
      }
    }
  });
  collect(link, DiscoveryOrigin::Response, deadline, acc);
  sender.join();

  link.close();
  set_state(DiscoveryState::Closed);
  return Result<DiscoverySnapshot>::success(acc.snapshot());
}

} // namespace udsonip
