#include "doip_socket.hpp"
#include "logging.hpp"
#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace udsonip {
namespace doip {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds remaining(Clock::time_point deadline) {
  auto now = Clock::now();
  if (now >= deadline) return std::chrono::milliseconds(0);
  return std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
}

// 1 = ready, 0 = timeout, -1 = error (errno set, EINTR retried)
int poll_fd(int fd, short events, std::chrono::milliseconds timeout) {
  struct pollfd entry;
  std::memset(&entry, 0, sizeof(entry));
  entry.fd = fd;
  entry.events = events;

  auto deadline = Clock::now() + timeout;
  for (;;) {
    int rc = ::poll(&entry, 1, static_cast<int>(remaining(deadline).count()));
    if (rc < 0 && errno == EINTR) continue;
    if (rc <= 0) return rc;
    if ((entry.revents & (POLLERR | POLLNVAL)) != 0) {
      errno = ECONNRESET;
      return -1;
    }
    return 1;
  }
}

bool write_all(int fd, const uint8_t* data, size_t len) {
  size_t total = 0;
  while (total < len) {
    ssize_t n = ::send(fd, data + total, len - total, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    total += static_cast<size_t>(n);
  }
  return true;
}

} // namespace

// ============================================================================
// TcpLink
// ============================================================================

TcpLink::~TcpLink() {
  close_socket();
}

void TcpLink::close() {
  if (fd_ >= 0) {
    LOG_TRANSPORT_DEBUG("Closing DoIP TCP link to {}:{}", cfg_.host, cfg_.tcp_port);
  }
  close_socket();
}

void TcpLink::close_socket() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  rx_buf_.clear();
  pending_.clear();
}

Result<void> TcpLink::open() {
  close_socket();

  auto r = connect_socket();
  if (!r.ok) return r;

  if (cfg_.routing_activation) {
    r = activate_routing();
    if (!r.ok) {
      close_socket();
      return r;
    }
  }

  LOG_TRANSPORT_INFO("DoIP link up: {}:{} (tester {}, entity {})", cfg_.host, cfg_.tcp_port,
                     format_address(cfg_.source_address), format_address(entity_address_));
  return Result<void>::success();
}

Result<void> TcpLink::connect_socket() {
  struct addrinfo hints;
  std::memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  struct addrinfo* result = nullptr;
  const std::string port_text = std::to_string(cfg_.tcp_port);
  int gai = ::getaddrinfo(cfg_.host.c_str(), port_text.c_str(), &hints, &result);
  if (gai != 0) {
    return Result<void>::failure(Errc::TransportError,
        std::string("getaddrinfo failed: ") + ::gai_strerror(gai));
  }

  std::string error = "failed to connect TCP socket";
  for (struct addrinfo* entry = result; entry != nullptr; entry = entry->ai_next) {
    int fd = ::socket(entry->ai_family, entry->ai_socktype, entry->ai_protocol);
    if (fd < 0) continue;

    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
      ::close(fd);
      continue;
    }

    int rc = ::connect(fd, entry->ai_addr, static_cast<socklen_t>(entry->ai_addrlen));
    if (rc < 0 && errno != EINPROGRESS) {
      error = std::string("connect failed: ") + std::strerror(errno);
      ::close(fd);
      continue;
    }

    if (rc < 0) {
      int ready = poll_fd(fd, POLLOUT, cfg_.connect_timeout);
      if (ready <= 0) {
        error = ready == 0 ? "TCP connect timeout" : std::string("TCP connect error: ") + std::strerror(errno);
        ::close(fd);
        continue;
      }
      int so_error = 0;
      socklen_t so_len = sizeof(so_error);
      if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &so_len) != 0 || so_error != 0) {
        error = std::string("TCP connect error: ") + std::strerror(so_error);
        ::close(fd);
        continue;
      }
    }

    // Back to blocking mode; reads are bounded by poll
    if (::fcntl(fd, F_SETFL, flags) < 0) {
      ::close(fd);
      continue;
    }
    int one = 1;
    if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) != 0) {
      LOG_TRANSPORT_DEBUG("TCP_NODELAY not set: {}", std::strerror(errno));
    }

    fd_ = fd;
    break;
  }
  ::freeaddrinfo(result);

  if (fd_ < 0) {
    LOG_TRANSPORT_WARN("Connect to {}:{} failed: {}", cfg_.host, cfg_.tcp_port, error);
    return Result<void>::failure(Errc::TransportError, error);
  }
  return Result<void>::success();
}

Result<void> TcpLink::activate_routing() {
  auto r = write_message(kRoutingActivationRequest,
                         build_routing_activation_request(cfg_.source_address, cfg_.activation_type));
  if (!r.ok) return r;

  const auto deadline = Clock::now() + cfg_.ack_timeout;
  for (;;) {
    auto msg = read_message(remaining(deadline));
    if (!msg.ok) {
      if (msg.error.code == Errc::Timeout) {
        return Result<void>::failure(Errc::TransportError, "routing activation response timeout");
      }
      return Result<void>::failure(msg.error);
    }

    if (msg.value.payload_type == kAliveCheckRequest) {
      answer_alive_check();
      continue;
    }
    if (msg.value.payload_type == kGenericNack) {
      return Result<void>::failure(Errc::TransportError, "generic NACK during routing activation");
    }
    if (msg.value.payload_type != kRoutingActivationResponse) {
      continue;
    }

    auto ra = parse_routing_activation_response(msg.value.payload);
    if (!ra.ok) {
      return Result<void>::failure(Errc::TransportError, ra.error.message);
    }
    if (ra.value.response_code == kRoutingActivationPending) {
      continue;  // confirmation pending, a final response follows
    }
    if (ra.value.response_code != kRoutingActivationSuccess) {
      return Result<void>::failure(Errc::TransportError,
          std::string("routing activation denied: ") + routing_activation_code_name(ra.value.response_code));
    }
    entity_address_ = ra.value.entity_address;
    return Result<void>::success();
  }
}

Result<void> TcpLink::write_message(uint16_t payload_type, const std::vector<uint8_t>& payload) {
  if (fd_ < 0) {
    return Result<void>::failure(Errc::TransportError, "link not open");
  }
  auto packet = encode_frame(cfg_.protocol_version, payload_type, payload);
  if (!write_all(fd_, packet.data(), packet.size())) {
    return Result<void>::failure(Errc::TransportError, std::string("send failed: ") + std::strerror(errno));
  }
  return Result<void>::success();
}

Result<Message> TcpLink::read_message(std::chrono::milliseconds timeout) {
  if (fd_ < 0) {
    return Result<Message>::failure(Errc::TransportError, "link not open");
  }

  const auto deadline = Clock::now() + timeout;
  uint8_t chunk[4096];

  for (;;) {
    if (rx_buf_.size() >= kHeaderSize) {
      auto hdr = decode_header(rx_buf_.data(), rx_buf_.size());
      if (!hdr.ok) {
        // The stream can not be resynchronized after a bad header
        return Result<Message>::failure(Errc::TransportError, hdr.error.message);
      }
      const size_t total = frame_size(hdr.value);
      if (rx_buf_.size() >= total) {
        Message m;
        m.version = hdr.value.version;
        m.payload_type = hdr.value.payload_type;
        m.payload.assign(rx_buf_.begin() + kHeaderSize, rx_buf_.begin() + total);
        rx_buf_.erase(rx_buf_.begin(), rx_buf_.begin() + total);
        return Result<Message>::success(std::move(m));
      }
    }

    int ready = poll_fd(fd_, POLLIN, remaining(deadline));
    if (ready == 0) {
      return Result<Message>::failure(Errc::Timeout);
    }
    if (ready < 0) {
      return Result<Message>::failure(Errc::TransportError, std::string("poll failed: ") + std::strerror(errno));
    }

    ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
    if (n == 0) {
      return Result<Message>::failure(Errc::TransportError, "connection closed by peer");
    }
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
      return Result<Message>::failure(Errc::TransportError, std::string("recv failed: ") + std::strerror(errno));
    }
    rx_buf_.insert(rx_buf_.end(), chunk, chunk + n);
  }
}

void TcpLink::answer_alive_check() {
  auto r = write_message(kAliveCheckResponse, build_alive_check_response(cfg_.source_address));
  if (!r.ok) {
    LOG_TRANSPORT_WARN("Alive check response failed: {}", r.error.describe());
  }
}

Result<void> TcpLink::send(LogicalAddress target, const std::vector<uint8_t>& payload) {
  auto r = write_message(kDiagnosticMessage, build_diagnostic_message(cfg_.source_address, target, payload));
  if (!r.ok) return r;
  LOG_TRANSPORT_TRACE("TX {} -> {}: {}", format_address(cfg_.source_address), format_address(target),
                      uds::to_hex(payload));

  const auto deadline = Clock::now() + cfg_.ack_timeout;
  for (;;) {
    auto msg = read_message(remaining(deadline));
    if (!msg.ok) {
      if (msg.error.code == Errc::Timeout) {
        return Result<void>::failure(Errc::TransportError, "no diagnostic message acknowledge");
      }
      return Result<void>::failure(msg.error);
    }

    switch (msg.value.payload_type) {
      case kDiagnosticAck:
        return Result<void>::success();

      case kDiagnosticNack: {
        auto ack = parse_diagnostic_ack(msg.value.payload);
        if (!ack.ok) {
          return Result<void>::failure(Errc::TransportError, ack.error.message);
        }
        LOG_TRANSPORT_WARN("Diagnostic NACK for {}: {}", format_address(target),
                           diagnostic_nack_name(ack.value.code));
        return Result<void>::failure(nack_to_errc(ack.value.code),
            std::string("diagnostic NACK: ") + diagnostic_nack_name(ack.value.code));
      }

      case kDiagnosticMessage: {
        auto dm = parse_diagnostic_message(msg.value.payload);
        if (dm.ok) {
          Frame f;
          f.source = dm.value.source;
          f.target = dm.value.target;
          f.payload = std::move(dm.value.user_data);
          pending_.push_back(std::move(f));
        }
        break;
      }

      case kAliveCheckRequest:
        answer_alive_check();
        break;

      case kGenericNack:
        return Result<void>::failure(Errc::TransportError, "generic DoIP NACK");

      default:
        LOG_TRANSPORT_DEBUG("Ignoring payload type 0x{:04X} while waiting for ACK", msg.value.payload_type);
        break;
    }
  }
}

Result<Frame> TcpLink::receive(std::chrono::milliseconds timeout) {
  if (!pending_.empty()) {
    Frame f = std::move(pending_.front());
    pending_.pop_front();
    return Result<Frame>::success(std::move(f));
  }

  const auto deadline = Clock::now() + timeout;
  for (;;) {
    auto msg = read_message(remaining(deadline));
    if (!msg.ok) {
      return Result<Frame>::failure(msg.error);
    }

    switch (msg.value.payload_type) {
      case kDiagnosticMessage: {
        auto dm = parse_diagnostic_message(msg.value.payload);
        if (!dm.ok) {
          LOG_TRANSPORT_WARN("Dropping diagnostic message: {}", dm.error.message);
          break;
        }
        Frame f;
        f.source = dm.value.source;
        f.target = dm.value.target;
        f.payload = std::move(dm.value.user_data);
        return Result<Frame>::success(std::move(f));
      }

      case kAliveCheckRequest:
        answer_alive_check();
        break;

      case kGenericNack:
        return Result<Frame>::failure(Errc::TransportError, "generic DoIP NACK");

      default:
        // Late ACKs and anything else are not frames for the caller
        LOG_TRANSPORT_TRACE("Ignoring payload type 0x{:04X}", msg.value.payload_type);
        break;
    }
  }
}

// ============================================================================
// UdpLink
// ============================================================================

UdpLink::~UdpLink() {
  close();
}

void UdpLink::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

uint16_t UdpLink::local_port() const {
  if (fd_ < 0) return 0;
  struct sockaddr_in addr;
  socklen_t len = sizeof(addr);
  std::memset(&addr, 0, sizeof(addr));
  if (::getsockname(fd_, reinterpret_cast<struct sockaddr*>(&addr), &len) != 0) return 0;
  return ntohs(addr.sin_port);
}

Result<void> UdpLink::broadcast(uint16_t port, const std::vector<uint8_t>& bytes) {
  return send_to(broadcast_address_, port, bytes);
}

Result<void> UdpLink::send_to(const std::string& ip, uint16_t port, const std::vector<uint8_t>& bytes) {
  if (fd_ < 0) {
    return Result<void>::failure(Errc::TransportError, "socket closed");
  }

  struct sockaddr_in dest;
  std::memset(&dest, 0, sizeof(dest));
  dest.sin_family = AF_INET;
  dest.sin_port = htons(port);
  if (::inet_pton(AF_INET, ip.c_str(), &dest.sin_addr) != 1) {
    return Result<void>::failure(Errc::AddressRejected, "invalid IPv4 address: " + ip);
  }

  ssize_t n = ::sendto(fd_, bytes.data(), bytes.size(), 0,
                       reinterpret_cast<const struct sockaddr*>(&dest), sizeof(dest));
  if (n < 0 || static_cast<size_t>(n) != bytes.size()) {
    return Result<void>::failure(Errc::TransportError, std::string("sendto failed: ") + std::strerror(errno));
  }
  return Result<void>::success();
}

Result<Datagram> UdpLink::receive(std::chrono::milliseconds timeout) {
  if (fd_ < 0) {
    return Result<Datagram>::failure(Errc::TransportError, "socket closed");
  }

  int ready = poll_fd(fd_, POLLIN, timeout);
  if (ready == 0) {
    return Result<Datagram>::failure(Errc::Timeout);
  }
  if (ready < 0) {
    return Result<Datagram>::failure(Errc::TransportError, std::string("poll failed: ") + std::strerror(errno));
  }

  std::vector<uint8_t> buf(65535);
  struct sockaddr_in from;
  socklen_t from_len = sizeof(from);
  std::memset(&from, 0, sizeof(from));
  ssize_t n = ::recvfrom(fd_, buf.data(), buf.size(), 0,
                         reinterpret_cast<struct sockaddr*>(&from), &from_len);
  if (n < 0) {
    if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
      return Result<Datagram>::failure(Errc::Timeout);
    }
    return Result<Datagram>::failure(Errc::TransportError, std::string("recvfrom failed: ") + std::strerror(errno));
  }

  char ip[INET_ADDRSTRLEN] = {0};
  ::inet_ntop(AF_INET, &from.sin_addr, ip, sizeof(ip));

  Datagram d;
  d.source_ip = ip;
  d.source_port = ntohs(from.sin_port);
  buf.resize(static_cast<size_t>(n));
  d.bytes = std::move(buf);
  return Result<Datagram>::success(std::move(d));
}

// ============================================================================
// UdpLinkFactory
// ============================================================================

Result<std::unique_ptr<UdpLink>> UdpLinkFactory::open_udp(uint16_t bind_port) {
  int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (fd < 0) {
    return Result<std::unique_ptr<UdpLink>>::failure(Errc::TransportError,
        std::string("socket failed: ") + std::strerror(errno));
  }

  int enabled = 1;
  if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &enabled, sizeof(enabled)) != 0 ||
      ::setsockopt(fd, SOL_SOCKET, SO_BROADCAST, &enabled, sizeof(enabled)) != 0) {
    std::string err = std::string("setsockopt failed: ") + std::strerror(errno);
    ::close(fd);
    return Result<std::unique_ptr<UdpLink>>::failure(Errc::TransportError, err);
  }

  struct sockaddr_in local;
  std::memset(&local, 0, sizeof(local));
  local.sin_family = AF_INET;
  local.sin_addr.s_addr = htonl(INADDR_ANY);
  local.sin_port = htons(bind_port);
  if (::bind(fd, reinterpret_cast<struct sockaddr*>(&local), sizeof(local)) != 0) {
    std::string err = "bind to UDP port " + std::to_string(bind_port) + " failed: " + std::strerror(errno);
    ::close(fd);
    LOG_TRANSPORT_WARN("{}", err);
    return Result<std::unique_ptr<UdpLink>>::failure(Errc::TransportError, err);
  }

  LOG_TRANSPORT_DEBUG("UDP socket bound to port {}", bind_port);
  return Result<std::unique_ptr<UdpLink>>::success(std::make_unique<UdpLink>(fd, broadcast_address_));
}

Result<std::unique_ptr<DatagramLink>> UdpLinkFactory::open(uint16_t bind_port) {
  auto r = open_udp(bind_port);
  if (!r.ok) {
    return Result<std::unique_ptr<DatagramLink>>::failure(r.error);
  }
  return Result<std::unique_ptr<DatagramLink>>::success(std::move(r.value));
}

} // namespace doip
} // namespace udsonip
