/**
 * @file loopback_test.cpp
 * @brief Real sockets against an in-process DoIP gateway on 127.0.0.1
 */

#include <gtest/gtest.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <atomic>
#include <cstring>
#include <thread>
#include "client.hpp"
#include "connection_bridge.hpp"
#include "discovery.hpp"
#include "doip.hpp"
#include "doip_socket.hpp"

using namespace udsonip;
using std::chrono::milliseconds;

namespace {

constexpr LogicalAddress kGatewayAddress = 0x1000;
constexpr LogicalAddress kUnknownEcu = 0x0FFF;

struct GatewayOptions {
  bool deny_routing = false;
  bool response_before_ack = false;
  bool alive_check_first = false;
  bool close_after_ack = false;
};

// Minimal DoIP gateway: one TCP client at a time plus a UDP vehicle
// identification responder. Every diagnostic request is echoed back as a
// positive response from its target.
class LoopbackGateway {
public:
  explicit LoopbackGateway(GatewayOptions opts = GatewayOptions()) : opts_(opts) {
    tcp_fd_ = bind_socket(SOCK_STREAM, tcp_port_);
    if (tcp_fd_ >= 0 && ::listen(tcp_fd_, 4) != 0) {
      ::close(tcp_fd_);
      tcp_fd_ = -1;
    }
    udp_fd_ = bind_socket(SOCK_DGRAM, udp_port_);
    if (ok()) {
      thread_ = std::thread([this] { run(); });
    }
  }

  ~LoopbackGateway() {
    stop_ = true;
    if (thread_.joinable()) thread_.join();
    if (tcp_fd_ >= 0) ::close(tcp_fd_);
    if (udp_fd_ >= 0) ::close(udp_fd_);
  }

  bool ok() const { return tcp_fd_ >= 0 && udp_fd_ >= 0; }
  uint16_t tcp_port() const { return tcp_port_; }
  uint16_t udp_port() const { return udp_port_; }
  int alive_answers() const { return alive_answers_.load(); }

  LinkConfig link_config() const {
    LinkConfig cfg;
    cfg.host = "127.0.0.1";
    cfg.tcp_port = tcp_port_;
    cfg.connect_timeout = milliseconds(1000);
    cfg.ack_timeout = milliseconds(1000);
    return cfg;
  }

private:
  static int bind_socket(int type, uint16_t& port) {
    int fd = ::socket(AF_INET, type, 0);
    if (fd < 0) return -1;
    int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    socklen_t len = sizeof(addr);
    if (::bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0 ||
        ::getsockname(fd, reinterpret_cast<struct sockaddr*>(&addr), &len) != 0) {
      ::close(fd);
      return -1;
    }
    port = ntohs(addr.sin_port);
    return fd;
  }

  static void send_frame(int fd, uint16_t type, const std::vector<uint8_t>& payload) {
    auto bytes = doip::encode_frame(0x02, type, payload);
    ::send(fd, bytes.data(), bytes.size(), MSG_NOSIGNAL);
  }

  void run() {
    while (!stop_) {
      struct pollfd fds[2];
      fds[0].fd = tcp_fd_;
      fds[0].events = POLLIN;
      fds[0].revents = 0;
      fds[1].fd = udp_fd_;
      fds[1].events = POLLIN;
      fds[1].revents = 0;
      if (::poll(fds, 2, 20) <= 0) continue;

      if (fds[1].revents & POLLIN) answer_datagram();
      if (fds[0].revents & POLLIN) {
        int client = ::accept(tcp_fd_, nullptr, nullptr);
        if (client >= 0) {
          serve(client);
          ::close(client);
        }
      }
    }
  }

  void answer_datagram() {
    uint8_t buf[512];
    struct sockaddr_in from;
    socklen_t len = sizeof(from);
    ssize_t n = ::recvfrom(udp_fd_, buf, sizeof(buf), 0, reinterpret_cast<struct sockaddr*>(&from), &len);
    if (n <= 0) return;
    auto msg = doip::decode_frame(std::vector<uint8_t>(buf, buf + n));
    if (!msg.ok || msg.value.payload_type != doip::kVehicleIdentificationRequest) return;

    doip::VehicleIdentification info;
    info.vin = "WVWZZZ1JZXW000001";
    info.logical_address = kGatewayAddress;
    info.eid = {0x02, 0x00, 0x00, 0x00, 0x00, 0x01};
    auto reply = doip::encode_frame(0x02, doip::kVehicleIdentificationResponse,
                                    doip::build_vehicle_identification(info));
    ::sendto(udp_fd_, reply.data(), reply.size(), 0, reinterpret_cast<struct sockaddr*>(&from), len);
  }

  // Returns when the client disconnects, on stop, or when the options say so
  void serve(int fd) {
    std::vector<uint8_t> rx;
    uint8_t chunk[1024];
    while (!stop_) {
      struct pollfd p;
      p.fd = fd;
      p.events = POLLIN;
      p.revents = 0;
      if (::poll(&p, 1, 20) <= 0) continue;
      ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
      if (n <= 0) return;
      rx.insert(rx.end(), chunk, chunk + n);

      while (rx.size() >= doip::kHeaderSize) {
        auto hdr = doip::decode_header(rx.data(), rx.size());
        if (!hdr.ok) return;
        const size_t total = doip::frame_size(hdr.value);
        if (rx.size() < total) break;
        std::vector<uint8_t> payload(rx.begin() + doip::kHeaderSize, rx.begin() + total);
        rx.erase(rx.begin(), rx.begin() + total);
        if (!handle(fd, hdr.value.payload_type, payload)) return;
      }
    }
  }

  bool handle(int fd, uint16_t type, const std::vector<uint8_t>& payload) {
    switch (type) {
      case doip::kRoutingActivationRequest: {
        doip::RoutingActivationResult ra;
        ra.tester_address = static_cast<LogicalAddress>((payload[0] << 8) | payload[1]);
        ra.entity_address = kGatewayAddress;
        ra.response_code = opts_.deny_routing ? 0x06 : doip::kRoutingActivationSuccess;
        send_frame(fd, doip::kRoutingActivationResponse, doip::build_routing_activation_response(ra));
        return !opts_.deny_routing;
      }

      case doip::kAliveCheckResponse:
        ++alive_answers_;
        return true;

      case doip::kDiagnosticMessage: {
        auto dm = doip::parse_diagnostic_message(payload);
        if (!dm.ok) return false;
        if (dm.value.target == kUnknownEcu) {
          send_frame(fd, doip::kDiagnosticNack,
                     doip::build_diagnostic_ack(dm.value.target, dm.value.source, doip::kNackUnknownTargetAddress));
          return true;
        }

        std::vector<uint8_t> reply = dm.value.user_data;
        if (!reply.empty()) reply[0] = static_cast<uint8_t>(reply[0] + 0x40);
        const auto response = doip::build_diagnostic_message(dm.value.target, dm.value.source, reply);
        const auto ack = doip::build_diagnostic_ack(dm.value.target, dm.value.source, 0x00);

        if (opts_.alive_check_first) {
          send_frame(fd, doip::kAliveCheckRequest, {});
        }
        if (opts_.response_before_ack) {
          send_frame(fd, doip::kDiagnosticMessage, response);
          send_frame(fd, doip::kDiagnosticAck, ack);
          return true;
        }
        send_frame(fd, doip::kDiagnosticAck, ack);
        if (opts_.close_after_ack) return false;
        send_frame(fd, doip::kDiagnosticMessage, response);
        return true;
      }

      default:
        return true;
    }
  }

  GatewayOptions opts_;
  int tcp_fd_{-1};
  int udp_fd_{-1};
  uint16_t tcp_port_{0};
  uint16_t udp_port_{0};
  std::atomic<bool> stop_{false};
  std::atomic<int> alive_answers_{0};
  std::thread thread_;
};

uds::ServiceRequest make_request(uint8_t sid, std::vector<uint8_t> payload) {
  uds::ServiceRequest req;
  req.sid = sid;
  req.payload = std::move(payload);
  return req;
}

std::unique_ptr<ConnectionBridge> make_bridge(const LoopbackGateway& gw, LogicalAddress target = 0x00E0) {
  BridgeConfig cfg;
  cfg.initial_target = target;
  return std::make_unique<ConnectionBridge>(std::make_unique<doip::TcpLink>(gw.link_config()),
                                            std::make_unique<uds::UdsCodec>(), cfg);
}

GatewayOptions with(bool GatewayOptions::*flag) {
  GatewayOptions o;
  o.*flag = true;
  return o;
}

} // namespace

// ============================================================================
// TCP
// ============================================================================

TEST(LoopbackTest, TcpLinkActivatesRouting) {
  LoopbackGateway gw;
  ASSERT_TRUE(gw.ok());

  doip::TcpLink link(gw.link_config());
  auto r = link.open();
  ASSERT_TRUE(r.ok) << r.error.describe();
  EXPECT_TRUE(link.is_open());
  EXPECT_EQ(link.entity_address(), kGatewayAddress);

  ASSERT_TRUE(link.send(0x00E0, {0x3E, 0x00}).ok);
  auto f = link.receive(milliseconds(1000));
  ASSERT_TRUE(f.ok) << f.error.describe();
  EXPECT_EQ(f.value.source, 0x00E0);
  EXPECT_EQ(f.value.target, kDefaultTesterAddress);
  EXPECT_EQ(f.value.payload, (std::vector<uint8_t>{0x7E, 0x00}));

  EXPECT_EQ(link.receive(milliseconds(20)).error.code, Errc::Timeout);
  link.close();
  EXPECT_FALSE(link.is_open());
}

TEST(LoopbackTest, RoutingActivationDenied) {
  LoopbackGateway gw(with(&GatewayOptions::deny_routing));
  ASSERT_TRUE(gw.ok());

  doip::TcpLink link(gw.link_config());
  auto r = link.open();
  EXPECT_EQ(r.error.code, Errc::TransportError);
  EXPECT_FALSE(link.is_open());
}

TEST(LoopbackTest, ConnectionRefused) {
  LinkConfig cfg;
  cfg.host = "127.0.0.1";
  cfg.tcp_port = 1;
  cfg.connect_timeout = milliseconds(500);
  doip::TcpLink link(cfg);
  EXPECT_EQ(link.open().error.code, Errc::TransportError);
}

TEST(LoopbackTest, BridgeRequestAndRetarget) {
  LoopbackGateway gw;
  ASSERT_TRUE(gw.ok());
  auto bridge = make_bridge(gw);
  ASSERT_TRUE(bridge->open().ok);

  auto r = bridge->request(make_request(0x22, {0xF1, 0x90}), milliseconds(1000));
  ASSERT_TRUE(r.ok) << r.error.describe();
  EXPECT_EQ(r.value.sid, 0x22);

  ASSERT_TRUE(bridge->retarget(0x00E1).ok);
  EXPECT_TRUE(bridge->request(make_request(0x3E, {0x00}), milliseconds(1000)).ok);
}

TEST(LoopbackTest, DiagnosticNackIsAddressRejected) {
  LoopbackGateway gw;
  ASSERT_TRUE(gw.ok());
  auto bridge = make_bridge(gw, kUnknownEcu);
  ASSERT_TRUE(bridge->open().ok);

  auto r = bridge->request(make_request(0x3E, {0x00}), milliseconds(1000));
  EXPECT_EQ(r.error.code, Errc::AddressRejected);
  EXPECT_EQ(bridge->state(), ConnectionState::Idle);

  ASSERT_TRUE(bridge->retarget(0x00E0).ok);
  EXPECT_TRUE(bridge->request(make_request(0x3E, {0x00}), milliseconds(1000)).ok);
}

TEST(LoopbackTest, ResponseBeforeAcknowledge) {
  LoopbackGateway gw(with(&GatewayOptions::response_before_ack));
  ASSERT_TRUE(gw.ok());
  auto bridge = make_bridge(gw);
  ASSERT_TRUE(bridge->open().ok);

  auto r = bridge->request(make_request(0x22, {0xF1, 0x90}), milliseconds(1000));
  ASSERT_TRUE(r.ok) << r.error.describe();
  EXPECT_EQ(r.value.payload, (std::vector<uint8_t>{0xF1, 0x90}));
}

TEST(LoopbackTest, AliveCheckIsAnswered) {
  LoopbackGateway gw(with(&GatewayOptions::alive_check_first));
  ASSERT_TRUE(gw.ok());
  auto bridge = make_bridge(gw);
  ASSERT_TRUE(bridge->open().ok);
  ASSERT_TRUE(bridge->request(make_request(0x3E, {0x00}), milliseconds(1000)).ok);

  auto deadline = std::chrono::steady_clock::now() + milliseconds(1000);
  while (gw.alive_answers() == 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(milliseconds(5));
  }
  EXPECT_EQ(gw.alive_answers(), 1);
}

TEST(LoopbackTest, PeerCloseMovesBridgeToError) {
  LoopbackGateway gw(with(&GatewayOptions::close_after_ack));
  ASSERT_TRUE(gw.ok());
  auto bridge = make_bridge(gw);
  ASSERT_TRUE(bridge->open().ok);

  auto r = bridge->request(make_request(0x3E, {0x00}), milliseconds(1000));
  EXPECT_EQ(r.error.code, Errc::TransportError);
  EXPECT_EQ(bridge->state(), ConnectionState::Error);
  EXPECT_EQ(bridge->request(make_request(0x3E, {0x00}), milliseconds(100)).error.code, Errc::NotConnected);
}

TEST(LoopbackTest, DiagClientConnect) {
  LoopbackGateway gw;
  ASSERT_TRUE(gw.ok());

  auto client = DiagClient::connect(gw.link_config(), 0x00E0);
  ASSERT_TRUE(client.ok) << client.error.describe();
  EXPECT_TRUE(client.value->read_data_by_identifier(0xF190).ok);
  EXPECT_TRUE(client.value->tester_present().ok);
  client.value->close();
}

TEST(LoopbackTest, DiagClientConnectFailure) {
  LoopbackGateway gw(with(&GatewayOptions::deny_routing));
  ASSERT_TRUE(gw.ok());
  auto client = DiagClient::connect(gw.link_config(), 0x00E0);
  EXPECT_EQ(client.error.code, Errc::TransportError);
}

// ============================================================================
// UDP
// ============================================================================

TEST(LoopbackTest, UdpLinkExchange) {
  LoopbackGateway gw;
  ASSERT_TRUE(gw.ok());

  doip::UdpLinkFactory factory("127.0.0.1");
  auto sock = factory.open_udp(0);
  ASSERT_TRUE(sock.ok) << sock.error.describe();
  EXPECT_NE(sock.value->local_port(), 0);

  ASSERT_TRUE(sock.value->broadcast(gw.udp_port(), doip::build_vehicle_identification_request(0x02)).ok);
  auto d = sock.value->receive(milliseconds(1000));
  ASSERT_TRUE(d.ok) << d.error.describe();
  EXPECT_EQ(d.value.source_ip, "127.0.0.1");
  EXPECT_EQ(d.value.source_port, gw.udp_port());

  EXPECT_EQ(sock.value->send_to("not-an-ip", gw.udp_port(), {0x00}).error.code, Errc::AddressRejected);
  sock.value->close();
  EXPECT_EQ(sock.value->receive(milliseconds(10)).error.code, Errc::TransportError);
}

TEST(LoopbackTest, DiscoverAndConnect) {
  LoopbackGateway gw;
  ASSERT_TRUE(gw.ok());

  DiscoveryConfig cfg;
  cfg.broadcast_address = "127.0.0.1";
  cfg.discovery_port = gw.udp_port();
  cfg.announcement_port = 0;
  DiscoveryEngine engine(cfg);

  auto found = engine.discover(milliseconds(300));
  ASSERT_TRUE(found.ok) << found.error.describe();
  ASSERT_EQ(found.value.size(), 1u);
  const DiscoveryRecord& rec = found.value[0];
  EXPECT_EQ(rec.source_ip, "127.0.0.1");
  EXPECT_EQ(rec.logical_address, kGatewayAddress);
  EXPECT_EQ(rec.vin, "WVWZZZ1JZXW000001");
  EXPECT_EQ(rec.origin, DiscoveryOrigin::Response);

  LinkConfig link = gw.link_config();
  auto bridge = rec.connect(link);
  ASSERT_TRUE(bridge.ok) << bridge.error.describe();
  EXPECT_EQ(bridge.value->current_target(), std::optional<LogicalAddress>(kGatewayAddress));
  EXPECT_TRUE(bridge.value->request(make_request(0x3E, {0x00}), milliseconds(1000)).ok);
}

TEST(LoopbackTest, QueryEntity) {
  LoopbackGateway gw;
  ASSERT_TRUE(gw.ok());

  DiscoveryConfig cfg;
  cfg.discovery_port = gw.udp_port();
  DiscoveryEngine engine(cfg);

  auto rec = engine.query_entity("127.0.0.1", milliseconds(1000));
  ASSERT_TRUE(rec.ok) << rec.error.describe();
  EXPECT_EQ(rec.value.logical_address, kGatewayAddress);
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
