/*
  Example: several ECUs behind one gateway connection

  Registers named peers on a single ConnectionBridge and talks to each of
  them inside a PeerScope. The TCP connection and routing activation are
  set up once.

  Usage: multi_ecu <gateway-ip>
*/

#include "doip_socket.hpp"
#include "logging.hpp"
#include "peer_registry.hpp"
#include <iostream>
#include <string>

using namespace udsonip;

namespace {

void print_vin(uds::Client& client) {
  auto r = client.read_data_by_identifier(0xF190);
  if (r && r.value.payload.size() > 2) {
    std::cout << "  VIN: " << std::string(r.value.payload.begin() + 2, r.value.payload.end()) << std::endl;
  } else {
    std::cout << "  VIN: " << r.error.describe() << std::endl;
  }
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "usage: " << argv[0] << " <gateway-ip>" << std::endl;
    return 1;
  }
  util::LogManager::Initialize("info");

  LinkConfig link;
  link.host = argv[1];
  ConnectionBridge bridge(std::make_unique<doip::TcpLink>(link), std::make_unique<uds::UdsCodec>());
  auto opened = bridge.open();
  if (!opened) {
    std::cerr << "Connect failed: " << opened.error.describe() << std::endl;
    return 1;
  }

  PeerRegistry registry(bridge);
  registry.register_peer("engine", 0x00E0);
  registry.register_peer("transmission", 0x00E1);
  registry.register_peer("abs", 0x00E2);
  registry.register_peer("airbag", 0x00E3);

  std::cout << "Registered ECUs:" << std::endl;
  for (const auto& peer : registry.peers()) {
    std::cout << "  - " << peer.name << ": " << format_address(peer.address) << std::endl;
  }

  const auto wait = std::chrono::seconds(2);

  std::cout << std::endl << "=== Engine ECU ===" << std::endl;
  {
    auto scope = registry.scope("engine", wait);
    if (scope) {
      uds::Client client(scope.value);
      print_vin(client);
      auto sw = client.read_data_by_identifier(0xF195);
      if (sw) std::cout << "  Software: " << uds::to_hex(sw.value.payload) << std::endl;
    }
  }

  std::cout << std::endl << "=== Transmission ECU ===" << std::endl;
  {
    auto scope = registry.scope("transmission", wait);
    if (scope) {
      uds::Client client(scope.value);
      print_vin(client);
    }
  }

  std::cout << std::endl << "=== ABS ECU ===" << std::endl;
  {
    auto scope = registry.scope("abs", wait);
    if (scope) {
      uds::Client client(scope.value);
      auto tp = client.tester_present();
      std::cout << "  TesterPresent: " << (tp ? "OK" : tp.error.describe()) << std::endl;
      auto dtcs = client.read_dtc_by_status_mask(0xFF);
      if (dtcs) std::cout << "  DTCs: " << uds::to_hex(dtcs.value.payload) << std::endl;
    }
  }

  bridge.close();
  std::cout << std::endl << "All connections closed" << std::endl;
  return 0;
}
