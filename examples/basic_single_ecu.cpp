/*
  Example: one gateway, one ECU

  Connects to a DoIP gateway, reads the VIN and the active session from the
  engine ECU and keeps the session alive with TesterPresent.

  Usage: basic_single_ecu <gateway-ip> [ecu-address]
*/

#include "client.hpp"
#include "logging.hpp"
#include <cstdlib>
#include <iostream>
#include <string>

using namespace udsonip;

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "usage: " << argv[0] << " <gateway-ip> [ecu-address]" << std::endl;
    return 1;
  }
  util::LogManager::Initialize("info");

  LinkConfig link;
  link.host = argv[1];
  const LogicalAddress ecu = argc > 2 ? static_cast<LogicalAddress>(std::strtoul(argv[2], nullptr, 0)) : 0x00E0;

  auto client = DiagClient::connect(link, ecu);
  if (!client) {
    std::cerr << "Connect failed: " << client.error.describe() << std::endl;
    return 1;
  }
  DiagClient& ecu_client = *client.value;

  std::cout << "=== Connected to " << link.host << " @ " << format_address(ecu) << " ===" << std::endl;

  auto vin = ecu_client.read_data_by_identifier(0xF190);
  if (vin && vin.value.payload.size() > 2) {
    std::cout << "VIN: " << std::string(vin.value.payload.begin() + 2, vin.value.payload.end()) << std::endl;
  } else {
    std::cout << "VIN read failed: " << vin.error.describe() << std::endl;
  }

  auto session = ecu_client.read_data_by_identifier(0xF186);
  if (session) {
    std::cout << "Active session: " << uds::to_hex(session.value.payload) << std::endl;
  }

  auto tp = ecu_client.tester_present();
  std::cout << "TesterPresent: " << (tp ? "OK" : tp.error.describe()) << std::endl;

  ecu_client.close();
  std::cout << "Connection closed" << std::endl;
  return 0;
}
