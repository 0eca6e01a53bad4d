/*
  Example: switching the target ECU on a live connection

  Uses a single DiagClient and moves its target between ECUs without
  reconnecting, then scans an address range for ECUs that answer
  TesterPresent.

  Usage: dynamic_switching <gateway-ip>
*/

#include "client.hpp"
#include "logging.hpp"
#include <iostream>
#include <vector>

using namespace udsonip;

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "usage: " << argv[0] << " <gateway-ip>" << std::endl;
    return 1;
  }
  util::LogManager::Initialize("warn");

  LinkConfig link;
  link.host = argv[1];
  auto connected = DiagClient::connect(link, 0x00E0);
  if (!connected) {
    std::cerr << "Connect failed: " << connected.error.describe() << std::endl;
    return 1;
  }
  DiagClient& client = *connected.value;

  for (LogicalAddress ecu : {0x00E0, 0x00E1, 0x00E2}) {
    auto r = client.set_target_address(ecu);
    if (!r) {
      std::cout << format_address(ecu) << ": " << r.error.describe() << std::endl;
      continue;
    }
    auto vin = client.read_data_by_identifier(0xF190);
    std::cout << format_address(ecu) << ": "
              << (vin ? uds::to_hex(vin.value.payload) : vin.error.describe()) << std::endl;
  }

  std::cout << std::endl << "=== Scanning 0x00E0-0x00EF ===" << std::endl;
  std::vector<LogicalAddress> alive;
  for (LogicalAddress ecu = 0x00E0; ecu <= 0x00EF; ++ecu) {
    if (!client.set_target_address(ecu)) continue;
    uds::ServiceRequest req;
    req.sid = static_cast<uint8_t>(uds::SID::TesterPresent);
    req.payload = {0x00};
    if (client.bridge().request(req, std::chrono::milliseconds(200))) {
      alive.push_back(ecu);
    }
  }
  for (LogicalAddress ecu : alive) {
    std::cout << "  " << format_address(ecu) << " responds" << std::endl;
  }
  std::cout << alive.size() << " ECU(s) found" << std::endl;

  client.close();
  return 0;
}
