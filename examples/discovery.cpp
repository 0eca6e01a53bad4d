/*
  Example: finding DoIP entities on the local network

  Broadcasts a vehicle identification request, listens for announcements
  and connects to the first entity found. An optional CIDR block switches
  to a unicast scan.

  Usage: discovery [cidr]
*/

#include "discovery.hpp"
#include "logging.hpp"
#include <iostream>

using namespace udsonip;

int main(int argc, char** argv) {
  util::LogManager::Initialize("info");

  DiscoveryEngine engine;
  auto found = argc > 1 ? engine.scan(argv[1], std::chrono::seconds(3))
                        : engine.discover(std::chrono::seconds(2));
  if (!found) {
    std::cerr << "Discovery failed: " << found.error.describe() << std::endl;
    return 1;
  }

  std::cout << "Found " << found.value.size() << " DoIP entit" << (found.value.size() == 1 ? "y" : "ies")
            << std::endl;
  for (const auto& rec : found.value) {
    std::cout << "  " << rec.describe() << "  VIN " << rec.vin << "  (" << to_string(rec.origin) << ")"
              << std::endl;
  }
  if (found.value.empty()) {
    return 0;
  }

  const DiscoveryRecord& first = found.value.front();
  auto bridge = first.connect();
  if (!bridge) {
    std::cerr << "Connect to " << first.describe() << " failed: " << bridge.error.describe() << std::endl;
    return 1;
  }

  uds::Client client(*bridge.value);
  auto tp = client.tester_present();
  std::cout << "TesterPresent to " << first.describe() << ": " << (tp ? "OK" : tp.error.describe()) << std::endl;
  bridge.value->close();
  return 0;
}
