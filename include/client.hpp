#ifndef UDSONIP_CLIENT_HPP
#define UDSONIP_CLIENT_HPP

/**
 * @file client.hpp
 * @brief Single-ECU convenience client: one gateway, one current target
 *
 * Example:
 *   LinkConfig link;
 *   link.host = "192.168.1.10";
 *   auto client = DiagClient::connect(link, 0x00E0);
 *   if (client) {
 *     auto vin = client.value->read_data_by_identifier(0xF190);
 *     client.value->set_target_address(0x00E1);   // same TCP connection
 *     client.value->tester_present();
 *   }
 *
 * For several ECUs used from several threads use PeerRegistry instead.
 */

#include <chrono>
#include <memory>
#include <optional>
#include <vector>
#include "config.hpp"
#include "connection_bridge.hpp"
#include "uds.hpp"
#include "udsonip.hpp"

namespace udsonip {

class DiagClient {
public:
  // Open a DoIP TCP link to link.host and target ecu
  static Result<std::unique_ptr<DiagClient>> connect(LinkConfig link, LogicalAddress ecu,
                                                     BridgeConfig bridge = {});

  // Wrap an existing bridge (opened or not)
  explicit DiagClient(std::unique_ptr<ConnectionBridge> bridge);
  ~DiagClient();

  DiagClient(const DiagClient&) = delete;
  DiagClient& operator=(const DiagClient&) = delete;

  std::optional<LogicalAddress> target_address() const { return bridge_->current_target(); }
  Result<void> set_target_address(LogicalAddress address) { return bridge_->retarget(address); }

  ConnectionBridge& bridge() { return *bridge_; }
  uds::Client& uds() { return uds_; }

  // Common services
  Result<uds::ServiceResponse> tester_present(bool suppress_response = false);
  Result<uds::ServiceResponse> read_data_by_identifier(uds::DID did);
  Result<uds::ServiceResponse> write_data_by_identifier(uds::DID did, const std::vector<uint8_t>& data);
  Result<uds::ServiceResponse> read_dtc_information(uint8_t status_mask = 0xFF);
  Result<uds::ServiceResponse> clear_dtc(uint32_t group = 0xFFFFFF);
  Result<uds::ServiceResponse> ecu_reset(uds::EcuResetType type = uds::EcuResetType::HardReset);
  Result<uds::ServiceResponse> change_session(uds::Session session);

  // Seed request without a key, key transfer with one
  Result<uds::ServiceResponse> security_access(uint8_t level,
                                               const std::optional<std::vector<uint8_t>>& key = std::nullopt);

  Result<uds::ServiceResponse> routine_control(uds::RoutineId id,
                                               uds::RoutineAction action = uds::RoutineAction::Start,
                                               const std::vector<uint8_t>& data = {});

  void close();

private:
  std::unique_ptr<ConnectionBridge> bridge_;
  uds::Client uds_;
};

} // namespace udsonip

#endif // UDSONIP_CLIENT_HPP
