#include "client.hpp"
#include "doip_socket.hpp"
#include "logging.hpp"

namespace udsonip {

Result<std::unique_ptr<DiagClient>> DiagClient::connect(LinkConfig link, LogicalAddress ecu,
                                                        BridgeConfig bridge) {
  using R = Result<std::unique_ptr<DiagClient>>;

  bridge.initial_target = ecu;
  bridge.source_address = link.source_address;
  const std::string where = link.host + ":" + format_address(ecu);

  auto b = std::make_unique<ConnectionBridge>(std::make_unique<doip::TcpLink>(std::move(link)),
                                              std::make_unique<uds::UdsCodec>(), bridge);
  if (b->current_target() != std::optional<LogicalAddress>(ecu)) {
    return R::failure(Errc::AddressRejected, format_address(ecu) + " rejected by bridge policy");
  }

  auto r = b->open();
  if (!r.ok) {
    LOG_ERROR("Failed to connect to {}: {}", where, r.error.describe());
    return R::failure(r.error);
  }
  return R::success(std::make_unique<DiagClient>(std::move(b)));
}

DiagClient::DiagClient(std::unique_ptr<ConnectionBridge> bridge)
  : bridge_(std::move(bridge)), uds_(*bridge_, bridge_->config().timings) {}

DiagClient::~DiagClient() {
  close();
}

void DiagClient::close() {
  bridge_->close();
}

Result<uds::ServiceResponse> DiagClient::tester_present(bool suppress_response) {
  return uds_.tester_present(suppress_response);
}

Result<uds::ServiceResponse> DiagClient::read_data_by_identifier(uds::DID did) {
  return uds_.read_data_by_identifier(did);
}

Result<uds::ServiceResponse> DiagClient::write_data_by_identifier(uds::DID did, const std::vector<uint8_t>& data) {
  return uds_.write_data_by_identifier(did, data);
}

Result<uds::ServiceResponse> DiagClient::read_dtc_information(uint8_t status_mask) {
  return uds_.read_dtc_by_status_mask(status_mask);
}

Result<uds::ServiceResponse> DiagClient::clear_dtc(uint32_t group) {
  return uds_.clear_diagnostic_information(group);
}

Result<uds::ServiceResponse> DiagClient::ecu_reset(uds::EcuResetType type) {
  return uds_.ecu_reset(type);
}

Result<uds::ServiceResponse> DiagClient::change_session(uds::Session session) {
  auto r = uds_.diagnostic_session_control(session);
  if (r.ok) {
    // Server timings from the session response apply to later requests
    bridge_->set_timings(uds_.timings());
  }
  return r;
}

Result<uds::ServiceResponse> DiagClient::security_access(uint8_t level,
                                                         const std::optional<std::vector<uint8_t>>& key) {
  if (!key) {
    return uds_.security_access_request_seed(level);
  }
  return uds_.security_access_send_key(level, *key);
}

Result<uds::ServiceResponse> DiagClient::routine_control(uds::RoutineId id, uds::RoutineAction action,
                                                         const std::vector<uint8_t>& data) {
  return uds_.routine_control(action, id, data);
}

} // namespace udsonip
