#include "uds.hpp"
#include <cstdio>
#include <thread>

namespace udsonip {
namespace uds {

static inline void sleep_for_min_gap(const Timings& t){ if (t.req_gap.count()>0) std::this_thread::sleep_for(t.req_gap); }

const char* nrc_name(uint8_t code) {
  switch (static_cast<NegativeResponseCode>(code)) {
    case NegativeResponseCode::GeneralReject:                  return "generalReject";
    case NegativeResponseCode::ServiceNotSupported:            return "serviceNotSupported";
    case NegativeResponseCode::SubFunctionNotSupported:        return "subFunctionNotSupported";
    case NegativeResponseCode::IncorrectMessageLengthOrFormat: return "incorrectMessageLengthOrInvalidFormat";
    case NegativeResponseCode::ResponseTooLong:                return "responseTooLong";
    case NegativeResponseCode::BusyRepeatRequest:              return "busyRepeatRequest";
    case NegativeResponseCode::ConditionsNotCorrect:           return "conditionsNotCorrect";
    case NegativeResponseCode::RequestSequenceError:           return "requestSequenceError";
    case NegativeResponseCode::NoResponseFromSubnetComponent:  return "noResponseFromSubnetComponent";
    case NegativeResponseCode::FailurePreventsExecution:       return "failurePreventsExecutionOfRequestedAction";
    case NegativeResponseCode::RequestOutOfRange:              return "requestOutOfRange";
    case NegativeResponseCode::SecurityAccessDenied:           return "securityAccessDenied";
    case NegativeResponseCode::InvalidKey:                     return "invalidKey";
    case NegativeResponseCode::ExceededNumberOfAttempts:       return "exceededNumberOfAttempts";
    case NegativeResponseCode::RequiredTimeDelayNotExpired:    return "requiredTimeDelayNotExpired";
    case NegativeResponseCode::UploadDownloadNotAccepted:      return "uploadDownloadNotAccepted";
    case NegativeResponseCode::TransferDataSuspended:          return "transferDataSuspended";
    case NegativeResponseCode::GeneralProgrammingFailure:      return "generalProgrammingFailure";
    case NegativeResponseCode::WrongBlockSequenceCounter:      return "wrongBlockSequenceCounter";
    case NegativeResponseCode::ResponsePending:                return "requestCorrectlyReceived-ResponsePending";
    case NegativeResponseCode::SubFunctionNotSupportedInActiveSession:
      return "subFunctionNotSupportedInActiveSession";
    case NegativeResponseCode::ServiceNotSupportedInActiveSession:
      return "serviceNotSupportedInActiveSession";
  }
  return "Unknown NRC";
}

std::string to_hex(const std::vector<uint8_t>& bytes) {
  std::string out;
  out.reserve(bytes.size() * 3);
  char buf[4];
  for (size_t i = 0; i < bytes.size(); ++i) {
    std::snprintf(buf, sizeof(buf), "%02X", bytes[i]);
    if (i) out.push_back(' ');
    out += buf;
  }
  return out;
}

// ============================================================================
// UdsCodec
// ============================================================================

std::vector<uint8_t> UdsCodec::encode(const ServiceRequest& req) const {
  std::vector<uint8_t> tx; tx.reserve(1 + req.payload.size());
  tx.push_back(req.sid);
  tx.insert(tx.end(), req.payload.begin(), req.payload.end());
  return tx;
}

Result<ServiceResponse> UdsCodec::decode(const std::vector<uint8_t>& bytes) const {
  if (bytes.empty()) {
    return Result<ServiceResponse>::failure(Errc::Malformed, "empty UDS response");
  }

  const uint8_t sid_rx = bytes[0];
  if (sid_rx == kNegativeResponseSid) {
    // [0x7F] [rejected SID] [NRC]
    if (bytes.size() < 3) {
      return Result<ServiceResponse>::failure(Errc::Malformed, "truncated negative response");
    }
    Error e = make_error(Errc::NegativeResponse, nrc_name(bytes[2]));
    e.rejected_sid = bytes[1];
    e.nrc = bytes[2];
    return Result<ServiceResponse>::failure(std::move(e));
  }

  // Positive response SIDs are 0x50..0xFE (request range 0x10..0xBE + 0x40)
  if (sid_rx < 0x50) {
    return Result<ServiceResponse>::failure(Errc::Malformed, "not a response SID");
  }

  ServiceResponse rsp;
  rsp.sid = static_cast<uint8_t>(sid_rx - kPositiveResponseOffset);
  rsp.payload.assign(bytes.begin() + 1, bytes.end());
  return Result<ServiceResponse>::success(std::move(rsp));
}

// ============================================================================
// Client
// ============================================================================

Result<ServiceResponse> Client::exchange(SID sid,
                                         const std::vector<uint8_t>& req_payload,
                                         std::chrono::milliseconds timeout,
                                         bool suppress_response) {
  ServiceRequest req;
  req.sid = static_cast<uint8_t>(sid);
  req.payload = req_payload;
  req.suppress_response = suppress_response;

  if (timeout.count() == 0) timeout = timings_.p2; // default

  sleep_for_min_gap(timings_);
  return ch_.request(req, timeout);
}

Result<ServiceResponse> Client::diagnostic_session_control(Session s) {
  auto res = exchange(SID::DiagnosticSessionControl, { static_cast<uint8_t>(s) });
  if (!res.ok) {
    return res;
  }

  // [0] = session echo
  // [1..2] = P2Server_max (ms, big-endian)
  // [3..4] = P2*Server_max (10ms resolution, big-endian)
  // Not all ECUs fill these in, so we only update if present.
  if (res.value.payload.size() >= 5) {
    const uint16_t p2_ms = codec::read_be16(res.value.payload, 1);
    const uint32_t p2_star_ms = static_cast<uint32_t>(codec::read_be16(res.value.payload, 3)) * 10;

    // Keep the DoIP defaults as a floor: gateway latency is not part of P2server
    if (p2_ms > timings_.p2.count()) {
      timings_.p2 = std::chrono::milliseconds(p2_ms);
    }
    if (p2_star_ms > timings_.p2_star.count()) {
      timings_.p2_star = std::chrono::milliseconds(p2_star_ms);
    }
  }
  return res;
}

Result<ServiceResponse> Client::ecu_reset(EcuResetType type) {
  return exchange(SID::ECUReset, { static_cast<uint8_t>(type) });
}

Result<ServiceResponse> Client::tester_present(bool suppress_response) {
  uint8_t sub = suppress_response ? kSuppressPositiveResponse : 0x00;
  return exchange(SID::TesterPresent, { sub }, std::chrono::milliseconds(0), suppress_response);
}

Result<ServiceResponse> Client::security_access_request_seed(uint8_t level) {
  const uint8_t sub = ((level & 0x01) || level == 0) ? static_cast<uint8_t>(level | 0x01)
                                                      : static_cast<uint8_t>(level - 1);
  return exchange(SID::SecurityAccess, { sub });
}

Result<ServiceResponse> Client::security_access_send_key(uint8_t level, const std::vector<uint8_t>& key) {
  const uint8_t sub = ((level & 0x01) || level == 0) ? static_cast<uint8_t>((level | 0x01) + 1) : level;
  std::vector<uint8_t> p{ sub };
  p.insert(p.end(), key.begin(), key.end());
  return exchange(SID::SecurityAccess, p);
}

Result<ServiceResponse> Client::read_data_by_identifier(DID did) {
  std::vector<uint8_t> p; p.reserve(2);
  codec::be16(p, did);
  return exchange(SID::ReadDataByIdentifier, p);
}

Result<ServiceResponse> Client::write_data_by_identifier(DID did, const std::vector<uint8_t>& data) {
  std::vector<uint8_t> p; p.reserve(2 + data.size());
  codec::be16(p, did);
  p.insert(p.end(), data.begin(), data.end());
  return exchange(SID::WriteDataByIdentifier, p, timings_.p2_star);
}

Result<ServiceResponse> Client::routine_control(RoutineAction action, RoutineId id,
                                                const std::vector<uint8_t>& record) {
  std::vector<uint8_t> p; p.reserve(3 + record.size());
  p.push_back(static_cast<uint8_t>(action));
  codec::be16(p, id);
  p.insert(p.end(), record.begin(), record.end());
  return exchange(SID::RoutineControl, p, timings_.p2_star);
}

Result<ServiceResponse> Client::clear_diagnostic_information(uint32_t group_of_dtc) {
  std::vector<uint8_t> p; p.reserve(3);
  codec::be24(p, group_of_dtc & 0xFFFFFF);
  return exchange(SID::ClearDiagnosticInformation, p, timings_.p2_star);
}

Result<ServiceResponse> Client::read_dtc_information(uint8_t sub_function,
                                                     const std::vector<uint8_t>& record) {
  std::vector<uint8_t> p{ sub_function };
  p.insert(p.end(), record.begin(), record.end());
  return exchange(SID::ReadDTCInformation, p);
}

Result<ServiceResponse> Client::read_dtc_by_status_mask(uint8_t status_mask) {
  return read_dtc_information(kReportDTCByStatusMask, { status_mask });
}

Result<ServiceResponse> Client::communication_control(uint8_t sub_function, uint8_t communication_type) {
  const bool suppress = (sub_function & kSuppressPositiveResponse) != 0;
  return exchange(SID::CommunicationControl, { sub_function, communication_type },
                  std::chrono::milliseconds(0), suppress);
}

Result<ServiceResponse> Client::control_dtc_setting(uint8_t setting_type) {
  const bool suppress = (setting_type & kSuppressPositiveResponse) != 0;
  return exchange(SID::ControlDTCSetting, { setting_type }, std::chrono::milliseconds(0), suppress);
}

} // namespace uds
} // namespace udsonip
