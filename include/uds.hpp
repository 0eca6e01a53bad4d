#ifndef UDSONIP_UDS_HPP
#define UDSONIP_UDS_HPP

/**
 * @file uds.hpp
 * @brief Unified Diagnostic Services (UDS) – ISO 14229-1:2013 codec and client
 *
 * UDS messages travel as the user data of DoIP diagnostic messages
 * (ISO 13400-2 payload type 0x8001). This header provides:
 *
 * 1) Timing parameters and service identifiers
 * 2) Negative response codes
 * 3) Request/response models and the ProtocolCodec abstraction
 * 4) The Channel abstraction (anything that can carry one request/response)
 * 5) Client: synchronous helpers for the common services
 *
 * MESSAGE FORMAT (ISO 14229-1 Section 7.2, pp. 16-17):
 * - Request:  [SID] [Sub-function] [Data...]
 * - Positive: [SID+0x40] [Sub-function echo] [Data...]
 * - Negative: [0x7F] [SID] [NRC]
 *
 * TIMING PARAMETERS (Section 7.2, pp. 16-18):
 * - P2server_max: max time for the initial response. Over DoIP the gateway
 *   and network add latency, so the client default is 1000ms instead of the
 *   CAN default of 50ms.
 * - P2*server_max: max time after NRC 0x78 (ResponsePending), default 5000ms
 */

#include <cstdint>
#include <vector>
#include <string>
#include <chrono>
#include "udsonip.hpp"

namespace udsonip {
namespace uds {

// ============================================================================
// 1) Timings and service identifiers
// ============================================================================

struct Timings {
  std::chrono::milliseconds p2{std::chrono::milliseconds(1000)};      ///< P2server_max
  std::chrono::milliseconds p2_star{std::chrono::milliseconds(5000)}; ///< P2*server_max
  std::chrono::milliseconds req_gap{std::chrono::milliseconds(0)};    ///< Minimum inter-request gap
  std::chrono::milliseconds pending_limit{std::chrono::milliseconds(30000)}; ///< Overall cap while the server reports response pending
};

/**
 * @brief UDS Service Identifiers wrapped by Client
 *
 * Positive response SID = Request SID + 0x40 (Section 8.3, p. 33)
 * Negative response always starts with 0x7F (Section 8.4, p. 34)
 */
enum class SID : uint8_t {
  DiagnosticSessionControl   = 0x10,  ///< Section 9.2 (p. 36)
  ECUReset                   = 0x11,  ///< Section 9.3 (p. 43)
  ClearDiagnosticInformation = 0x14,  ///< Section 11.2 (p. 175)
  ReadDTCInformation         = 0x19,  ///< Section 11.3 (p. 178)
  ReadDataByIdentifier       = 0x22,  ///< Section 10.2 (p. 106)
  SecurityAccess             = 0x27,  ///< Section 9.4 (p. 47)
  CommunicationControl       = 0x28,  ///< Section 9.5 (p. 53)
  WriteDataByIdentifier      = 0x2E,  ///< Section 10.7 (p. 162)
  RoutineControl             = 0x31,  ///< Section 13.2 (p. 260)
  TesterPresent              = 0x3E,  ///< Section 9.6 (p. 58)
  ControlDTCSetting          = 0x85   ///< Section 9.9 (p. 71)
};

// DiagnosticSessionControl (0x10) sub-functions, Table 25 (p. 39)
enum class Session : uint8_t {
  DefaultSession      = 0x01,
  ProgrammingSession  = 0x02,
  ExtendedSession     = 0x03,
  SafetySystemSession = 0x04
};

// ECUReset (0x11) sub-functions, Table 33 (p. 44)
enum class EcuResetType : uint8_t {
  HardReset     = 0x01,
  KeyOffOnReset = 0x02,
  SoftReset     = 0x03
};

// RoutineControl (0x31) sub-functions, Table 379 (p. 262)
enum class RoutineAction : uint8_t {
  Start  = 0x01,
  Stop   = 0x02,
  Result = 0x03
};

// ReadDTCInformation (0x19) reportDTCByStatusMask
constexpr uint8_t kReportDTCByStatusMask = 0x02;

// suppressPosRspMsgIndicationBit (Section 8.2.2)
constexpr uint8_t kSuppressPositiveResponse = 0x80;

// ============================================================================
// 2) Negative response codes (Annex A, Table A.1)
// ============================================================================

enum class NegativeResponseCode : uint8_t {
  GeneralReject                          = 0x10,
  ServiceNotSupported                    = 0x11,
  SubFunctionNotSupported                = 0x12,
  IncorrectMessageLengthOrFormat         = 0x13,
  ResponseTooLong                        = 0x14,
  BusyRepeatRequest                      = 0x21,
  ConditionsNotCorrect                   = 0x22,
  RequestSequenceError                   = 0x24,
  NoResponseFromSubnetComponent          = 0x25,
  FailurePreventsExecution               = 0x26,
  RequestOutOfRange                      = 0x31,
  SecurityAccessDenied                   = 0x33,
  InvalidKey                             = 0x35,
  ExceededNumberOfAttempts               = 0x36,
  RequiredTimeDelayNotExpired            = 0x37,
  UploadDownloadNotAccepted              = 0x70,
  TransferDataSuspended                  = 0x71,
  GeneralProgrammingFailure              = 0x72,
  WrongBlockSequenceCounter              = 0x73,
  ResponsePending                        = 0x78, // RCR-RP, wait P2*
  SubFunctionNotSupportedInActiveSession = 0x7E,
  ServiceNotSupportedInActiveSession     = 0x7F
};

constexpr uint8_t kNegativeResponseSid = 0x7F;
constexpr uint8_t kPositiveResponseOffset = 0x40;

inline bool is_positive_response(uint8_t sid_rx, uint8_t sid_req) {
  return sid_rx == static_cast<uint8_t>(sid_req + kPositiveResponseOffset);
}

// Human readable NRC name ("Unknown NRC" for codes outside Table A.1)
const char* nrc_name(uint8_t code);

// ============================================================================
// 3) Request/response models and codec
// ============================================================================

using DID = uint16_t;
using RoutineId = uint16_t;

struct ServiceRequest {
  uint8_t sid{0};
  std::vector<uint8_t> payload;    // everything after the SID
  bool suppress_response{false};   // no reply expected (bit 7 of sub-function set)
};

struct ServiceResponse {
  uint8_t sid{0};                  // request SID the response belongs to
  std::vector<uint8_t> payload;    // positive response payload (after SID)
};

// Encodes requests into transport payload bytes and decodes replies
class ProtocolCodec {
public:
  virtual ~ProtocolCodec() = default;

  virtual std::vector<uint8_t> encode(const ServiceRequest& req) const = 0;

  // NegativeResponse error (with nrc / rejected_sid) for 0x7F frames,
  // Malformed for anything that is not a well-formed response
  virtual Result<ServiceResponse> decode(const std::vector<uint8_t>& bytes) const = 0;
};

class UdsCodec : public ProtocolCodec {
public:
  std::vector<uint8_t> encode(const ServiceRequest& req) const override;
  Result<ServiceResponse> decode(const std::vector<uint8_t>& bytes) const override;
};

namespace codec {
  inline void be16(std::vector<uint8_t>& v, uint16_t x){ v.push_back(uint8_t(x>>8)); v.push_back(uint8_t(x)); }
  inline void be24(std::vector<uint8_t>& v, uint32_t x){ v.push_back(uint8_t(x>>16)); v.push_back(uint8_t(x>>8)); v.push_back(uint8_t(x)); }
  inline uint16_t read_be16(const std::vector<uint8_t>& v, size_t at) {
    return static_cast<uint16_t>((static_cast<uint16_t>(v[at]) << 8) | v[at + 1]);
  }
}

// Hex dump used in log lines, e.g. "22 F1 90"
std::string to_hex(const std::vector<uint8_t>& bytes);

// ============================================================================
// 4) Channel abstraction
// ============================================================================

// Anything that can carry one UDS request to the current peer and return its
// reply: the ConnectionBridge itself or a PeerScope on a shared bridge.
class Channel {
public:
  virtual ~Channel() = default;
  virtual Result<ServiceResponse> request(const ServiceRequest& req,
                                          std::chrono::milliseconds timeout) = 0;
};

// ============================================================================
// 5) Client API
// ============================================================================

class Client {
public:
  Client(Channel& ch, Timings timings = {}) : ch_(ch), timings_(timings) {}

  // Core exchange primitive; timeout 0 means P2
  Result<ServiceResponse> exchange(SID sid, const std::vector<uint8_t>& req_payload,
                                   std::chrono::milliseconds timeout = std::chrono::milliseconds(0),
                                   bool suppress_response = false);

  Result<ServiceResponse> diagnostic_session_control(Session s);
  Result<ServiceResponse> ecu_reset(EcuResetType type);
  Result<ServiceResponse> tester_present(bool suppress_response = false);

  // level is the requestSeed sub-function: an even level is lowered to the odd
  // seed value, and sendKey uses the even value above it (level 1 -> 0x01/0x02)
  Result<ServiceResponse> security_access_request_seed(uint8_t level);
  Result<ServiceResponse> security_access_send_key(uint8_t level, const std::vector<uint8_t>& key);

  Result<ServiceResponse> read_data_by_identifier(DID did);
  Result<ServiceResponse> write_data_by_identifier(DID did, const std::vector<uint8_t>& data);

  Result<ServiceResponse> routine_control(RoutineAction action, RoutineId id,
                                          const std::vector<uint8_t>& record = {});

  // groupOfDTC is 3 bytes; 0xFFFFFF = all groups
  Result<ServiceResponse> clear_diagnostic_information(uint32_t group_of_dtc = 0xFFFFFF);
  Result<ServiceResponse> read_dtc_information(uint8_t sub_function, const std::vector<uint8_t>& record = {});
  Result<ServiceResponse> read_dtc_by_status_mask(uint8_t status_mask = 0xFF);

  Result<ServiceResponse> communication_control(uint8_t sub_function, uint8_t communication_type);
  Result<ServiceResponse> control_dtc_setting(uint8_t setting_type);

  void set_timings(const Timings& t) { timings_ = t; }
  const Timings& timings() const { return timings_; }

private:
  Channel& ch_;
  Timings timings_{};
};

} // namespace uds
} // namespace udsonip

#endif // UDSONIP_UDS_HPP
