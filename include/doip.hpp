#ifndef UDSONIP_DOIP_HPP
#define UDSONIP_DOIP_HPP

/**
 * @file doip.hpp
 * @brief Diagnostics over IP (ISO 13400-2) message codec
 *
 * Every DoIP message starts with the generic header (Section 7.1.2, Table 11):
 *
 *   [version] [~version] [payload type (2, BE)] [payload length (4, BE)] [payload...]
 *
 * Payload types handled here (Table 17):
 * - 0x0000 Generic DoIP header negative acknowledge
 * - 0x0001 Vehicle identification request
 * - 0x0004 Vehicle identification response / vehicle announcement
 * - 0x0005 Routing activation request
 * - 0x0006 Routing activation response
 * - 0x0007 Alive check request
 * - 0x0008 Alive check response
 * - 0x8001 Diagnostic message
 * - 0x8002 Diagnostic message positive acknowledgement
 * - 0x8003 Diagnostic message negative acknowledgement
 *
 * Only encoding/decoding lives here; socket handling is in doip_socket.hpp.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "udsonip.hpp"

namespace udsonip {
namespace doip {

// ============================================================================
// Constants
// ============================================================================

constexpr uint16_t kGenericNack                  = 0x0000;
constexpr uint16_t kVehicleIdentificationRequest = 0x0001;
constexpr uint16_t kVehicleIdentificationResponse = 0x0004;
constexpr uint16_t kRoutingActivationRequest     = 0x0005;
constexpr uint16_t kRoutingActivationResponse    = 0x0006;
constexpr uint16_t kAliveCheckRequest            = 0x0007;
constexpr uint16_t kAliveCheckResponse           = 0x0008;
constexpr uint16_t kDiagnosticMessage            = 0x8001;
constexpr uint16_t kDiagnosticAck                = 0x8002;
constexpr uint16_t kDiagnosticNack               = 0x8003;

constexpr size_t kHeaderSize = 8;
constexpr uint32_t kMaxPayloadSize = 4u * 1024u * 1024u;

// Routing activation response codes (Table 25)
constexpr uint8_t kRoutingActivationSuccess = 0x10;
constexpr uint8_t kRoutingActivationPending = 0x11;

// Diagnostic message NACK codes (Table 29)
constexpr uint8_t kNackInvalidSourceAddress  = 0x02;
constexpr uint8_t kNackUnknownTargetAddress  = 0x03;
constexpr uint8_t kNackMessageTooLarge       = 0x04;
constexpr uint8_t kNackOutOfMemory           = 0x05;
constexpr uint8_t kNackTargetUnreachable     = 0x06;
constexpr uint8_t kNackUnknownNetwork        = 0x07;
constexpr uint8_t kNackTransportProtocolError = 0x08;

// ============================================================================
// Generic header
// ============================================================================

struct Header {
  uint8_t version{0};
  uint16_t payload_type{0};
  uint32_t payload_length{0};
};

struct Message {
  uint8_t version{0};
  uint16_t payload_type{0};
  std::vector<uint8_t> payload;
};

std::vector<uint8_t> encode_frame(uint8_t version, uint16_t payload_type,
                                  const std::vector<uint8_t>& payload);

/**
 * @brief Parse the 8-byte generic header
 *
 * Malformed if fewer than 8 bytes are given, the inverse version byte does not
 * match, or the announced payload exceeds kMaxPayloadSize.
 */
Result<Header> decode_header(const uint8_t* data, size_t len);

// Total message size (header + payload) announced by a header
inline size_t frame_size(const Header& h) { return kHeaderSize + static_cast<size_t>(h.payload_length); }

// Parse one complete message (e.g. a UDP datagram); Malformed if truncated
Result<Message> decode_frame(const std::vector<uint8_t>& bytes);

// ============================================================================
// Vehicle identification (0x0001 / 0x0004)
// ============================================================================

struct VehicleIdentification {
  std::string vin;                    // 17 ASCII characters, unprintables as '.'
  LogicalAddress logical_address{0};
  std::array<uint8_t, 6> eid{};       // entity identification (usually a MAC)
  std::array<uint8_t, 6> gid{};       // group identification
  uint8_t further_action{0};
  std::optional<uint8_t> vin_gid_status;
};

// Vehicle identification request carries no payload
std::vector<uint8_t> build_vehicle_identification_request(uint8_t version);

// 32 or 33 byte payload (Table 19); anything else is Malformed
Result<VehicleIdentification> parse_vehicle_identification(const std::vector<uint8_t>& payload);
std::vector<uint8_t> build_vehicle_identification(const VehicleIdentification& info);

// ============================================================================
// Routing activation (0x0005 / 0x0006)
// ============================================================================

struct RoutingActivationResult {
  LogicalAddress tester_address{0};
  LogicalAddress entity_address{0};
  uint8_t response_code{0};
};

// [source (2)] [activation type (1)] [reserved (4)]
std::vector<uint8_t> build_routing_activation_request(LogicalAddress source, uint8_t activation_type);

// 9 or 13 byte payload (Table 24)
Result<RoutingActivationResult> parse_routing_activation_response(const std::vector<uint8_t>& payload);
std::vector<uint8_t> build_routing_activation_response(const RoutingActivationResult& r);

const char* routing_activation_code_name(uint8_t code);

// ============================================================================
// Diagnostic messages (0x8001 / 0x8002 / 0x8003)
// ============================================================================

struct DiagnosticMessage {
  LogicalAddress source{0};
  LogicalAddress target{0};
  std::vector<uint8_t> user_data;
};

struct DiagnosticAck {
  LogicalAddress source{0};
  LogicalAddress target{0};
  uint8_t code{0};              // ACK code 0x00 or NACK code (Table 29)
  std::vector<uint8_t> previous; // optional echo of the acknowledged message
};

std::vector<uint8_t> build_diagnostic_message(LogicalAddress source, LogicalAddress target,
                                              const std::vector<uint8_t>& user_data);
Result<DiagnosticMessage> parse_diagnostic_message(const std::vector<uint8_t>& payload);

std::vector<uint8_t> build_diagnostic_ack(LogicalAddress source, LogicalAddress target, uint8_t code);
Result<DiagnosticAck> parse_diagnostic_ack(const std::vector<uint8_t>& payload);

const char* diagnostic_nack_name(uint8_t code);

// NACK 0x03/0x06/0x07 -> AddressRejected, everything else -> TransportError
Errc nack_to_errc(uint8_t code);

// Alive check response payload: [source (2)]
std::vector<uint8_t> build_alive_check_response(LogicalAddress source);

} // namespace doip
} // namespace udsonip

#endif // UDSONIP_DOIP_HPP
