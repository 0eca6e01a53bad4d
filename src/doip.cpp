#include "doip.hpp"
#include <cctype>

namespace udsonip {
namespace doip {

namespace {
  inline void put16(std::vector<uint8_t>& v, uint16_t x){ v.push_back(uint8_t(x>>8)); v.push_back(uint8_t(x)); }
  inline void put32(std::vector<uint8_t>& v, uint32_t x){
    v.push_back(uint8_t(x>>24)); v.push_back(uint8_t(x>>16)); v.push_back(uint8_t(x>>8)); v.push_back(uint8_t(x));
  }
  inline uint16_t get16(const uint8_t* p){ return static_cast<uint16_t>((p[0] << 8) | p[1]); }
  inline uint32_t get32(const uint8_t* p){
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
  }
}

// ============================================================================
// Generic header
// ============================================================================

std::vector<uint8_t> encode_frame(uint8_t version, uint16_t payload_type,
                                  const std::vector<uint8_t>& payload) {
  std::vector<uint8_t> out;
  out.reserve(kHeaderSize + payload.size());
  out.push_back(version);
  out.push_back(static_cast<uint8_t>(~version));
  put16(out, payload_type);
  put32(out, static_cast<uint32_t>(payload.size()));
  out.insert(out.end(), payload.begin(), payload.end());
  return out;
}

Result<Header> decode_header(const uint8_t* data, size_t len) {
  if (len < kHeaderSize) {
    return Result<Header>::failure(Errc::Malformed, "shorter than DoIP header");
  }
  if (static_cast<uint8_t>(~data[0]) != data[1]) {
    return Result<Header>::failure(Errc::Malformed, "protocol/inverse version mismatch");
  }

  Header h;
  h.version = data[0];
  h.payload_type = get16(data + 2);
  h.payload_length = get32(data + 4);
  if (h.payload_length > kMaxPayloadSize) {
    return Result<Header>::failure(Errc::Malformed, "payload length too large");
  }
  return Result<Header>::success(h);
}

Result<Message> decode_frame(const std::vector<uint8_t>& bytes) {
  auto hdr = decode_header(bytes.data(), bytes.size());
  if (!hdr.ok) {
    return Result<Message>::failure(hdr.error);
  }
  if (bytes.size() < frame_size(hdr.value)) {
    return Result<Message>::failure(Errc::Malformed, "message ended before full payload");
  }

  Message m;
  m.version = hdr.value.version;
  m.payload_type = hdr.value.payload_type;
  m.payload.assign(bytes.begin() + kHeaderSize, bytes.begin() + frame_size(hdr.value));
  return Result<Message>::success(std::move(m));
}

// ============================================================================
// Vehicle identification
// ============================================================================

std::vector<uint8_t> build_vehicle_identification_request(uint8_t version) {
  return encode_frame(version, kVehicleIdentificationRequest, {});
}

Result<VehicleIdentification> parse_vehicle_identification(const std::vector<uint8_t>& payload) {
  if (payload.size() != 32 && payload.size() != 33) {
    return Result<VehicleIdentification>::failure(Errc::Malformed,
        "vehicle identification payload must be 32 or 33 bytes");
  }

  VehicleIdentification info;
  info.vin.assign(payload.begin(), payload.begin() + 17);
  for (auto& ch : info.vin) {
    if (!std::isprint(static_cast<unsigned char>(ch))) ch = '.';
  }
  info.logical_address = get16(payload.data() + 17);
  for (size_t i = 0; i < 6; ++i) {
    info.eid[i] = payload[19 + i];
    info.gid[i] = payload[25 + i];
  }
  info.further_action = payload[31];
  if (payload.size() == 33) {
    info.vin_gid_status = payload[32];
  }
  return Result<VehicleIdentification>::success(std::move(info));
}

std::vector<uint8_t> build_vehicle_identification(const VehicleIdentification& info) {
  std::vector<uint8_t> p;
  p.reserve(33);
  for (size_t i = 0; i < 17; ++i) {
    p.push_back(i < info.vin.size() ? static_cast<uint8_t>(info.vin[i]) : 0x00);
  }
  put16(p, info.logical_address);
  p.insert(p.end(), info.eid.begin(), info.eid.end());
  p.insert(p.end(), info.gid.begin(), info.gid.end());
  p.push_back(info.further_action);
  if (info.vin_gid_status) p.push_back(*info.vin_gid_status);
  return p;
}

// ============================================================================
// Routing activation
// ============================================================================

std::vector<uint8_t> build_routing_activation_request(LogicalAddress source, uint8_t activation_type) {
  std::vector<uint8_t> p;
  p.reserve(7);
  put16(p, source);
  p.push_back(activation_type);
  put32(p, 0);  // reserved by ISO 13400
  return p;
}

Result<RoutingActivationResult> parse_routing_activation_response(const std::vector<uint8_t>& payload) {
  if (payload.size() != 9 && payload.size() != 13) {
    return Result<RoutingActivationResult>::failure(Errc::Malformed,
        "routing activation response payload must be 9 or 13 bytes");
  }
  RoutingActivationResult r;
  r.tester_address = get16(payload.data());
  r.entity_address = get16(payload.data() + 2);
  r.response_code = payload[4];
  return Result<RoutingActivationResult>::success(r);
}

std::vector<uint8_t> build_routing_activation_response(const RoutingActivationResult& r) {
  std::vector<uint8_t> p;
  p.reserve(9);
  put16(p, r.tester_address);
  put16(p, r.entity_address);
  p.push_back(r.response_code);
  put32(p, 0);
  return p;
}

const char* routing_activation_code_name(uint8_t code) {
  switch (code) {
    case 0x00: return "InvalidSourceAddress";
    case 0x01: return "NoSocketAvailable";
    case 0x02: return "Busy";
    case 0x03: return "AlreadyRegisteredTester";
    case 0x04: return "FailedAuthentication";
    case 0x05: return "RejectedConfirmation";
    case 0x06: return "UnsupportedActivationType";
    case 0x07: return "TlsRequired";
    case kRoutingActivationSuccess: return "Success";
    case kRoutingActivationPending: return "ConfirmationPending";
    default:   return "Reserved";
  }
}

// ============================================================================
// Diagnostic messages
// ============================================================================

std::vector<uint8_t> build_diagnostic_message(LogicalAddress source, LogicalAddress target,
                                              const std::vector<uint8_t>& user_data) {
  std::vector<uint8_t> p;
  p.reserve(4 + user_data.size());
  put16(p, source);
  put16(p, target);
  p.insert(p.end(), user_data.begin(), user_data.end());
  return p;
}

Result<DiagnosticMessage> parse_diagnostic_message(const std::vector<uint8_t>& payload) {
  if (payload.size() < 4) {
    return Result<DiagnosticMessage>::failure(Errc::Malformed, "diagnostic message too short");
  }
  DiagnosticMessage m;
  m.source = get16(payload.data());
  m.target = get16(payload.data() + 2);
  m.user_data.assign(payload.begin() + 4, payload.end());
  return Result<DiagnosticMessage>::success(std::move(m));
}

std::vector<uint8_t> build_diagnostic_ack(LogicalAddress source, LogicalAddress target, uint8_t code) {
  std::vector<uint8_t> p;
  p.reserve(5);
  put16(p, source);
  put16(p, target);
  p.push_back(code);
  return p;
}

Result<DiagnosticAck> parse_diagnostic_ack(const std::vector<uint8_t>& payload) {
  if (payload.size() < 5) {
    return Result<DiagnosticAck>::failure(Errc::Malformed, "diagnostic acknowledge too short");
  }
  DiagnosticAck a;
  a.source = get16(payload.data());
  a.target = get16(payload.data() + 2);
  a.code = payload[4];
  a.previous.assign(payload.begin() + 5, payload.end());
  return Result<DiagnosticAck>::success(std::move(a));
}

const char* diagnostic_nack_name(uint8_t code) {
  switch (code) {
    case kNackInvalidSourceAddress:   return "InvalidSourceAddress";
    case kNackUnknownTargetAddress:   return "UnknownTargetAddress";
    case kNackMessageTooLarge:        return "DiagnosticMessageTooLarge";
    case kNackOutOfMemory:            return "OutOfMemory";
    case kNackTargetUnreachable:      return "TargetUnreachable";
    case kNackUnknownNetwork:         return "UnknownNetwork";
    case kNackTransportProtocolError: return "TransportProtocolError";
    default:                          return "Reserved";
  }
}

Errc nack_to_errc(uint8_t code) {
  switch (code) {
    case kNackUnknownTargetAddress:
    case kNackTargetUnreachable:
    case kNackUnknownNetwork:
      return Errc::AddressRejected;
    default:
      return Errc::TransportError;
  }
}

std::vector<uint8_t> build_alive_check_response(LogicalAddress source) {
  std::vector<uint8_t> p;
  p.reserve(2);
  put16(p, source);
  return p;
}

} // namespace doip
} // namespace udsonip
