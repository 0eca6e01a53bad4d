#ifndef UDSONIP_HPP
#define UDSONIP_HPP

/**
 * @file udsonip.hpp
 * @brief Shared types for UDS over DoIP (ISO 14229-1 on ISO 13400-2)
 *
 * One DoIP gateway is reached over a single TCP connection; every ECU behind
 * it is identified by a 16-bit logical address. The types here are shared by
 * the connection bridge, the peer registry and the discovery engine:
 *
 * - LogicalAddress: DoIP routing identifier of an ECU (ISO 13400-2 Table 13)
 * - ConnectionState: lifecycle of the single physical connection
 * - Errc / Error: failure taxonomy reported by every operation
 * - Result<T>: value-or-error return type (no exceptions cross the API)
 *
 * Typical address ranges (ISO 13400-2 Table 13):
 * - 0x0001-0x0DFF: vehicle manufacturer specific ECUs
 * - 0x0E00-0x0E7F: external legislated test equipment (tester)
 * - 0x0E80-0x0EFF: external vehicle-manufacturer test equipment
 * - 0xE400-0xEFFF: functional group addresses
 */

#include <cstdint>
#include <string>
#include <utility>

namespace udsonip {

using LogicalAddress = uint16_t;

// Default tester (client) logical address used by most DoIP tools
constexpr LogicalAddress kDefaultTesterAddress = 0x0E00;

// ============================================================================
// Connection state
// ============================================================================

/**
 * @brief State of the single physical connection owned by a ConnectionBridge
 *
 * - Disconnected: no physical link (never opened or closed)
 * - Idle: link up, nobody holds the bridge exclusively
 * - Busy: link up, one holder (scope or single request) owns the bridge
 * - Error: the link failed; operations fail NotConnected until reopened
 */
enum class ConnectionState : uint8_t {
  Disconnected,
  Idle,
  Busy,
  Error
};

const char* to_string(ConnectionState s);

// ============================================================================
// Error taxonomy
// ============================================================================

enum class Errc : uint8_t {
  None = 0,
  NotConnected,          ///< operation on a closed or failed bridge
  AddressRejected,       ///< retarget refused (policy or gateway NACK)
  Timeout,               ///< no reply within the caller's deadline
  TransportError,        ///< link failure, terminal until reconnect
  NegativeResponse,      ///< peer answered 0x7F SID NRC
  DuplicateName,         ///< exclusive registration of an existing name
  UnknownPeer,           ///< scope on an unregistered name
  ReentrantAcquisition,  ///< holder tried to acquire the bridge again
  BusyTimeout,           ///< exclusive hold not granted before the deadline
  Malformed              ///< unparseable frame or response
};

const char* to_string(Errc c);

struct Error {
  Errc code{Errc::None};
  uint8_t nrc{0};           // valid if code == NegativeResponse
  uint8_t rejected_sid{0};  // valid if code == NegativeResponse
  std::string message;

  // "<code>: <message>" plus NRC details for negative responses
  std::string describe() const;
};

inline Error make_error(Errc code, std::string message = {}) {
  Error e;
  e.code = code;
  e.message = std::move(message);
  return e;
}

// ============================================================================
// Result type
// ============================================================================

template<typename T>
struct Result {
  bool ok{false};
  T value{};
  Error error{};

  static Result success(T v) {
    Result r; r.ok = true; r.value = std::move(v); return r;
  }

  static Result failure(Error e) {
    Result r; r.ok = false; r.error = std::move(e); return r;
  }

  static Result failure(Errc code, std::string message = {}) {
    return failure(make_error(code, std::move(message)));
  }

  explicit operator bool() const { return ok; }
};

template<>
struct Result<void> {
  bool ok{false};
  Error error{};

  static Result success() {
    Result r; r.ok = true; return r;
  }

  static Result failure(Error e) {
    Result r; r.ok = false; r.error = std::move(e); return r;
  }

  static Result failure(Errc code, std::string message = {}) {
    return failure(make_error(code, std::move(message)));
  }

  explicit operator bool() const { return ok; }
};

// Format a logical address as 0xNNNN
std::string format_address(LogicalAddress a);

} // namespace udsonip

#endif // UDSONIP_HPP
