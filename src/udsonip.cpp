#include "udsonip.hpp"
#include "uds.hpp"
#include <cstdio>

namespace udsonip {

const char* to_string(ConnectionState s) {
  switch (s) {
    case ConnectionState::Disconnected: return "Disconnected";
    case ConnectionState::Idle:         return "Idle";
    case ConnectionState::Busy:         return "Busy";
    case ConnectionState::Error:        return "Error";
  }
  return "Unknown";
}

const char* to_string(Errc c) {
  switch (c) {
    case Errc::None:                 return "None";
    case Errc::NotConnected:         return "NotConnected";
    case Errc::AddressRejected:      return "AddressRejected";
    case Errc::Timeout:              return "Timeout";
    case Errc::TransportError:       return "TransportError";
    case Errc::NegativeResponse:     return "NegativeResponse";
    case Errc::DuplicateName:        return "DuplicateName";
    case Errc::UnknownPeer:          return "UnknownPeer";
    case Errc::ReentrantAcquisition: return "ReentrantAcquisition";
    case Errc::BusyTimeout:          return "BusyTimeout";
    case Errc::Malformed:            return "Malformed";
  }
  return "Unknown";
}

std::string Error::describe() const {
  std::string out = to_string(code);
  if (code == Errc::NegativeResponse) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), " (SID 0x%02X, NRC 0x%02X %s)",
                  rejected_sid, nrc, uds::nrc_name(nrc));
    out += buf;
  }
  if (!message.empty()) {
    out += ": ";
    out += message;
  }
  return out;
}

std::string format_address(LogicalAddress a) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "0x%04X", a);
  return buf;
}

} // namespace udsonip
