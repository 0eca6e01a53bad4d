#ifndef UDSONIP_LOGGING_HPP
#define UDSONIP_LOGGING_HPP

/**
 * @file logging.hpp
 * @brief Component loggers for udsonip (spdlog)
 *
 * Components:
 * - default:   general library messages
 * - bridge:    ConnectionBridge send/receive and state transitions
 * - registry:  PeerRegistry registrations and scope enter/exit
 * - discovery: DiscoveryEngine probe/announcement traffic
 * - transport: DoIP TCP/UDP socket level events
 *
 * All loggers share one colour console sink. Initialization runs exactly once
 * (std::call_once); the first GetLogger() call initializes with level "warn"
 * if the application did not call Initialize() itself.
 */

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace udsonip {
namespace util {

class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum level (trace, debug, info, warn, error, critical, off)
   *
   * Multiple calls are safe; only the first one takes effect. Use
   * SetLogLevel() to change the level afterwards.
   */
  static void Initialize(const std::string& log_level = "warn");

  // Flush and drop all component loggers
  static void Shutdown();

  // Logger for a component; falls back to "default" for unknown names
  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  static void SetLogLevel(const std::string& level);
  static void SetComponentLevel(const std::string& component, const std::string& level);
};

} // namespace util
} // namespace udsonip

#define LOG_TRACE(...) udsonip::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) udsonip::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)  udsonip::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)  udsonip::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) udsonip::util::LogManager::GetLogger()->error(__VA_ARGS__)

#define LOG_BRIDGE_TRACE(...) udsonip::util::LogManager::GetLogger("bridge")->trace(__VA_ARGS__)
#define LOG_BRIDGE_DEBUG(...) udsonip::util::LogManager::GetLogger("bridge")->debug(__VA_ARGS__)
#define LOG_BRIDGE_INFO(...)  udsonip::util::LogManager::GetLogger("bridge")->info(__VA_ARGS__)
#define LOG_BRIDGE_WARN(...)  udsonip::util::LogManager::GetLogger("bridge")->warn(__VA_ARGS__)
#define LOG_BRIDGE_ERROR(...) udsonip::util::LogManager::GetLogger("bridge")->error(__VA_ARGS__)

#define LOG_REGISTRY_DEBUG(...) udsonip::util::LogManager::GetLogger("registry")->debug(__VA_ARGS__)
#define LOG_REGISTRY_INFO(...)  udsonip::util::LogManager::GetLogger("registry")->info(__VA_ARGS__)
#define LOG_REGISTRY_WARN(...)  udsonip::util::LogManager::GetLogger("registry")->warn(__VA_ARGS__)
#define LOG_REGISTRY_ERROR(...) udsonip::util::LogManager::GetLogger("registry")->error(__VA_ARGS__)

#define LOG_DISCOVERY_DEBUG(...) udsonip::util::LogManager::GetLogger("discovery")->debug(__VA_ARGS__)
#define LOG_DISCOVERY_INFO(...)  udsonip::util::LogManager::GetLogger("discovery")->info(__VA_ARGS__)
#define LOG_DISCOVERY_WARN(...)  udsonip::util::LogManager::GetLogger("discovery")->warn(__VA_ARGS__)
#define LOG_DISCOVERY_ERROR(...) udsonip::util::LogManager::GetLogger("discovery")->error(__VA_ARGS__)

#define LOG_TRANSPORT_TRACE(...) udsonip::util::LogManager::GetLogger("transport")->trace(__VA_ARGS__)
#define LOG_TRANSPORT_DEBUG(...) udsonip::util::LogManager::GetLogger("transport")->debug(__VA_ARGS__)
#define LOG_TRANSPORT_INFO(...)  udsonip::util::LogManager::GetLogger("transport")->info(__VA_ARGS__)
#define LOG_TRANSPORT_WARN(...)  udsonip::util::LogManager::GetLogger("transport")->warn(__VA_ARGS__)
#define LOG_TRANSPORT_ERROR(...) udsonip::util::LogManager::GetLogger("transport")->error(__VA_ARGS__)

#endif // UDSONIP_LOGGING_HPP
