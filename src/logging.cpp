#include "logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <map>
#include <mutex>
#include <vector>

namespace udsonip {
namespace util {

static std::once_flag s_init_flag;

// Guards s_loggers (all reads and writes)
static std::mutex s_loggers_mutex;
static std::map<std::string, std::shared_ptr<spdlog::logger>> s_loggers;

static const char* const kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";

static void InitializeInternal(const std::string& log_level) {
  try {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern(kPattern);

    const std::vector<std::string> components = {
      "default", "bridge", "registry", "discovery", "transport"
    };

    std::lock_guard<std::mutex> lock(s_loggers_mutex);
    for (const auto& component : components) {
      auto logger = std::make_shared<spdlog::logger>(component, console_sink);
      logger->set_level(spdlog::level::from_str(log_level));
      logger->flush_on(spdlog::level::warn);
      spdlog::register_logger(logger);
      s_loggers[component] = logger;
    }
    spdlog::set_default_logger(s_loggers["default"]);
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Log initialization failed: " << ex.what() << "\n";
  }
}

void LogManager::Initialize(const std::string& log_level) {
  std::call_once(s_init_flag, InitializeInternal, log_level);
}

void LogManager::Shutdown() {
  std::lock_guard<std::mutex> lock(s_loggers_mutex);
  for (auto& entry : s_loggers) {
    entry.second->flush();
  }
  spdlog::drop_all();
  s_loggers.clear();
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string& name) {
  Initialize();

  std::lock_guard<std::mutex> lock(s_loggers_mutex);
  auto it = s_loggers.find(name);
  if (it != s_loggers.end()) {
    return it->second;
  }
  it = s_loggers.find("default");
  if (it != s_loggers.end()) {
    return it->second;
  }

  // Initialization failed or Shutdown() ran: hand out a silent logger so
  // callers never dereference null
  auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto logger = std::make_shared<spdlog::logger>("default", sink);
  logger->set_level(spdlog::level::off);
  s_loggers["default"] = logger;
  return logger;
}

void LogManager::SetLogLevel(const std::string& level) {
  Initialize();
  std::lock_guard<std::mutex> lock(s_loggers_mutex);
  const auto lvl = spdlog::level::from_str(level);
  for (auto& entry : s_loggers) {
    entry.second->set_level(lvl);
  }
}

void LogManager::SetComponentLevel(const std::string& component, const std::string& level) {
  Initialize();
  std::lock_guard<std::mutex> lock(s_loggers_mutex);
  auto it = s_loggers.find(component);
  if (it != s_loggers.end()) {
    it->second->set_level(spdlog::level::from_str(level));
  }
}

} // namespace util
} // namespace udsonip
