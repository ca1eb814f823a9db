#include "common/Logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace jwks::common {

namespace {

std::mutex g_mtxLogger;

}  // namespace

bool Logger::_bInitialized = false;

void Logger::init(const std::string& sLevel) {
  std::lock_guard<std::mutex> lock(g_mtxLogger);

  auto eLevel = spdlog::level::from_str(sLevel);
  // from_str maps unknown names to off
  const bool bUnknown = eLevel == spdlog::level::off && sLevel != "off";
  if (bUnknown) eLevel = spdlog::level::info;

  if (!_bInitialized) {
    auto spLogger = spdlog::stdout_color_mt("jwks");
    spLogger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
    spdlog::set_default_logger(spLogger);
    _bInitialized = true;
  }
  spdlog::default_logger()->set_level(eLevel);

  if (bUnknown) {
    spdlog::default_logger()->warn("Unknown log level '{}'; using info", sLevel);
  }
}

std::shared_ptr<spdlog::logger> Logger::get() {
  bool bNeedsInit = false;
  {
    std::lock_guard<std::mutex> lock(g_mtxLogger);
    bNeedsInit = !_bInitialized;
  }
  if (bNeedsInit) init("info");
  return spdlog::default_logger();
}

}  // namespace jwks::common
