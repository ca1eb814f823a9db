#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace jwks::common {

/// Process-wide "jwks" logger on spdlog, installed as spdlog's default
/// logger. Class abbreviation: N/A (static interface)
///
/// Usage:
///   Logger::init("debug");
///   Logger::get()->info("Rotated signing key {}", sKid);
class Logger {
 public:
  /// Create the logger on first call; later calls only change the level.
  /// Unknown level names fall back to "info" with a warning.
  static void init(const std::string& sLevel);

  /// The default logger. Initializes at "info" when init() was never called.
  static std::shared_ptr<spdlog::logger> get();

 private:
  static bool _bInitialized;
};

}  // namespace jwks::common
