#pragma once

#include <memory>
#include <mutex>
#include <string>

#include <spdlog/spdlog.h>

namespace certmon::common {

/// Process-wide spdlog logger named "certmon".
/// Safe to call get() from any worker thread; the first call initializes at "info"
/// when init() has not run yet.
///
/// Usage:
///   Logger::init("debug");
///   Logger::get()->info("Sync finished: added={} deleted={}", iAdded, iDeleted);
class Logger {
 public:
  /// Set up the logger or change its level.
  /// Throws std::invalid_argument for a level spdlog does not know.
  static void init(const std::string& sLevel);

  static std::shared_ptr<spdlog::logger> get();

  /// Accepts "trace", "debug", "info", "warn", "error", "critical" and "off".
  static bool isValidLevel(const std::string& sLevel);

  /// Flush and release every sink. get() re-initializes afterwards.
  static void shutdown();

 private:
  static std::mutex _mtx;
  static std::shared_ptr<spdlog::logger> _spLogger;
};

}  // namespace certmon::common
