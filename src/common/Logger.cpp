#include "common/Logger.hpp"

#include <array>
#include <stdexcept>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace certmon::common {

namespace {

constexpr const char* kLoggerName = "certmon";
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

constexpr std::array<const char*, 7> kLevels = {"trace", "debug", "info",    "warn",
                                                "error", "critical", "off"};

}  // namespace

std::mutex Logger::_mtx;
std::shared_ptr<spdlog::logger> Logger::_spLogger;

bool Logger::isValidLevel(const std::string& sLevel) {
  for (const char* pLevel : kLevels) {
    if (sLevel == pLevel) return true;
  }
  return false;
}

void Logger::init(const std::string& sLevel) {
  if (!isValidLevel(sLevel)) {
    throw std::invalid_argument("Unknown log level: " + sLevel);
  }
  const auto level = spdlog::level::from_str(sLevel);

  std::lock_guard<std::mutex> lock(_mtx);
  if (_spLogger) {
    _spLogger->set_level(level);
    return;
  }

  auto spLogger = spdlog::get(kLoggerName);
  if (!spLogger) {
    spLogger = spdlog::stdout_color_mt(kLoggerName);
  }
  spLogger->set_pattern(kPattern);
  spLogger->set_level(level);
  spLogger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(spLogger);
  _spLogger = spLogger;
}

std::shared_ptr<spdlog::logger> Logger::get() {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    if (_spLogger) return _spLogger;
  }
  init("info");
  return get();
}

void Logger::shutdown() {
  std::lock_guard<std::mutex> lock(_mtx);
  if (_spLogger) _spLogger->flush();
  _spLogger.reset();
  spdlog::drop_all();
  spdlog::shutdown();
}

}  // namespace certmon::common
