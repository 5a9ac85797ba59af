#include "common/TimeUtils.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <ctime>

namespace certmon::common {

int daysUntil(SysTime tpTarget, SysTime tpNow) {
  const auto durDiff = std::chrono::duration_cast<std::chrono::seconds>(tpTarget - tpNow);
  const double dHours = static_cast<double>(durDiff.count()) / 3600.0;
  return static_cast<int>(std::floor(dHours / 24.0));
}

std::string formatDate(SysTime tp) {
  const std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tmUtc{};
  gmtime_r(&t, &tmUtc);
  char buf[16];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tmUtc);
  return std::string(buf);
}

std::string formatLocalDateTime(SysTime tp) {
  const std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tmLocal{};
  localtime_r(&t, &tmLocal);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tmLocal);
  return std::string(buf);
}

std::string toIso8601(SysTime tp) {
  const std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tmUtc{};
  gmtime_r(&t, &tmUtc);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%FT%TZ", &tmUtc);
  return std::string(buf);
}

std::optional<SysTime> parseIso8601(const std::string& sValue) {
  int iYear = 0, iMonth = 0, iDay = 0, iHour = 0, iMinute = 0, iSecond = 0;
  int iConsumed = 0;
  if (std::sscanf(sValue.c_str(), "%4d-%2d-%2d%*[T ]%2d:%2d:%2d%n", &iYear, &iMonth, &iDay,
                  &iHour, &iMinute, &iSecond, &iConsumed) < 6) {
    return std::nullopt;
  }
  if (iMonth < 1 || iMonth > 12 || iDay < 1 || iDay > 31 || iHour > 23 || iMinute > 59 ||
      iSecond > 60) {
    return std::nullopt;
  }

  SysTime tp = makeUtc(iYear, iMonth, iDay, iHour, iMinute, iSecond);

  size_t uPos = static_cast<size_t>(iConsumed);
  // Fractional seconds are dropped
  if (uPos < sValue.size() && sValue[uPos] == '.') {
    ++uPos;
    while (uPos < sValue.size() && std::isdigit(static_cast<unsigned char>(sValue[uPos]))) {
      ++uPos;
    }
  }
  if (uPos >= sValue.size() || sValue[uPos] == 'Z' || sValue[uPos] == 'z') {
    return tp;
  }

  const char cSign = sValue[uPos];
  int iOffH = 0, iOffM = 0;
  if ((cSign != '+' && cSign != '-') ||
      std::sscanf(sValue.c_str() + uPos + 1, "%2d:%2d", &iOffH, &iOffM) != 2) {
    return std::nullopt;
  }
  const auto durOffset = std::chrono::hours(iOffH) + std::chrono::minutes(iOffM);
  return cSign == '+' ? tp - durOffset : tp + durOffset;
}

std::string formatDuration(std::chrono::milliseconds dur) {
  const auto iMs = dur.count();
  char buf[48];
  if (iMs < 1000) {
    std::snprintf(buf, sizeof(buf), "%lldms", static_cast<long long>(iMs));
  } else if (iMs < 60'000) {
    std::snprintf(buf, sizeof(buf), "%.1fs", static_cast<double>(iMs) / 1000.0);
  } else {
    const long long iMinutes = iMs / 60'000;
    const double dSeconds = static_cast<double>(iMs % 60'000) / 1000.0;
    std::snprintf(buf, sizeof(buf), "%lldm%.1fs", iMinutes, dSeconds);
  }
  return std::string(buf);
}

SysTime makeUtc(int iYear, int iMonth, int iDay, int iHour, int iMinute, int iSecond) {
  std::tm tmUtc{};
  tmUtc.tm_year = iYear - 1900;
  tmUtc.tm_mon = iMonth - 1;
  tmUtc.tm_mday = iDay;
  tmUtc.tm_hour = iHour;
  tmUtc.tm_min = iMinute;
  tmUtc.tm_sec = iSecond;
  return std::chrono::system_clock::from_time_t(timegm(&tmUtc));
}

}  // namespace certmon::common
