#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "common/Types.hpp"

namespace certmon::common {

/// Whole days between tpNow and tpTarget: floor(hours / 24).
/// Negative once tpTarget is in the past.
int daysUntil(SysTime tpTarget, SysTime tpNow = std::chrono::system_clock::now());

/// "2006-01-02" in UTC.
std::string formatDate(SysTime tp);

/// "2006-01-02 15:04:05" in local time, used in rendered messages.
std::string formatLocalDateTime(SysTime tp);

/// "2006-01-02T15:04:05Z".
std::string toIso8601(SysTime tp);

/// Parse "YYYY-MM-DDTHH:MM:SS[.fff]Z" or with a "+HH:MM" offset.
std::optional<SysTime> parseIso8601(const std::string& sValue);

/// Human-readable elapsed time, e.g. "2m5.3s" or "840ms".
std::string formatDuration(std::chrono::milliseconds dur);

/// Build a UTC time point from calendar fields.
SysTime makeUtc(int iYear, int iMonth, int iDay, int iHour = 0, int iMinute = 0,
                int iSecond = 0);

}  // namespace certmon::common
