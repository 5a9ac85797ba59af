#include "core/CronExpression.hpp"

#include <chrono>
#include <ctime>
#include <sstream>
#include <vector>

#include "common/Errors.hpp"

namespace certmon::core {

namespace {

constexpr int kSearchDays = 366 * 5;

[[noreturn]] void invalid(const std::string& sExpr, const std::string& sWhy) {
  throw common::ValidationError("invalid_cron", "Invalid cron expression '" + sExpr + "': " + sWhy);
}

int parseNumber(const std::string& sExpr, const std::string& sToken) {
  if (sToken.empty()) invalid(sExpr, "empty value");
  int iValue = 0;
  for (const char c : sToken) {
    if (c < '0' || c > '9') invalid(sExpr, "'" + sToken + "' is not a number");
    iValue = iValue * 10 + (c - '0');
    if (iValue > 1000) invalid(sExpr, "'" + sToken + "' is out of range");
  }
  return iValue;
}

/// Expand one field into the set of values it selects. Returns whether it was "*".
template <size_t N>
bool parseField(const std::string& sExpr, const std::string& sField, int iMin, int iMax,
                std::bitset<N>& bsOut) {
  bool bStar = false;
  std::stringstream ss(sField);
  std::string sItem;
  while (std::getline(ss, sItem, ',')) {
    if (sItem.empty()) invalid(sExpr, "empty list item in '" + sField + "'");

    int iStep = 1;
    std::string sRange = sItem;
    if (const size_t uSlash = sItem.find('/'); uSlash != std::string::npos) {
      iStep = parseNumber(sExpr, sItem.substr(uSlash + 1));
      if (iStep == 0) invalid(sExpr, "step must be positive");
      sRange = sItem.substr(0, uSlash);
    }

    int iLo = iMin;
    int iHi = iMax;
    if (sRange == "*") {
      bStar = iStep == 1 && sField == "*";
    } else if (const size_t uDash = sRange.find('-'); uDash != std::string::npos) {
      iLo = parseNumber(sExpr, sRange.substr(0, uDash));
      iHi = parseNumber(sExpr, sRange.substr(uDash + 1));
    } else {
      iLo = parseNumber(sExpr, sRange);
      iHi = sItem.find('/') != std::string::npos ? iMax : iLo;
    }

    if (iLo < iMin || iHi > iMax || iLo > iHi) {
      invalid(sExpr, "'" + sItem + "' is outside " + std::to_string(iMin) + "-" +
                         std::to_string(iMax));
    }
    for (int i = iLo; i <= iHi; i += iStep) {
      bsOut.set(static_cast<size_t>(i));
    }
  }
  return bStar;
}

std::tm toLocal(common::SysTime tp) {
  const std::time_t tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tmLocal{};
  localtime_r(&tt, &tmLocal);
  return tmLocal;
}

common::SysTime fromLocal(std::tm tmLocal) {
  tmLocal.tm_isdst = -1;
  return std::chrono::system_clock::from_time_t(std::mktime(&tmLocal));
}

}  // namespace

CronExpression CronExpression::parse(const std::string& sExpr) {
  std::istringstream iss(sExpr);
  std::vector<std::string> vFields;
  std::string sField;
  while (iss >> sField) vFields.push_back(sField);
  if (vFields.size() != 5) {
    invalid(sExpr, "expected 5 fields, got " + std::to_string(vFields.size()));
  }

  CronExpression ce;
  ce._sText = sExpr;
  parseField(sExpr, vFields[0], 0, 59, ce._bsMinutes);
  parseField(sExpr, vFields[1], 0, 23, ce._bsHours);
  ce._bMonthDayStar = parseField(sExpr, vFields[2], 1, 31, ce._bsMonthDays);
  parseField(sExpr, vFields[3], 1, 12, ce._bsMonths);

  std::bitset<8> bsWeekDays;
  ce._bWeekDayStar = parseField(sExpr, vFields[4], 0, 7, bsWeekDays);
  for (size_t i = 0; i < 7; ++i) ce._bsWeekDays[i] = bsWeekDays[i];
  if (bsWeekDays[7]) ce._bsWeekDays.set(0);
  return ce;
}

bool CronExpression::dayMatches(int iMonthDay, int iMonth, int iWeekDay) const {
  if (!_bsMonths[static_cast<size_t>(iMonth)]) return false;
  const bool bMonthDay = _bsMonthDays[static_cast<size_t>(iMonthDay)];
  const bool bWeekDay = _bsWeekDays[static_cast<size_t>(iWeekDay)];
  if (_bMonthDayStar || _bWeekDayStar) return bMonthDay && bWeekDay;
  return bMonthDay || bWeekDay;
}

bool CronExpression::matches(common::SysTime tp) const {
  const std::tm tmLocal = toLocal(tp);
  return _bsMinutes[static_cast<size_t>(tmLocal.tm_min)] &&
         _bsHours[static_cast<size_t>(tmLocal.tm_hour)] &&
         dayMatches(tmLocal.tm_mday, tmLocal.tm_mon + 1, tmLocal.tm_wday);
}

common::SysTime CronExpression::next(common::SysTime tpAfter) const {
  std::tm tmCursor = toLocal(tpAfter + std::chrono::minutes(1));
  tmCursor.tm_sec = 0;

  for (int iDay = 0; iDay < kSearchDays; ++iDay) {
    // normalize after the day roll-over
    const common::SysTime tpDay = fromLocal(tmCursor);
    tmCursor = toLocal(tpDay);

    if (dayMatches(tmCursor.tm_mday, tmCursor.tm_mon + 1, tmCursor.tm_wday)) {
      for (int iHour = tmCursor.tm_hour; iHour < 24; ++iHour) {
        if (!_bsHours[static_cast<size_t>(iHour)]) continue;
        const int iFirstMinute = iHour == tmCursor.tm_hour ? tmCursor.tm_min : 0;
        for (int iMinute = iFirstMinute; iMinute < 60; ++iMinute) {
          if (!_bsMinutes[static_cast<size_t>(iMinute)]) continue;
          std::tm tmHit = tmCursor;
          tmHit.tm_hour = iHour;
          tmHit.tm_min = iMinute;
          return fromLocal(tmHit);
        }
      }
    }

    tmCursor.tm_mday += 1;
    tmCursor.tm_hour = 0;
    tmCursor.tm_min = 0;
  }
  invalid(_sText, "no matching time within five years");
}

}  // namespace certmon::core
