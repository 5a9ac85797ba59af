#pragma once

#include <bitset>
#include <string>

#include "common/Types.hpp"

namespace certmon::core {

/// Five-field cron expression: minute hour day-of-month month day-of-week.
/// Supports "*", lists, ranges and steps; day-of-week 0 and 7 are Sunday.
/// When both day fields are restricted a day matches if either matches.
/// Evaluated in local time.
/// Class abbreviation: ce
class CronExpression {
 public:
  /// Throws common::ValidationError on a malformed expression.
  static CronExpression parse(const std::string& sExpr);

  /// First matching minute strictly after tpAfter.
  /// Throws common::ValidationError if nothing matches within five years.
  common::SysTime next(common::SysTime tpAfter) const;

  bool matches(common::SysTime tp) const;

  const std::string& text() const { return _sText; }

 private:
  CronExpression() = default;

  bool dayMatches(int iMonthDay, int iMonth, int iWeekDay) const;

  std::string _sText;
  std::bitset<60> _bsMinutes;
  std::bitset<24> _bsHours;
  std::bitset<32> _bsMonthDays;
  std::bitset<13> _bsMonths;
  std::bitset<7> _bsWeekDays;
  bool _bMonthDayStar = false;
  bool _bWeekDayStar = false;
};

}  // namespace certmon::core
