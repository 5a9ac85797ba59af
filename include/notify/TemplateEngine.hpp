#pragma once

#include <map>
#include <string>
#include <vector>

#include "common/AlertSettings.hpp"

namespace certmon::notify {

/// Each category exposes a fixed set of substitution fields.
enum class TemplateCategory {
  Expiry,
  Operation,
  TaskSummary,
};

using TemplateValues = std::map<std::string, std::string>;

/// Fields of an expiry alert.
/// Class abbreviation: etd
struct ExpiryTemplateData {
  std::string sDomain;
  std::string sStatus;
  int iDays = 0;
  int iDomainDays = 0;
  std::string sExpiryDate;
  std::string sIssuer;
  std::string sIp;
  std::string sTls;
  int iHttpCode = 0;
  std::string sRecord;
  std::string sReason;

  TemplateValues toValues() const;
};

/// Fields of a lifecycle event (add, delete, renew, update, zone add/remove).
/// Class abbreviation: otd
struct OperationTemplateData {
  std::string sAction;
  std::string sDomain;
  std::string sDetails;
  std::string sTime;

  TemplateValues toValues() const;
};

/// Fields of a run summary (sync or rescan).
/// Class abbreviation: tsd
struct TaskSummaryData {
  int iAdded = 0;
  int iUpdated = 0;
  int iDeleted = 0;
  int iSkipped = 0;
  int iTotal = 0;
  int iActive = 0;
  int iExpired = 0;
  int iWarning = 0;
  std::string sDuration;
  std::string sTime;
  std::string sDetails;

  TemplateValues toValues() const;
};

/// Strict "{{.Field}}" renderer. Whitespace inside the braces is allowed.
/// A field outside the category's set, an empty name or an unterminated
/// placeholder throws common::TemplateError; nothing is silently dropped.
/// Class abbreviation: te
class TemplateEngine {
 public:
  static std::string render(const std::string& sTemplate, TemplateCategory category,
                            const TemplateValues& tvValues);

  /// Parse only. Throws common::TemplateError.
  static void validate(const std::string& sTemplate, TemplateCategory category);

  /// True if sTemplate contains a placeholder for sField.
  static bool references(const std::string& sTemplate, const std::string& sField);

  static const std::vector<std::string>& fieldsFor(TemplateCategory category);
};

/// Validate every non-empty template in als against its category.
/// Throws common::TemplateError naming the offending setting.
void validateTemplates(const common::AlertSettings& als);

}  // namespace certmon::notify
