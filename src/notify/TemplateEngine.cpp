#include "notify/TemplateEngine.hpp"

#include <algorithm>
#include <cctype>
#include <functional>
#include <tuple>

#include "common/Errors.hpp"

namespace certmon::notify {

namespace {

const std::vector<std::string> kExpiryFields = {"Domain", "Status",   "Days", "DomainDays",
                                                "ExpiryDate", "Issuer", "IP", "TLS",
                                                "HTTPCode", "Record", "Reason"};
const std::vector<std::string> kOperationFields = {"Action", "Domain", "Details", "Time"};
const std::vector<std::string> kTaskSummaryFields = {"Added",  "Updated", "Deleted", "Skipped",
                                                     "Total",  "Active",  "Expired", "Warning",
                                                     "Duration", "Time",  "Details"};

std::string trim(const std::string& sValue) {
  const auto itBegin = std::find_if_not(sValue.begin(), sValue.end(),
                                        [](unsigned char c) { return std::isspace(c); });
  const auto itEnd = std::find_if_not(sValue.rbegin(), sValue.rend(), [](unsigned char c) {
                       return std::isspace(c);
                     }).base();
  return itBegin < itEnd ? std::string(itBegin, itEnd) : std::string{};
}

/// Walk sTemplate, handing literal runs and placeholder names to the callbacks.
void scan(const std::string& sTemplate,
          const std::function<void(const std::string&)>& fnLiteral,
          const std::function<void(const std::string&)>& fnField) {
  size_t uPos = 0;
  while (uPos < sTemplate.size()) {
    const size_t uOpen = sTemplate.find("{{", uPos);
    if (uOpen == std::string::npos) {
      fnLiteral(sTemplate.substr(uPos));
      return;
    }
    fnLiteral(sTemplate.substr(uPos, uOpen - uPos));

    const size_t uClose = sTemplate.find("}}", uOpen + 2);
    if (uClose == std::string::npos) {
      throw common::TemplateError("unterminated_placeholder",
                                  "Unterminated placeholder at offset " + std::to_string(uOpen));
    }

    const std::string sInner = trim(sTemplate.substr(uOpen + 2, uClose - uOpen - 2));
    if (sInner.size() < 2 || sInner.front() != '.') {
      throw common::TemplateError("invalid_placeholder",
                                  "Invalid placeholder '{{" + sInner + "}}'");
    }
    const std::string sName = sInner.substr(1);
    const bool bIdentifier = std::all_of(sName.begin(), sName.end(), [](unsigned char c) {
      return std::isalnum(c) || c == '_';
    });
    if (!bIdentifier) {
      throw common::TemplateError("invalid_placeholder",
                                  "Invalid placeholder '{{" + sInner + "}}'");
    }
    fnField(sName);
    uPos = uClose + 2;
  }
}

void requireKnown(const std::string& sName, TemplateCategory category) {
  const auto& vFields = TemplateEngine::fieldsFor(category);
  if (std::find(vFields.begin(), vFields.end(), sName) == vFields.end()) {
    throw common::TemplateError("unknown_field", "Unknown template field '" + sName + "'");
  }
}

}  // namespace

TemplateValues ExpiryTemplateData::toValues() const {
  return {{"Domain", sDomain},           {"Status", sStatus},
          {"Days", std::to_string(iDays)}, {"DomainDays", std::to_string(iDomainDays)},
          {"ExpiryDate", sExpiryDate},   {"Issuer", sIssuer},
          {"IP", sIp},                   {"TLS", sTls},
          {"HTTPCode", std::to_string(iHttpCode)}, {"Record", sRecord},
          {"Reason", sReason}};
}

TemplateValues OperationTemplateData::toValues() const {
  return {{"Action", sAction}, {"Domain", sDomain}, {"Details", sDetails}, {"Time", sTime}};
}

TemplateValues TaskSummaryData::toValues() const {
  return {{"Added", std::to_string(iAdded)},     {"Updated", std::to_string(iUpdated)},
          {"Deleted", std::to_string(iDeleted)}, {"Skipped", std::to_string(iSkipped)},
          {"Total", std::to_string(iTotal)},     {"Active", std::to_string(iActive)},
          {"Expired", std::to_string(iExpired)}, {"Warning", std::to_string(iWarning)},
          {"Duration", sDuration},               {"Time", sTime},
          {"Details", sDetails}};
}

const std::vector<std::string>& TemplateEngine::fieldsFor(TemplateCategory category) {
  switch (category) {
    case TemplateCategory::Expiry:
      return kExpiryFields;
    case TemplateCategory::Operation:
      return kOperationFields;
    case TemplateCategory::TaskSummary:
      return kTaskSummaryFields;
  }
  return kOperationFields;
}

std::string TemplateEngine::render(const std::string& sTemplate, TemplateCategory category,
                                   const TemplateValues& tvValues) {
  std::string sOut;
  sOut.reserve(sTemplate.size());
  scan(
      sTemplate, [&](const std::string& sLiteral) { sOut += sLiteral; },
      [&](const std::string& sName) {
        requireKnown(sName, category);
        const auto it = tvValues.find(sName);
        if (it != tvValues.end()) sOut += it->second;
      });
  return sOut;
}

void TemplateEngine::validate(const std::string& sTemplate, TemplateCategory category) {
  scan(
      sTemplate, [](const std::string&) {},
      [&](const std::string& sName) { requireKnown(sName, category); });
}

bool TemplateEngine::references(const std::string& sTemplate, const std::string& sField) {
  bool bFound = false;
  try {
    scan(
        sTemplate, [](const std::string&) {},
        [&](const std::string& sName) { bFound = bFound || sName == sField; });
  } catch (const common::TemplateError&) {
    return false;
  }
  return bFound;
}

void validateTemplates(const common::AlertSettings& als) {
  const std::vector<std::tuple<const char*, const std::string*, TemplateCategory>> vChecks = {
      {"notify_on_expiry_tpl", &als.sExpiryTemplate, TemplateCategory::Expiry},
      {"notify_on_add_tpl", &als.sAddTemplate, TemplateCategory::Operation},
      {"notify_on_delete_tpl", &als.sDeleteTemplate, TemplateCategory::Operation},
      {"notify_on_renew_tpl", &als.sRenewTemplate, TemplateCategory::Operation},
      {"notify_on_update_tpl", &als.sUpdateTemplate, TemplateCategory::Operation},
      {"notify_on_zone_add_tpl", &als.sZoneAddTemplate, TemplateCategory::Operation},
      {"notify_on_zone_delete_tpl", &als.sZoneDeleteTemplate, TemplateCategory::Operation},
      {"sync_finish_tpl", &als.sSyncFinishTemplate, TemplateCategory::TaskSummary},
      {"scan_finish_tpl", &als.sScanFinishTemplate, TemplateCategory::TaskSummary},
  };

  for (const auto& [pKey, pTemplate, category] : vChecks) {
    if (pTemplate->empty()) continue;
    try {
      TemplateEngine::validate(*pTemplate, category);
    } catch (const common::TemplateError& e) {
      throw common::TemplateError(e._sErrorCode, std::string(pKey) + ": " + e.what());
    }
  }
}

}  // namespace certmon::notify
