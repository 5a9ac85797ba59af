#include "core/SkipPolicy.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace certmon::core {

namespace {

std::string toLower(std::string sValue) {
  std::transform(sValue.begin(), sValue.end(), sValue.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return sValue;
}

std::vector<std::string> lowerAll(std::vector<std::string> vItems) {
  for (auto& sItem : vItems) sItem = toLower(sItem);
  std::erase(vItems, std::string{});
  return vItems;
}

}  // namespace

SkipPolicy::SkipPolicy(std::vector<std::string> vContains,
                       std::vector<std::string> vLabelPrefixes,
                       std::vector<std::string> vLabelSuffixes)
    : _vContains(lowerAll(std::move(vContains))),
      _vLabelPrefixes(lowerAll(std::move(vLabelPrefixes))),
      _vLabelSuffixes(lowerAll(std::move(vLabelSuffixes))) {}

bool SkipPolicy::shouldSkip(const std::string& sHostname) const {
  const std::string sName = toLower(sHostname);

  for (const auto& sNeedle : _vContains) {
    if (sName.find(sNeedle) != std::string::npos) return true;
  }

  const std::string sLabel = sName.substr(0, sName.find('.'));
  for (const auto& sPrefix : _vLabelPrefixes) {
    if (sLabel.starts_with(sPrefix)) return true;
  }
  for (const auto& sSuffix : _vLabelSuffixes) {
    if (sLabel.ends_with(sSuffix)) return true;
  }
  return false;
}

}  // namespace certmon::core
