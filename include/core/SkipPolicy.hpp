#pragma once

#include <string>
#include <vector>

namespace certmon::core {

/// Decides which discovered hostnames are never monitored
/// (verification records, service records, private-naming conventions).
/// Rules are configuration; an empty policy skips nothing.
/// Class abbreviation: sp
class SkipPolicy {
 public:
  SkipPolicy() = default;
  SkipPolicy(std::vector<std::string> vContains, std::vector<std::string> vLabelPrefixes,
             std::vector<std::string> vLabelSuffixes);

  /// True if sHostname contains any vContains entry (case-insensitive), or its
  /// first label starts with a prefix or ends with a suffix.
  bool shouldSkip(const std::string& sHostname) const;

 private:
  std::vector<std::string> _vContains;
  std::vector<std::string> _vLabelPrefixes;
  std::vector<std::string> _vLabelSuffixes;
};

}  // namespace certmon::core
