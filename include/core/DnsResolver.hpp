#pragma once

#include "core/Prober.hpp"

namespace certmon::core {

/// System resolver: getaddrinfo for the address set, res_nquery for the CNAME.
/// A missing CNAME is not an error.
/// Class abbreviation: sdr
class SystemDnsResolver : public IDnsResolver {
 public:
  DnsAnswer resolve(const std::string& sHostname, const common::RunContext& rcCtx) override;
};

}  // namespace certmon::core
