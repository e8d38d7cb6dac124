#pragma once

#include <string>

#include "writers/BaseDnsWriter.hpp"

namespace dnspub::writers {

/// Writer for TLDs that are not served from this registry's DNS.
/// Logs every name it is asked to publish and discards it.
class VoidDnsWriter : public BaseDnsWriter {
 public:
  static constexpr const char* kName = "VoidDnsWriter";

  explicit VoidDnsWriter(std::string sZone);
  ~VoidDnsWriter() override;

 protected:
  void publishDomainUnchecked(const std::string& sDomainName) override;
  void publishHostUnchecked(const std::string& sHostName) override;
  void commitUnchecked() override;

 private:
  std::string _sZone;
};

}  // namespace dnspub::writers
