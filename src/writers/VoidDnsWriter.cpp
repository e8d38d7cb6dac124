#include "writers/VoidDnsWriter.hpp"

#include "common/Logger.hpp"

#include <utility>

namespace dnspub::writers {

VoidDnsWriter::VoidDnsWriter(std::string sZone) : _sZone(std::move(sZone)) {}

VoidDnsWriter::~VoidDnsWriter() = default;

void VoidDnsWriter::publishDomainUnchecked(const std::string& sDomainName) {
  common::Logger::get()->warn("Ignoring domain name publish request for {} in zone {}",
                              sDomainName, _sZone);
}

void VoidDnsWriter::publishHostUnchecked(const std::string& sHostName) {
  common::Logger::get()->warn("Ignoring host name publish request for {} in zone {}",
                              sHostName, _sZone);
}

void VoidDnsWriter::commitUnchecked() {
  common::Logger::get()->warn("VoidDnsWriter ignoring commit for zone {}", _sZone);
}

}  // namespace dnspub::writers
