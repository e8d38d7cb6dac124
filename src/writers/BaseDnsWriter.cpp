#include "writers/BaseDnsWriter.hpp"

#include <stdexcept>

namespace dnspub::writers {

BaseDnsWriter::BaseDnsWriter() = default;
BaseDnsWriter::~BaseDnsWriter() = default;

void BaseDnsWriter::checkNotCommitted(const char* pOperation) const {
  if (_bCommitted) {
    throw std::logic_error(std::string(pOperation) + " called after commit()");
  }
}

void BaseDnsWriter::publishDomain(const std::string& sDomainName) {
  checkNotCommitted("publishDomain()");
  publishDomainUnchecked(sDomainName);
}

void BaseDnsWriter::publishHost(const std::string& sHostName) {
  checkNotCommitted("publishHost()");
  publishHostUnchecked(sHostName);
}

void BaseDnsWriter::commit() {
  if (_bCommitted) {
    throw std::logic_error("commit() has already been called");
  }
  // Set before running so a failed commit cannot be re-driven on the same writer.
  _bCommitted = true;
  commitUnchecked();
}

}  // namespace dnspub::writers
