#pragma once

#include <string>

#include "writers/IDnsWriter.hpp"

namespace dnspub::writers {

/// Enforces single use: no publishing after commit(), one commit() per writer.
/// Subclasses implement the *Unchecked hooks.
/// Class abbreviation: bw
class BaseDnsWriter : public IDnsWriter {
 public:
  ~BaseDnsWriter() override;

  void publishDomain(const std::string& sDomainName) final;
  void publishHost(const std::string& sHostName) final;
  void commit() final;

  bool committed() const { return _bCommitted; }

 protected:
  BaseDnsWriter();

  virtual void publishDomainUnchecked(const std::string& sDomainName) = 0;
  virtual void publishHostUnchecked(const std::string& sHostName) = 0;
  virtual void commitUnchecked() = 0;

 private:
  void checkNotCommitted(const char* pOperation) const;

  bool _bCommitted = false;
};

}  // namespace dnspub::writers
