#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "writers/IDnsWriter.hpp"

namespace dnspub::dal {
class IRegistryDataSource;
}

namespace dnspub::writers {

/// Closed table of writer factories, filled once at startup.
/// Each lookup produces a fresh single-use writer for the zone.
/// Class abbreviation: dwr
class DnsWriterRegistry {
 public:
  using WriterFactory = std::function<std::unique_ptr<IDnsWriter>(const std::string& sZone)>;

  explicit DnsWriterRegistry(const dal::IRegistryDataSource& rdsRegistry);
  ~DnsWriterRegistry();

  /// Throws std::logic_error on a duplicate name.
  void registerWriter(const std::string& sName, WriterFactory fnFactory);

  /// A new writer for the zone, or nullptr when the name is not registered or
  /// not enabled for the zone's TLD.
  std::unique_ptr<IDnsWriter> getByNameForZone(const std::string& sName,
                                               const std::string& sZone) const;

  std::vector<std::string> writerNames() const;

 private:
  const dal::IRegistryDataSource& _rdsRegistry;
  std::map<std::string, WriterFactory> _mFactories;
};

}  // namespace dnspub::writers
