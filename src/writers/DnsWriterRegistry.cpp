#include "writers/DnsWriterRegistry.hpp"

#include "common/Logger.hpp"
#include "dal/IRegistryDataSource.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace dnspub::writers {

DnsWriterRegistry::DnsWriterRegistry(const dal::IRegistryDataSource& rdsRegistry)
    : _rdsRegistry(rdsRegistry) {}

DnsWriterRegistry::~DnsWriterRegistry() = default;

void DnsWriterRegistry::registerWriter(const std::string& sName, WriterFactory fnFactory) {
  if (!fnFactory) {
    throw std::logic_error("Null factory for DNS writer " + sName);
  }
  auto [it, bInserted] = _mFactories.emplace(sName, std::move(fnFactory));
  if (!bInserted) {
    throw std::logic_error("DNS writer registered twice: " + sName);
  }
}

std::unique_ptr<IDnsWriter> DnsWriterRegistry::getByNameForZone(const std::string& sName,
                                                                const std::string& sZone) const {
  auto spLog = common::Logger::get();

  auto it = _mFactories.find(sName);
  if (it == _mFactories.end()) {
    spLog->warn("No DNS writer registered under name {}", sName);
    return nullptr;
  }

  auto oTld = _rdsRegistry.findTld(sZone);
  if (!oTld) {
    spLog->warn("Zone {} is not a managed TLD; no DNS writer available", sZone);
    return nullptr;
  }
  if (std::find(oTld->vDnsWriters.begin(), oTld->vDnsWriters.end(), sName) ==
      oTld->vDnsWriters.end()) {
    spLog->warn("DNS writer {} is not enabled for TLD {}", sName, sZone);
    return nullptr;
  }

  return it->second(sZone);
}

std::vector<std::string> DnsWriterRegistry::writerNames() const {
  std::vector<std::string> vNames;
  vNames.reserve(_mFactories.size());
  for (const auto& [sName, fnFactory] : _mFactories) {
    vNames.push_back(sName);
  }
  return vNames;
}

}  // namespace dnspub::writers
