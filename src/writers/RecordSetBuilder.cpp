#include "writers/RecordSetBuilder.hpp"

#include "common/DomainNames.hpp"
#include "common/Errors.hpp"
#include "dal/IRegistryDataSource.hpp"
#include "writers/DesiredState.hpp"

#include <arpa/inet.h>

#include <array>
#include <utility>
#include <vector>

namespace dnspub::writers {

namespace {

/// Canonical text form of an address and whether it is IPv6.
std::pair<std::string, bool> canonicalAddress(const std::string& sAddress) {
  std::array<unsigned char, sizeof(struct in6_addr)> aBuf{};
  std::array<char, INET6_ADDRSTRLEN> aText{};

  if (inet_pton(AF_INET, sAddress.c_str(), aBuf.data()) == 1) {
    if (inet_ntop(AF_INET, aBuf.data(), aText.data(), aText.size()) == nullptr) {
      throw common::ValidationError("invalid_address", "Cannot format address: " + sAddress);
    }
    return {std::string(aText.data()), false};
  }
  if (inet_pton(AF_INET6, sAddress.c_str(), aBuf.data()) == 1) {
    if (inet_ntop(AF_INET6, aBuf.data(), aText.data(), aText.size()) == nullptr) {
      throw common::ValidationError("invalid_address", "Cannot format address: " + sAddress);
    }
    return {std::string(aText.data()), true};
  }
  throw common::ValidationError("invalid_address",
                                "Address is neither IPv4 nor IPv6: " + sAddress);
}

}  // namespace

RecordSetBuilder::RecordSetBuilder(const dal::IRegistryDataSource& rdsRegistry,
                                   common::RecordTtls rtTtls,
                                   std::chrono::system_clock::time_point tpReference)
    : _rdsRegistry(rdsRegistry), _rtTtls(rtTtls), _tpReference(tpReference) {}

RecordSetBuilder::~RecordSetBuilder() = default;

void RecordSetBuilder::stageDomain(const std::string& sDomainName,
                                   DesiredState& dstState) const {
  const std::string sAbsolute = common::domain_names::toAbsolute(sDomainName);
  auto oDomain = _rdsRegistry.findDomain(common::domain_names::canonicalize(sDomainName),
                                         _tpReference);

  if (!oDomain || !oDomain->shouldPublishToDns()) {
    dstState.stage(sAbsolute, {});
    return;
  }

  std::set<common::ResourceRecord> setRecords;

  if (!oDomain->vDsData.empty()) {
    common::ResourceRecord rrDs{sAbsolute, common::RecordType::DS, _rtTtls.uDsTtl, {}};
    for (const auto& ds : oDomain->vDsData) {
      rrDs.setRrdata.insert(ds.toRrData());
    }
    setRecords.insert(std::move(rrDs));
  }

  std::vector<std::string> vSubordinateHosts;
  if (!oDomain->vNameservers.empty()) {
    common::ResourceRecord rrNs{sAbsolute, common::RecordType::NS, _rtTtls.uNsTtl, {}};
    for (const auto& sNameserver : oDomain->vNameservers) {
      rrNs.setRrdata.insert(common::domain_names::toAbsolute(sNameserver));
      if (common::domain_names::isUnder(sNameserver, sDomainName)) {
        vSubordinateHosts.push_back(sNameserver);
      }
    }
    setRecords.insert(std::move(rrNs));
  }

  dstState.stage(sAbsolute, std::move(setRecords));

  for (const auto& sHost : vSubordinateHosts) {
    stageSubordinateHost(sHost, dstState);
  }
}

void RecordSetBuilder::stageSubordinateHost(const std::string& sHostName,
                                            DesiredState& dstState) const {
  const std::string sAbsolute = common::domain_names::toAbsolute(sHostName);
  auto oHost = _rdsRegistry.findHost(common::domain_names::canonicalize(sHostName),
                                     _tpReference);
  if (!oHost) {
    dstState.stage(sAbsolute, {});
    return;
  }

  common::ResourceRecord rrA{sAbsolute, common::RecordType::A, _rtTtls.uATtl, {}};
  common::ResourceRecord rrAaaa{sAbsolute, common::RecordType::AAAA, _rtTtls.uATtl, {}};
  for (const auto& sAddress : oHost->vInetAddresses) {
    auto [sCanonical, bIpv6] = canonicalAddress(sAddress);
    (bIpv6 ? rrAaaa : rrA).setRrdata.insert(std::move(sCanonical));
  }

  std::set<common::ResourceRecord> setRecords;
  if (!rrA.setRrdata.empty()) setRecords.insert(std::move(rrA));
  if (!rrAaaa.setRrdata.empty()) setRecords.insert(std::move(rrAaaa));
  dstState.stage(sAbsolute, std::move(setRecords));
}

std::optional<std::string> RecordSetBuilder::findSuperordinateDomain(
    const std::string& sHostName) const {
  const std::string sCanonical = common::domain_names::canonicalize(sHostName);
  auto oTld = _rdsRegistry.findTldForName(sCanonical);
  if (!oTld) {
    return std::nullopt;
  }
  return common::domain_names::superordinateDomain(sCanonical, *oTld);
}

}  // namespace dnspub::writers
