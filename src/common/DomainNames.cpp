#include "common/DomainNames.hpp"

#include <algorithm>
#include <cctype>

namespace dnspub::common::domain_names {

namespace {

constexpr size_t kMaxNameLength = 253;
constexpr size_t kMaxLabelLength = 63;

bool isLabelChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
}

}  // namespace

std::string canonicalize(const std::string& sName) {
  std::string sOut = sName;
  if (!sOut.empty() && sOut.back() == '.') {
    sOut.pop_back();
  }
  std::transform(sOut.begin(), sOut.end(), sOut.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return sOut;
}

std::string toAbsolute(const std::string& sName) {
  return canonicalize(sName) + ".";
}

std::vector<std::string> labels(const std::string& sName) {
  const std::string sCanonical = canonicalize(sName);
  std::vector<std::string> vLabels;
  if (sCanonical.empty()) return vLabels;

  size_t uStart = 0;
  while (true) {
    const size_t uDot = sCanonical.find('.', uStart);
    if (uDot == std::string::npos) {
      vLabels.push_back(sCanonical.substr(uStart));
      break;
    }
    vLabels.push_back(sCanonical.substr(uStart, uDot - uStart));
    uStart = uDot + 1;
  }
  return vLabels;
}

bool isValid(const std::string& sName) {
  const std::string sCanonical = canonicalize(sName);
  if (sCanonical.empty() || sCanonical.size() > kMaxNameLength) return false;

  for (const auto& sLabel : labels(sCanonical)) {
    if (sLabel.empty() || sLabel.size() > kMaxLabelLength) return false;
    if (sLabel.front() == '-' || sLabel.back() == '-') return false;
    if (!std::all_of(sLabel.begin(), sLabel.end(), isLabelChar)) return false;
  }
  return true;
}

bool isUnder(const std::string& sName, const std::string& sParent) {
  const std::string sChild = canonicalize(sName);
  const std::string sSuffix = "." + canonicalize(sParent);
  if (sSuffix.size() < 2 || sChild.size() <= sSuffix.size()) return false;
  return sChild.compare(sChild.size() - sSuffix.size(), sSuffix.size(), sSuffix) == 0;
}

std::optional<std::string> superordinateDomain(const std::string& sHost,
                                               const std::string& sTld) {
  if (!isUnder(sHost, sTld)) return std::nullopt;

  const auto vHostLabels = labels(sHost);
  const auto vTldLabels = labels(sTld);
  const size_t uFirst = vHostLabels.size() - vTldLabels.size() - 1;

  std::string sDomain;
  for (size_t i = uFirst; i < vHostLabels.size(); ++i) {
    if (!sDomain.empty()) sDomain += '.';
    sDomain += vHostLabels[i];
  }
  return sDomain;
}

}  // namespace dnspub::common::domain_names
