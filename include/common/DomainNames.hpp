#pragma once

#include <optional>
#include <string>
#include <vector>

namespace dnspub::common::domain_names {

/// Lower-cases the name and strips a single trailing dot.
std::string canonicalize(const std::string& sName);

/// Canonical form with a trailing dot, as stored in record sets.
std::string toAbsolute(const std::string& sName);

/// Splits a name into its labels (trailing dot ignored).
std::vector<std::string> labels(const std::string& sName);

/// True for a syntactically valid host name: 1-63 octet LDH labels (underscore
/// allowed for service labels), no leading/trailing hyphen, 253 octets total.
bool isValid(const std::string& sName);

/// True if sName is strictly below sParent on a label boundary.
/// "a.example" is under "example"; "example" and "aexample" are not.
bool isUnder(const std::string& sName, const std::string& sParent);

/// The domain immediately below sTld that contains sHost, i.e. the TLD labels
/// plus one. Returns nullopt when sHost is not strictly under sTld.
std::optional<std::string> superordinateDomain(const std::string& sHost,
                                               const std::string& sTld);

}  // namespace dnspub::common::domain_names
