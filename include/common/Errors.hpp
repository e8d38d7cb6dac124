#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace dnspub::common {

/// Base error for all application-level exceptions.
/// Carries HTTP status code and machine-readable error code slug.
struct AppError : public std::runtime_error {
  int _iHttpStatus;
  std::string _sErrorCode;

  explicit AppError(int iHttpStatus, std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)),
        _iHttpStatus(iHttpStatus),
        _sErrorCode(std::move(sCode)) {}
};

/// 400 Bad Request: malformed batch, name or record data.
struct ValidationError : AppError {
  explicit ValidationError(std::string sCode, std::string sMsg)
      : AppError(400, std::move(sCode), std::move(sMsg)) {}
};

/// 401 Unauthorized: task request signature missing or wrong.
struct AuthenticationError : AppError {
  explicit AuthenticationError(std::string sCode, std::string sMsg)
      : AppError(401, std::move(sCode), std::move(sMsg)) {}
};

/// 409 Conflict: provider zone no longer matches what was read before the
/// change was submitted. Retryable: the whole reconciliation is re-run.
struct ZoneStateError : AppError {
  std::string _sReason;

  explicit ZoneStateError(std::string sReason)
      : AppError(409, "zone_state_mismatch",
                 "Zone state on provider does not match the expected state: " + sReason),
        _sReason(std::move(sReason)) {}
};

/// 502 Bad Gateway: upstream DNS provider error.
struct ProviderError : AppError {
  explicit ProviderError(std::string sCode, std::string sMsg)
      : AppError(502, std::move(sCode), std::move(sMsg)) {}
};

/// 502 Bad Gateway: provider rejected a change request. Carries every reason
/// the provider reported so the caller can classify the failure.
struct ProviderChangeError : ProviderError {
  std::vector<std::string> _vReasons;

  explicit ProviderChangeError(std::vector<std::string> vReasons, std::string sMsg)
      : ProviderError("change_rejected", std::move(sMsg)), _vReasons(std::move(vReasons)) {}
};

/// 503 Service Unavailable: per-zone lock not obtained; the transport retries later.
struct ServiceUnavailableError : AppError {
  explicit ServiceUnavailableError(std::string sCode, std::string sMsg)
      : AppError(503, std::move(sCode), std::move(sMsg)) {}
};

}  // namespace dnspub::common
