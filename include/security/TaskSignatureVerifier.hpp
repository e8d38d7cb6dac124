#pragma once

#include <string>

namespace dnspub::security {

/// Authenticates task requests: the X-Task-Signature header must be the
/// lower-case hex HMAC-SHA256 of the raw request body under the shared secret.
/// The secret is zeroed on destruction.
/// Class abbreviation: tsv
class TaskSignatureVerifier {
 public:
  /// Throws std::runtime_error on an empty secret.
  explicit TaskSignatureVerifier(const std::string& sSecret);
  ~TaskSignatureVerifier();

  TaskSignatureVerifier(const TaskSignatureVerifier&) = delete;
  TaskSignatureVerifier& operator=(const TaskSignatureVerifier&) = delete;

  /// Hex signature for a body. Used by tests and by the dispatcher side.
  std::string sign(const std::string& sBody) const;

  /// Throws common::AuthenticationError when sSignatureHex is missing or wrong.
  void verify(const std::string& sBody, const std::string& sSignatureHex) const;

 private:
  std::string _sSecret;
};

}  // namespace dnspub::security
