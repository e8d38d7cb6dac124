#include "security/TaskSignatureVerifier.hpp"

#include "common/Errors.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <cctype>
#include <stdexcept>

namespace dnspub::security {

namespace {

std::string hmacSha256Hex(const std::string& sKey, const std::string& sData) {
  unsigned char vHash[EVP_MAX_MD_SIZE];
  unsigned int uHashLen = 0;

  unsigned char* pResult = HMAC(
      EVP_sha256(),
      sKey.data(), static_cast<int>(sKey.size()),
      reinterpret_cast<const unsigned char*>(sData.data()),
      sData.size(),
      vHash, &uHashLen);

  if (!pResult) {
    throw std::runtime_error("HMAC-SHA256 computation failed");
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string sHex;
  sHex.reserve(uHashLen * 2);
  for (unsigned int i = 0; i < uHashLen; ++i) {
    sHex += kHex[vHash[i] >> 4];
    sHex += kHex[vHash[i] & 0x0f];
  }
  OPENSSL_cleanse(vHash, sizeof(vHash));
  return sHex;
}

}  // anonymous namespace

TaskSignatureVerifier::TaskSignatureVerifier(const std::string& sSecret) : _sSecret(sSecret) {
  if (_sSecret.empty()) {
    throw std::runtime_error("Task secret cannot be empty");
  }
}

TaskSignatureVerifier::~TaskSignatureVerifier() {
  if (!_sSecret.empty()) {
    OPENSSL_cleanse(_sSecret.data(), _sSecret.size());
  }
}

std::string TaskSignatureVerifier::sign(const std::string& sBody) const {
  return hmacSha256Hex(_sSecret, sBody);
}

void TaskSignatureVerifier::verify(const std::string& sBody,
                                   const std::string& sSignatureHex) const {
  if (sSignatureHex.empty()) {
    throw common::AuthenticationError("missing_signature", "X-Task-Signature header required");
  }

  std::string sProvided = sSignatureHex;
  for (auto& c : sProvided) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  const std::string sExpected = sign(sBody);

  // Constant-time comparison
  if (sProvided.size() != sExpected.size() ||
      CRYPTO_memcmp(sProvided.data(), sExpected.data(), sExpected.size()) != 0) {
    throw common::AuthenticationError("invalid_signature", "Task signature mismatch");
  }
}

}  // namespace dnspub::security
