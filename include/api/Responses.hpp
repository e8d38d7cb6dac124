#pragma once

#include <crow.h>
#include <nlohmann/json.hpp>

#include <string>

#include "common/Errors.hpp"

namespace dnspub::api {

/// JSON response with the Content-Type set.
inline crow::response jsonResponse(int iStatus, const nlohmann::json& jBody) {
  crow::response resp(iStatus, jBody.dump(2));
  resp.set_header("Content-Type", "application/json");
  return resp;
}

/// {"error": code, "message": text}
inline crow::response errorResponse(int iStatus, const std::string& sCode,
                                    const std::string& sMessage) {
  return jsonResponse(iStatus, {{"error", sCode}, {"message", sMessage}});
}

inline crow::response errorResponse(const common::AppError& e) {
  return errorResponse(e._iHttpStatus, e._sErrorCode, e.what());
}

}  // namespace dnspub::api
