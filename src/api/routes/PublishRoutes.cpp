#include "api/routes/PublishRoutes.hpp"

#include "api/Responses.hpp"
#include "common/Errors.hpp"
#include "common/Json.hpp"
#include "common/Logger.hpp"
#include "core/PublishDnsUpdatesAction.hpp"
#include "security/TaskSignatureVerifier.hpp"

#include <nlohmann/json.hpp>

namespace dnspub::api::routes {

PublishRoutes::PublishRoutes(core::PublishDnsUpdatesAction& pdaAction,
                             const security::TaskSignatureVerifier& tsvVerifier)
    : _pdaAction(pdaAction), _tsvVerifier(tsvVerifier) {}

PublishRoutes::~PublishRoutes() = default;

void PublishRoutes::registerRoutes(crow::SimpleApp& app) {
  // POST /_dr/task/publishDnsUpdates
  CROW_ROUTE(app, "/_dr/task/publishDnsUpdates").methods("POST"_method)(
      [this](const crow::request& req) -> crow::response { return handlePublish(req); });
}

crow::response PublishRoutes::handlePublish(const crow::request& req) {
  try {
    _tsvVerifier.verify(req.body, req.get_header_value("X-Task-Signature"));

    auto pbBatch = nlohmann::json::parse(req.body).get<common::PublishBatch>();
    _pdaAction.run(pbBatch);

    return jsonResponse(200, {{"status", "ok"}});
  } catch (const common::AppError& e) {
    if (e._iHttpStatus >= 500) {
      common::Logger::get()->error("publishDnsUpdates failed: {}", e.what());
    }
    return errorResponse(e);
  } catch (const nlohmann::json::exception& e) {
    return errorResponse(400, "invalid_json", std::string("Invalid JSON body: ") + e.what());
  } catch (const std::exception& e) {
    common::Logger::get()->error("publishDnsUpdates failed unexpectedly: {}", e.what());
    return errorResponse(500, "internal_error", e.what());
  }
}

}  // namespace dnspub::api::routes
