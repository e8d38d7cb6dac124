#include "api/routes/HealthRoutes.hpp"

#include "api/Responses.hpp"
#include "providers/IProvider.hpp"

#include <nlohmann/json.hpp>

#include <utility>

namespace dnspub::api::routes {

HealthRoutes::HealthRoutes(std::vector<providers::IProvider*> vProviders)
    : _vProviders(std::move(vProviders)) {}

HealthRoutes::~HealthRoutes() = default;

void HealthRoutes::registerRoutes(crow::SimpleApp& app) {
  // GET /health
  CROW_ROUTE(app, "/health").methods("GET"_method)(
      [this]() -> crow::response { return handleHealth(); });
}

crow::response HealthRoutes::handleHealth() {
  bool bAllOk = true;
  nlohmann::json jProviders = nlohmann::json::object();
  for (auto* pProvider : _vProviders) {
    const auto hsStatus = pProvider->testConnectivity();
    if (hsStatus != common::HealthStatus::Ok) bAllOk = false;
    jProviders[pProvider->name()] = common::toString(hsStatus);
  }

  nlohmann::json jResp = {{"status", bAllOk ? "ok" : "degraded"}, {"providers", jProviders}};
  return jsonResponse(bAllOk ? 200 : 503, jResp);
}

}  // namespace dnspub::api::routes
