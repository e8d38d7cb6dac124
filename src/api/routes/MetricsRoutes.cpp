#include "api/routes/MetricsRoutes.hpp"

#include "api/Responses.hpp"
#include "core/DnsMetrics.hpp"

namespace dnspub::api::routes {

MetricsRoutes::MetricsRoutes(const core::DnsMetrics& dmMetrics) : _dmMetrics(dmMetrics) {}

MetricsRoutes::~MetricsRoutes() = default;

void MetricsRoutes::registerRoutes(crow::SimpleApp& app) {
  // GET /metrics
  CROW_ROUTE(app, "/metrics").methods("GET"_method)(
      [this]() -> crow::response { return jsonResponse(200, _dmMetrics.snapshot()); });
}

}  // namespace dnspub::api::routes
