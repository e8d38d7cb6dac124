#pragma once

#include <crow.h>

#include <vector>

namespace dnspub::providers {
class IProvider;
}

namespace dnspub::api::routes {

/// Handler for GET /health
/// Class abbreviation: hr
class HealthRoutes {
 public:
  explicit HealthRoutes(std::vector<providers::IProvider*> vProviders);
  ~HealthRoutes();

  void registerRoutes(crow::SimpleApp& app);

  /// 200 {"status":"ok"} when every provider answers, 503 "degraded" otherwise.
  crow::response handleHealth();

 private:
  std::vector<providers::IProvider*> _vProviders;
};

}  // namespace dnspub::api::routes
