#pragma once

#include <crow.h>

namespace dnspub::core {
class DnsMetrics;
}

namespace dnspub::api::routes {

/// Handler for GET /metrics
/// Class abbreviation: mr
class MetricsRoutes {
 public:
  explicit MetricsRoutes(const core::DnsMetrics& dmMetrics);
  ~MetricsRoutes();

  void registerRoutes(crow::SimpleApp& app);

 private:
  const core::DnsMetrics& _dmMetrics;
};

}  // namespace dnspub::api::routes
