#pragma once

#include <crow.h>

namespace dnspub::api::routes {
class HealthRoutes;
class MetricsRoutes;
class PublishRoutes;
}  // namespace dnspub::api::routes

namespace dnspub::api {

/// Owns the Crow application instance; registers all routes at startup.
/// Class abbreviation: api
class ApiServer {
 public:
  ApiServer(routes::PublishRoutes& prRoutes, routes::HealthRoutes& hrRoutes,
            routes::MetricsRoutes& mrRoutes);
  ~ApiServer();

  void registerRoutes();

  /// Blocks serving requests until stop() or SIGINT/SIGTERM.
  void start(int iPort, int iThreads);
  void stop();

 private:
  crow::SimpleApp _app;
  routes::PublishRoutes& _prRoutes;
  routes::HealthRoutes& _hrRoutes;
  routes::MetricsRoutes& _mrRoutes;
};

}  // namespace dnspub::api
