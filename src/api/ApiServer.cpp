#include "api/ApiServer.hpp"

#include "api/routes/HealthRoutes.hpp"
#include "api/routes/MetricsRoutes.hpp"
#include "api/routes/PublishRoutes.hpp"
#include "common/Logger.hpp"

namespace dnspub::api {

ApiServer::ApiServer(routes::PublishRoutes& prRoutes, routes::HealthRoutes& hrRoutes,
                     routes::MetricsRoutes& mrRoutes)
    : _prRoutes(prRoutes), _hrRoutes(hrRoutes), _mrRoutes(mrRoutes) {}

ApiServer::~ApiServer() = default;

void ApiServer::registerRoutes() {
  _prRoutes.registerRoutes(_app);
  _hrRoutes.registerRoutes(_app);
  _mrRoutes.registerRoutes(_app);
}

void ApiServer::start(int iPort, int iThreads) {
  common::Logger::get()->info("HTTP server listening on port {} with {} threads", iPort,
                              iThreads);
  _app.loglevel(crow::LogLevel::Warning);
  _app.port(static_cast<uint16_t>(iPort)).concurrency(static_cast<uint16_t>(iThreads)).run();
}

void ApiServer::stop() { _app.stop(); }

}  // namespace dnspub::api
