#include "api/ApiServer.hpp"

#include "api/routes/HealthRoutes.hpp"
#include "api/routes/JwksRoutes.hpp"
#include "common/Logger.hpp"

#include <cstdint>

namespace jwks::api {

ApiServer::ApiServer(core::JwksService& jsService, std::string sDiscoveryPath)
    : _upJwksRoutes(std::make_unique<routes::JwksRoutes>(jsService, std::move(sDiscoveryPath))),
      _upHealthRoutes(std::make_unique<routes::HealthRoutes>()) {}

ApiServer::~ApiServer() = default;

void ApiServer::registerRoutes() {
  _upJwksRoutes->registerRoutes(_app);
  _upHealthRoutes->registerRoutes(_app);
}

void ApiServer::start(int iPort, int iThreads) {
  common::Logger::get()->info("HTTP server listening on port {} ({} threads)", iPort, iThreads);
  _app.loglevel(crow::LogLevel::Warning);
  _app.port(static_cast<uint16_t>(iPort)).concurrency(static_cast<uint16_t>(iThreads)).run();
}

void ApiServer::stop() { _app.stop(); }

}  // namespace jwks::api
