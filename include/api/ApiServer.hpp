#pragma once

#include <memory>
#include <string>

#include <crow.h>

namespace jwks::core {
class JwksService;
}

namespace jwks::api {

namespace routes {
class HealthRoutes;
class JwksRoutes;
}  // namespace routes

/// Owns the Crow application and the route handlers.
/// Class abbreviation: api
class ApiServer {
 public:
  ApiServer(core::JwksService& jsService, std::string sDiscoveryPath);
  ~ApiServer();

  void registerRoutes();

  /// Blocks until stop() is called or the process receives SIGINT/SIGTERM.
  void start(int iPort, int iThreads);
  void stop();

 private:
  crow::SimpleApp _app;
  std::unique_ptr<routes::JwksRoutes> _upJwksRoutes;
  std::unique_ptr<routes::HealthRoutes> _upHealthRoutes;
};

}  // namespace jwks::api
