#pragma once

#include <string>

#include <crow.h>

namespace jwks::core {
class JwksService;
}

namespace jwks::api::routes {

/// Publishes the public key set at the discovery path (default /jwks).
/// Class abbreviation: jr
class JwksRoutes {
 public:
  JwksRoutes(core::JwksService& jsService, std::string sDiscoveryPath);
  ~JwksRoutes();

  void registerRoutes(crow::SimpleApp& app);

  /// Body of GET <discovery path>. AppErrors become {error, message}.
  crow::response handleKeySet() const;

  const std::string& discoveryPath() const { return _sDiscoveryPath; }

 private:
  core::JwksService& _jsService;
  std::string _sDiscoveryPath;
};

}  // namespace jwks::api::routes
