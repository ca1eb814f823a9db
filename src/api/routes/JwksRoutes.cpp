#include "api/routes/JwksRoutes.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/JwksService.hpp"

#include <nlohmann/json.hpp>

#include <utility>

namespace jwks::api::routes {

JwksRoutes::JwksRoutes(core::JwksService& jsService, std::string sDiscoveryPath)
    : _jsService(jsService), _sDiscoveryPath(std::move(sDiscoveryPath)) {}

JwksRoutes::~JwksRoutes() = default;

crow::response JwksRoutes::handleKeySet() const {
  try {
    crow::response resp(200, _jsService.getPublicKeySet().dump(2));
    resp.set_header("Content-Type", "application/json");
    return resp;
  } catch (const common::AppError& e) {
    common::Logger::get()->error("Key set request failed: {}", e.what());
    nlohmann::json jErr = {{"error", e._sErrorCode}, {"message", e.what()}};
    crow::response resp(e._iHttpStatus, jErr.dump(2));
    resp.set_header("Content-Type", "application/json");
    return resp;
  }
}

void JwksRoutes::registerRoutes(crow::SimpleApp& app) {
  // GET <discovery path>
  app.route_dynamic(std::string(_sDiscoveryPath))
      .methods("GET"_method)([this](const crow::request&) { return handleKeySet(); });
}

}  // namespace jwks::api::routes
