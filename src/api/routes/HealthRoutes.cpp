#include "api/routes/HealthRoutes.hpp"

#include <nlohmann/json.hpp>

namespace jwks::api::routes {

HealthRoutes::HealthRoutes() = default;
HealthRoutes::~HealthRoutes() = default;

crow::response HealthRoutes::handleHealth() {
  crow::response resp(200, nlohmann::json{{"status", "ok"}}.dump());
  resp.set_header("Content-Type", "application/json");
  return resp;
}

void HealthRoutes::registerRoutes(crow::SimpleApp& app) {
  CROW_ROUTE(app, "/health").methods("GET"_method)([]() { return handleHealth(); });
}

}  // namespace jwks::api::routes
