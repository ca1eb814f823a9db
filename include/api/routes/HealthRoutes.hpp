#pragma once

#include <crow.h>

namespace jwks::api::routes {

/// Handler for GET /health
class HealthRoutes {
 public:
  HealthRoutes();
  ~HealthRoutes();

  void registerRoutes(crow::SimpleApp& app);

  static crow::response handleHealth();
};

}  // namespace jwks::api::routes
