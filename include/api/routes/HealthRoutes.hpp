#pragma once

#include <string>

#include <crow.h>

namespace gitbridge::core {
class FileService;
}

namespace gitbridge::api::routes {

/// Handlers for / and /health
/// Class abbreviation: hr
class HealthRoutes {
 public:
  HealthRoutes(core::FileService& fsService, std::string sActiveProfile);
  ~HealthRoutes();

  void registerRoutes(crow::SimpleApp& app);

 private:
  core::FileService& _fsService;
  std::string _sActiveProfile;
};

}  // namespace gitbridge::api::routes
