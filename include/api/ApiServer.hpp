#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include <crow.h>

namespace gitbridge::core {
class FileService;
}
namespace gitbridge::profiles {
class ProfileStore;
}

namespace gitbridge::api {

namespace routes {
class FileRoutes;
class HealthRoutes;
class ProfileRoutes;
}  // namespace routes

/// Owns the Crow application instance; registers all routes at startup.
/// Class abbreviation: api
class ApiServer {
 public:
  ApiServer(core::FileService& fsService, profiles::ProfileStore& psStore,
            std::string sActiveProfile);
  ~ApiServer();

  void registerRoutes();

  /// Blocks until stop() is called or the process receives SIGINT/SIGTERM.
  void start(int iPort, int iThreads);
  void stop();

  crow::SimpleApp& app() { return _app; }

 private:
  crow::SimpleApp _app;
  std::unique_ptr<routes::FileRoutes> _upFileRoutes;
  std::unique_ptr<routes::HealthRoutes> _upHealthRoutes;
  std::unique_ptr<routes::ProfileRoutes> _upProfileRoutes;
};

}  // namespace gitbridge::api
