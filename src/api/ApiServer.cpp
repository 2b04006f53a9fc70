#include "api/ApiServer.hpp"

#include "api/routes/FileRoutes.hpp"
#include "api/routes/HealthRoutes.hpp"
#include "api/routes/ProfileRoutes.hpp"
#include "common/Logger.hpp"

namespace gitbridge::api {

ApiServer::ApiServer(core::FileService& fsService, profiles::ProfileStore& psStore,
                     std::string sActiveProfile)
    : _upFileRoutes(std::make_unique<routes::FileRoutes>(fsService)),
      _upHealthRoutes(std::make_unique<routes::HealthRoutes>(fsService, std::move(sActiveProfile))),
      _upProfileRoutes(std::make_unique<routes::ProfileRoutes>(psStore)) {}

ApiServer::~ApiServer() = default;

void ApiServer::registerRoutes() {
  _upHealthRoutes->registerRoutes(_app);
  _upFileRoutes->registerRoutes(_app);
  _upProfileRoutes->registerRoutes(_app);
}

void ApiServer::start(int iPort, int iThreads) {
  common::Logger::get()->info("HTTP server listening on port {} ({} threads)", iPort, iThreads);
  _app.loglevel(crow::LogLevel::Warning);
  _app.port(static_cast<std::uint16_t>(iPort))
      .concurrency(static_cast<std::uint16_t>(iThreads))
      .run();
}

void ApiServer::stop() { _app.stop(); }

}  // namespace gitbridge::api
