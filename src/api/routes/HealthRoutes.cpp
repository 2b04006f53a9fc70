#include "api/routes/HealthRoutes.hpp"

#include "api/ResponseHelpers.hpp"
#include "common/Logger.hpp"
#include "common/Types.hpp"
#include "core/FileService.hpp"

#include <nlohmann/json.hpp>

#include <utility>

namespace gitbridge::api::routes {

namespace {

constexpr const char* kVersion = "2.0-stable";

const char* remoteName(common::RemoteStatus status) {
  switch (status) {
    case common::RemoteStatus::Connected:    return "connected";
    case common::RemoteStatus::Disconnected: return "disconnected";
    case common::RemoteStatus::Timeout:      return "timeout";
  }
  return "unknown";
}

}  // namespace

HealthRoutes::HealthRoutes(core::FileService& fsService, std::string sActiveProfile)
    : _fsService(fsService), _sActiveProfile(std::move(sActiveProfile)) {}

HealthRoutes::~HealthRoutes() = default;

void HealthRoutes::registerRoutes(crow::SimpleApp& app) {
  // GET /
  CROW_ROUTE(app, "/").methods("GET"_method)([this]() -> crow::response {
    nlohmann::json jResp = {
        {"status", "GitBridge is live"},
        {"version", kVersion},
        {"endpoints", {"/upload", "/move", "/delete", "/tree", "/profiles", "/health",
                       "/verify_upload"}},
        {"active_profile", _sActiveProfile},
    };
    return jsonResponse(200, jResp);
  });

  // GET /health
  CROW_ROUTE(app, "/health").methods("GET"_method)([this]() -> crow::response {
    try {
      auto hrReport = _fsService.health();
      nlohmann::json jResp = {
          {"status", hrReport.sStatus},
          {"repo", hrReport.sRepo},
          {"safe_mode", hrReport.bSafeMode},
          {"bootstrap", hrReport.bsBootstrap.bReady ? "ready" : "degraded"},
      };
      if (!hrReport.bsBootstrap.bReady) {
        jResp["bootstrap_error"] = hrReport.bsBootstrap.sDetail;
      }
      if (hrReport.oClean) {
        jResp["git_status"] = *hrReport.oClean ? "clean" : "dirty";
      }
      if (hrReport.oRemote) {
        jResp["remote"] = remoteName(*hrReport.oRemote);
      }
      if (!hrReport.sGitError.empty()) {
        jResp["git_error"] = hrReport.sGitError;
      }
      if (!hrReport.sMessage.empty()) {
        jResp["message"] = hrReport.sMessage;
      }
      return jsonResponse(hrReport.sStatus == "ok" ? 200 : 500, jResp);
    } catch (const common::AppError& e) {
      return errorResponse(e);
    } catch (const std::exception& e) {
      common::Logger::get()->error("Unexpected error in /health: {}", e.what());
      return errorResponse(500, "internal_error", "Internal server error");
    }
  });
}

}  // namespace gitbridge::api::routes
