#include "api/routes/ProfileRoutes.hpp"

#include "api/ResponseHelpers.hpp"
#include "common/Logger.hpp"
#include "profiles/ProfileStore.hpp"

#include <nlohmann/json.hpp>

namespace gitbridge::api::routes {

ProfileRoutes::ProfileRoutes(profiles::ProfileStore& psStore) : _psStore(psStore) {}

ProfileRoutes::~ProfileRoutes() = default;

void ProfileRoutes::registerRoutes(crow::SimpleApp& app) {
  // GET /profiles
  CROW_ROUTE(app, "/profiles").methods("GET"_method)([this]() -> crow::response {
    try {
      return jsonResponse(200, {{"profiles", _psStore.listNames()}});
    } catch (const common::AppError& e) {
      return errorResponse(e);
    } catch (const std::exception& e) {
      common::Logger::get()->error("Unexpected error in /profiles: {}", e.what());
      return errorResponse(500, "internal_error", "Internal server error");
    }
  });

  // POST /profiles/activate
  CROW_ROUTE(app, "/profiles/activate").methods("POST"_method)(
      [this](const crow::request& req) -> crow::response {
        try {
          auto jBody = parseObjectBody(req);
          if (!hasStringFields(jBody, {"name"})) {
            return errorResponse(400, "missing_fields", "Missing required: name");
          }
          const auto sName = jBody["name"].get<std::string>();
          _psStore.activate(sName);
          return jsonResponse(200, {{"status", "success"},
                                    {"name", sName},
                                    {"message", "Restart required"}});
        } catch (const common::AppError& e) {
          return errorResponse(e);
        } catch (const std::exception& e) {
          common::Logger::get()->error("Unexpected error in /profiles/activate: {}", e.what());
          return errorResponse(500, "internal_error", "Internal server error");
        }
      });
}

}  // namespace gitbridge::api::routes
