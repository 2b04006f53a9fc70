#include "api/routes/FileRoutes.hpp"

#include "api/ResponseHelpers.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "common/Types.hpp"
#include "core/FileService.hpp"

#include <nlohmann/json.hpp>

namespace gitbridge::api::routes {

namespace {

const char* outcomeName(common::PublishOutcome outcome) {
  return outcome == common::PublishOutcome::Published ? "published" : "no_changes";
}

}  // namespace

FileRoutes::FileRoutes(core::FileService& fsService) : _fsService(fsService) {}

FileRoutes::~FileRoutes() = default;

void FileRoutes::registerRoutes(crow::SimpleApp& app) {
  // POST /upload
  CROW_ROUTE(app, "/upload").methods("POST"_method)(
      [this](const crow::request& req) -> crow::response {
        try {
          auto jBody = parseObjectBody(req);
          if (!hasStringFields(jBody, {"path", "content"})) {
            return errorResponse(400, "missing_fields", "Missing required: path, content");
          }

          common::OperationRequest orRequest;
          orRequest.kind = common::OperationKind::Write;
          orRequest.sPath = jBody["path"].get<std::string>();
          orRequest.sContent = jBody["content"].get<std::string>();
          auto oresResult = _fsService.apply(orRequest);

          return jsonResponse(200, {{"status", "success"},
                                    {"path", oresResult.sPath},
                                    {"publish", outcomeName(oresResult.outcome)}});
        } catch (const common::AppError& e) {
          return errorResponse(e);
        } catch (const std::exception& e) {
          common::Logger::get()->error("Unexpected error in /upload: {}", e.what());
          return errorResponse(500, "internal_error", "Internal server error");
        }
      });

  // POST /move
  CROW_ROUTE(app, "/move").methods("POST"_method)(
      [this](const crow::request& req) -> crow::response {
        try {
          auto jBody = parseObjectBody(req);
          if (!hasStringFields(jBody, {"src", "dst"})) {
            return errorResponse(400, "missing_fields", "Missing required: src, dst");
          }

          common::OperationRequest orRequest;
          orRequest.kind = common::OperationKind::Move;
          orRequest.sPath = jBody["src"].get<std::string>();
          orRequest.sDestination = jBody["dst"].get<std::string>();
          auto oresResult = _fsService.apply(orRequest);

          return jsonResponse(200, {{"status", "success"},
                                    {"from", oresResult.sPath},
                                    {"to", oresResult.sDestination},
                                    {"publish", outcomeName(oresResult.outcome)}});
        } catch (const common::AppError& e) {
          return errorResponse(e);
        } catch (const std::exception& e) {
          common::Logger::get()->error("Unexpected error in /move: {}", e.what());
          return errorResponse(500, "internal_error", "Internal server error");
        }
      });

  // POST /delete
  CROW_ROUTE(app, "/delete").methods("POST"_method)(
      [this](const crow::request& req) -> crow::response {
        try {
          auto jBody = parseObjectBody(req);
          if (!hasStringFields(jBody, {"path"})) {
            return errorResponse(400, "missing_fields", "Missing required: path");
          }

          common::OperationRequest orRequest;
          orRequest.kind = common::OperationKind::Delete;
          orRequest.sPath = jBody["path"].get<std::string>();
          auto oresResult = _fsService.apply(orRequest);

          return jsonResponse(200, {{"status", "success"},
                                    {"path", oresResult.sPath},
                                    {"publish", outcomeName(oresResult.outcome)}});
        } catch (const common::AppError& e) {
          return errorResponse(e);
        } catch (const std::exception& e) {
          common::Logger::get()->error("Unexpected error in /delete: {}", e.what());
          return errorResponse(500, "internal_error", "Internal server error");
        }
      });

  // GET /tree
  CROW_ROUTE(app, "/tree").methods("GET"_method)([this]() -> crow::response {
    try {
      auto vFiles = _fsService.listTree();
      return jsonResponse(200, {{"files", vFiles}, {"count", vFiles.size()}});
    } catch (const common::AppError& e) {
      return errorResponse(e);
    } catch (const std::exception& e) {
      common::Logger::get()->error("Unexpected error in /tree: {}", e.what());
      return errorResponse(500, "internal_error", "Internal server error");
    }
  });

  // POST /verify_upload
  CROW_ROUTE(app, "/verify_upload").methods("POST"_method)(
      [this](const crow::request& req) -> crow::response {
        try {
          auto jBody = parseObjectBody(req);
          if (!hasStringFields(jBody, {"path"})) {
            return errorResponse(400, "missing_fields", "Missing required: path");
          }

          auto fiInfo = _fsService.verify(jBody["path"].get<std::string>());
          nlohmann::json jResp = {{"exists", fiInfo.bExists}, {"path", fiInfo.sPath}};
          if (fiInfo.bExists) {
            jResp["size"] = fiInfo.uSize;
            jResp["modified"] = fiInfo.iModifiedEpochSeconds;
          }
          return jsonResponse(200, jResp);
        } catch (const common::AppError& e) {
          return errorResponse(e);
        } catch (const std::exception& e) {
          common::Logger::get()->error("Unexpected error in /verify_upload: {}", e.what());
          return errorResponse(500, "internal_error", "Internal server error");
        }
      });
}

}  // namespace gitbridge::api::routes
