#pragma once

#include <string>

#include <crow.h>
#include <nlohmann/json.hpp>

#include "common/Errors.hpp"

namespace gitbridge::api {

/// JSON response with the given status code.
inline crow::response jsonResponse(int iStatus, const nlohmann::json& jBody) {
  crow::response resp(iStatus, jBody.dump(2));
  resp.set_header("Content-Type", "application/json");
  return resp;
}

inline crow::response errorResponse(int iStatus, const std::string& sCode,
                                    const std::string& sMessage) {
  return jsonResponse(iStatus, {{"error", sCode}, {"message", sMessage}});
}

inline crow::response errorResponse(const common::AppError& e) {
  return errorResponse(e._iHttpStatus, e._sErrorCode, e.what());
}

/// Parse a request body that must be a JSON object.
/// Throws ValidationError("invalid_json") otherwise.
inline nlohmann::json parseObjectBody(const crow::request& req) {
  nlohmann::json jBody = nlohmann::json::parse(req.body, nullptr, false);
  if (jBody.is_discarded() || !jBody.is_object()) {
    throw common::ValidationError("invalid_json", "Request body must be a JSON object");
  }
  return jBody;
}

/// True if every key is present and holds a string.
inline bool hasStringFields(const nlohmann::json& jBody,
                            std::initializer_list<const char*> ilKeys) {
  for (const char* pKey : ilKeys) {
    auto it = jBody.find(pKey);
    if (it == jBody.end() || !it->is_string()) {
      return false;
    }
  }
  return true;
}

}  // namespace gitbridge::api
