#pragma once

#include <string>

#include <crow.h>
#include <nlohmann/json.hpp>

#include "common/Errors.hpp"

namespace certmon::api {

inline crow::response jsonResponse(int iStatus, const nlohmann::json& jBody) {
  crow::response resp(iStatus, jBody.dump(2));
  resp.set_header("Content-Type", "application/json");
  return resp;
}

inline crow::response errorResponse(const common::AppError& e) {
  return jsonResponse(e._iHttpStatus, {{"error", e._sErrorCode}, {"message", e.what()}});
}

inline crow::response invalidJsonResponse() {
  return jsonResponse(400, {{"error", "invalid_json"}, {"message", "Invalid JSON body"}});
}

/// Parse a request body; throws nlohmann::json::exception on malformed input.
inline nlohmann::json parseBody(const crow::request& req) {
  if (req.body.empty()) return nlohmann::json::object();
  return nlohmann::json::parse(req.body);
}

}  // namespace certmon::api
