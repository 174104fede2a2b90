#pragma once
#include <crow.h>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace handler {
enum class StatusCode { _200=200, _400=400, _404=404, _409=409, _500=500 };

inline crow::response jsonResp(StatusCode code, const nlohmann::json& j) {
  crow::response r{(int)code};
  r.set_header("Content-Type", "application/json");
  r.body = j.dump(2);
  return r;
}
inline crow::response msg(StatusCode code, const std::string& m) {
  return jsonResp(code, {{"message", m}});
}
// Configuration problems are the caller's fault, everything else is ours.
inline crow::response error(const std::exception& e) {
  const bool bad_request = dynamic_cast<const std::invalid_argument*>(&e) != nullptr;
  return jsonResp(bad_request ? StatusCode::_400 : StatusCode::_500,
                  {{"status", "fail"}, {"error", e.what()}});
}
} // namespace handler
