#pragma once
// ─── FleetGate — Utility functions ──────────────────────────────────────
// Small standalone helpers (header-only).

#include "crow.h"
#include "models.h"

#include <algorithm>
#include <chrono>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

inline std::string format_time(const char *pattern, bool utc) {
  auto now = std::chrono::system_clock::now();
  std::time_t now_time = std::chrono::system_clock::to_time_t(now);
  std::tm tm_value{};
  if (utc)
    gmtime_r(&now_time, &tm_value);
  else
    localtime_r(&now_time, &tm_value);
  std::ostringstream oss;
  oss << std::put_time(&tm_value, pattern);
  return oss.str();
}

inline std::string now_utc() { return format_time("%Y-%m-%dT%H:%M:%SZ", true); }

// Response timestamp, local time: YYYY-MM-DD HH:MM:SS
inline std::string now_local() { return format_time("%Y-%m-%d %H:%M:%S", false); }

// Filename-safe variant: YYYYmmddHHMMSS
inline std::string now_compact() { return format_time("%Y%m%d%H%M%S", false); }

inline std::string json_escape(const std::string &value) {
  std::ostringstream oss;
  for (char ch : value) {
    switch (ch) {
      case '\\': oss << "\\\\"; break;
      case '"':  oss << "\\\""; break;
      case '\n': oss << "\\n";  break;
      case '\r': oss << "\\r";  break;
      case '\t': oss << "\\t";  break;
      default:   oss << ch;     break;
    }
  }
  return oss.str();
}

inline bool is_allowed_role(const std::string &role,
                            const std::vector<std::string> &allowed) {
  for (const auto &item : allowed) {
    if (item == role) return true;
  }
  return false;
}

inline bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

inline std::optional<int> parse_int_param(const char *value) {
  if (!value) return std::nullopt;
  try { return std::stoi(value); }
  catch (const std::exception &) { return std::nullopt; }
}

inline std::optional<std::string> extract_bearer_token(
    const crow::request &request) {
  auto header = request.get_header_value("Authorization");
  const std::string prefix = "Bearer ";
  if (header.rfind(prefix, 0) == 0 && header.size() > prefix.size()) {
    return header.substr(prefix.size());
  }
  return std::nullopt;
}

inline std::optional<std::string> extract_cookie(const crow::request &request,
                                                 const std::string &name) {
  auto cookie = request.get_header_value("Cookie");
  if (cookie.empty()) return std::nullopt;
  const std::string key = name + "=";
  size_t pos = 0;
  while ((pos = cookie.find(key, pos)) != std::string::npos) {
    // Only accept the key at the start of a cookie pair.
    if (pos == 0 || cookie[pos - 1] == ' ' || cookie[pos - 1] == ';') {
      size_t start = pos + key.size();
      size_t end = cookie.find(';', start);
      if (end == std::string::npos) end = cookie.length();
      if (end > start) return cookie.substr(start, end - start);
      return std::nullopt;
    }
    pos += key.size();
  }
  return std::nullopt;
}

// Reads an optional string member from a parsed JSON body.
inline std::string json_string(const crow::json::rvalue &body,
                               const std::string &key,
                               const std::string &fallback = "") {
  if (!body || body.t() != crow::json::type::Object || !body.has(key))
    return fallback;
  const auto &value = body[key];
  if (value.t() != crow::json::type::String) return fallback;
  return value.s();
}

inline crow::response json_response(int code, crow::json::wvalue payload) {
  crow::response res{payload};
  res.code = code;
  return res;
}

inline crow::response json_error(int code, const std::string &message) {
  crow::json::wvalue payload;
  payload["success"] = false;
  payload["error"] = message;
  return json_response(code, std::move(payload));
}

inline crow::response json_error(ApiError error, const std::string &message) {
  return json_error(http_status_for(error), message);
}

inline crow::json::wvalue ping_result_to_json(const PingResult &result) {
  crow::json::wvalue payload;
  payload["status"] = result.status;
  payload["message"] = result.message;
  payload["output"] = result.output;
  if (result.responseTimeMs)
    payload["response_time"] = *result.responseTimeMs;
  else
    payload["response_time"] = nullptr;
  return payload;
}

inline crow::json::wvalue command_results_to_json(
    const std::vector<CommandResult> &results) {
  crow::json::wvalue list = crow::json::wvalue::list();
  for (size_t i = 0; i < results.size(); ++i) {
    list[static_cast<int>(i)]["command"] = results[i].command;
    list[static_cast<int>(i)]["output"] = results[i].output;
    list[static_cast<int>(i)]["status"] = results[i].status;
  }
  return list;
}

inline std::string build_device_payload_json(const DeviceRecord &device) {
  std::ostringstream oss;
  oss << '{';
  oss << "\"id\":" << device.id << ',';
  oss << "\"name\":\"" << json_escape(device.name) << "\",";
  oss << "\"host\":\"" << json_escape(device.host) << "\",";
  oss << "\"deviceType\":\"" << json_escape(device.deviceType) << "\"";
  oss << '}';
  return oss.str();
}
