#pragma once
// ─── FleetGate — Data models ────────────────────────────────────────────
// Pure data structures used across the application.

#include <optional>
#include <string>
#include <vector>

struct DeviceRecord {
  int id = 0;
  std::string name;
  std::string host;
  int port = 22;
  std::string username;
  std::string password;
  std::string secret;
  std::string deviceType;
};

struct AuthSession {
  std::string user;
  std::string role;
  std::string token;
  std::string issuedAt;
};

struct PingResult {
  std::string status;  // success | error | timeout
  std::string message;
  std::string output;
  std::optional<double> responseTimeMs;
};

struct CommandResult {
  std::string command;
  std::string output;
  std::string status;  // success | error
};

struct AuditEvent {
  int id = 0;
  std::string type;
  std::string actor;
  std::string role;
  std::string createdAt;
  std::string payloadJson;
};

// Error taxonomy surfaced at the HTTP edge.
enum class ApiError {
  Unauthenticated,
  Forbidden,
  DeviceNotFound,
  MalformedInput,
  ConnectTimeout,
  AuthenticationFailed,
  TransportError,
  ProbeTimeout,
};

inline int http_status_for(ApiError error) {
  switch (error) {
    case ApiError::Unauthenticated: return 401;
    case ApiError::Forbidden:       return 403;
    case ApiError::DeviceNotFound:  return 404;
    case ApiError::MalformedInput:  return 400;
    default:                        return 500;
  }
}
