#pragma once
// ─── FleetGate — Application context ────────────────────────────────────
// Shared services for the route handlers. Everything is constructed once
// in main (or a test fixture) and referenced from here.

#include "crow.h"
#include "audit_log.h"
#include "auth.h"
#include "device_transport.h"
#include "inventory.h"
#include "models.h"
#include "ping.h"

#include <optional>
#include <string>

struct AppContext {
  AppContext(InventoryStore &inventory_store, const AuthProvider &auth_provider,
             SessionStore &session_store, DeviceTransport &device_transport,
             ReachabilityProber &reachability, AuditLog &audit_log)
      : inventory(inventory_store),
        auth(auth_provider),
        sessions(session_store),
        transport(device_transport),
        prober(reachability),
        audit(audit_log) {}

  InventoryStore &inventory;
  const AuthProvider &auth;
  SessionStore &sessions;
  DeviceTransport &transport;
  ReachabilityProber &prober;
  AuditLog &audit;

  // ── Settings ──
  std::string backup_dir = "backups_routers";
  std::string session_cookie = "fleetgate_session";

  // Session from the session cookie or an Authorization: Bearer header.
  std::optional<AuthSession> find_auth(const crow::request &request) const;

  std::string session_cookie_header(const std::string &token) const;
  std::string expired_cookie_header() const;

  void append_audit(const std::string &type, const std::string &actor,
                    const std::string &role, const std::string &payload_json);
  void append_audit(const std::string &type, const AuthSession &auth,
                    const std::string &payload_json);
};
