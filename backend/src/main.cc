// ─── FleetGate — Entry point ────────────────────────────────────────────
// Builds the shared services, registers every route group and runs the
// Crow server.

#include "crow.h"
#include "app_context.h"
#include "audit_log.h"
#include "auth.h"
#include "inventory.h"
#include "ping.h"
#include "routes.h"
#include "security_middleware.h"
#include "ssh.h"
#include "utils.h"
#include "version.h"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

namespace {

std::string env_or(const char *name, const std::string &fallback) {
  const char *value = std::getenv(name);
  if (!value || !*value) return fallback;
  return value;
}

}  // namespace

int main() {
  const std::string bind = env_or("FLEETGATE_BIND", "0.0.0.0");
  const std::string inventory_path = env_or("FLEETGATE_INVENTORY", "devices.yaml");
  const std::string audit_path = env_or("FLEETGATE_AUDIT_DB", "fleetgate.db");
  int port = 5000;
  if (auto parsed = parse_int_param(std::getenv("FLEETGATE_PORT"))) {
    if (*parsed > 0 && *parsed < 65536) {
      port = *parsed;
    } else {
      std::cerr << "[main] ignoring FLEETGATE_PORT out of range: " << *parsed
                << '\n';
    }
  }

  std::string error;
  if (!ssh_library_init(error)) {
    std::cerr << "[ssh] " << error << '\n';
  }

  InventoryStore inventory(inventory_path);
  StaticCredentialProvider auth = StaticCredentialProvider::with_defaults();
  SessionStore sessions;
  SshTransport transport(10);
  SystemPingProber prober(4, 10);

  AuditLog audit;
  if (!audit.open(audit_path, error)) {
    std::cerr << "[audit] SQLite open failed, keeping events in memory: "
              << error << '\n';
  }

  AppContext ctx(inventory, auth, sessions, transport, prober, audit);
  ctx.backup_dir = env_or("FLEETGATE_BACKUP_DIR", ctx.backup_dir);

  CrowApp app;
  register_all_routes(app, ctx);

  std::cerr << "[main] FleetGate " << APP_VERSION << " listening on " << bind
            << ':' << port << " (inventory " << inventory.path() << ")\n";
  app.bindaddr(bind).port(static_cast<std::uint16_t>(port)).multithreaded().run();

  ssh_library_shutdown();
  return 0;
}
