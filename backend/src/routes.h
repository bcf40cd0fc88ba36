#pragma once
// ─── FleetGate — API route registration ─────────────────────────────────
// Each function registers a group of CROW_ROUTE entries.

#include "security_middleware.h"

struct AppContext;

void register_health_routes(CrowApp &app, AppContext &ctx);
void register_auth_routes(CrowApp &app, AppContext &ctx);
void register_ping_routes(CrowApp &app, AppContext &ctx);
void register_device_routes(CrowApp &app, AppContext &ctx);
void register_monitoring_routes(CrowApp &app, AppContext &ctx);
void register_maintenance_routes(CrowApp &app, AppContext &ctx);
void register_security_routes(CrowApp &app, AppContext &ctx);
void register_audit_routes(CrowApp &app, AppContext &ctx);

// Registers every group above.
void register_all_routes(CrowApp &app, AppContext &ctx);
