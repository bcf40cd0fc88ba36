#pragma once
// ─── FleetGate — Security headers middleware ────────────────────────────
// Global Crow middleware that injects security headers on every JSON
// response. Route files take a CrowApp (= crow::App<SecurityHeadersMiddleware>).

#include "crow.h"

struct SecurityHeadersMiddleware {
  struct context {};

  void before_handle(crow::request & /*req*/, crow::response & /*res*/,
                     context & /*ctx*/) {}

  void after_handle(crow::request & /*req*/, crow::response &res,
                    context & /*ctx*/) {
    res.add_header("X-Content-Type-Options", "nosniff");
    res.add_header("X-Frame-Options", "DENY");
    res.add_header("Referrer-Policy", "no-referrer");
    // Device configs and credentials flow through these responses.
    res.add_header("Cache-Control", "no-store");
    res.add_header("Content-Security-Policy",
                   "default-src 'none'; frame-ancestors 'none'");
  }
};

using CrowApp = crow::App<SecurityHeadersMiddleware>;
