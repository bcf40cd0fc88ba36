// ─── FleetGate — AppContext implementation ──────────────────────────────

#include "app_context.h"
#include "utils.h"

// ── Auth helpers ────────────────────────────────────────────────────────

std::optional<AuthSession> AppContext::find_auth(
    const crow::request &request) const {
  auto token = extract_cookie(request, session_cookie);
  if (!token) token = extract_bearer_token(request);
  if (!token) return std::nullopt;
  return sessions.find(*token);
}

std::string AppContext::session_cookie_header(const std::string &token) const {
  return session_cookie + "=" + token + "; Path=/; HttpOnly; SameSite=Strict";
}

std::string AppContext::expired_cookie_header() const {
  return session_cookie + "=; Path=/; HttpOnly; SameSite=Strict; Max-Age=0";
}

// ── Audit ───────────────────────────────────────────────────────────────

void AppContext::append_audit(const std::string &type, const std::string &actor,
                              const std::string &role,
                              const std::string &payload_json) {
  audit.append(type, actor, role, payload_json);
}

void AppContext::append_audit(const std::string &type, const AuthSession &auth,
                              const std::string &payload_json) {
  audit.append(type, auth.user, auth.role, payload_json);
}
