// ─── FleetGate — Authentication implementation ──────────────────────────

#include "auth.h"
#include "utils.h"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <random>

StaticCredentialProvider StaticCredentialProvider::with_defaults() {
  return StaticCredentialProvider({
      {"admin", {"admin123", "admin"}},
      {"user", {"user123", "user"}},
  });
}

std::optional<std::string> StaticCredentialProvider::authenticate(
    const std::string &username, const std::string &password) const {
  auto it = table_.find(username);
  if (it == table_.end() || it->second.password != password)
    return std::nullopt;
  return it->second.role;
}

// ── Token generation (/dev/urandom, random_device fallback) ────────────

std::string SessionStore::generate_token() {
  unsigned char bytes[32];
  bool filled = false;
  std::ifstream urandom("/dev/urandom", std::ios::binary);
  if (urandom.good()) {
    urandom.read(reinterpret_cast<char *>(bytes), sizeof(bytes));
    filled = urandom.gcount() == sizeof(bytes);
  }
  if (!filled) {
    std::random_device rd;
    for (size_t i = 0; i < sizeof(bytes); i += 4) {
      uint32_t val = rd();
      std::memcpy(bytes + i, &val, std::min(sizeof(val), sizeof(bytes) - i));
    }
  }
  char buf[70];
  int offset = snprintf(buf, sizeof(buf), "fgs_");
  for (size_t i = 0; i < sizeof(bytes); ++i)
    offset += snprintf(buf + offset, sizeof(buf) - offset, "%02x", bytes[i]);
  return std::string(buf);
}

AuthSession SessionStore::create(const std::string &user,
                                 const std::string &role) {
  AuthSession session;
  session.user = user;
  session.role = role;
  session.token = generate_token();
  session.issuedAt = now_utc();
  std::lock_guard<std::mutex> lock(mutex_);
  sessions_[session.token] = session;
  return session;
}

std::optional<AuthSession> SessionStore::find(const std::string &token) const {
  if (token.empty()) return std::nullopt;
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(token);
  if (it == sessions_.end()) return std::nullopt;
  return it->second;
}

bool SessionStore::destroy(const std::string &token) {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.erase(token) > 0;
}

size_t SessionStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}
