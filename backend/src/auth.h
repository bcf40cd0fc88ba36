#pragma once
// ─── FleetGate — Authentication provider and session store ──────────────

#include "models.h"

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

class AuthProvider {
public:
  virtual ~AuthProvider() = default;
  // Returns the role for a valid pair. Unknown user and wrong password are
  // indistinguishable to the caller.
  virtual std::optional<std::string> authenticate(
      const std::string &username, const std::string &password) const = 0;
};

struct Credential {
  std::string password;
  std::string role;
};

class StaticCredentialProvider : public AuthProvider {
public:
  explicit StaticCredentialProvider(
      std::unordered_map<std::string, Credential> table)
      : table_(std::move(table)) {}

  // admin/admin123 (admin) and user/user123 (user).
  static StaticCredentialProvider with_defaults();

  std::optional<std::string> authenticate(
      const std::string &username, const std::string &password) const override;

private:
  std::unordered_map<std::string, Credential> table_;
};

// Server-side sessions keyed by an opaque token. No expiry.
class SessionStore {
public:
  AuthSession create(const std::string &user, const std::string &role);
  std::optional<AuthSession> find(const std::string &token) const;
  bool destroy(const std::string &token);
  size_t size() const;

private:
  static std::string generate_token();

  mutable std::mutex mutex_;
  std::unordered_map<std::string, AuthSession> sessions_;
};
