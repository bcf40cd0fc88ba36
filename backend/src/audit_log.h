#pragma once
// ─── FleetGate — Audit trail ────────────────────────────────────────────
// Operator actions kept in a bounded in-memory ring and mirrored into the
// SQLite `audit_events` table.

#include "models.h"

#include <sqlite3.h>

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

class AuditLog {
public:
  AuditLog() = default;
  ~AuditLog();
  AuditLog(const AuditLog &) = delete;
  AuditLog &operator=(const AuditLog &) = delete;

  // Opens (or creates) the database. Without a successful open the log
  // stays memory-only.
  bool open(const std::string &path, std::string &error);

  void append(const std::string &type, const std::string &actor,
              const std::string &role, const std::string &payload_json);

  // Newest first.
  std::vector<AuditEvent> recent(int limit) const;

private:
  bool insert(const AuditEvent &event);
  std::vector<AuditEvent> select_recent(int limit) const;

  sqlite3 *db_ = nullptr;
  mutable std::mutex mutex_;
  std::vector<AuditEvent> ring_;
  std::atomic<int> next_id_{1};
};
