// ─── FleetGate — Audit trail implementation ─────────────────────────────

#include "audit_log.h"
#include "utils.h"

#include <iostream>

namespace {

std::string column_text(sqlite3_stmt *stmt, int index) {
  const unsigned char *text = sqlite3_column_text(stmt, index);
  return text ? reinterpret_cast<const char *>(text) : "";
}

}  // namespace

AuditLog::~AuditLog() {
  if (db_) sqlite3_close(db_);
}

bool AuditLog::open(const std::string &path, std::string &error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
    error = db_ ? sqlite3_errmsg(db_) : "sqlite3_open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    return false;
  }

  const char *schema =
      "CREATE TABLE IF NOT EXISTS audit_events ("
      "id INTEGER PRIMARY KEY,"
      "type TEXT NOT NULL,"
      "actor TEXT NOT NULL,"
      "role TEXT NOT NULL,"
      "created_at TEXT NOT NULL,"
      "payload TEXT NOT NULL"
      ");";
  char *errmsg = nullptr;
  if (sqlite3_exec(db_, schema, nullptr, nullptr, &errmsg) != SQLITE_OK) {
    error = errmsg ? errmsg : "SQLite schema failed";
    if (errmsg) sqlite3_free(errmsg);
    sqlite3_close(db_);
    db_ = nullptr;
    return false;
  }

  // Continue numbering after the rows already stored.
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT MAX(id) FROM audit_events", -1, &stmt,
                         nullptr) == SQLITE_OK) {
    if (sqlite3_step(stmt) == SQLITE_ROW)
      next_id_.store(sqlite3_column_int(stmt, 0) + 1);
    sqlite3_finalize(stmt);
  }
  return true;
}

void AuditLog::append(const std::string &type, const std::string &actor,
                      const std::string &role,
                      const std::string &payload_json) {
  AuditEvent event;
  event.id = next_id_.fetch_add(1);
  event.type = type;
  event.actor = actor;
  event.role = role;
  event.createdAt = now_utc();
  event.payloadJson = payload_json.empty() ? "{}" : payload_json;

  std::lock_guard<std::mutex> lock(mutex_);
  ring_.push_back(event);
  if (ring_.size() > 200) ring_.erase(ring_.begin(), ring_.begin() + 50);
  insert(event);
}

bool AuditLog::insert(const AuditEvent &event) {
  if (!db_) return true;
  const char *sql =
      "INSERT INTO audit_events (id, type, actor, role, created_at, payload) "
      "VALUES (?, ?, ?, ?, ?, ?)";
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    std::cerr << "[audit] insert prepare failed: " << sqlite3_errmsg(db_) << '\n';
    return false;
  }
  sqlite3_bind_int(stmt, 1, event.id);
  sqlite3_bind_text(stmt, 2, event.type.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, event.actor.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 4, event.role.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 5, event.createdAt.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 6, event.payloadJson.c_str(), -1, SQLITE_TRANSIENT);
  bool ok = sqlite3_step(stmt) == SQLITE_DONE;
  if (!ok) std::cerr << "[audit] insert failed: " << sqlite3_errmsg(db_) << '\n';
  sqlite3_finalize(stmt);
  return ok;
}

std::vector<AuditEvent> AuditLog::recent(int limit) const {
  if (limit <= 0) limit = 50;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_) return select_recent(limit);

  std::vector<AuditEvent> events;
  for (auto it = ring_.rbegin();
       it != ring_.rend() && static_cast<int>(events.size()) < limit; ++it)
    events.push_back(*it);
  return events;
}

std::vector<AuditEvent> AuditLog::select_recent(int limit) const {
  std::vector<AuditEvent> events;
  const char *sql =
      "SELECT id, type, actor, role, created_at, payload FROM audit_events "
      "ORDER BY id DESC LIMIT ?";
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    std::cerr << "[audit] select failed: " << sqlite3_errmsg(db_) << '\n';
    return events;
  }
  sqlite3_bind_int(stmt, 1, limit);
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    AuditEvent event;
    event.id = sqlite3_column_int(stmt, 0);
    event.type = column_text(stmt, 1);
    event.actor = column_text(stmt, 2);
    event.role = column_text(stmt, 3);
    event.createdAt = column_text(stmt, 4);
    event.payloadJson = column_text(stmt, 5);
    events.push_back(event);
  }
  sqlite3_finalize(stmt);
  return events;
}
