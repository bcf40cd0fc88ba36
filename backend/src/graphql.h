#pragma once
// ─── FleetGate — GraphQL inventory API ──────────────────────────────────
// A small GraphQL front end over the device inventory: one query or
// mutation per document, variables, aliases and nested selections.
// Fragments, directives and subscriptions are rejected.

#include "crow.h"
#include "security_middleware.h"

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

class AuditLog;
class DeviceTransport;
class InventoryStore;
struct AppContext;

namespace graphql {

struct Value {
  enum class Kind { Null, Int, Float, String, Boolean, Enum, List, Object, Variable };

  Kind kind = Kind::Null;
  std::string text;  // scalar literal, enum name or variable name
  std::vector<Value> items;
  std::vector<std::pair<std::string, Value>> fields;

  const Value *field(const std::string &name) const;
};

struct Field {
  std::string alias;
  std::string name;
  std::vector<std::pair<std::string, Value>> arguments;
  std::vector<Field> selection;

  const std::string &response_key() const { return alias.empty() ? name : alias; }
};

struct Operation {
  std::string type = "query";  // query | mutation
  std::string name;
  std::unordered_map<std::string, Value> variable_defaults;
  std::vector<Field> selection;
};

// Parses a GraphQL document holding exactly one operation.
bool parse_document(const std::string &source, Operation &operation,
                    std::string &error);

// Converts a JSON variable value into a GraphQL value.
Value value_from_json(const crow::json::rvalue &json);

// Executes documents against the inventory. The result is a GraphQL
// response object: {"data": ...} or {"data": null, "errors": [...]}.
class InventoryApi {
public:
  InventoryApi(InventoryStore &inventory, DeviceTransport &transport,
               AuditLog &audit)
      : inventory_(inventory), transport_(transport), audit_(audit) {}

  crow::json::wvalue execute(const std::string &query,
                             const crow::json::rvalue &variables);

private:
  InventoryStore &inventory_;
  DeviceTransport &transport_;
  AuditLog &audit_;
};

}  // namespace graphql

// Registers POST /graphql. No session is required.
void register_graphql_routes(CrowApp &app, AppContext &ctx);
