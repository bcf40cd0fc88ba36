// ─── FleetGate — GraphQL inventory API implementation ───────────────────

#include "graphql.h"
#include "app_context.h"
#include "audit_log.h"
#include "device_ops.h"
#include "device_transport.h"
#include "inventory.h"
#include "utils.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace graphql {

const Value *Value::field(const std::string &name) const {
  for (const auto &entry : fields) {
    if (entry.first == name) return &entry.second;
  }
  return nullptr;
}

// ═══════════════════════════════════════════════════════════════════════
//  Parser
// ═══════════════════════════════════════════════════════════════════════

namespace {

struct ParseError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct ExecutionError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

bool is_name_start(char ch) {
  return ch == '_' || std::isalpha(static_cast<unsigned char>(ch));
}

bool is_name_char(char ch) {
  return ch == '_' || std::isalnum(static_cast<unsigned char>(ch));
}

void append_utf8(std::string &out, unsigned int cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

// Bounds recursion so nested input cannot exhaust the worker's stack.
constexpr int kMaxDepth = 64;

class Parser {
public:
  explicit Parser(const std::string &source) : src_(source) {}

  Operation parse_document() {
    Operation operation;
    skip_ignored();
    if (peek() == '{') {
      operation.selection = parse_selection_set();
    } else {
      std::string keyword = parse_name();
      if (keyword == "subscription")
        fail("Subscriptions are not supported");
      if (keyword == "fragment") fail("Fragments are not supported");
      if (keyword != "query" && keyword != "mutation")
        fail("Unexpected Name \"" + keyword + "\"");
      operation.type = keyword;
      if (is_name_start(peek())) operation.name = parse_name();
      if (peek() == '(') parse_variable_definitions(operation);
      if (peek() == '@') fail("Directives are not supported");
      operation.selection = parse_selection_set();
    }
    if (pos_ < src_.size())
      fail("Only one operation per document is supported");
    return operation;
  }

private:
  [[noreturn]] void fail(const std::string &message) const {
    throw ParseError("Syntax Error at offset " + std::to_string(pos_) + ": " +
                     message);
  }

  struct DepthGuard {
    explicit DepthGuard(Parser &parser) : parser_(parser) {
      if (++parser_.depth_ > kMaxDepth) parser_.fail("Document nested too deeply");
    }
    ~DepthGuard() { --parser_.depth_; }
    Parser &parser_;
  };

  char peek() const { return pos_ < src_.size() ? src_[pos_] : '\0'; }

  void skip_ignored() {
    while (pos_ < src_.size()) {
      char ch = src_[pos_];
      if (ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == ',') {
        ++pos_;
      } else if (ch == '#') {
        while (pos_ < src_.size() && src_[pos_] != '\n' && src_[pos_] != '\r')
          ++pos_;
      } else if (static_cast<unsigned char>(ch) == 0xEF &&
                 src_.compare(pos_, 3, "\xEF\xBB\xBF") == 0) {
        pos_ += 3;
      } else {
        break;
      }
    }
  }

  void expect(char ch) {
    if (peek() != ch) fail(std::string("Expected \"") + ch + "\"");
    ++pos_;
    skip_ignored();
  }

  std::string parse_name() {
    if (!is_name_start(peek())) fail("Expected Name");
    size_t start = pos_;
    while (pos_ < src_.size() && is_name_char(src_[pos_])) ++pos_;
    std::string name = src_.substr(start, pos_ - start);
    skip_ignored();
    return name;
  }

  void parse_variable_definitions(Operation &operation) {
    expect('(');
    while (peek() != ')') {
      expect('$');
      std::string name = parse_name();
      expect(':');
      parse_type();
      if (peek() == '=') {
        expect('=');
        operation.variable_defaults[name] = parse_value(true);
      }
      if (pos_ >= src_.size()) fail("Unterminated variable definitions");
    }
    expect(')');
  }

  void parse_type() {
    DepthGuard guard(*this);
    if (peek() == '[') {
      expect('[');
      parse_type();
      expect(']');
    } else {
      parse_name();
    }
    if (peek() == '!') expect('!');
  }

  std::vector<Field> parse_selection_set() {
    DepthGuard guard(*this);
    expect('{');
    std::vector<Field> fields;
    while (peek() != '}') {
      if (pos_ >= src_.size()) fail("Unterminated selection set");
      if (src_.compare(pos_, 3, "...") == 0) fail("Fragments are not supported");
      fields.push_back(parse_field());
    }
    if (fields.empty()) fail("Selection set must not be empty");
    expect('}');
    return fields;
  }

  Field parse_field() {
    Field field;
    std::string first = parse_name();
    if (peek() == ':') {
      expect(':');
      field.alias = first;
      field.name = parse_name();
    } else {
      field.name = first;
    }
    if (peek() == '(') {
      expect('(');
      while (peek() != ')') {
        if (pos_ >= src_.size()) fail("Unterminated argument list");
        std::string name = parse_name();
        expect(':');
        field.arguments.emplace_back(name, parse_value(false));
      }
      expect(')');
    }
    if (peek() == '@') fail("Directives are not supported");
    if (peek() == '{') field.selection = parse_selection_set();
    return field;
  }

  Value parse_value(bool is_const) {
    DepthGuard guard(*this);
    Value value;
    char ch = peek();
    if (ch == '$') {
      if (is_const) fail("Variables are not allowed in default values");
      ++pos_;
      value.kind = Value::Kind::Variable;
      value.text = parse_name();
      return value;
    }
    if (ch == '[') {
      expect('[');
      value.kind = Value::Kind::List;
      while (peek() != ']') {
        if (pos_ >= src_.size()) fail("Unterminated list");
        value.items.push_back(parse_value(is_const));
      }
      expect(']');
      return value;
    }
    if (ch == '{') {
      expect('{');
      value.kind = Value::Kind::Object;
      while (peek() != '}') {
        if (pos_ >= src_.size()) fail("Unterminated object");
        std::string name = parse_name();
        expect(':');
        value.fields.emplace_back(name, parse_value(is_const));
      }
      expect('}');
      return value;
    }
    if (ch == '"') {
      value.kind = Value::Kind::String;
      value.text = parse_string();
      return value;
    }
    if (ch == '-' || std::isdigit(static_cast<unsigned char>(ch)))
      return parse_number();
    if (is_name_start(ch)) {
      std::string name = parse_name();
      if (name == "true" || name == "false") {
        value.kind = Value::Kind::Boolean;
      } else if (name == "null") {
        value.kind = Value::Kind::Null;
      } else {
        value.kind = Value::Kind::Enum;
      }
      value.text = name;
      return value;
    }
    fail("Unexpected character");
  }

  Value parse_number() {
    Value value;
    value.kind = Value::Kind::Int;
    size_t start = pos_;
    if (peek() == '-') ++pos_;
    if (!std::isdigit(static_cast<unsigned char>(peek()))) fail("Invalid number");
    while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
    if (peek() == '.') {
      value.kind = Value::Kind::Float;
      ++pos_;
      if (!std::isdigit(static_cast<unsigned char>(peek()))) fail("Invalid number");
      while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
    }
    if (peek() == 'e' || peek() == 'E') {
      value.kind = Value::Kind::Float;
      ++pos_;
      if (peek() == '+' || peek() == '-') ++pos_;
      if (!std::isdigit(static_cast<unsigned char>(peek()))) fail("Invalid number");
      while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
    }
    value.text = src_.substr(start, pos_ - start);
    skip_ignored();
    return value;
  }

  std::string parse_string() {
    if (src_.compare(pos_, 3, "\"\"\"") == 0) {
      size_t end = src_.find("\"\"\"", pos_ + 3);
      if (end == std::string::npos) fail("Unterminated string");
      std::string text = src_.substr(pos_ + 3, end - pos_ - 3);
      pos_ = end + 3;
      skip_ignored();
      return text;
    }
    ++pos_;
    std::string out;
    while (true) {
      if (pos_ >= src_.size() || src_[pos_] == '\n') fail("Unterminated string");
      char ch = src_[pos_++];
      if (ch == '"') break;
      if (ch != '\\') {
        out += ch;
        continue;
      }
      if (pos_ >= src_.size()) fail("Unterminated string");
      char esc = src_[pos_++];
      switch (esc) {
        case '"':  out += '"';  break;
        case '\\': out += '\\'; break;
        case '/':  out += '/';  break;
        case 'b':  out += '\b'; break;
        case 'f':  out += '\f'; break;
        case 'n':  out += '\n'; break;
        case 'r':  out += '\r'; break;
        case 't':  out += '\t'; break;
        case 'u': {
          if (pos_ + 4 > src_.size()) fail("Invalid unicode escape");
          unsigned int cp = 0;
          for (int i = 0; i < 4; ++i) {
            char hex = src_[pos_++];
            cp <<= 4;
            if (hex >= '0' && hex <= '9') cp |= static_cast<unsigned int>(hex - '0');
            else if (hex >= 'a' && hex <= 'f') cp |= static_cast<unsigned int>(hex - 'a' + 10);
            else if (hex >= 'A' && hex <= 'F') cp |= static_cast<unsigned int>(hex - 'A' + 10);
            else fail("Invalid unicode escape");
          }
          append_utf8(out, cp);
          break;
        }
        default:
          fail(std::string("Invalid escape \\") + esc);
      }
    }
    skip_ignored();
    return out;
  }

  const std::string &src_;
  size_t pos_ = 0;
  int depth_ = 0;
};

}  // namespace

bool parse_document(const std::string &source, Operation &operation,
                    std::string &error) {
  try {
    operation = Parser(source).parse_document();
    return true;
  } catch (const ParseError &e) {
    error = e.what();
    return false;
  }
}

Value value_from_json(const crow::json::rvalue &json) {
  Value value;
  if (!json) return value;
  switch (json.t()) {
    case crow::json::type::True:
    case crow::json::type::False:
      value.kind = Value::Kind::Boolean;
      value.text = json.t() == crow::json::type::True ? "true" : "false";
      break;
    case crow::json::type::Number: {
      double number = json.d();
      if (std::floor(number) == number && std::fabs(number) < 2147483648.0) {
        value.kind = Value::Kind::Int;
        value.text = std::to_string(static_cast<long long>(number));
      } else {
        value.kind = Value::Kind::Float;
        value.text = std::to_string(number);
      }
      break;
    }
    case crow::json::type::String:
      value.kind = Value::Kind::String;
      value.text = json.s();
      break;
    case crow::json::type::List:
      value.kind = Value::Kind::List;
      for (const auto &item : json) value.items.push_back(value_from_json(item));
      break;
    case crow::json::type::Object:
      value.kind = Value::Kind::Object;
      for (const auto &member : json)
        value.fields.emplace_back(member.key(), value_from_json(member));
      break;
    default:
      break;
  }
  return value;
}

// ═══════════════════════════════════════════════════════════════════════
//  Executor
// ═══════════════════════════════════════════════════════════════════════

namespace {

using Variables = std::unordered_map<std::string, Value>;

Value resolve(const Value &value, const Variables &variables) {
  if (value.kind == Value::Kind::Variable) {
    auto it = variables.find(value.text);
    return it == variables.end() ? Value{} : it->second;
  }
  Value out = value;
  for (auto &item : out.items) item = resolve(item, variables);
  for (auto &entry : out.fields) entry.second = resolve(entry.second, variables);
  return out;
}

const Value *find_argument(const Field &field, const std::string &name) {
  for (const auto &arg : field.arguments) {
    if (arg.first == name) return &arg.second;
  }
  return nullptr;
}

int int_argument(const Field &field, const std::string &name,
                 const Variables &variables) {
  const Value *raw = find_argument(field, name);
  if (!raw)
    throw ExecutionError("Field \"" + field.name + "\" argument \"" + name +
                         "\" of type \"Int!\" is required");
  Value value = resolve(*raw, variables);
  if (value.kind != Value::Kind::Int)
    throw ExecutionError("Argument \"" + name + "\" has invalid value: expected Int");
  try {
    return std::stoi(value.text);
  } catch (const std::exception &) {
    throw ExecutionError("Argument \"" + name + "\" is out of Int range");
  }
}

DeviceRecord device_input(const Field &field, const Variables &variables) {
  const Value *raw = find_argument(field, "deviceData");
  if (!raw)
    throw ExecutionError("Field \"" + field.name +
                         "\" argument \"deviceData\" of type \"DeviceInput!\" is required");
  Value value = resolve(*raw, variables);
  if (value.kind != Value::Kind::Object)
    throw ExecutionError("Argument \"deviceData\" must be a DeviceInput object");

  auto required = [&value](const char *name) {
    const Value *member = value.field(name);
    if (!member || member->kind != Value::Kind::String)
      throw ExecutionError(std::string("DeviceInput field \"") + name +
                           "\" of type \"String!\" is required");
    return member->text;
  };
  DeviceRecord device;
  device.name = required("name");
  device.host = required("host");
  device.username = required("username");
  device.password = required("password");
  device.secret = required("secret");
  device.deviceType = required("deviceType");
  return device;
}

void require_selection(const Field &field, const std::string &type_name) {
  if (field.selection.empty())
    throw ExecutionError("Field \"" + field.name + "\" of type \"" + type_name +
                         "\" must have a selection of subfields");
}

void reject_selection(const Field &field, const std::string &type_name) {
  if (!field.selection.empty())
    throw ExecutionError("Field \"" + field.name + "\" must not have a selection since type \"" +
                         type_name + "\" has no subfields");
}

crow::json::wvalue device_to_graph(const DeviceRecord &device,
                                   const std::vector<Field> &selection) {
  crow::json::wvalue out;
  for (const auto &field : selection) {
    const std::string &key = field.response_key();
    if (field.name == "__typename") {
      out[key] = "Device";
      continue;
    }
    reject_selection(field, field.name == "id" ? "Int" : "String");
    if (field.name == "id") out[key] = device.id;
    else if (field.name == "name") out[key] = device.name;
    else if (field.name == "host") out[key] = device.host;
    else if (field.name == "username") out[key] = device.username;
    else if (field.name == "password") out[key] = device.password;
    else if (field.name == "secret") out[key] = device.secret;
    else if (field.name == "deviceType") out[key] = device.deviceType;
    else
      throw ExecutionError("Cannot query field \"" + field.name +
                           "\" on type \"Device\"");
  }
  return out;
}

// {device} payload shared by createDevice and updateDevice.
crow::json::wvalue device_payload(const std::string &type_name,
                                  const std::optional<DeviceRecord> &device,
                                  const std::vector<Field> &selection) {
  crow::json::wvalue out;
  for (const auto &field : selection) {
    const std::string &key = field.response_key();
    if (field.name == "__typename") {
      out[key] = type_name;
    } else if (field.name == "device") {
      require_selection(field, "Device");
      if (device)
        out[key] = device_to_graph(*device, field.selection);
      else
        out[key] = nullptr;
    } else {
      throw ExecutionError("Cannot query field \"" + field.name +
                           "\" on type \"" + type_name + "\"");
    }
  }
  return out;
}

}  // namespace

crow::json::wvalue InventoryApi::execute(const std::string &query,
                                         const crow::json::rvalue &variables) {
  crow::json::wvalue response;
  auto fail = [&response](const std::string &message) {
    response = crow::json::wvalue();
    response["data"] = nullptr;
    response["errors"] = crow::json::wvalue::list();
    response["errors"][0]["message"] = message;
    return std::move(response);
  };

  Operation operation;
  std::string parse_error;
  if (!parse_document(query, operation, parse_error)) return fail(parse_error);

  Variables vars = operation.variable_defaults;
  if (variables && variables.t() == crow::json::type::Object) {
    for (const auto &member : variables)
      vars[member.key()] = value_from_json(member);
  }

  try {
    crow::json::wvalue data;
    for (const auto &field : operation.selection) {
      const std::string &key = field.response_key();
      if (field.name == "__typename") {
        data[key] = operation.type == "mutation" ? "Mutation" : "Query";
        continue;
      }

      if (operation.type == "query") {
        if (field.name == "devices") {
          require_selection(field, "[Device]");
          auto devices = inventory_.load();
          data[key] = crow::json::wvalue::list();
          for (size_t i = 0; i < devices.size(); ++i)
            data[key][static_cast<int>(i)] =
                device_to_graph(devices[i], field.selection);
        } else if (field.name == "deviceById") {
          require_selection(field, "Device");
          int id = int_argument(field, "id", vars);
          auto device = inventory_.find_by_id(id);
          if (device)
            data[key] = device_to_graph(*device, field.selection);
          else
            data[key] = nullptr;
        } else {
          throw ExecutionError("Cannot query field \"" + field.name +
                               "\" on type \"Query\"");
        }
        continue;
      }

      // Mutations run in document order.
      if (field.name == "createDevice") {
        require_selection(field, "CreateDevice");
        DeviceRecord created = device_input(field, vars);
        std::string error;
        bool saved = inventory_.update(
            [&created](std::vector<DeviceRecord> &devices) {
              created.id = InventoryStore::next_id(devices);
              devices.push_back(created);
              return true;
            },
            error);
        if (!saved) throw ExecutionError("Failed to save inventory: " + error);
        audit_.append("graphql.device.create", "graphql", "",
                      build_device_payload_json(created));

        std::string output;
        if (!push_hostname(transport_, created, output, error)) {
          std::cerr << "[graphql] hostname push to " << created.name
                    << " failed: " << error << '\n';
          audit_.append("graphql.hostname.failure", "graphql", "",
                        build_device_payload_json(created));
        }
        data[key] = device_payload("CreateDevice", created, field.selection);
      } else if (field.name == "updateDevice") {
        require_selection(field, "UpdateDevice");
        int id = int_argument(field, "id", vars);
        DeviceRecord input = device_input(field, vars);
        std::optional<DeviceRecord> updated;
        std::string error;
        bool saved = inventory_.update(
            [&](std::vector<DeviceRecord> &devices) {
              for (auto &device : devices) {
                if (device.id != id) continue;
                input.id = device.id;
                input.port = device.port;
                device = input;
                updated = device;
                return true;
              }
              return false;
            },
            error);
        if (!saved) throw ExecutionError("Failed to save inventory: " + error);

        if (updated) {
          audit_.append("graphql.device.update", "graphql", "",
                        build_device_payload_json(*updated));
          std::string output;
          if (!push_hostname(transport_, *updated, output, error)) {
            std::cerr << "[graphql] hostname push to " << updated->name
                      << " failed: " << error << '\n';
            audit_.append("graphql.hostname.failure", "graphql", "",
                          build_device_payload_json(*updated));
          }
        }
        // Unknown ids resolve the whole mutation field to null.
        if (updated)
          data[key] = device_payload("UpdateDevice", updated, field.selection);
        else
          data[key] = nullptr;
      } else if (field.name == "deleteDevice") {
        require_selection(field, "DeleteDevice");
        int id = int_argument(field, "id", vars);
        std::string error;
        bool saved = inventory_.update(
            [id](std::vector<DeviceRecord> &devices) {
              devices.erase(std::remove_if(devices.begin(), devices.end(),
                                           [id](const DeviceRecord &device) {
                                             return device.id == id;
                                           }),
                            devices.end());
              return true;
            },
            error);
        if (!saved) throw ExecutionError("Failed to save inventory: " + error);
        audit_.append("graphql.device.delete", "graphql", "",
                      "{\"id\":" + std::to_string(id) + "}");

        crow::json::wvalue payload;
        for (const auto &sub : field.selection) {
          if (sub.name == "__typename") payload[sub.response_key()] = "DeleteDevice";
          else if (sub.name == "ok") payload[sub.response_key()] = true;
          else
            throw ExecutionError("Cannot query field \"" + sub.name +
                                 "\" on type \"DeleteDevice\"");
        }
        data[key] = std::move(payload);
      } else {
        throw ExecutionError("Cannot query field \"" + field.name +
                             "\" on type \"Mutation\"");
      }
    }
    response["data"] = std::move(data);
    return response;
  } catch (const ExecutionError &e) {
    return fail(e.what());
  }
}

}  // namespace graphql

// ══════════════════════════════════════════════════════════════════════
//  Route
// ══════════════════════════════════════════════════════════════════════

void register_graphql_routes(CrowApp &app, AppContext &ctx) {
  // POST /graphql {query, variables}
  CROW_ROUTE(app, "/graphql").methods(crow::HTTPMethod::Post)(
      [&ctx](const crow::request &request) {
        auto body = crow::json::load(request.body);
        std::string query = json_string(body, "query");
        if (query.empty()) {
          crow::json::wvalue payload;
          payload["data"] = nullptr;
          payload["errors"] = crow::json::wvalue::list();
          payload["errors"][0]["message"] = "Must provide query string.";
          return json_response(400, std::move(payload));
        }

        crow::json::rvalue variables;
        if (body.has("variables")) variables = body["variables"];

        graphql::InventoryApi api(ctx.inventory, ctx.transport, ctx.audit);
        return crow::response{api.execute(query, variables)};
      });
}
