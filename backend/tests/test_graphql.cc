#include <doctest/doctest.h>
#include "audit_log.h"
#include "fakes.h"
#include "graphql.h"

namespace {

// Serializes the response and reloads it for inspection.
crow::json::rvalue run(graphql::InventoryApi &api, const std::string &query,
                       const std::string &variables = "") {
  crow::json::rvalue vars;
  if (!variables.empty()) vars = crow::json::load(variables);
  crow::json::wvalue result = api.execute(query, vars);
  return crow::json::load(result.dump());
}

const char *kCreate =
    "mutation Create($data: DeviceInput!) {"
    "  createDevice(deviceData: $data) {"
    "    device { id name host username password secret deviceType }"
    "  }"
    "}";

const char *kDeviceData =
    R"({"data": {"name": "EDGE1", "host": "10.1.1.1", "username": "cisco",)"
    R"( "password": "pw", "secret": "en", "deviceType": "cisco_ios"}})";

struct GraphFixture {
  GraphFixture() : store(file.path()), api(store, transport, audit) {}

  TempFile file{"graphql.yaml"};
  InventoryStore store;
  FakeTransport transport;
  AuditLog audit;
  graphql::InventoryApi api;
};

}  // namespace

TEST_CASE("Parser accepts aliases, arguments and variables") {
  graphql::Operation op;
  std::string error;
  REQUIRE(graphql::parse_document(
      "query Q($id: Int! = 3) { first: deviceById(id: $id) { name } # note\n }",
      op, error));
  CHECK(op.type == "query");
  CHECK(op.name == "Q");
  REQUIRE(op.selection.size() == 1);
  CHECK(op.selection[0].alias == "first");
  CHECK(op.selection[0].name == "deviceById");
  CHECK(op.selection[0].response_key() == "first");
  REQUIRE(op.selection[0].arguments.size() == 1);
  CHECK(op.selection[0].arguments[0].second.kind == graphql::Value::Kind::Variable);
  CHECK(op.variable_defaults.at("id").text == "3");
}

TEST_CASE("Parser handles string escapes and object values") {
  graphql::Operation op;
  std::string error;
  REQUIRE(graphql::parse_document(
      R"(mutation { createDevice(deviceData: {name: "a\"b", host: "hA"}) { device { name } } })",
      op, error));
  CHECK(op.type == "mutation");
  const auto &data = op.selection[0].arguments[0].second;
  REQUIRE(data.kind == graphql::Value::Kind::Object);
  CHECK(data.field("name")->text == "a\"b");
  CHECK(data.field("host")->text == "hA");
  CHECK(data.field("secret") == nullptr);
}

TEST_CASE("Parser rejects unsupported syntax") {
  graphql::Operation op;
  std::string error;
  CHECK_FALSE(graphql::parse_document("{ devices { ...F } }", op, error));
  CHECK_FALSE(graphql::parse_document("subscription { devices { id } }", op, error));
  CHECK_FALSE(graphql::parse_document("{ devices @skip(if: true) { id } }", op, error));
  CHECK_FALSE(graphql::parse_document("{ devices { id } } { devices { id } }", op, error));
  CHECK_FALSE(graphql::parse_document("{ devices { id }", op, error));
  CHECK_FALSE(graphql::parse_document("", op, error));
  CHECK(error.find("Syntax Error") == 0);
}

TEST_CASE("Parser refuses deeply nested input") {
  graphql::Operation op;
  std::string error;

  std::string lists = "{ devices(x: " + std::string(100000, '[') + " ) { id } }";
  CHECK_FALSE(graphql::parse_document(lists, op, error));
  CHECK(error.find("nested too deeply") != std::string::npos);

  std::string selections;
  for (int i = 0; i < 20000; ++i) selections += "{ a ";
  error.clear();
  CHECK_FALSE(graphql::parse_document(selections, op, error));
  CHECK(error.find("nested too deeply") != std::string::npos);

  error.clear();
  std::string types = "query($v: " + std::string(5000, '[') + "Int" +
                      std::string(5000, ']') + ") { devices { id } }";
  CHECK_FALSE(graphql::parse_document(types, op, error));
  CHECK(error.find("nested too deeply") != std::string::npos);

  // Ordinary nesting stays well under the limit.
  std::string shallow = "{ devices(x: " + std::string(10, '[') + "1" +
                        std::string(10, ']') + ") { id } }";
  CHECK(graphql::parse_document(shallow, op, error));
}

TEST_CASE_FIXTURE(GraphFixture, "devices on an empty inventory is an empty list") {
  auto response = run(api, "{ devices { id name } }");
  REQUIRE(response.has("data"));
  CHECK(response["data"]["devices"].size() == 0);
  CHECK_FALSE(response.has("errors"));
}

TEST_CASE_FIXTURE(GraphFixture, "createDevice then deviceById returns the same fields") {
  auto created = run(api, kCreate, kDeviceData);
  REQUIRE_FALSE(created.has("errors"));
  const auto &device = created["data"]["createDevice"]["device"];
  CHECK(device["id"].i() == 1);
  CHECK(std::string(device["name"].s()) == "EDGE1");

  auto fetched = run(api, "query($id: Int!) { deviceById(id: $id) { id name host username password secret deviceType } }",
                     R"({"id": 1})");
  const auto &same = fetched["data"]["deviceById"];
  CHECK(std::string(same["name"].s()) == "EDGE1");
  CHECK(std::string(same["host"].s()) == "10.1.1.1");
  CHECK(std::string(same["username"].s()) == "cisco");
  CHECK(std::string(same["password"].s()) == "pw");
  CHECK(std::string(same["secret"].s()) == "en");
  CHECK(std::string(same["deviceType"].s()) == "cisco_ios");

  // The new hostname is pushed and saved on the device.
  REQUIRE(transport.log.config_sets.size() == 1);
  CHECK(transport.log.config_sets[0] == std::vector<std::string>{"hostname EDGE1"});
  CHECK(transport.log.saves == 1);
}

TEST_CASE_FIXTURE(GraphFixture, "ids keep increasing after creates") {
  seed_inventory(store, {make_device("R1", "10.0.0.1", 7)});
  auto created = run(api, kCreate, kDeviceData);
  CHECK(created["data"]["createDevice"]["device"]["id"].i() == 8);
  CHECK(store.load().size() == 2);
}

TEST_CASE_FIXTURE(GraphFixture, "a failed hostname push keeps the saved record") {
  transport.fail_with = TransportFailure::ConnectionError;
  auto created = run(api, kCreate, kDeviceData);
  REQUIRE_FALSE(created.has("errors"));
  CHECK(store.find_by_name("EDGE1").has_value());

  auto events = audit.recent(10);
  REQUIRE_FALSE(events.empty());
  CHECK(events[0].type == "graphql.hostname.failure");
}

TEST_CASE_FIXTURE(GraphFixture, "updateDevice replaces the record") {
  seed_inventory(store, {make_device("R1", "10.0.0.1", 1)});
  auto updated = run(api,
                     "mutation($d: DeviceInput!) { updateDevice(id: 1, deviceData: $d) { device { id name host } } }",
                     R"({"d": {"name": "R1-new", "host": "10.0.0.9", "username": "u",)"
                     R"( "password": "p", "secret": "s", "deviceType": "cisco_xe"}})");
  const auto &device = updated["data"]["updateDevice"]["device"];
  CHECK(device["id"].i() == 1);
  CHECK(std::string(device["name"].s()) == "R1-new");
  auto stored = store.find_by_id(1);
  REQUIRE(stored.has_value());
  CHECK(stored->host == "10.0.0.9");
  CHECK(stored->deviceType == "cisco_xe");
}

TEST_CASE_FIXTURE(GraphFixture, "updateDevice with an unknown id resolves to null") {
  seed_inventory(store, {make_device("R1", "10.0.0.1", 1)});
  auto updated = run(api,
                     "mutation { updateDevice(id: 42, deviceData: {name: \"x\", host: \"h\","
                     " username: \"u\", password: \"p\", secret: \"s\", deviceType: \"cisco_ios\"})"
                     " { device { id } } }");
  REQUIRE_FALSE(updated.has("errors"));
  CHECK(updated["data"]["updateDevice"].t() == crow::json::type::Null);
  CHECK(store.load()[0].name == "R1");
  CHECK(transport.log.opens == 0);
}

TEST_CASE_FIXTURE(GraphFixture, "deleteDevice removes the record from devices") {
  seed_inventory(store, {make_device("R1", "10.0.0.1", 1), make_device("R2", "10.0.0.2", 2)});
  auto deleted = run(api, "mutation { deleteDevice(id: 1) { ok } }");
  CHECK(deleted["data"]["deleteDevice"]["ok"].b());

  auto listed = run(api, "{ devices { id name } }");
  REQUIRE(listed["data"]["devices"].size() == 1);
  CHECK(std::string(listed["data"]["devices"][0]["name"].s()) == "R2");

  auto missing = run(api, "{ deviceById(id: 1) { name } }");
  CHECK(missing["data"]["deviceById"].t() == crow::json::type::Null);
}

TEST_CASE_FIXTURE(GraphFixture, "execution errors come back in the errors list") {
  SUBCASE("unknown field") {
    auto response = run(api, "{ routers { id } }");
    REQUIRE(response.has("errors"));
    CHECK(response["data"].t() == crow::json::type::Null);
  }
  SUBCASE("missing subselection") {
    auto response = run(api, "{ devices }");
    REQUIRE(response.has("errors"));
  }
  SUBCASE("incomplete DeviceInput") {
    auto response = run(api, "mutation { createDevice(deviceData: {name: \"x\"}) { device { id } } }");
    REQUIRE(response.has("errors"));
    CHECK(store.load().empty());
  }
  SUBCASE("syntax error") {
    auto response = run(api, "{ devices { id ");
    REQUIRE(response.has("errors"));
    std::string message = response["errors"][0]["message"].s();
    CHECK(message.find("Syntax Error") == 0);
  }
}
