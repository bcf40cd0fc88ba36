#include <doctest/doctest.h>
#include "fakes.h"
#include "inventory.h"

#include <fstream>

namespace {

void write_text(const std::string &path, const std::string &text) {
  std::ofstream out(path, std::ios::out | std::ios::trunc);
  out << text;
}

}  // namespace

TEST_CASE("Absent inventory file loads as an empty list") {
  TempFile file("absent.yaml");
  InventoryStore store(file.path());
  CHECK(store.load().empty());
  CHECK_FALSE(store.find_by_name("R1").has_value());
}

TEST_CASE("Malformed inventory loads as an empty list") {
  TempFile file("malformed.yaml");
  InventoryStore store(file.path());

  SUBCASE("broken YAML") { write_text(file.path(), "devices: [name: {\n"); }
  SUBCASE("root is a sequence") { write_text(file.path(), "- a\n- b\n"); }
  SUBCASE("devices is a scalar") { write_text(file.path(), "devices: 42\n"); }
  SUBCASE("empty file") { write_text(file.path(), ""); }
  SUBCASE("no devices key") { write_text(file.path(), "other: 1\n"); }

  CHECK(store.load().empty());
}

TEST_CASE("Inventory YAML is parsed field by field") {
  const std::string text =
      "devices:\n"
      "  - id: 3\n"
      "    name: R1\n"
      "    host: 192.168.1.1\n"
      "    username: cisco\n"
      "    password: pw\n"
      "    secret: en\n"
      "    device_type: cisco_ios\n"
      "  - name: SW1\n"
      "    host: 192.168.1.2\n"
      "    port: 2222\n"
      "    username: admin\n"
      "    password: pw2\n"
      "    secret: en2\n"
      "    device_type: cisco_nxos\n";
  std::string error;
  auto devices = parse_inventory_yaml(text, error);
  CHECK(error.empty());
  REQUIRE(devices.size() == 2);
  CHECK(devices[0].id == 3);
  CHECK(devices[0].name == "R1");
  CHECK(devices[0].host == "192.168.1.1");
  CHECK(devices[0].port == 22);
  CHECK(devices[0].deviceType == "cisco_ios");
  CHECK(devices[1].id == 0);
  CHECK(devices[1].port == 2222);
  CHECK(devices[1].secret == "en2");
}

TEST_CASE("Saved inventory reads back identical records") {
  TempFile file("roundtrip.yaml");
  InventoryStore store(file.path());
  auto r1 = make_device("R1", "10.0.0.1", 1);
  auto r2 = make_device("R2", "10.0.0.2", 2);
  r2.port = 2022;

  std::string error;
  REQUIRE(store.save({r1, r2}, error));
  auto devices = store.load();
  REQUIRE(devices.size() == 2);
  CHECK(devices[1].name == "R2");
  CHECK(devices[1].port == 2022);
  CHECK(devices[1].password == "cisco");
  CHECK(devices[0].secret == "enable");

  auto found = store.find_by_id(2);
  REQUIRE(found.has_value());
  CHECK(found->host == "10.0.0.2");
  CHECK_FALSE(store.find_by_id(9).has_value());
}

TEST_CASE("Duplicate names resolve to the first entry") {
  TempFile file("dupes.yaml");
  InventoryStore store(file.path());
  seed_inventory(store, {make_device("R1", "10.0.0.1", 1),
                         make_device("R1", "10.0.0.99", 2)});
  auto found = store.find_by_name("R1");
  REQUIRE(found.has_value());
  CHECK(found->host == "10.0.0.1");
}

TEST_CASE("update saves only when the mutator asks for it") {
  TempFile file("update.yaml");
  InventoryStore store(file.path());
  seed_inventory(store, {make_device("R1", "10.0.0.1", 1)});

  std::string error;
  CHECK(store.update([](std::vector<DeviceRecord> &devices) {
    devices.push_back(make_device("R2", "10.0.0.2", InventoryStore::next_id(devices)));
    return true;
  }, error));
  CHECK(store.load().size() == 2);

  CHECK(store.update([](std::vector<DeviceRecord> &devices) {
    devices.clear();
    return false;
  }, error));
  CHECK(store.load().size() == 2);
}

TEST_CASE("next_id is one past the largest id") {
  CHECK(InventoryStore::next_id({}) == 1);
  CHECK(InventoryStore::next_id({make_device("a", "h", 4), make_device("b", "h", 2)}) == 5);
}

TEST_CASE("Emitted YAML omits default port and unset id") {
  auto yaml = emit_inventory_yaml({make_device("R1", "10.0.0.1")});
  CHECK(yaml.find("port") == std::string::npos);
  CHECK(yaml.find("id:") == std::string::npos);
  CHECK(yaml.find("device_type: cisco_ios") != std::string::npos);
}
