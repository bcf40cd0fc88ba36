// ─── FleetGate — Device inventory store implementation ──────────────────

#include "inventory.h"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>

namespace {

std::string scalar_field(const YAML::Node &node, const char *key) {
  const YAML::Node value = node[key];
  if (!value || !value.IsScalar()) return "";
  return value.as<std::string>();
}

bool read_device(const YAML::Node &node, DeviceRecord &device) {
  if (!node.IsMap()) return false;
  device.name = scalar_field(node, "name");
  device.host = scalar_field(node, "host");
  device.username = scalar_field(node, "username");
  device.password = scalar_field(node, "password");
  device.secret = scalar_field(node, "secret");
  device.deviceType = scalar_field(node, "device_type");
  if (node["id"] && node["id"].IsScalar()) device.id = node["id"].as<int>();
  if (node["port"] && node["port"].IsScalar())
    device.port = node["port"].as<int>();
  return true;
}

}  // namespace

std::vector<DeviceRecord> parse_inventory_yaml(const std::string &text,
                                               std::string &error) {
  std::vector<DeviceRecord> devices;
  YAML::Node root;
  try {
    root = YAML::Load(text);
  } catch (const YAML::Exception &e) {
    error = e.what();
    return devices;
  }
  if (!root || root.IsNull()) return devices;
  if (!root.IsMap()) {
    error = "inventory root is not a mapping";
    return devices;
  }
  const YAML::Node list = root["devices"];
  if (!list || list.IsNull()) return devices;
  if (!list.IsSequence()) {
    error = "'devices' is not a sequence";
    return devices;
  }
  for (const auto &item : list) {
    DeviceRecord device;
    try {
      if (read_device(item, device)) devices.push_back(device);
    } catch (const YAML::Exception &e) {
      error = std::string("invalid device entry: ") + e.what();
    }
  }
  return devices;
}

std::string emit_inventory_yaml(const std::vector<DeviceRecord> &devices) {
  YAML::Emitter out;
  out << YAML::BeginMap << YAML::Key << "devices" << YAML::Value
      << YAML::BeginSeq;
  for (const auto &device : devices) {
    out << YAML::BeginMap;
    if (device.id > 0) out << YAML::Key << "id" << YAML::Value << device.id;
    out << YAML::Key << "name" << YAML::Value << device.name;
    out << YAML::Key << "host" << YAML::Value << device.host;
    if (device.port != 22)
      out << YAML::Key << "port" << YAML::Value << device.port;
    out << YAML::Key << "username" << YAML::Value << device.username;
    out << YAML::Key << "password" << YAML::Value << device.password;
    out << YAML::Key << "secret" << YAML::Value << device.secret;
    out << YAML::Key << "device_type" << YAML::Value << device.deviceType;
    out << YAML::EndMap;
  }
  out << YAML::EndSeq << YAML::EndMap;
  return std::string(out.c_str()) + "\n";
}

std::vector<DeviceRecord> InventoryStore::load() const {
  std::ifstream in(path_);
  if (!in) {
    std::cerr << "[inventory] " << path_ << " not found" << '\n';
    return {};
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();

  std::string error;
  auto devices = parse_inventory_yaml(buffer.str(), error);
  if (!error.empty())
    std::cerr << "[inventory] Failed to read " << path_ << ": " << error << '\n';
  return devices;
}

bool InventoryStore::save(const std::vector<DeviceRecord> &devices,
                          std::string &error) {
  const std::string tmp_path = path_ + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::out | std::ios::trunc);
    if (!out) {
      error = "Unable to open " + tmp_path + ": " + std::strerror(errno);
      return false;
    }
    out << emit_inventory_yaml(devices);
    out.flush();
    if (!out) {
      error = "Unable to write " + tmp_path;
      return false;
    }
  }
  if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
    error = "Unable to replace " + path_ + ": " + std::strerror(errno);
    std::remove(tmp_path.c_str());
    return false;
  }
  return true;
}

std::optional<DeviceRecord> InventoryStore::find_by_name(
    const std::string &name) const {
  for (const auto &device : load()) {
    if (device.name == name) return device;
  }
  return std::nullopt;
}

std::optional<DeviceRecord> InventoryStore::find_by_id(int id) const {
  for (const auto &device : load()) {
    if (device.id == id) return device;
  }
  return std::nullopt;
}

bool InventoryStore::update(
    const std::function<bool(std::vector<DeviceRecord> &)> &mutator,
    std::string &error) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  auto devices = load();
  if (!mutator(devices)) return true;
  return save(devices, error);
}

int InventoryStore::next_id(const std::vector<DeviceRecord> &devices) {
  int max_id = 0;
  for (const auto &device : devices) max_id = std::max(max_id, device.id);
  return max_id + 1;
}
