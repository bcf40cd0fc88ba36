#pragma once
// ─── FleetGate — Device inventory store ─────────────────────────────────
// YAML-backed device list. Re-read on every call, no cache.

#include "models.h"

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class InventoryStore {
public:
  explicit InventoryStore(std::string path) : path_(std::move(path)) {}

  // Returns an empty list when the file is absent or malformed.
  std::vector<DeviceRecord> load() const;

  // Overwrites the file with `devices` under the top-level `devices` key.
  bool save(const std::vector<DeviceRecord> &devices, std::string &error);

  std::optional<DeviceRecord> find_by_name(const std::string &name) const;
  std::optional<DeviceRecord> find_by_id(int id) const;

  // Load, mutate and save while holding the writer lock. The mutator
  // returns false to skip the save.
  bool update(const std::function<bool(std::vector<DeviceRecord> &)> &mutator,
              std::string &error);

  static int next_id(const std::vector<DeviceRecord> &devices);

  const std::string &path() const { return path_; }

private:
  std::string path_;
  std::mutex write_mutex_;
};

// YAML text <-> records.
std::vector<DeviceRecord> parse_inventory_yaml(const std::string &text,
                                               std::string &error);
std::string emit_inventory_yaml(const std::vector<DeviceRecord> &devices);
