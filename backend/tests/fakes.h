#pragma once
// ─── FleetGate — Test doubles ───────────────────────────────────────────
// In-memory transport, prober and temp-file helpers shared by the tests.

#include "device_transport.h"
#include "inventory.h"
#include "ping.h"

#include <cstdio>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <unistd.h>
#include <vector>

// Everything the fake device saw, shared between channel and transport.
struct FakeDeviceLog {
  std::vector<std::string> commands;
  std::vector<std::vector<std::string>> config_sets;
  int enables = 0;
  int saves = 0;
  int opens = 0;
  int closes = 0;
};

class FakeChannel : public DeviceChannel {
public:
  FakeChannel(FakeDeviceLog &log, const std::set<std::string> &failing,
              const std::map<std::string, std::string> &replies)
      : log_(log), failing_(failing), replies_(replies) {}
  ~FakeChannel() override { close(); }

  bool send_command(const std::string &command, std::string &output,
                    std::string &error) override {
    log_.commands.push_back(command);
    if (failing_.count(command)) {
      error = "% Invalid input detected at '^' marker.";
      return false;
    }
    auto it = replies_.find(command);
    output = it == replies_.end() ? "output of " + command : it->second;
    return true;
  }

  bool enable(std::string &) override {
    ++log_.enables;
    return true;
  }

  bool send_config_set(const std::vector<std::string> &commands,
                       std::string &output, std::string &) override {
    log_.config_sets.push_back(commands);
    output = "R1(config)#";
    for (const auto &command : commands) output += command + "\n";
    return true;
  }

  bool save_config(std::string &output, std::string &) override {
    ++log_.saves;
    output = "[OK]";
    return true;
  }

  void close() override {
    if (!closed_) {
      closed_ = true;
      ++log_.closes;
    }
  }

private:
  FakeDeviceLog &log_;
  const std::set<std::string> &failing_;
  const std::map<std::string, std::string> &replies_;
  bool closed_ = false;
};

class FakeTransport : public DeviceTransport {
public:
  std::unique_ptr<DeviceChannel> open(const DeviceRecord &device,
                                      TransportError &error) override {
    opened_devices.push_back(device.name);
    if (fail_with != TransportFailure::None) {
      error.kind = fail_with;
      error.message = "cannot reach " + device.host;
      return nullptr;
    }
    ++log.opens;
    return std::make_unique<FakeChannel>(log, failing_commands, replies);
  }

  FakeDeviceLog log;
  std::set<std::string> failing_commands;
  std::map<std::string, std::string> replies;
  std::vector<std::string> opened_devices;
  TransportFailure fail_with = TransportFailure::None;
};

class FakeProber : public ReachabilityProber {
public:
  PingResult probe(const std::string &host) override {
    probed.push_back(host);
    auto it = results.find(host);
    if (it != results.end()) return it->second;
    return classify_ping(0, false, "64 bytes from " + host + ": time=1.5 ms");
  }

  std::map<std::string, PingResult> results;
  std::vector<std::string> probed;
};

// Unique path under /tmp, removed (with its .tmp sibling) on destruction.
class TempFile {
public:
  explicit TempFile(const std::string &name) {
    static int counter = 0;
    path_ = "/tmp/fleetgate_test_" + std::to_string(getpid()) + "_" +
            std::to_string(++counter) + "_" + name;
    std::remove(path_.c_str());
  }
  ~TempFile() {
    std::remove(path_.c_str());
    std::remove((path_ + ".tmp").c_str());
  }
  TempFile(const TempFile &) = delete;
  TempFile &operator=(const TempFile &) = delete;

  const std::string &path() const { return path_; }

private:
  std::string path_;
};

inline DeviceRecord make_device(const std::string &name, const std::string &host,
                                int id = 0) {
  DeviceRecord device;
  device.id = id;
  device.name = name;
  device.host = host;
  device.username = "cisco";
  device.password = "cisco";
  device.secret = "enable";
  device.deviceType = "cisco_ios";
  return device;
}

inline void seed_inventory(InventoryStore &store,
                           const std::vector<DeviceRecord> &devices) {
  std::string error;
  store.save(devices, error);
}
