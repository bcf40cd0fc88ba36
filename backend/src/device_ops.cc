// ─── FleetGate — Device operations implementation ───────────────────────

#include "device_ops.h"
#include "utils.h"

#include <yaml-cpp/yaml.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sys/stat.h>

bool parse_template_commands(const std::string &template_content,
                             std::vector<std::string> &commands,
                             std::string &error) {
  commands.clear();
  YAML::Node root;
  try {
    root = YAML::Load(template_content);
  } catch (const YAML::Exception &e) {
    error = std::string("Invalid YAML template: ") + e.what();
    return false;
  }
  if (!root.IsMap() || !root["commands"]) {
    error = "Template must contain a \"commands\" section";
    return false;
  }
  const YAML::Node list = root["commands"];
  if (!list.IsSequence()) {
    error = "Template \"commands\" must be a sequence";
    return false;
  }
  try {
    for (const auto &item : list) {
      if (!item.IsScalar()) {
        error = "Template commands must be strings";
        return false;
      }
      commands.push_back(item.as<std::string>());
    }
  } catch (const YAML::Exception &e) {
    error = std::string("Invalid YAML template: ") + e.what();
    return false;
  }
  return true;
}

std::vector<CommandResult> apply_template(
    DeviceChannel &channel, const std::vector<std::string> &commands) {
  std::vector<CommandResult> results;
  results.reserve(commands.size());
  for (const auto &command : commands) {
    CommandResult result;
    result.command = command;
    std::string output;
    std::string error;
    bool ok = true;
    if (starts_with(command, "configure")) ok = channel.enable(error);
    if (ok) ok = channel.send_command(command, output, error);
    result.status = ok ? "success" : "error";
    result.output = ok ? output : error;
    results.push_back(result);
  }
  return results;
}

std::vector<std::string> password_change_commands(
    const std::string &username, const std::string &new_password) {
  return {"username " + username + " password " + new_password};
}

bool user_management_commands(const std::string &action,
                              const std::string &username,
                              const std::string &password,
                              std::vector<std::string> &commands,
                              std::string &error) {
  if (username.empty()) {
    error = "Missing username";
    return false;
  }
  if (action == "add") {
    if (password.empty()) {
      error = "Missing password";
      return false;
    }
    commands = {"username " + username + " privilege 15 password " + password};
    return true;
  }
  if (action == "remove") {
    commands = {"no username " + username};
    return true;
  }
  error = "Invalid action (expected add or remove)";
  return false;
}

const std::vector<std::string> &patch_simulation_steps() {
  static const std::vector<std::string> steps = {
      "Checking current system version...",
      "Downloading patch file...",
      "Verifying file integrity...",
      "Creating configuration backup...",
      "Applying security patch...",
      "Restarting services...",
      "Verifying operation...",
      "Patch applied successfully",
  };
  return steps;
}

const std::vector<std::string> &security_audit_commands() {
  static const std::vector<std::string> commands = {
      "show running-config", "show users", "show privilege"};
  return commands;
}

std::string backup_file_path(const std::string &dir,
                             const std::string &device_name,
                             const std::string &stamp) {
  std::string safe_name = device_name;
  for (char &ch : safe_name) {
    if (ch == '/' || ch == '\\' || ch == ' ') ch = '_';
  }
  if (safe_name.empty() || safe_name == "." || safe_name == "..")
    safe_name = "device";
  std::string base = dir.empty() ? "." : dir;
  if (base.back() == '/') base.pop_back();
  return base + "/backup_" + safe_name + "_" + stamp + ".txt";
}

bool write_backup(const std::string &dir, const std::string &device_name,
                  const std::string &config, std::string &path,
                  std::string &error) {
  if (!dir.empty() && mkdir(dir.c_str(), 0750) != 0 && errno != EEXIST) {
    error = "Unable to create " + dir + ": " + std::strerror(errno);
    return false;
  }
  path = backup_file_path(dir, device_name, now_compact());
  std::ofstream out(path, std::ios::out | std::ios::trunc);
  if (!out) {
    error = "Unable to open " + path + ": " + std::strerror(errno);
    return false;
  }
  out << config;
  out.flush();
  if (!out) {
    error = "Unable to write " + path;
    return false;
  }
  return true;
}

bool push_hostname(DeviceTransport &transport, const DeviceRecord &device,
                   std::string &output, std::string &error) {
  TransportError open_error;
  auto channel = transport.open(device, open_error);
  if (!channel) {
    error = open_error.message;
    return false;
  }
  if (!channel->send_config_set({"hostname " + device.name}, output, error))
    return false;
  std::string save_output;
  if (!channel->save_config(save_output, error)) return false;
  output += save_output;
  return true;
}
