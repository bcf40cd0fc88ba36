#pragma once
// ─── FleetGate — Device operations ──────────────────────────────────────
// Command sets and multi-step device actions shared by the HTTP routes and
// the GraphQL mutations.

#include "device_transport.h"
#include "models.h"

#include <string>
#include <vector>

// Parses a YAML template and extracts its `commands` sequence. Returns
// false with `error` set when the text is not YAML or has no commands.
bool parse_template_commands(const std::string &template_content,
                             std::vector<std::string> &commands,
                             std::string &error);

// Runs each command on its own; a failing command is recorded and the rest
// still run. Commands starting with "configure" enter privileged mode first.
std::vector<CommandResult> apply_template(DeviceChannel &channel,
                                          const std::vector<std::string> &commands);

std::vector<std::string> password_change_commands(const std::string &username,
                                                  const std::string &new_password);

// action is "add" or "remove".
bool user_management_commands(const std::string &action,
                              const std::string &username,
                              const std::string &password,
                              std::vector<std::string> &commands,
                              std::string &error);

const std::vector<std::string> &patch_simulation_steps();
const std::vector<std::string> &security_audit_commands();

// <dir>/backup_<device>_<stamp>.txt
std::string backup_file_path(const std::string &dir,
                             const std::string &device_name,
                             const std::string &stamp);

// Writes `config` to a fresh backup file, creating `dir` when missing.
bool write_backup(const std::string &dir, const std::string &device_name,
                  const std::string &config, std::string &path,
                  std::string &error);

// Opens a session, applies "hostname <name>" and saves the config.
bool push_hostname(DeviceTransport &transport, const DeviceRecord &device,
                   std::string &output, std::string &error);
