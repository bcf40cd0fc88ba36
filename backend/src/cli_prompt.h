#pragma once
// ─── FleetGate — Cisco CLI text helpers ─────────────────────────────────
// Prompt detection, echo stripping and per-dialect command tables used by
// the SSH transport.

#include <optional>
#include <string>

namespace cli {

// Last line of `buffer` (after the final newline), with '\r' removed.
std::string last_line(const std::string &buffer);

// True when the buffer ends at an exec or config prompt such as "R1>",
// "R1#" or "R1(config-if)#".
bool ends_with_prompt(const std::string &buffer);

// True when the prompt is privileged ("#").
bool is_privileged_prompt(const std::string &prompt);

// True when the buffer ends with a "Password:" request.
bool ends_with_password_request(const std::string &buffer);

// Normalizes line endings and removes the echoed command line and the
// trailing prompt from a raw reply.
std::string clean_output(const std::string &raw, const std::string &command);

// Returns the first IOS error marker line ("% Invalid input ..."), if any.
std::optional<std::string> find_error_line(const std::string &output);

bool is_supported_device_type(const std::string &device_type);

// Command that copies running config to startup on this dialect.
std::string save_command_for(const std::string &device_type);

}  // namespace cli
