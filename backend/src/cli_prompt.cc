// ─── FleetGate — Cisco CLI text helpers implementation ──────────────────

#include "cli_prompt.h"

#include <algorithm>
#include <regex>
#include <sstream>
#include <vector>

namespace cli {

namespace {

std::string strip_cr(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (char ch : value) {
    if (ch != '\r') out += ch;
  }
  return out;
}

std::string rtrim(std::string value) {
  while (!value.empty() &&
         (value.back() == ' ' || value.back() == '\t' || value.back() == '\n'))
    value.pop_back();
  return value;
}

std::vector<std::string> split_lines(const std::string &text) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) lines.push_back(line);
  return lines;
}

}  // namespace

std::string last_line(const std::string &buffer) {
  std::string text = strip_cr(buffer);
  size_t pos = text.find_last_of('\n');
  if (pos == std::string::npos) return text;
  return text.substr(pos + 1);
}

bool ends_with_prompt(const std::string &buffer) {
  static const std::regex prompt_re(
      R"(^[A-Za-z0-9_.@/:\-]+(\([A-Za-z0-9_./ \-]+\))?[>#]\s*$)");
  return std::regex_match(last_line(buffer), prompt_re);
}

bool is_privileged_prompt(const std::string &prompt) {
  std::string trimmed = rtrim(prompt);
  return !trimmed.empty() && trimmed.back() == '#';
}

bool ends_with_password_request(const std::string &buffer) {
  std::string line = rtrim(last_line(buffer));
  std::transform(line.begin(), line.end(), line.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  const std::string marker = "password:";
  return line.size() >= marker.size() &&
         line.compare(line.size() - marker.size(), marker.size(), marker) == 0;
}

std::string clean_output(const std::string &raw, const std::string &command) {
  auto lines = split_lines(strip_cr(raw));
  if (!lines.empty() && !command.empty() &&
      lines.front().find(command) != std::string::npos)
    lines.erase(lines.begin());
  if (!lines.empty() && ends_with_prompt(lines.back())) lines.pop_back();

  std::string out;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i) out += '\n';
    out += lines[i];
  }
  return rtrim(out);
}

std::optional<std::string> find_error_line(const std::string &output) {
  static const char *markers[] = {"% Invalid input", "% Incomplete command",
                                  "% Ambiguous command", "% Unknown command"};
  for (const auto &line : split_lines(strip_cr(output))) {
    for (const char *marker : markers) {
      if (line.find(marker) != std::string::npos) return rtrim(line);
    }
  }
  return std::nullopt;
}

bool is_supported_device_type(const std::string &device_type) {
  return device_type == "cisco_ios" || device_type == "cisco_xe" ||
         device_type == "cisco_nxos" || device_type == "cisco_asa" ||
         device_type == "cisco_xr";
}

std::string save_command_for(const std::string &device_type) {
  if (device_type == "cisco_nxos") return "copy running-config startup-config";
  return "write memory";
}

}  // namespace cli
