#include <doctest/doctest.h>
#include "cli_prompt.h"

TEST_CASE("Exec and config prompts are recognized") {
  CHECK(cli::ends_with_prompt("banner\r\nR1>"));
  CHECK(cli::ends_with_prompt("R1#"));
  CHECK(cli::ends_with_prompt("output\nR1(config)#"));
  CHECK(cli::ends_with_prompt("output\nR1(config-if)# "));
  CHECK(cli::ends_with_prompt("core-sw.lab#"));
  CHECK_FALSE(cli::ends_with_prompt("Building configuration..."));
  CHECK_FALSE(cli::ends_with_prompt("R1#\nmore text"));
  CHECK_FALSE(cli::ends_with_prompt(""));
}

TEST_CASE("Privileged prompt ends with #") {
  CHECK(cli::is_privileged_prompt("R1#"));
  CHECK(cli::is_privileged_prompt("R1# "));
  CHECK_FALSE(cli::is_privileged_prompt("R1>"));
}

TEST_CASE("Password requests are detected case-insensitively") {
  CHECK(cli::ends_with_password_request("R1>enable\r\nPassword: "));
  CHECK(cli::ends_with_password_request("PASSWORD:"));
  CHECK_FALSE(cli::ends_with_password_request("R1#"));
}

TEST_CASE("clean_output drops echo and prompt") {
  std::string raw = "show users\r\n    Line  User\r\n*  2 vty 0  cisco\r\nR1#";
  CHECK(cli::clean_output(raw, "show users") == "    Line  User\n*  2 vty 0  cisco");
  CHECK(cli::clean_output("R1#", "show clock") == "");
}

TEST_CASE("IOS error markers are reported") {
  auto line = cli::find_error_line("shw run\n% Invalid input detected at '^' marker.\nR1#");
  REQUIRE(line.has_value());
  CHECK(*line == "% Invalid input detected at '^' marker.");
  CHECK_FALSE(cli::find_error_line("Building configuration...\n[OK]").has_value());
}

TEST_CASE("Dialect tables") {
  CHECK(cli::is_supported_device_type("cisco_ios"));
  CHECK(cli::is_supported_device_type("cisco_nxos"));
  CHECK_FALSE(cli::is_supported_device_type("juniper_junos"));
  CHECK(cli::save_command_for("cisco_ios") == "write memory");
  CHECK(cli::save_command_for("cisco_nxos") == "copy running-config startup-config");
}
