#pragma once
// ─── FleetGate — Reachability prober ────────────────────────────────────
// Shells out to the OS ping utility and turns its text into a PingResult.

#include "models.h"

#include <optional>
#include <string>
#include <utility>

class ReachabilityProber {
public:
  virtual ~ReachabilityProber() = default;
  virtual PingResult probe(const std::string &host) = 0;
};

// Runs `<program> -c <count> <host>` with a hard deadline. `program` is
// looked up on PATH unless it contains a slash.
class SystemPingProber : public ReachabilityProber {
public:
  SystemPingProber(int count = 4, int timeout_seconds = 10,
                   std::string program = "ping")
      : count_(count), timeout_seconds_(timeout_seconds),
        program_(std::move(program)) {}

  PingResult probe(const std::string &host) override;

private:
  int count_;
  int timeout_seconds_;
  std::string program_;
};

// First "time=<n> ms" (or localized "tiempo=") value in the output.
std::optional<double> parse_response_time(const std::string &output);

// exit 0 -> success, nonzero -> error, deadline hit -> timeout.
PingResult classify_ping(int exit_code, bool timed_out,
                         const std::string &output, int timeout_seconds = 10);
