// ─── FleetGate — Reachability prober implementation ─────────────────────

#include "ping.h"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <fcntl.h>
#include <cstring>
#include <iostream>
#include <poll.h>
#include <regex>
#include <sstream>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

std::optional<double> parse_response_time(const std::string &output) {
  static const std::regex time_re(R"((?:time|tiempo)[=<]\s*(\d+(?:\.\d+)?)\s*ms)",
                                  std::regex::icase);
  std::istringstream in(output);
  std::string line;
  while (std::getline(in, line)) {
    std::smatch match;
    if (std::regex_search(line, match, time_re)) {
      try {
        return std::stod(match[1].str());
      } catch (const std::exception &) {
        continue;
      }
    }
  }
  return std::nullopt;
}

PingResult classify_ping(int exit_code, bool timed_out,
                         const std::string &output, int timeout_seconds) {
  PingResult result;
  if (timed_out) {
    result.status = "timeout";
    result.message = "Ping timed out";
    result.output = "Ping exceeded the " + std::to_string(timeout_seconds) +
                    " second time limit";
    return result;
  }
  result.output = output;
  if (exit_code == 0) {
    result.status = "success";
    result.message = "Device reachable";
    result.responseTimeMs = parse_response_time(output);
  } else {
    result.status = "error";
    result.message = "Device unreachable";
  }
  return result;
}

PingResult SystemPingProber::probe(const std::string &host) {
  if (host.empty() || host[0] == '-') {
    PingResult result;
    result.status = "error";
    result.message = "Invalid host: '" + host + "'";
    return result;
  }

  int fds[2];
  // Close-on-exec keeps concurrent children from inheriting this pipe.
  if (pipe2(fds, O_CLOEXEC) != 0) {
    PingResult result;
    result.status = "error";
    result.message = std::string("Failed to run ping: ") + std::strerror(errno);
    return result;
  }

  const std::string count = std::to_string(count_);
  pid_t pid = fork();
  if (pid < 0) {
    ::close(fds[0]);
    ::close(fds[1]);
    PingResult result;
    result.status = "error";
    result.message = std::string("Failed to run ping: ") + std::strerror(errno);
    return result;
  }
  if (pid == 0) {
    dup2(fds[1], STDOUT_FILENO);
    dup2(fds[1], STDERR_FILENO);
    ::close(fds[0]);
    ::close(fds[1]);
    execlp(program_.c_str(), program_.c_str(), "-c", count.c_str(), host.c_str(),
           static_cast<char *>(nullptr));
    _exit(127);
  }
  ::close(fds[1]);

  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::seconds(timeout_seconds_);
  std::string output;
  bool timed_out = false;
  char buffer[4096];
  while (true) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      timed_out = true;
      break;
    }
    pollfd pfd{};
    pfd.fd = fds[0];
    pfd.events = POLLIN;
    int prc = poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (prc < 0 && errno == EINTR) continue;
    if (prc == 0) {
      timed_out = true;
      break;
    }
    ssize_t n = read(fds[0], buffer, sizeof(buffer));
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) break;
    output.append(buffer, static_cast<size_t>(n));
  }
  ::close(fds[0]);

  if (timed_out) kill(pid, SIGKILL);
  int status = 0;
  while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }

  int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  if (exit_code == 127 && output.empty() && !timed_out)
    std::cerr << "[ping] " << program_ << " not found" << '\n';
  return classify_ping(exit_code, timed_out, output, timeout_seconds_);
}
