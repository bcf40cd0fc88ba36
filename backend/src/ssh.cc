// ─── FleetGate — SSH transport implementation ───────────────────────────

#include "ssh.h"
#include "cli_prompt.h"

#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <functional>
#include <iostream>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

#ifdef FLEETGATE_SSH_ENABLED
#include <libssh2.h>
#endif

// ═══════════════════════════════════════════════════════════════════════
//  TCP helper
// ═══════════════════════════════════════════════════════════════════════

int open_tcp_socket(const std::string &host, int port, int timeout_ms,
                    bool &timed_out, std::string &error) {
  timed_out = false;
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;

  addrinfo *result = nullptr;
  const std::string port_str = std::to_string(port);
  int rc = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &result);
  if (rc != 0 || !result) {
    error = "Unable to resolve host " + host;
    return -1;
  }

  // One deadline covers every resolved address.
  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(timeout_ms);
  int sock = -1;
  for (addrinfo *ptr = result; ptr != nullptr; ptr = ptr->ai_next) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      timed_out = true;
      break;
    }
    sock = static_cast<int>(socket(ptr->ai_family,
                                   ptr->ai_socktype | SOCK_CLOEXEC,
                                   ptr->ai_protocol));
    if (sock < 0) continue;

    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
    bool connected = connect(sock, ptr->ai_addr, ptr->ai_addrlen) == 0;
    if (!connected && errno == EINPROGRESS) {
      pollfd pfd{};
      pfd.fd = sock;
      pfd.events = POLLOUT;
      int prc = poll(&pfd, 1, static_cast<int>(remaining.count()));
      if (prc == 0) {
        timed_out = true;
      } else if (prc > 0) {
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        getsockopt(sock, SOL_SOCKET, SO_ERROR, &so_error, &len);
        connected = so_error == 0;
      }
    }
    if (connected) {
      fcntl(sock, F_SETFL, flags);
      break;
    }
    close(sock);
    sock = -1;
  }

  freeaddrinfo(result);
  if (sock < 0) {
    error = timed_out ? "Timeout - unable to reach " + host
                      : "Unable to connect to " + host;
  } else {
    timed_out = false;
  }
  return sock;
}

// ═══════════════════════════════════════════════════════════════════════
//  libssh2 channel
// ═══════════════════════════════════════════════════════════════════════

#ifdef FLEETGATE_SSH_ENABLED

namespace {

void kbd_callback(const char * /*name*/, int /*name_len*/,
                  const char * /*instruction*/, int /*instruction_len*/,
                  int num_prompts,
                  const LIBSSH2_USERAUTH_KBDINT_PROMPT * /*prompts*/,
                  LIBSSH2_USERAUTH_KBDINT_RESPONSE *responses,
                  void **abstract) {
  const auto *password = static_cast<const std::string *>(*abstract);
  for (int i = 0; i < num_prompts; ++i) {
    responses[i].text = strdup(password->c_str());
    responses[i].length = static_cast<unsigned int>(password->size());
  }
}

bool auth_method_listed(const char *list, const char *method) {
  return list && std::strstr(list, method) != nullptr;
}

class SshChannel : public DeviceChannel {
public:
  explicit SshChannel(DeviceRecord device) : device_(std::move(device)) {}
  ~SshChannel() override { close(); }

  bool connect(int timeout_seconds, TransportError &error);

  bool send_command(const std::string &command, std::string &output,
                    std::string &error) override;
  bool enable(std::string &error) override;
  bool send_config_set(const std::vector<std::string> &commands,
                       std::string &output, std::string &error) override;
  bool save_config(std::string &output, std::string &error) override;
  void close() override;

private:
  bool write_all(const std::string &data, std::string &error);
  bool read_until(const std::function<bool(const std::string &)> &done,
                  std::string &buffer, std::string &error);
  bool exchange(const std::string &line, std::string &raw, std::string &error);

  DeviceRecord device_;
  int socket_fd_ = -1;
  LIBSSH2_SESSION *session_ = nullptr;
  LIBSSH2_CHANNEL *channel_ = nullptr;
  std::string prompt_;
};

bool SshChannel::connect(int timeout_seconds, TransportError &error) {
  // Connect, handshake and authentication share a single deadline.
  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::seconds(timeout_seconds);
  auto remaining_ms = [&deadline]() -> long {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? static_cast<long>(left.count()) : 1L;
  };

  bool timed_out = false;
  std::string socket_error;
  socket_fd_ = open_tcp_socket(device_.host, device_.port,
                               timeout_seconds * 1000, timed_out, socket_error);
  if (socket_fd_ < 0) {
    error.kind = timed_out ? TransportFailure::Timeout
                           : TransportFailure::ConnectionError;
    error.message = socket_error;
    return false;
  }

  session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr,
                                     static_cast<void *>(&device_.password));
  if (!session_) {
    error = {TransportFailure::ConnectionError, "libssh2 init failed"};
    return false;
  }

  libssh2_session_set_blocking(session_, 1);
  libssh2_session_set_timeout(session_, remaining_ms());
  int rc = libssh2_session_handshake(session_, socket_fd_);
  if (rc != 0) {
    if (rc == LIBSSH2_ERROR_TIMEOUT)
      error = {TransportFailure::Timeout, "Timeout - SSH handshake did not complete"};
    else
      error = {TransportFailure::ConnectionError, "SSH handshake failed"};
    return false;
  }

  libssh2_session_set_timeout(session_, remaining_ms());
  const std::string &user = device_.username;
  const char *methods = libssh2_userauth_list(
      session_, user.c_str(), static_cast<unsigned int>(user.size()));
  if (methods) {
    rc = LIBSSH2_ERROR_AUTHENTICATION_FAILED;
    if (auth_method_listed(methods, "password")) {
      rc = libssh2_userauth_password(session_, user.c_str(),
                                     device_.password.c_str());
    }
    if (rc != 0 && rc != LIBSSH2_ERROR_TIMEOUT &&
        auth_method_listed(methods, "keyboard-interactive")) {
      rc = libssh2_userauth_keyboard_interactive(session_, user.c_str(),
                                                 &kbd_callback);
    }
    if (rc == LIBSSH2_ERROR_TIMEOUT) {
      error = {TransportFailure::Timeout, "Timeout - SSH authentication did not complete"};
      return false;
    }
    if (rc != 0) {
      error = {TransportFailure::AuthenticationFailed, "Authentication failed"};
      return false;
    }
  } else if (!libssh2_userauth_authenticated(session_)) {
    error = {TransportFailure::AuthenticationFailed, "Authentication failed"};
    return false;
  }

  // Only the connect phase is bounded.
  libssh2_session_set_timeout(session_, 0);

  channel_ = libssh2_channel_open_session(session_);
  if (!channel_) {
    error = {TransportFailure::ConnectionError, "SSH channel open failed"};
    return false;
  }
  if (libssh2_channel_request_pty(channel_, "vt100") != 0) {
    error = {TransportFailure::ConnectionError, "SSH pty request failed"};
    return false;
  }
  if (libssh2_channel_shell(channel_) != 0) {
    error = {TransportFailure::ConnectionError, "SSH shell request failed"};
    return false;
  }
  libssh2_session_set_blocking(session_, 0);

  std::string raw;
  std::string io_error;
  if (!write_all("\n", io_error) ||
      !read_until([](const std::string &buf) { return cli::ends_with_prompt(buf); },
                  raw, io_error)) {
    error = {TransportFailure::ConnectionError, io_error};
    return false;
  }
  prompt_ = cli::last_line(raw);

  const std::string pager = device_.deviceType == "cisco_asa"
                                ? "terminal pager 0"
                                : "terminal length 0";
  if (!exchange(pager, raw, io_error)) {
    error = {TransportFailure::ConnectionError, io_error};
    return false;
  }
  return true;
}

bool SshChannel::write_all(const std::string &data, std::string &error) {
  size_t offset = 0;
  while (offset < data.size()) {
    ssize_t rc = libssh2_channel_write(channel_, data.data() + offset,
                                       data.size() - offset);
    if (rc == LIBSSH2_ERROR_EAGAIN) {
      std::this_thread::sleep_for(std::chrono::milliseconds(12));
      continue;
    }
    if (rc < 0) {
      error = "SSH write failed";
      return false;
    }
    offset += static_cast<size_t>(rc);
  }
  return true;
}

bool SshChannel::read_until(
    const std::function<bool(const std::string &)> &done, std::string &buffer,
    std::string &error) {
  buffer.clear();
  std::vector<char> chunk(4096);
  while (true) {
    ssize_t rc = libssh2_channel_read(channel_, chunk.data(), chunk.size());
    if (rc > 0) {
      buffer.append(chunk.data(), static_cast<size_t>(rc));
      if (done(buffer)) return true;
      continue;
    }
    if (rc == LIBSSH2_ERROR_EAGAIN || rc == 0) {
      if (libssh2_channel_eof(channel_)) {
        error = "SSH channel closed by device";
        return false;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(12));
      continue;
    }
    error = "SSH read failed";
    return false;
  }
}

bool SshChannel::exchange(const std::string &line, std::string &raw,
                          std::string &error) {
  if (!write_all(line + "\n", error)) return false;
  if (!read_until([](const std::string &buf) { return cli::ends_with_prompt(buf); },
                  raw, error))
    return false;
  prompt_ = cli::last_line(raw);
  return true;
}

bool SshChannel::send_command(const std::string &command, std::string &output,
                              std::string &error) {
  std::string raw;
  if (!exchange(command, raw, error)) return false;
  output = cli::clean_output(raw, command);
  if (auto cli_error = cli::find_error_line(output)) {
    error = *cli_error;
    return false;
  }
  return true;
}

bool SshChannel::enable(std::string &error) {
  if (cli::is_privileged_prompt(prompt_)) return true;

  auto prompt_or_password = [](const std::string &buf) {
    return cli::ends_with_prompt(buf) || cli::ends_with_password_request(buf);
  };
  std::string raw;
  if (!write_all("enable\n", error)) return false;
  if (!read_until(prompt_or_password, raw, error)) return false;

  if (cli::ends_with_password_request(raw)) {
    if (!write_all(device_.secret + "\n", error)) return false;
    if (!read_until(prompt_or_password, raw, error)) return false;
    // A rejected secret is asked for again; answer blank until the device
    // gives up and returns to the exec prompt.
    for (int attempt = 0; attempt < 3 && cli::ends_with_password_request(raw);
         ++attempt) {
      if (!write_all("\n", error)) return false;
      if (!read_until(prompt_or_password, raw, error)) return false;
    }
  }
  prompt_ = cli::last_line(raw);
  if (!cli::is_privileged_prompt(prompt_)) {
    error = "Unable to enter privileged mode (check secret)";
    return false;
  }
  return true;
}

bool SshChannel::send_config_set(const std::vector<std::string> &commands,
                                 std::string &output, std::string &error) {
  if (!enable(error)) return false;

  std::string transcript;
  std::string raw;
  if (!exchange("configure terminal", raw, error)) return false;
  transcript += raw;
  for (const auto &command : commands) {
    if (!exchange(command, raw, error)) return false;
    transcript += raw;
  }
  if (!exchange("end", raw, error)) return false;
  transcript += raw;

  output.clear();
  for (char ch : transcript) {
    if (ch != '\r') output += ch;
  }
  return true;
}

bool SshChannel::save_config(std::string &output, std::string &error) {
  if (!enable(error)) return false;
  return send_command(cli::save_command_for(device_.deviceType), output, error);
}

void SshChannel::close() {
  if (channel_) {
    libssh2_session_set_blocking(session_, 1);
    libssh2_channel_close(channel_);
    libssh2_channel_free(channel_);
    channel_ = nullptr;
  }
  if (session_) {
    libssh2_session_disconnect(session_, "Session closed");
    libssh2_session_free(session_);
    session_ = nullptr;
  }
  if (socket_fd_ >= 0) {
    ::close(socket_fd_);
    socket_fd_ = -1;
  }
}

}  // namespace

#endif

// ═══════════════════════════════════════════════════════════════════════
//  Transport
// ═══════════════════════════════════════════════════════════════════════

std::unique_ptr<DeviceChannel> SshTransport::open(const DeviceRecord &device,
                                                  TransportError &error) {
  if (!cli::is_supported_device_type(device.deviceType)) {
    error = {TransportFailure::ConnectionError,
             "Unsupported device_type: " + device.deviceType};
    return nullptr;
  }
#ifdef FLEETGATE_SSH_ENABLED
  auto channel = std::make_unique<SshChannel>(device);
  if (!channel->connect(connect_timeout_seconds_, error)) {
    std::cerr << "[ssh] " << device.name << " (" << device.host
              << "): " << error.message << '\n';
    return nullptr;
  }
  return channel;
#else
  (void)connect_timeout_seconds_;
  error = {TransportFailure::ConnectionError,
           "SSH transport disabled (libssh2 not found)"};
  return nullptr;
#endif
}

bool ssh_library_init(std::string &error) {
#ifdef FLEETGATE_SSH_ENABLED
  if (libssh2_init(0) != 0) {
    error = "libssh2 init failed";
    return false;
  }
#else
  (void)error;
#endif
  return true;
}

void ssh_library_shutdown() {
#ifdef FLEETGATE_SSH_ENABLED
  libssh2_exit();
#endif
}
