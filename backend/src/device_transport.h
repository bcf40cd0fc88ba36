#pragma once
// ─── FleetGate — Device transport interface ─────────────────────────────
// One blocking remote CLI session per operation. The libssh2 implementation
// lives in ssh.h; tests substitute their own.

#include "models.h"

#include <memory>
#include <string>
#include <vector>

enum class TransportFailure {
  None,
  Timeout,
  AuthenticationFailed,
  ConnectionError,
};

struct TransportError {
  TransportFailure kind = TransportFailure::None;
  std::string message;
};

inline ApiError api_error_for(TransportFailure kind) {
  switch (kind) {
    case TransportFailure::Timeout:              return ApiError::ConnectTimeout;
    case TransportFailure::AuthenticationFailed: return ApiError::AuthenticationFailed;
    default:                                     return ApiError::TransportError;
  }
}

// An open CLI session. Destroying the object closes the connection.
class DeviceChannel {
public:
  virtual ~DeviceChannel() = default;

  // Sends one command line; `output` receives the device text without the
  // echoed command or the trailing prompt.
  virtual bool send_command(const std::string &command, std::string &output,
                            std::string &error) = 0;

  // Enters privileged mode using the device secret.
  virtual bool enable(std::string &error) = 0;

  // Applies configuration lines in config mode, entering privileged mode
  // first when needed. `output` receives the raw transcript.
  virtual bool send_config_set(const std::vector<std::string> &commands,
                               std::string &output, std::string &error) = 0;

  // Saves the running config to startup.
  virtual bool save_config(std::string &output, std::string &error) = 0;

  virtual void close() = 0;
};

class DeviceTransport {
public:
  virtual ~DeviceTransport() = default;

  // Returns nullptr and fills `error` when the session cannot be opened.
  virtual std::unique_ptr<DeviceChannel> open(const DeviceRecord &device,
                                              TransportError &error) = 0;
};
