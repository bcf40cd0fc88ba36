#pragma once
// ─── FleetGate — SSH transport (libssh2) ────────────────────────────────
// TCP socket helper and the libssh2-backed DeviceTransport used in
// production. Each open() yields one interactive shell on the device.

#include "device_transport.h"

#include <string>

// Opens a TCP connection, giving up after `timeout_ms`. Returns -1 on
// failure; `timed_out` tells a deadline expiry from other faults.
int open_tcp_socket(const std::string &host, int port, int timeout_ms,
                    bool &timed_out, std::string &error);

class SshTransport : public DeviceTransport {
public:
  explicit SshTransport(int connect_timeout_seconds = 10)
      : connect_timeout_seconds_(connect_timeout_seconds) {}

  std::unique_ptr<DeviceChannel> open(const DeviceRecord &device,
                                      TransportError &error) override;

private:
  int connect_timeout_seconds_;
};

// Process-wide libssh2 setup; call once from main.
bool ssh_library_init(std::string &error);
void ssh_library_shutdown();
