#include <doctest/doctest.h>
#include "fakes.h"
#include "ssh.h"

TEST_CASE("TCP connect gives up once the deadline has passed") {
  bool timed_out = false;
  std::string error;
  int fd = open_tcp_socket("127.0.0.1", 22, 0, timed_out, error);
  CHECK(fd == -1);
  CHECK(timed_out);
  CHECK(error.find("Timeout") == 0);
}

TEST_CASE("Unsupported device types are refused before any network I/O") {
  SshTransport transport(1);
  DeviceRecord device = make_device("J1", "127.0.0.1");
  device.deviceType = "juniper_junos";
  TransportError error;
  CHECK(transport.open(device, error) == nullptr);
  CHECK(error.kind == TransportFailure::ConnectionError);
  CHECK(error.message == "Unsupported device_type: juniper_junos");
}
