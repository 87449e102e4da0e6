#pragma once

#include <string_view>

#include "companion/connection.hpp"
#include "companion/timedef.hpp"

namespace companion {

struct ConnectResult {
  Connection cnx;
  bool connectPending{false};
  bool failure{false};
  // errno of the last failing step when failure is true.
  int err{0};
};

// Resolve host:port and start a non-blocking connect to the first usable address.
// connectPending is true if the connection is still in progress (EINPROGRESS).
ConnectResult ConnectTCP(std::string_view host, std::string_view port, int family = 0);

// Same as above, but waits up to 'timeout' for a pending connect to complete.
// On success the returned connection is established (and still non-blocking).
ConnectResult ConnectTCP(std::string_view host, std::string_view port, SysDuration timeout);

}  // namespace companion
