#ifndef YGGDASH_ADMIN_ADMIN_ADDRESS_HPP
#define YGGDASH_ADMIN_ADMIN_ADDRESS_HPP

#include "admin_error.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace yggdash {

enum class Transport { Unix, Tcp };

struct AdminAddress {
  Transport transport = Transport::Unix;
  std::string path; // Unix only
  std::string host; // Tcp only
  uint16_t port = 0;
};

// Accepts unix:///path, tcp://host:port, host:port and [v6]:port.
Result<AdminAddress> parse_admin_address(std::string_view text);

std::string to_string(const AdminAddress &addr);

// Splits "host:port" / "[v6]:port". An empty host is allowed here; callers
// decide whether it is meaningful. Returns false on a malformed port. Port 0
// only makes sense for a listener, so it is refused unless allow_zero_port.
bool split_host_port(std::string_view text, std::string &host, uint16_t &port,
                     bool allow_zero_port = false);

} // namespace yggdash

#endif
