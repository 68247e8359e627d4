#include "admin_address.hpp"
#include <charconv>

namespace yggdash {

bool split_host_port(std::string_view text, std::string &host,
                     uint16_t &port, bool allow_zero_port) {
  std::string_view port_part;
  if (text.starts_with("[")) {
    auto close = text.find(']');
    if (close == std::string_view::npos || close + 1 >= text.size() ||
        text[close + 1] != ':')
      return false;
    host = std::string(text.substr(1, close - 1));
    port_part = text.substr(close + 2);
  } else {
    auto colon = text.rfind(':');
    if (colon == std::string_view::npos)
      return false;
    // An unbracketed v6 literal is ambiguous.
    if (text.substr(0, colon).find(':') != std::string_view::npos)
      return false;
    host = std::string(text.substr(0, colon));
    port_part = text.substr(colon + 1);
  }

  if (port_part.empty())
    return false;
  unsigned int value = 0;
  auto [ptr, ec] =
      std::from_chars(port_part.data(), port_part.data() + port_part.size(),
                      value);
  if (ec != std::errc{} || ptr != port_part.data() + port_part.size())
    return false;
  if ((value == 0 && !allow_zero_port) || value > 65535)
    return false;
  port = static_cast<uint16_t>(value);
  return true;
}

Result<AdminAddress> parse_admin_address(std::string_view text) {
  auto invalid = [&](std::string_view why) {
    return make_admin_error(AdminErrc::InvalidAddress,
                            std::string(why) + ": '" + std::string(text) +
                                "'");
  };

  if (text.empty())
    return invalid("empty address");

  AdminAddress addr;
  auto scheme_end = text.find("://");
  if (scheme_end != std::string_view::npos) {
    std::string_view scheme = text.substr(0, scheme_end);
    std::string_view rest = text.substr(scheme_end + 3);
    if (scheme == "unix") {
      // unix:///abs/path leaves "/abs/path"; unix://rel/path keeps it relative
      if (rest.empty())
        return invalid("empty socket path");
      addr.transport = Transport::Unix;
      addr.path = std::string(rest);
      return addr;
    }
    if (scheme != "tcp")
      return invalid("unsupported scheme");
    text = rest;
    if (!text.empty() && text.back() == '/')
      text.remove_suffix(1);
  }

  addr.transport = Transport::Tcp;
  if (!split_host_port(text, addr.host, addr.port))
    return invalid("expected host:port");
  if (addr.host.empty())
    return invalid("empty host");
  return addr;
}

std::string to_string(const AdminAddress &addr) {
  if (addr.transport == Transport::Unix)
    return "unix://" + addr.path;
  if (addr.host.find(':') != std::string::npos)
    return "tcp://[" + addr.host + "]:" + std::to_string(addr.port);
  return "tcp://" + addr.host + ":" + std::to_string(addr.port);
}

} // namespace yggdash
