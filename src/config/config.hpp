#ifndef YGGDASH_CONFIG_CONFIG_HPP
#define YGGDASH_CONFIG_CONFIG_HPP

#include "admin/admin_address.hpp"
#include <chrono>
#include <cstdint>
#include <string>

namespace yggdash {

struct Config {
  std::string node_name;
  std::string admin_address = "unix:///var/run/yggdrasil.sock";
  std::string listen_address = "[::]:80";
  std::string asset_dir = ".";
  std::chrono::milliseconds admin_timeout{5000};
  int threads = 4;
  bool show_help = false;

  // Validated forms, filled in by parse_args.
  AdminAddress admin;
  std::string listen_host;
  uint16_t listen_port = 0;
};

// Throws std::invalid_argument on an unknown flag, a missing value, or a
// malformed number or address.
Config parse_args(int argc, const char *const *argv);

std::string default_node_name();

std::string usage(const char *argv0);

} // namespace yggdash

#endif
