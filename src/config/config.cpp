#include "config.hpp"
#include <boost/asio/ip/host_name.hpp>
#include <charconv>
#include <stdexcept>
#include <string_view>

namespace yggdash {

namespace {

// Larger values overflow deadline arithmetic in the I/O layer.
constexpr long kMaxTimeoutMs = 24L * 60 * 60 * 1000;
constexpr int kMaxThreads = 256;

template <typename T>
T parse_number(std::string_view flag, std::string_view text, T min, T max) {
  T value{};
  auto [ptr, ec] =
      std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size() || value < min ||
      value > max)
    throw std::invalid_argument("invalid value for --" + std::string(flag) +
                                ": '" + std::string(text) + "'");
  return value;
}

void resolve_listen(Config &cfg) {
  // ":80" listens on every interface, port 0 picks an ephemeral one
  if (!split_host_port(cfg.listen_address, cfg.listen_host, cfg.listen_port,
                       true))
    throw std::invalid_argument("invalid listen address: '" +
                                cfg.listen_address + "'");
  if (cfg.listen_host.empty())
    cfg.listen_host = "::";
}

} // namespace

std::string default_node_name() {
  boost::system::error_code ec;
  std::string name = boost::asio::ip::host_name(ec);
  if (ec || name.empty())
    return "Unnamed node";
  return name;
}

Config parse_args(int argc, const char *const *argv) {
  Config cfg;
  bool have_name = false;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg.starts_with("--"))
      arg.remove_prefix(2);
    else if (arg.starts_with("-"))
      arg.remove_prefix(1);
    else
      throw std::invalid_argument("unexpected argument: '" +
                                  std::string(arg) + "'");

    // --flag=value as well as --flag value
    std::string_view value;
    bool inline_value = false;
    if (auto eq = arg.find('='); eq != std::string_view::npos) {
      value = arg.substr(eq + 1);
      arg = arg.substr(0, eq);
      inline_value = true;
    }

    if (arg == "help" || arg == "h") {
      cfg.show_help = true;
      continue;
    }

    if (!inline_value) {
      if (i + 1 >= argc)
        throw std::invalid_argument("missing value for --" +
                                    std::string(arg));
      value = argv[++i];
    }

    if (arg == "nodename") {
      cfg.node_name = std::string(value);
      have_name = true;
    } else if (arg == "adminaddr") {
      cfg.admin_address = std::string(value);
    } else if (arg == "listenaddr") {
      cfg.listen_address = std::string(value);
    } else if (arg == "assetdir") {
      cfg.asset_dir = std::string(value);
    } else if (arg == "timeout") {
      cfg.admin_timeout =
          std::chrono::milliseconds(parse_number<long>(arg, value, 1,
                                                       kMaxTimeoutMs));
    } else if (arg == "threads") {
      cfg.threads = parse_number<int>(arg, value, 1, kMaxThreads);
    } else {
      throw std::invalid_argument("unknown flag: --" + std::string(arg));
    }
  }

  if (cfg.show_help)
    return cfg;

  if (!have_name)
    cfg.node_name = default_node_name();

  auto admin = parse_admin_address(cfg.admin_address);
  if (!admin)
    throw std::invalid_argument(admin.error().detail);
  cfg.admin = std::move(admin).value();

  resolve_listen(cfg);
  return cfg;
}

std::string usage(const char *argv0) {
  return std::string("Usage: ") + argv0 +
         " [options]\n"
         "  --nodename NAME     friendly name of the node (default: host name)\n"
         "  --adminaddr ADDR    admin socket, unix:///path or host:port\n"
         "                      (default: unix:///var/run/yggdrasil.sock)\n"
         "  --listenaddr ADDR   address and port to listen on (default: [::]:80)\n"
         "  --assetdir DIR      directory holding template.html and static files\n"
         "                      (default: .)\n"
         "  --timeout MS        admin socket timeout in milliseconds, at most\n"
         "                      86400000 (default: 5000)\n"
         "  --threads N         HTTP worker threads, at most 256 (default: 4)\n";
}

} // namespace yggdash
