#include "../config/config.hpp"
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <vector>

using namespace yggdash;

static Config parse(std::vector<const char *> args) {
  args.insert(args.begin(), "yggdash");
  return parse_args(static_cast<int>(args.size()), args.data());
}

static bool rejects(std::vector<const char *> args) {
  try {
    parse(std::move(args));
  } catch (const std::invalid_argument &) {
    return true;
  }
  return false;
}

void test_defaults() {
  std::cout << "TEST: defaults..." << std::endl;
  Config cfg = parse({});
  assert(!cfg.node_name.empty());
  assert(cfg.node_name == default_node_name());
  assert(cfg.admin.transport == Transport::Unix);
  assert(cfg.admin.path == "/var/run/yggdrasil.sock");
  assert(cfg.listen_host == "::");
  assert(cfg.listen_port == 80);
  assert(cfg.asset_dir == ".");
  assert(cfg.admin_timeout == std::chrono::milliseconds(5000));
  assert(cfg.threads == 4);
  std::cout << "PASS" << std::endl;
}

void test_flags() {
  std::cout << "TEST: flags..." << std::endl;
  Config cfg = parse({"--nodename", "edge-1", "-adminaddr", "localhost:9001",
                      "--listenaddr=127.0.0.1:8080", "--assetdir", "/srv/www",
                      "--timeout", "250", "--threads", "2"});
  assert(cfg.node_name == "edge-1");
  assert(cfg.admin.transport == Transport::Tcp);
  assert(cfg.admin.host == "localhost");
  assert(cfg.admin.port == 9001);
  assert(cfg.listen_host == "127.0.0.1");
  assert(cfg.listen_port == 8080);
  assert(cfg.asset_dir == "/srv/www");
  assert(cfg.admin_timeout == std::chrono::milliseconds(250));
  assert(cfg.threads == 2);

  Config any = parse({"--listenaddr", ":8080", "--nodename", ""});
  assert(any.listen_host == "::");
  assert(any.listen_port == 8080);
  assert(any.node_name.empty());

  Config ephemeral = parse({"--listenaddr", "127.0.0.1:0"});
  assert(ephemeral.listen_host == "127.0.0.1");
  assert(ephemeral.listen_port == 0);

  Config longest = parse({"--timeout", "86400000", "--threads", "256"});
  assert(longest.admin_timeout == std::chrono::hours(24));
  assert(longest.threads == 256);

  assert(parse({"--help"}).show_help);
  assert(parse({"-h"}).show_help);
  std::cout << "PASS" << std::endl;
}

void test_rejections() {
  std::cout << "TEST: bad arguments..." << std::endl;
  assert(rejects({"--bogus", "1"}));
  assert(rejects({"--nodename"}));
  assert(rejects({"stray"}));
  assert(rejects({"--adminaddr", "ftp://x:1"}));
  assert(rejects({"--adminaddr", "unix://"}));
  assert(rejects({"--listenaddr", "80"}));
  assert(rejects({"--listenaddr", "[::]:99999"}));
  assert(rejects({"--timeout", "0"}));
  assert(rejects({"--timeout", "5s"}));
  assert(rejects({"--threads", "-1"}));
  assert(rejects({"--timeout", "86400001"}));
  assert(rejects({"--timeout", "9223372036854775807"}));
  assert(rejects({"--timeout", "99999999999999999999999"}));
  assert(rejects({"--threads", "257"}));
  assert(rejects({"--adminaddr", "127.0.0.1:0"}));
  std::cout << "PASS" << std::endl;
}

int main() {
  test_defaults();
  test_flags();
  test_rejections();
  std::cout << "All Config Tests Passed!" << std::endl;
  return 0;
}
