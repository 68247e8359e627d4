#include "../admin/admin_address.hpp"
#include <cassert>
#include <iostream>

using namespace yggdash;

void test_unix_addresses() {
  std::cout << "TEST: unix admin addresses..." << std::endl;

  auto a = parse_admin_address("unix:///var/run/yggdrasil.sock");
  assert(a);
  assert(a.value().transport == Transport::Unix);
  assert(a.value().path == "/var/run/yggdrasil.sock");
  assert(to_string(a.value()) == "unix:///var/run/yggdrasil.sock");

  auto rel = parse_admin_address("unix://run/ygg.sock");
  assert(rel);
  assert(rel.value().path == "run/ygg.sock");

  auto empty = parse_admin_address("unix://");
  assert(!empty);
  assert(empty.error().code == AdminErrc::InvalidAddress);

  std::cout << "PASS" << std::endl;
}

void test_tcp_addresses() {
  std::cout << "TEST: tcp admin addresses..." << std::endl;

  auto bare = parse_admin_address("localhost:9001");
  assert(bare);
  assert(bare.value().transport == Transport::Tcp);
  assert(bare.value().host == "localhost");
  assert(bare.value().port == 9001);

  auto scheme = parse_admin_address("tcp://127.0.0.1:9001");
  assert(scheme);
  assert(scheme.value().host == "127.0.0.1");
  assert(to_string(scheme.value()) == "tcp://127.0.0.1:9001");

  auto v6 = parse_admin_address("[::1]:9001");
  assert(v6);
  assert(v6.value().host == "::1");
  assert(v6.value().port == 9001);
  assert(to_string(v6.value()) == "tcp://[::1]:9001");

  std::cout << "PASS" << std::endl;
}

void test_rejected_addresses() {
  std::cout << "TEST: malformed admin addresses..." << std::endl;

  for (const char *bad :
       {"", "localhost", "localhost:", "localhost:http", "localhost:0",
        "localhost:70000", ":9001", "::1:9001", "[::1]9001", "http://x:1",
        "tcp://"}) {
    auto r = parse_admin_address(bad);
    if (r) {
      std::cerr << "accepted: '" << bad << "'" << std::endl;
    }
    assert(!r);
    assert(r.error().code == AdminErrc::InvalidAddress);
    assert(!r.error().detail.empty());
  }

  std::cout << "PASS" << std::endl;
}

void test_split_host_port() {
  std::cout << "TEST: split_host_port..." << std::endl;
  std::string host;
  uint16_t port = 0;

  assert(split_host_port("[::]:80", host, port));
  assert(host == "::" && port == 80);

  assert(split_host_port(":8080", host, port));
  assert(host.empty() && port == 8080);

  assert(split_host_port("0.0.0.0:443", host, port));
  assert(host == "0.0.0.0" && port == 443);

  assert(!split_host_port("[::]", host, port));
  assert(!split_host_port("80", host, port));

  // Port 0 is only accepted when the caller asks for it.
  assert(!split_host_port("127.0.0.1:0", host, port));
  port = 1;
  assert(split_host_port("127.0.0.1:0", host, port, true));
  assert(host == "127.0.0.1" && port == 0);
  assert(split_host_port("[::1]:0", host, port, true));
  assert(host == "::1" && port == 0);
  assert(!split_host_port("127.0.0.1:65536", host, port, true));

  std::cout << "PASS" << std::endl;
}

int main() {
  test_unix_addresses();
  test_tcp_addresses();
  test_rejected_addresses();
  test_split_host_port();
  std::cout << "All Admin Address Tests Passed!" << std::endl;
  return 0;
}
