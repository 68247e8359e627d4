#include "../http/http_server.hpp"
#include "fake_admin.hpp"
#include <atomic>
#include <boost/beast/version.hpp>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <thread>
#include <vector>

using namespace yggdash;
using namespace yggdash::testing;
namespace hs = yggdash::http_server;
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using unix_stream = net::local::stream_protocol;

static http::response<http::string_body>
fetch(tcp::socket &socket, beast::flat_buffer &buffer,
      const std::string &target) {
  http::request<http::string_body> req{http::verb::get, target, 11};
  req.set(http::field::host, "127.0.0.1");
  req.keep_alive(true);
  http::write(socket, req);

  http::response<http::string_body> res;
  http::read(socket, buffer, res);
  return res;
}

void test_end_to_end() {
  std::cout << "TEST: HTTP loopback..." << std::endl;
  auto dir = std::filesystem::temp_directory_path() /
             ("yggdash_http_" + std::to_string(::getpid()));
  std::filesystem::create_directories(dir);
  {
    std::ofstream(dir / "template.html") << "<h1>%HOSTNAME%</h1>%PEERS%";
    std::ofstream(dir / "style.css") << "h1 { margin: 0; }";
  }

  auto sock = temp_socket_path("http");
  FakeUnixAdmin admin(
      unix_stream::endpoint(sock),
      {switch_peers_reply({{"1", "200::1", 1500, 2500, "[]"}})});

  AdminAddress addr;
  addr.transport = Transport::Unix;
  addr.path = sock;
  auto handler = std::make_shared<const hs::request_handler>(
      "loopback", AdminClient(addr, std::chrono::milliseconds(1000)), dir);

  hs::http_server server(handler, "127.0.0.1", 0, 2);
  const unsigned short port = server.local_port();
  assert(port != 0);
  std::thread t([&server] { server.run(); });

  {
    net::io_context ioc;
    tcp::socket socket(ioc);
    socket.connect({net::ip::make_address("127.0.0.1"), port});
    beast::flat_buffer buffer;

    // Two requests over one keep-alive connection.
    auto page = fetch(socket, buffer, "/");
    assert(page.result() == http::status::ok);
    assert(page[http::field::server] == "yggdash");
    assert(page.body().find("<h1>loopback</h1>") != std::string::npos);
    assert(page.body().find("Root attached to switch port 1") !=
           std::string::npos);
    assert(page.body().find("1.5 kB sent") != std::string::npos);
    assert(page.body().find("2.5 kB received") != std::string::npos);

    auto css = fetch(socket, buffer, "/style.css");
    assert(css.result() == http::status::ok);
    assert(css.body() == "h1 { margin: 0; }");

    // A missing asset no longer takes the process down.
    auto js = fetch(socket, buffer, "/chartist.min.js");
    assert(js.result() == http::status::not_found);

    auto again = fetch(socket, buffer, "/");
    assert(again.result() == http::status::ok);

    beast::error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
  }

  server.stop();
  t.join();
  assert(admin.requests().size() == 2);

  std::filesystem::remove_all(dir);
  std::cout << "PASS" << std::endl;
}

void test_assets_not_blocked_by_stalled_dashboards() {
  std::cout << "TEST: assets served while dashboards wait on admin..."
            << std::endl;
  auto dir = std::filesystem::temp_directory_path() /
             ("yggdash_http_stall_" + std::to_string(::getpid()));
  std::filesystem::create_directories(dir);
  {
    std::ofstream(dir / "template.html") << "%PEERS%";
    std::ofstream(dir / "style.css") << "p {}";
  }

  auto sock = temp_socket_path("http_stall");
  FakeUnixAdmin admin(unix_stream::endpoint(sock), {}, FakeMode::Stall);

  AdminAddress addr;
  addr.transport = Transport::Unix;
  addr.path = sock;
  auto handler = std::make_shared<const hs::request_handler>(
      "stalled", AdminClient(addr, std::chrono::milliseconds(2000)), dir);

  // As many stalled dashboard loads as there are I/O threads.
  hs::http_server server(handler, "127.0.0.1", 0, 2);
  const unsigned short port = server.local_port();
  std::thread t([&server] { server.run(); });

  std::vector<std::thread> loads;
  std::atomic<int> timed_out{0};
  for (int i = 0; i < 2; ++i) {
    loads.emplace_back([port, &timed_out] {
      net::io_context ioc;
      tcp::socket socket(ioc);
      socket.connect({net::ip::make_address("127.0.0.1"), port});
      beast::flat_buffer buffer;
      auto page = fetch(socket, buffer, "/");
      if (page.result() == http::status::ok &&
          page.body().find("Timed out") != std::string::npos)
        ++timed_out;
    });
  }
  // Let both dashboard requests reach the admin socket.
  std::this_thread::sleep_for(std::chrono::milliseconds(300));

  {
    net::io_context ioc;
    tcp::socket socket(ioc);
    socket.connect({net::ip::make_address("127.0.0.1"), port});
    beast::flat_buffer buffer;
    auto start = std::chrono::steady_clock::now();
    auto css = fetch(socket, buffer, "/style.css");
    auto elapsed = std::chrono::steady_clock::now() - start;
    std::cout << "style.css latency: "
              << std::chrono::duration_cast<std::chrono::milliseconds>(elapsed)
                     .count()
              << " ms" << std::endl;
    assert(css.result() == http::status::ok);
    assert(css.body() == "p {}");
    assert(elapsed < std::chrono::milliseconds(500));
  }

  for (auto &l : loads)
    l.join();
  assert(timed_out == 2);

  server.stop();
  t.join();
  std::filesystem::remove_all(dir);
  std::cout << "PASS" << std::endl;
}

int main() {
  try {
    test_end_to_end();
    test_assets_not_blocked_by_stalled_dashboards();
    std::cout << "All HTTP Server Tests Passed!" << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Test Failed: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
