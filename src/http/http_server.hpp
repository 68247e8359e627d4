#pragma once

#include "request_handler.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/config.hpp>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace yggdash::http_server {

namespace beast = boost::beast;   // from <boost/beast.hpp>
namespace http = beast::http;     // from <boost/beast/http.hpp>
namespace net = boost::asio;      // from <boost/asio.hpp>
using tcp = boost::asio::ip::tcp; // from <boost/asio/ip/tcp.hpp>

// session class is internal to http_server.cpp

class http_server {
public:
  // Binds immediately; throws boost::system::system_error if the address is
  // unusable. Port 0 picks an ephemeral port (see local_port()).
  // `threads` sizes both the I/O pool and the pool that runs dashboard
  // requests, which block on the admin socket.
  http_server(std::shared_ptr<const request_handler> handler,
              const std::string &address, unsigned short port,
              int threads = 4);
  ~http_server();

  // Blocks until stop() or SIGINT/SIGTERM.
  void run();
  void stop();

  unsigned short local_port() const;

private:
  void do_accept();
  void on_accept(beast::error_code ec, tcp::socket socket);

  net::io_context ioc_;
  net::signal_set signals_;
  tcp::acceptor acceptor_;
  std::shared_ptr<const request_handler> handler_;
  int threads_;
  std::vector<std::thread> thread_pool_;
  net::thread_pool query_pool_;
};

} // namespace yggdash::http_server
