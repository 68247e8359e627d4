#include "http_server.hpp"
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <csignal>
#include <iostream>

namespace yggdash::http_server {

// Basic session to handle a single request/response
class session : public std::enable_shared_from_this<session> {
  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  http::request<http::string_body> req_;
  std::shared_ptr<const request_handler> handler_;
  net::thread_pool::executor_type query_exec_;

public:
  session(tcp::socket &&socket, std::shared_ptr<const request_handler> handler,
          net::thread_pool::executor_type query_exec)
      : stream_(std::move(socket)), handler_(std::move(handler)),
        query_exec_(query_exec) {}

  void run() {
    net::dispatch(stream_.get_executor(),
                  beast::bind_front_handler(&session::do_read,
                                            shared_from_this()));
  }

private:
  void do_read() {
    req_ = {};
    stream_.expires_after(std::chrono::seconds(30));
    http::async_read(
        stream_, buffer_, req_,
        beast::bind_front_handler(&session::on_read, shared_from_this()));
  }

  void on_read(beast::error_code ec, std::size_t bytes_transferred) {
    boost::ignore_unused(bytes_transferred);

    if (ec == http::error::end_of_stream) {
      return do_close();
    }
    if (ec == beast::error::timeout) {
      return do_close();
    }
    if (ec) {
      std::cerr << "[http] read: " << ec.message() << "\n";
      return;
    }

    stream_.expires_never();
    if (!handler_->is_dashboard(req_))
      return send_response(handler_->handle(req_));

    // The admin query may block for up to its timeout, so it runs on the
    // query pool and the I/O threads stay free for other connections.
    net::post(query_exec_, [self = shared_from_this()] {
      auto res = std::make_shared<response>(self->handler_->handle(self->req_));
      net::dispatch(self->stream_.get_executor(),
                    [self, res] { self->send_response(std::move(*res)); });
    });
  }

  void send_response(response &&res) {
    auto sp = std::make_shared<response>(std::move(res));
    http::async_write(stream_, *sp,
                      [self = shared_from_this(), sp](beast::error_code ec,
                                                      std::size_t bytes) {
                        self->on_write(ec, bytes, sp->keep_alive());
                      });
  }

  void on_write(beast::error_code ec, std::size_t bytes_transferred,
                bool keep_alive) {
    boost::ignore_unused(bytes_transferred);

    if (ec) {
      std::cerr << "[http] write: " << ec.message() << "\n";
      return;
    }

    if (keep_alive) {
      do_read();
    } else {
      do_close();
    }
  }

  void do_close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  }
};

http_server::http_server(std::shared_ptr<const request_handler> handler,
                         const std::string &address, unsigned short port,
                         int threads)
    : ioc_(threads), signals_(ioc_, SIGINT, SIGTERM),
      acceptor_(ioc_, {net::ip::make_address(address), port}),
      handler_(std::move(handler)), threads_(threads < 1 ? 1 : threads),
      query_pool_(static_cast<std::size_t>(threads_)) {
  signals_.async_wait(
      [this](boost::system::error_code /*ec*/, int /*signal*/) { stop(); });
}

http_server::~http_server() {
  stop();
  for (auto &t : thread_pool_)
    if (t.joinable())
      t.join();
  query_pool_.stop();
  query_pool_.join();
}

unsigned short http_server::local_port() const {
  return acceptor_.local_endpoint().port();
}

void http_server::run() {
  do_accept();
  thread_pool_.reserve(threads_ - 1);
  for (int i = 1; i < threads_; ++i)
    thread_pool_.emplace_back([this] { ioc_.run(); });
  ioc_.run();
  for (auto &t : thread_pool_)
    if (t.joinable())
      t.join();
  thread_pool_.clear();
}

void http_server::stop() { ioc_.stop(); }

void http_server::do_accept() {
  acceptor_.async_accept(
      net::make_strand(ioc_),
      beast::bind_front_handler(&http_server::on_accept, this));
}

void http_server::on_accept(beast::error_code ec, tcp::socket socket) {
  if (ec) {
    if (ec == net::error::operation_aborted)
      return;
    std::cerr << "[http] accept: " << ec.message() << "\n";
  } else {
    // Enable TCP_NODELAY to disable Nagle's algorithm
    boost::system::error_code ec_opt;
    socket.set_option(tcp::no_delay(true), ec_opt);
    if (ec_opt) {
      std::cerr << "[http] Failed to set TCP_NODELAY: " << ec_opt.message()
                << "\n";
    }

    std::make_shared<session>(std::move(socket), handler_,
                              query_pool_.get_executor())
        ->run();
  }

  // Accept another connection
  do_accept();
}

} // namespace yggdash::http_server
