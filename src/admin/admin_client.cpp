#include "admin_client.hpp"
#include "json_framer.hpp"
#include <array>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/write.hpp>
#include <optional>
#include <string>

namespace yggdash {

namespace net = boost::asio;
using tcp = net::ip::tcp;
using unix_stream = net::local::stream_protocol;
using json = nlohmann::json;

namespace {

// One request/response round trip on an already-created socket. All
// handlers run on the caller's private io_context, so no locking is needed.
template <class Socket> class Exchange {
public:
  Exchange(net::io_context &ioc, std::string payload, std::size_t max_bytes)
      : socket_(ioc), payload_(std::move(payload)), max_bytes_(max_bytes) {}

  Socket &socket() { return socket_; }
  bool done() const { return result_.has_value(); }

  void on_connect(const boost::system::error_code &ec) {
    if (ec)
      return fail(make_admin_error(AdminErrc::ConnectFailed, ec.message()));
    net::async_write(socket_, net::buffer(payload_),
                     [this](boost::system::error_code ec, std::size_t) {
                       if (ec)
                         return fail(make_admin_error(AdminErrc::WriteFailed,
                                                      ec.message()));
                       do_read();
                     });
  }

  // First outcome wins; the socket is closed right away so any pending
  // operation completes with operation_aborted.
  void fail(AdminError err) { finish(Result<json>(std::move(err))); }

  Result<json> take() { return std::move(*result_); }

private:
  void do_read() {
    socket_.async_read_some(
        net::buffer(chunk_),
        [this](boost::system::error_code ec, std::size_t n) { on_read(ec, n); });
  }

  void on_read(const boost::system::error_code &ec, std::size_t n) {
    buffer_.append(chunk_.data(), n);
    if (buffer_.size() > max_bytes_)
      return fail(make_admin_error(AdminErrc::ResponseTooLarge,
                                   std::to_string(buffer_.size()) +
                                       " bytes received"));

    if (ec == net::error::eof) {
      if (buffer_.empty())
        return fail(make_admin_error(AdminErrc::NoResponse,
                                     "connection closed before any data"));
      return parse();
    }
    if (ec)
      return fail(make_admin_error(AdminErrc::ReadFailed, ec.message()));

    // Endpoints may keep the connection open after replying, so stop as
    // soon as a whole document is buffered.
    if (framer_.feed(chunk_.data(), n) == JsonFramer::State::Complete)
      return parse();
    do_read();
  }

  void parse() {
    json j = json::parse(buffer_, nullptr, false);
    if (j.is_discarded())
      return fail(make_admin_error(AdminErrc::DecodeFailed,
                                   "invalid JSON (" +
                                       std::to_string(buffer_.size()) +
                                       " bytes)"));
    finish(Result<json>(std::move(j)));
  }

  void finish(Result<json> r) {
    if (result_)
      return;
    result_.emplace(std::move(r));
    boost::system::error_code ignored;
    socket_.shutdown(net::socket_base::shutdown_both, ignored);
    socket_.close(ignored);
  }

  Socket socket_;
  std::string payload_;
  std::size_t max_bytes_;
  std::array<char, 4096> chunk_{};
  std::string buffer_;
  JsonFramer framer_;
  std::optional<Result<json>> result_;
};

template <class Socket, class OnTimeout>
Result<json> run_exchange(net::io_context &ioc, Exchange<Socket> &ex,
                          std::chrono::milliseconds timeout,
                          OnTimeout &&on_timeout) {
  ioc.run_for(timeout);
  if (!ex.done()) {
    ex.fail(make_admin_error(AdminErrc::Timeout,
                             "no complete response after " +
                                 std::to_string(timeout.count()) + " ms"));
    on_timeout();
    // Drain the aborted handlers before the exchange goes out of scope.
    ioc.restart();
    ioc.run();
  }
  return ex.take();
}

} // namespace

AdminClient::AdminClient(AdminAddress address,
                         std::chrono::milliseconds timeout,
                         std::size_t max_response)
    : address_(std::move(address)), timeout_(timeout),
      max_response_(max_response) {}

Result<json> AdminClient::query(const json &request) const {
  std::string payload;
  try {
    payload = request.dump();
  } catch (const json::exception &e) {
    return make_admin_error(AdminErrc::EncodeFailed, e.what());
  }

  net::io_context ioc;

  if (address_.transport == Transport::Unix) {
    Exchange<unix_stream::socket> ex(ioc, std::move(payload), max_response_);
    unix_stream::endpoint ep;
    try {
      ep = unix_stream::endpoint(address_.path);
    } catch (const boost::system::system_error &e) {
      return make_admin_error(AdminErrc::ConnectFailed, e.what());
    }
    ex.socket().async_connect(
        ep, [&ex](boost::system::error_code ec) { ex.on_connect(ec); });
    return run_exchange(ioc, ex, timeout_, [] {});
  }

  Exchange<tcp::socket> ex(ioc, std::move(payload), max_response_);
  tcp::resolver resolver(ioc);
  resolver.async_resolve(
      address_.host, std::to_string(address_.port),
      [&ex](boost::system::error_code ec, tcp::resolver::results_type results) {
        if (ec)
          return ex.fail(make_admin_error(AdminErrc::ConnectFailed,
                                          "resolve: " + ec.message()));
        if (ex.done())
          return;
        net::async_connect(ex.socket(), results,
                           [&ex](boost::system::error_code ec,
                                 const tcp::endpoint &) { ex.on_connect(ec); });
      });
  return run_exchange(ioc, ex, timeout_, [&resolver] { resolver.cancel(); });
}

Result<SwitchPeers> AdminClient::get_switch_peers() const {
  auto res = query(make_switch_peers_request());
  if (!res)
    return res.error();
  return decode_switch_peers(res.value());
}

} // namespace yggdash
