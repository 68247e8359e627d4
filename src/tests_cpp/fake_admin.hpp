#pragma once

#include <array>
#include <boost/asio.hpp>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

// In-process stand-in for the node's admin socket. Serves every connection
// on a background io_context: reads one JSON request, then answers with the
// configured chunks, pausing between them so the client sees them apart.

namespace yggdash::testing {

enum class FakeMode {
  Reply,             // write chunks, then close
  ReplyKeepOpen,     // write chunks, leave the connection open
  CloseWithoutReply, // close as soon as the request is in
  Stall              // never answer
};

template <class Protocol> class FakeAdmin {
  using socket_type = typename Protocol::socket;
  using endpoint_type = typename Protocol::endpoint;
  using acceptor_type = typename Protocol::acceptor;

  struct Conn : std::enable_shared_from_this<Conn> {
    socket_type socket;
    FakeAdmin *owner;
    boost::asio::steady_timer timer;
    std::array<char, 1024> chunk{};
    std::string request;
    std::size_t next = 0;

    Conn(socket_type s, FakeAdmin *o)
        : socket(std::move(s)), owner(o), timer(socket.get_executor()) {}

    void read() {
      auto self = this->shared_from_this();
      socket.async_read_some(
          boost::asio::buffer(chunk),
          [self](boost::system::error_code ec, std::size_t n) {
            if (ec)
              return;
            self->request.append(self->chunk.data(), n);
            if (!nlohmann::json::accept(self->request))
              return self->read();
            self->owner->record(self->request);
            switch (self->owner->mode_) {
            case FakeMode::CloseWithoutReply: {
              boost::system::error_code ignored;
              self->socket.shutdown(socket_type::shutdown_both, ignored);
              self->socket.close(ignored);
              return;
            }
            case FakeMode::Stall:
              self->owner->held_.push_back(self);
              return;
            default:
              self->write_next();
            }
          });
    }

    void write_next() {
      auto self = this->shared_from_this();
      if (next == owner->chunks_.size()) {
        if (owner->mode_ == FakeMode::ReplyKeepOpen) {
          owner->held_.push_back(self);
        } else {
          boost::system::error_code ignored;
          socket.shutdown(socket_type::shutdown_both, ignored);
          socket.close(ignored);
        }
        return;
      }
      boost::asio::async_write(
          socket, boost::asio::buffer(owner->chunks_[next]),
          [self](boost::system::error_code ec, std::size_t) {
            if (ec)
              return;
            ++self->next;
            self->timer.expires_after(std::chrono::milliseconds(20));
            self->timer.async_wait(
                [self](boost::system::error_code) { self->write_next(); });
          });
    }
  };

public:
  FakeAdmin(endpoint_type ep, std::vector<std::string> chunks,
            FakeMode mode = FakeMode::Reply)
      : acceptor_(io_, ep), chunks_(std::move(chunks)), mode_(mode) {
    do_accept();
    thread_ = std::thread([this] { io_.run(); });
  }

  ~FakeAdmin() {
    io_.stop();
    thread_.join();
  }

  endpoint_type endpoint() const { return acceptor_.local_endpoint(); }

  std::vector<std::string> requests() const {
    std::lock_guard<std::mutex> lock(mx_);
    return requests_;
  }

private:
  void do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, socket_type s) {
          if (ec)
            return;
          std::make_shared<Conn>(std::move(s), this)->read();
          do_accept();
        });
  }

  void record(const std::string &req) {
    std::lock_guard<std::mutex> lock(mx_);
    requests_.push_back(req);
  }

  boost::asio::io_context io_;
  acceptor_type acceptor_;
  std::vector<std::string> chunks_;
  FakeMode mode_;
  std::vector<std::shared_ptr<Conn>> held_; // io thread only
  mutable std::mutex mx_;
  std::vector<std::string> requests_;
  std::thread thread_;
};

using FakeUnixAdmin = FakeAdmin<boost::asio::local::stream_protocol>;
using FakeTcpAdmin = FakeAdmin<boost::asio::ip::tcp>;

// Fresh socket path under the temp directory; any stale file is removed.
inline std::string temp_socket_path(const std::string &name) {
  auto p = std::filesystem::temp_directory_path() /
           ("yggdash_" + name + "_" + std::to_string(::getpid()) + ".sock");
  std::filesystem::remove(p);
  return p.string();
}

// Builds a getSwitchPeers success reply from (port, ip, sent, recvd, coords).
struct LinkSpec {
  std::string port;
  std::string ip;
  uint64_t sent;
  uint64_t recvd;
  std::string coords;
};

inline std::string switch_peers_reply(const std::vector<LinkSpec> &links) {
  nlohmann::json peers = nlohmann::json::object();
  for (const auto &l : links) {
    peers[l.port] = {{"ip", l.ip},
                     {"bytes_sent", l.sent},
                     {"bytes_recvd", l.recvd},
                     {"coords", l.coords}};
  }
  nlohmann::json reply = {{"status", "success"},
                          {"request", {{"request", "getSwitchPeers"}}},
                          {"response", {{"switchpeers", peers}}}};
  return reply.dump() + "\n";
}

// Splits `text` into `parts` roughly equal pieces.
inline std::vector<std::string> split_chunks(const std::string &text,
                                             std::size_t parts) {
  std::vector<std::string> out;
  std::size_t step = (text.size() + parts - 1) / parts;
  for (std::size_t pos = 0; pos < text.size(); pos += step)
    out.push_back(text.substr(pos, step));
  return out;
}

} // namespace yggdash::testing
