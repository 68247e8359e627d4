#ifndef YGGDASH_ADMIN_ADMIN_CLIENT_HPP
#define YGGDASH_ADMIN_ADMIN_CLIENT_HPP

#include "admin_address.hpp"
#include "admin_error.hpp"
#include "switch_peers.hpp"
#include <chrono>
#include <cstddef>
#include <nlohmann/json.hpp>

namespace yggdash {

// Talks to the node's admin socket. Every call opens its own connection,
// sends one JSON request and reads exactly one JSON document back. Nothing is
// pooled or cached, so one client can be shared by concurrent requests.
class AdminClient {
public:
  static constexpr std::size_t kDefaultMaxResponse = 4 * 1024 * 1024;
  static constexpr std::chrono::milliseconds kDefaultTimeout{5000};

  explicit AdminClient(AdminAddress address,
                       std::chrono::milliseconds timeout = kDefaultTimeout,
                       std::size_t max_response = kDefaultMaxResponse);

  // The response is complete once the bytes received so far form a whole
  // JSON document, or the endpoint closes the stream. The whole exchange
  // (connect, write, read) must finish within the timeout.
  Result<nlohmann::json> query(const nlohmann::json &request) const;

  // {"request": "getSwitchPeers"} followed by a validated decode.
  Result<SwitchPeers> get_switch_peers() const;

  const AdminAddress &address() const { return address_; }

private:
  AdminAddress address_;
  std::chrono::milliseconds timeout_;
  std::size_t max_response_;
};

} // namespace yggdash

#endif
