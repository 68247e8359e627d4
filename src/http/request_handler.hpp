#pragma once

#include "admin/admin_client.hpp"
#include <boost/beast/http.hpp>
#include <filesystem>
#include <string>

namespace yggdash::http_server {

namespace beast = boost::beast;
namespace http = beast::http;

using request = http::request<http::string_body>;
using response = http::response<http::string_body>;

// Routes one request. Holds only read-only configuration, so a single
// instance is shared by every session and worker thread.
class request_handler {
public:
  request_handler(std::string node_name, AdminClient admin,
                  std::filesystem::path asset_dir);

  response handle(const request &req) const;

  // True when handle() will query the admin socket and may block for up to
  // the admin timeout.
  bool is_dashboard(const request &req) const;

private:
  response dashboard(const request &req) const;
  response static_asset(const request &req, std::string_view name) const;
  response plain(const request &req, http::status status,
                 std::string_view body) const;

  std::string node_name_;
  AdminClient admin_;
  std::filesystem::path asset_dir_;
};

} // namespace yggdash::http_server
