#include "request_handler.hpp"
#include "dashboard/assets.hpp"
#include "dashboard/page_renderer.hpp"
#include "dashboard/peer_aggregator.hpp"
#include <boost/beast/version.hpp>
#include <iostream>

namespace yggdash::http_server {

request_handler::request_handler(std::string node_name, AdminClient admin,
                                 std::filesystem::path asset_dir)
    : node_name_(std::move(node_name)), admin_(std::move(admin)),
      asset_dir_(std::move(asset_dir)) {}

static std::string_view route_path(const request &req) {
  std::string_view target(req.target().data(), req.target().size());
  if (auto q = target.find('?'); q != std::string_view::npos)
    target = target.substr(0, q);
  return target;
}

static bool readable_method(const request &req) {
  return req.method() == http::verb::get || req.method() == http::verb::head;
}

bool request_handler::is_dashboard(const request &req) const {
  std::string_view target = route_path(req);
  return readable_method(req) && (target == "/" || target == "/index.html");
}

response request_handler::handle(const request &req) const {
  std::string_view target = route_path(req);

  if (!readable_method(req)) {
    auto res = plain(req, http::status::method_not_allowed,
                     "Method not allowed\n");
    res.set(http::field::allow, "GET, HEAD");
    return res;
  }

  if (is_dashboard(req))
    return dashboard(req);

  auto slash = target.rfind('/');
  std::string_view name =
      slash == std::string_view::npos ? target : target.substr(slash + 1);
  if (target == "/" + std::string(name) && is_static_asset(name))
    return static_asset(req, name);

  return plain(req, http::status::not_found, "Not found\n");
}

response request_handler::dashboard(const request &req) const {
  Asset tpl = load_asset(asset_dir_, kTemplateFile);
  if (tpl.status != AssetStatus::Ok)
    return plain(req, http::status::internal_server_error,
                 "Unable to load page template\n");

  std::string body;
  auto peers = admin_.get_switch_peers();
  if (!peers) {
    const AdminError &err = peers.error();
    std::cerr << "[dashboard] " << to_string(admin_.address()) << ": "
              << to_string(err.code) << ": " << err.detail << "\n";
    body = render_message_page(tpl.body, node_name_, err.message);
  } else {
    body = render_page(tpl.body, node_name_, aggregate(peers.value()));
  }

  response res{http::status::ok, req.version()};
  res.set(http::field::server, "yggdash");
  res.set(http::field::content_type, "text/html; charset=utf-8");
  res.set(http::field::cache_control, "no-store");
  res.keep_alive(req.keep_alive());
  res.body() = std::move(body);
  res.prepare_payload();
  if (req.method() == http::verb::head)
    res.body().clear();
  return res;
}

response request_handler::static_asset(const request &req,
                                       std::string_view name) const {
  Asset asset = load_asset(asset_dir_, name);
  if (asset.status == AssetStatus::NotFound)
    return plain(req, http::status::not_found, "Not found\n");
  if (asset.status != AssetStatus::Ok)
    return plain(req, http::status::internal_server_error,
                 "Unable to read file\n");

  response res{http::status::ok, req.version()};
  res.set(http::field::server, "yggdash");
  res.set(http::field::content_type, std::string(content_type_for(name)));
  res.keep_alive(req.keep_alive());
  res.body() = std::move(asset.body);
  res.prepare_payload();
  if (req.method() == http::verb::head)
    res.body().clear();
  return res;
}

response request_handler::plain(const request &req, http::status status,
                                std::string_view body) const {
  response res{status, req.version()};
  res.set(http::field::server, "yggdash");
  res.set(http::field::content_type, "text/plain");
  res.keep_alive(req.keep_alive());
  res.body() = std::string(body);
  res.prepare_payload();
  if (req.method() == http::verb::head)
    res.body().clear();
  return res;
}

} // namespace yggdash::http_server
