#include "assets.hpp"
#include <array>
#include <fstream>
#include <iostream>
#include <iterator>
#include <system_error>

namespace yggdash {

static constexpr std::array<std::string_view, 3> kStaticAssets = {
    "style.css", "chartist.min.css", "chartist.min.js"};

Asset load_asset(const std::filesystem::path &dir, std::string_view name) {
  const auto path = dir / std::string(name);

  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    std::cerr << "[assets] " << path.string() << ": not found\n";
    return {AssetStatus::NotFound, {}};
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::cerr << "[assets] " << path.string() << ": cannot open\n";
    return {AssetStatus::ReadError, {}};
  }
  std::string body((std::istreambuf_iterator<char>(in)),
                   std::istreambuf_iterator<char>());
  if (in.bad()) {
    std::cerr << "[assets] " << path.string() << ": read failed\n";
    return {AssetStatus::ReadError, {}};
  }
  return {AssetStatus::Ok, std::move(body)};
}

bool is_static_asset(std::string_view name) {
  for (auto a : kStaticAssets)
    if (a == name)
      return true;
  return false;
}

std::string_view content_type_for(std::string_view name) {
  if (name.ends_with(".css"))
    return "text/css";
  if (name.ends_with(".js"))
    return "application/javascript";
  if (name.ends_with(".html"))
    return "text/html";
  return "application/octet-stream";
}

} // namespace yggdash
