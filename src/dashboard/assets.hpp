#ifndef YGGDASH_DASHBOARD_ASSETS_HPP
#define YGGDASH_DASHBOARD_ASSETS_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace yggdash {

inline constexpr std::string_view kTemplateFile = "template.html";

enum class AssetStatus { Ok, NotFound, ReadError };

struct Asset {
  AssetStatus status = AssetStatus::Ok;
  std::string body;
};

// Reads `dir/name` whole. Failures are logged and reported, never fatal.
Asset load_asset(const std::filesystem::path &dir, std::string_view name);

// style.css, chartist.min.css, chartist.min.js
bool is_static_asset(std::string_view name);

std::string_view content_type_for(std::string_view name);

} // namespace yggdash

#endif
