#include "byte_format.hpp"
#include <cmath>
#include <cstdio>

namespace yggdash {

std::string humanize_bytes(uint64_t bytes) {
  static constexpr const char *units[] = {"B",  "kB", "MB", "GB",
                                          "TB", "PB", "EB"};
  if (bytes < 10)
    return std::to_string(bytes) + " B";

  int exp = 0;
  uint64_t base = 1;
  while (exp < 6 && bytes / base >= 1000) {
    base *= 1000;
    ++exp;
  }
  double val = std::floor(static_cast<double>(bytes) /
                              static_cast<double>(base) * 10.0 +
                          0.5) /
               10.0;

  char buf[32];
  if (val < 10.0)
    std::snprintf(buf, sizeof(buf), "%.1f %s", val, units[exp]);
  else
    std::snprintf(buf, sizeof(buf), "%.0f %s", val, units[exp]);
  return buf;
}

} // namespace yggdash
