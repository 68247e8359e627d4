#ifndef YGGDASH_DASHBOARD_BYTE_FORMAT_HPP
#define YGGDASH_DASHBOARD_BYTE_FORMAT_HPP

#include <cstdint>
#include <string>

namespace yggdash {

// SI units, base 1000: 9 -> "9 B", 1234 -> "1.2 kB", 512000 -> "512 kB".
std::string humanize_bytes(uint64_t bytes);

} // namespace yggdash

#endif
