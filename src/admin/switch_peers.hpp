#ifndef YGGDASH_ADMIN_SWITCH_PEERS_HPP
#define YGGDASH_ADMIN_SWITCH_PEERS_HPP

#include "admin_error.hpp"
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <string>

namespace yggdash {

// One active switch port as reported by getSwitchPeers.
struct RawLinkRecord {
  std::string ip;       // remote mesh address
  uint64_t bytes_sent = 0;
  uint64_t bytes_recvd = 0;
  std::string coords;   // serialized list, "[]" for the root
};

// Keyed by link (switch port) identifier.
using SwitchPeers = std::map<std::string, RawLinkRecord>;

nlohmann::json make_switch_peers_request();

// Validates the envelope and every record. Never throws; structural problems
// come back as MissingField / WrongType naming the offending path.
Result<SwitchPeers> decode_switch_peers(const nlohmann::json &response);

} // namespace yggdash

#endif
