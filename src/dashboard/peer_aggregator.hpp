#ifndef YGGDASH_DASHBOARD_PEER_AGGREGATOR_HPP
#define YGGDASH_DASHBOARD_PEER_AGGREGATOR_HPP

#include "admin/switch_peers.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace yggdash {

struct PeerSummary {
  std::vector<std::string> links; // switch ports reaching this peer
  uint64_t bytes_sent = 0;
  uint64_t bytes_recvd = 0;
  std::string coords; // from the first link seen

  uint64_t total() const { return bytes_sent + bytes_recvd; }
};

using PeerMap = std::map<std::string, PeerSummary>; // keyed by mesh address

struct Aggregate {
  PeerMap peers;
  uint64_t total_bytes = 0; // sent + received over every link
};

// Collapses per-link records into per-address summaries. Byte counts are
// conserved: total_bytes and the per-peer sums both equal the input sums.
Aggregate aggregate(const SwitchPeers &links);

// "[]" is the root of the spanning tree.
std::string coords_label(std::string_view coords);

} // namespace yggdash

#endif
