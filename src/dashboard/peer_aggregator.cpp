#include "peer_aggregator.hpp"
#include <iostream>

namespace yggdash {

Aggregate aggregate(const SwitchPeers &links) {
  Aggregate out;
  for (const auto &[port, rec] : links) {
    auto it = out.peers.find(rec.ip);
    if (it == out.peers.end()) {
      PeerSummary s;
      s.links.push_back(port);
      s.bytes_sent = rec.bytes_sent;
      s.bytes_recvd = rec.bytes_recvd;
      s.coords = rec.coords;
      out.peers.emplace(rec.ip, std::move(s));
    } else {
      PeerSummary &s = it->second;
      if (s.coords != rec.coords) {
        std::cerr << "[aggregate] peer " << rec.ip << " port " << port
                  << " reports coords " << rec.coords << ", keeping "
                  << s.coords << "\n";
      }
      s.links.push_back(port);
      s.bytes_sent += rec.bytes_sent;
      s.bytes_recvd += rec.bytes_recvd;
    }
    out.total_bytes += rec.bytes_sent + rec.bytes_recvd;
  }
  return out;
}

std::string coords_label(std::string_view coords) {
  if (coords == "[]")
    return "Root";
  return std::string(coords);
}

} // namespace yggdash
