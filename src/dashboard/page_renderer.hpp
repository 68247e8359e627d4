#ifndef YGGDASH_DASHBOARD_PAGE_RENDERER_HPP
#define YGGDASH_DASHBOARD_PAGE_RENDERER_HPP

#include "peer_aggregator.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace yggdash {

inline constexpr std::string_view kHostnameToken = "%HOSTNAME%";
inline constexpr std::string_view kPeersToken = "%PEERS%";
inline constexpr std::string_view kNoPeersNotice =
    "<div>There are no connected peers at this time.</div>";

// Values of one donut chart. Each peer's slice is drawn against the bytes of
// the peers rendered before it (offset) and after it (remainder), so the
// charts line up as one pie split across the page.
struct ChartSeries {
  uint64_t offset = 0;
  uint64_t sent = 0;
  uint64_t recvd = 0;
  uint64_t remainder = 0;
};

// One entry per peer, in PeerMap order.
std::vector<ChartSeries> chart_series(const PeerMap &peers,
                                      uint64_t total_bytes);

std::string html_escape(std::string_view text);

// "switch port 3" or "switch ports 3, 7"
std::string ports_label(const std::vector<std::string> &links);

// The %PEERS% fragment. Every peer-derived string is escaped.
std::string render_peers(const PeerMap &peers, uint64_t total_bytes);

// Replaces every token in one pass over `tpl`; inserted text is not
// rescanned. The node name is escaped, peers_html is inserted as is.
std::string substitute_template(std::string_view tpl,
                                std::string_view node_name,
                                std::string_view peers_html);

std::string render_page(std::string_view tpl, std::string_view node_name,
                        const Aggregate &agg);

// Same page with an escaped message in place of the peer list.
std::string render_message_page(std::string_view tpl,
                                std::string_view node_name,
                                std::string_view message);

} // namespace yggdash

#endif
