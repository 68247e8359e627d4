#include "page_renderer.hpp"
#include "byte_format.hpp"
#include <sstream>

namespace yggdash {

std::vector<ChartSeries> chart_series(const PeerMap &peers,
                                      uint64_t total_bytes) {
  std::vector<ChartSeries> out;
  out.reserve(peers.size());
  uint64_t offset = 0;
  for (const auto &[addr, peer] : peers) {
    ChartSeries s;
    s.offset = offset;
    s.sent = peer.bytes_sent;
    s.recvd = peer.bytes_recvd;
    uint64_t used = offset + peer.total();
    s.remainder = total_bytes > used ? total_bytes - used : 0;
    out.push_back(s);
    offset += peer.total();
  }
  return out;
}

std::string html_escape(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
    case '&':
      out += "&amp;";
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    case '"':
      out += "&quot;";
      break;
    case '\'':
      out += "&#39;";
      break;
    default:
      out += c;
    }
  }
  return out;
}

std::string ports_label(const std::vector<std::string> &links) {
  if (links.size() == 1)
    return "switch port " + links.front();
  std::string out = "switch ports ";
  for (size_t i = 0; i < links.size(); ++i) {
    if (i > 0)
      out += ", ";
    out += links[i];
  }
  return out;
}

std::string render_peers(const PeerMap &peers, uint64_t total_bytes) {
  if (peers.empty())
    return std::string(kNoPeersNotice);

  auto series = chart_series(peers, total_bytes);
  std::ostringstream os;
  size_t n = 0;
  for (const auto &[addr, peer] : peers) {
    const ChartSeries &s = series[n];
    os << "<div class='node'>\n"
       << "<div class='ct-chart ct-perfect-fourth' id='ct-" << n
       << "'></div>\n"
       << "<script>\nnew Chartist.Pie('#ct-" << n << "', { series: ["
       << s.offset << ", " << s.sent << ", " << s.recvd << ", "
       << s.remainder
       << "] }, { donut: true, donutWidth: 25, donutSolid: true, "
          "startAngle: 0, showLabel: false });\n</script>\n"
       << "<div class='ipv6'>" << html_escape(addr) << "</div>\n"
       << "<div>" << html_escape(coords_label(peer.coords)) << " attached to "
       << html_escape(ports_label(peer.links)) << "</div>\n"
       << "<div>" << humanize_bytes(peer.bytes_sent) << " sent</div>\n"
       << "<div>" << humanize_bytes(peer.bytes_recvd) << " received</div>\n"
       << "</div>\n";
    ++n;
  }
  return os.str();
}

std::string substitute_template(std::string_view tpl,
                                std::string_view node_name,
                                std::string_view peers_html) {
  const std::string name = html_escape(node_name);
  std::string out;
  out.reserve(tpl.size() + peers_html.size());

  size_t pos = 0;
  while (pos < tpl.size()) {
    size_t mark = tpl.find('%', pos);
    if (mark == std::string_view::npos) {
      out.append(tpl.substr(pos));
      break;
    }
    out.append(tpl.substr(pos, mark - pos));
    std::string_view rest = tpl.substr(mark);
    if (rest.starts_with(kHostnameToken)) {
      out += name;
      pos = mark + kHostnameToken.size();
    } else if (rest.starts_with(kPeersToken)) {
      out.append(peers_html);
      pos = mark + kPeersToken.size();
    } else {
      out += '%';
      pos = mark + 1;
    }
  }
  return out;
}

std::string render_page(std::string_view tpl, std::string_view node_name,
                        const Aggregate &agg) {
  return substitute_template(tpl, node_name,
                             render_peers(agg.peers, agg.total_bytes));
}

std::string render_message_page(std::string_view tpl,
                                std::string_view node_name,
                                std::string_view message) {
  return substitute_template(tpl, node_name,
                             "<div>" + html_escape(message) + "</div>");
}

} // namespace yggdash
