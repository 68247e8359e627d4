#include "switch_peers.hpp"
#include <cmath>
#include <limits>

namespace yggdash {

using json = nlohmann::json;

namespace {

const char *type_name(const json &j) { return j.type_name(); }

AdminError missing(const std::string &path) {
  return make_admin_error(AdminErrc::MissingField, "missing field " + path);
}

AdminError wrong_type(const std::string &path, const json &j,
                      std::string_view expected) {
  return make_admin_error(AdminErrc::WrongType,
                          "field " + path + " is " + type_name(j) +
                              ", expected " + std::string(expected));
}

bool read_counter(const json &j, uint64_t &out) {
  if (j.is_number_unsigned()) {
    out = j.get<uint64_t>();
    return true;
  }
  if (j.is_number_integer()) {
    auto v = j.get<int64_t>();
    if (v < 0)
      return false;
    out = static_cast<uint64_t>(v);
    return true;
  }
  if (j.is_number_float()) {
    double d = j.get<double>();
    if (!std::isfinite(d) || d < 0.0 ||
        d >= static_cast<double>(std::numeric_limits<uint64_t>::max()))
      return false;
    out = static_cast<uint64_t>(d);
    return true;
  }
  return false;
}

// Looks up member `key` of object `obj`; on failure fills `err`.
const json *member(const json &obj, const std::string &path,
                   const char *key, AdminError &err) {
  auto it = obj.find(key);
  if (it == obj.end()) {
    err = missing(path + "." + key);
    return nullptr;
  }
  return &*it;
}

} // namespace

json make_switch_peers_request() { return json{{"request", "getSwitchPeers"}}; }

Result<SwitchPeers> decode_switch_peers(const json &response) {
  if (!response.is_object())
    return make_admin_error(AdminErrc::DecodeFailed,
                            std::string("top level is ") +
                                type_name(response) + ", expected object");

  auto status = response.find("status");
  if (status == response.end() || !status->is_string() ||
      status->get_ref<const std::string &>() != "success") {
    AdminError err = make_admin_error(
        AdminErrc::NotSuccessful,
        status == response.end() ? "status absent"
                                 : "status is " + status->dump());
    auto reason = response.find("error");
    if (reason != response.end() && reason->is_string())
      err.message += ": " + reason->get<std::string>();
    return err;
  }

  auto body = response.find("response");
  if (body == response.end())
    return missing("response");
  if (!body->is_object())
    return wrong_type("response", *body, "object");

  AdminError err{};
  const json *peers = member(*body, "response", "switchpeers", err);
  if (!peers)
    return err;
  if (!peers->is_object())
    return wrong_type("response.switchpeers", *peers, "object");

  SwitchPeers out;
  for (auto it = peers->begin(); it != peers->end(); ++it) {
    const std::string path = "response.switchpeers." + it.key();
    const json &entry = it.value();
    if (!entry.is_object())
      return wrong_type(path, entry, "object");

    RawLinkRecord rec;

    const json *ip = member(entry, path, "ip", err);
    if (!ip)
      return err;
    if (!ip->is_string())
      return wrong_type(path + ".ip", *ip, "string");
    rec.ip = ip->get<std::string>();

    const json *sent = member(entry, path, "bytes_sent", err);
    if (!sent)
      return err;
    if (!read_counter(*sent, rec.bytes_sent))
      return wrong_type(path + ".bytes_sent", *sent, "non-negative number");

    const json *recvd = member(entry, path, "bytes_recvd", err);
    if (!recvd)
      return err;
    if (!read_counter(*recvd, rec.bytes_recvd))
      return wrong_type(path + ".bytes_recvd", *recvd, "non-negative number");

    const json *coords = member(entry, path, "coords", err);
    if (!coords)
      return err;
    if (!coords->is_string())
      return wrong_type(path + ".coords", *coords, "string");
    rec.coords = coords->get<std::string>();

    out.emplace(it.key(), std::move(rec));
  }
  return out;
}

} // namespace yggdash
