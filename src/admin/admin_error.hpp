#ifndef YGGDASH_ADMIN_ADMIN_ERROR_HPP
#define YGGDASH_ADMIN_ADMIN_ERROR_HPP

#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace yggdash {

enum class AdminErrc {
  InvalidAddress,
  EncodeFailed,
  ConnectFailed,
  WriteFailed,
  ReadFailed,
  NoResponse,
  Timeout,
  ResponseTooLarge,
  DecodeFailed,
  NotSuccessful,
  MissingField,
  WrongType
};

std::string_view to_string(AdminErrc code);

struct AdminError {
  AdminErrc code;
  std::string message; // user-facing, rendered into the page
  std::string detail;  // low-level cause, logged only
};

// Value-or-error return used by the admin path.
template <typename T> class Result {
  std::variant<T, AdminError> v_;

public:
  Result(T value) : v_(std::move(value)) {}
  Result(AdminError err) : v_(std::move(err)) {}

  bool has_value() const { return v_.index() == 0; }
  explicit operator bool() const { return has_value(); }

  T &value() & { return std::get<0>(v_); }
  const T &value() const & { return std::get<0>(v_); }
  T &&value() && { return std::get<0>(std::move(v_)); }

  const AdminError &error() const { return std::get<1>(v_); }
};

AdminError make_admin_error(AdminErrc code, std::string detail = {});

} // namespace yggdash

#endif
