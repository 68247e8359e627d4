#include "admin_error.hpp"

namespace yggdash {

std::string_view to_string(AdminErrc code) {
  switch (code) {
  case AdminErrc::InvalidAddress:
    return "invalid_address";
  case AdminErrc::EncodeFailed:
    return "encode_failed";
  case AdminErrc::ConnectFailed:
    return "connect_failed";
  case AdminErrc::WriteFailed:
    return "write_failed";
  case AdminErrc::ReadFailed:
    return "read_failed";
  case AdminErrc::NoResponse:
    return "no_response";
  case AdminErrc::Timeout:
    return "timeout";
  case AdminErrc::ResponseTooLarge:
    return "response_too_large";
  case AdminErrc::DecodeFailed:
    return "decode_failed";
  case AdminErrc::NotSuccessful:
    return "not_successful";
  case AdminErrc::MissingField:
    return "missing_field";
  case AdminErrc::WrongType:
    return "wrong_type";
  }
  return "unknown";
}

static std::string default_message(AdminErrc code) {
  switch (code) {
  case AdminErrc::InvalidAddress:
    return "Invalid admin socket address";
  case AdminErrc::EncodeFailed:
    return "Unable to marshal JSON";
  case AdminErrc::ConnectFailed:
    return "Unable to connect to admin socket";
  case AdminErrc::WriteFailed:
    return "Unable to send request to admin socket";
  case AdminErrc::ReadFailed:
    return "Unable to read from admin socket";
  case AdminErrc::NoResponse:
    return "No response from admin socket";
  case AdminErrc::Timeout:
    return "Timed out waiting for admin socket";
  case AdminErrc::ResponseTooLarge:
    return "Response from admin socket is too large";
  case AdminErrc::DecodeFailed:
    return "Unable to unmarshal JSON";
  case AdminErrc::NotSuccessful:
    return "Non-successful response";
  case AdminErrc::MissingField:
  case AdminErrc::WrongType:
    return "Malformed response from admin socket";
  }
  return "Unknown admin socket error";
}

AdminError make_admin_error(AdminErrc code, std::string detail) {
  return AdminError{code, default_message(code), std::move(detail)};
}

} // namespace yggdash
