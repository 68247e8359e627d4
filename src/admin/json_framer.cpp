#include "json_framer.hpp"

namespace yggdash {

JsonFramer::State JsonFramer::feed(const char *data, std::size_t n) {
  for (std::size_t i = 0; i < n && state_ == State::NeedMore; ++i) {
    char c = data[i];

    if (in_string_) {
      if (escaped_)
        escaped_ = false;
      else if (c == '\\')
        escaped_ = true;
      else if (c == '"')
        in_string_ = false;
      continue;
    }

    if (!started_) {
      if (c == ' ' || c == '\n' || c == '\r' || c == '\t')
        continue;
      // Scalars have no closing mark; those are framed by EOF instead.
      if (c != '{' && c != '[') {
        state_ = State::Malformed;
        break;
      }
      started_ = true;
    }

    switch (c) {
    case '"':
      in_string_ = true;
      break;
    case '{':
    case '[':
      ++depth_;
      break;
    case '}':
    case ']':
      if (--depth_ == 0)
        state_ = State::Complete;
      break;
    default:
      break;
    }
  }
  return state_;
}

} // namespace yggdash
