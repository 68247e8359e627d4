#ifndef YGGDASH_ADMIN_JSON_FRAMER_HPP
#define YGGDASH_ADMIN_JSON_FRAMER_HPP

#include <cstddef>
#include <cstdint>

namespace yggdash {

// Finds the end of one top-level JSON object or array in a byte stream.
// Each byte is looked at once, so feeding a response in many small pieces
// costs the same as feeding it whole. Only nesting and string state are
// tracked; the completed document still goes through the real parser.
class JsonFramer {
public:
  enum class State { NeedMore, Complete, Malformed };

  State feed(const char *data, std::size_t n);
  State state() const { return state_; }

private:
  State state_ = State::NeedMore;
  uint32_t depth_ = 0;
  bool started_ = false;
  bool in_string_ = false;
  bool escaped_ = false;
};

} // namespace yggdash

#endif
