#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <json/json.h>

/* splits a byte stream of concatenated JSON objects into whole objects */
class JsonStreamDecoder
{
  std::string buffer_ {};
  size_t scan_pos_ {};
  size_t depth_ {};
  bool in_string_ {}, escaped_ {};
  unsigned int malformed_ {};

  static constexpr size_t MAX_OBJECT_SIZE = 1 << 20;

  void reset_scan();

public:
  void push( const std::string_view data );

  /* next complete object, or nullopt if none is buffered yet; unparsable objects are skipped and counted */
  std::optional<Json::Value> pop();

  size_t buffered() const { return buffer_.size(); }
  unsigned int malformed() const { return malformed_; }
};
