#pragma once

#include "cpanbridge/core/Value.hpp"

#include <stdexcept>
#include <string>
#include <string_view>

namespace cpanbridge::protocol {

class JsonParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Parses one complete JSON document in jsoncpp strict mode (no comments,
// no trailing content, no duplicate keys). Throws JsonParseError on malformed
// input or when nesting exceeds the reader's stack limit.
Value parse_json(std::string_view text);

// Compact serialization. Object keys come out sorted and every non-ASCII or
// invalid byte is written as a \u escape, so the output is always valid JSON.
std::string to_json(const Value& value);

// Returns |value| as a quoted, escaped JSON string literal.
std::string quote_json_string(std::string_view value);

}  // namespace cpanbridge::protocol
