#pragma once

#include <json/json.h>

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cpanbridge {

// Request parameters and results travel as jsoncpp documents.
using Value = Json::Value;

Value string_array(const std::vector<std::string>& items);

// Object member lookup that tolerates non-object values.
const Value* find_member(const Value& object, std::string_view key);

// Strict integer test: integral doubles such as 1.0 do not qualify.
bool is_integer(const Value& value);

// Typed accessors over a request's params object. Missing or ill-typed
// values raise a validation BridgeError naming the parameter.
namespace params {

std::string require_string(const Value& params, std::string_view key);
std::optional<std::string> optional_string(const Value& params, std::string_view key);
std::string string_or(const Value& params, std::string_view key, std::string fallback);
std::int64_t integer_or(const Value& params, std::string_view key, std::int64_t fallback);
std::int64_t require_integer(const Value& params, std::string_view key);
bool boolean_or(const Value& params, std::string_view key, bool fallback);

// Returns the named member or a static null value when absent.
const Value& member(const Value& params, std::string_view key);

// Returns the first present key among the given aliases.
std::optional<std::string> first_string(const Value& params, std::initializer_list<std::string_view> keys);

}  // namespace params

}  // namespace cpanbridge
