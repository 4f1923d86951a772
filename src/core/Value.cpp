#include "cpanbridge/core/Value.hpp"

#include "cpanbridge/core/BridgeError.hpp"

#include <charconv>
#include <cmath>

namespace cpanbridge {

Value string_array(const std::vector<std::string>& items) {
    Value array(Json::arrayValue);
    for (const auto& item : items) {
        array.append(item);
    }
    return array;
}

const Value* find_member(const Value& object, std::string_view key) {
    if (!object.isObject()) {
        return nullptr;
    }
    return object.find(key.data(), key.data() + key.size());
}

bool is_integer(const Value& value) {
    return value.type() == Json::intValue || value.type() == Json::uintValue;
}

namespace params {

namespace {

const Value kNull{};

[[noreturn]] void throw_wrong_type(std::string_view key, std::string_view expected) {
    throw_validation_error("Parameter '" + std::string(key) + "' must be " + std::string(expected));
}

std::optional<std::int64_t> parse_integer_text(const std::string& text) {
    std::int64_t value{};
    const auto* begin = text.data();
    const auto* end = text.data() + text.size();
    const auto result = std::from_chars(begin, end, value);
    if (result.ec != std::errc{} || result.ptr != end) {
        return std::nullopt;
    }
    return value;
}

std::int64_t integral_value(const Value& value, std::string_view key) {
    if (value.type() == Json::uintValue && !value.isInt64()) {
        throw_wrong_type(key, "a signed 64-bit integer");
    }
    return value.asInt64();
}

}  // namespace

const Value& member(const Value& params, std::string_view key) {
    const auto* found = find_member(params, key);
    return found ? *found : kNull;
}

std::optional<std::string> optional_string(const Value& params, std::string_view key) {
    const auto& value = member(params, key);
    if (value.isNull()) {
        return std::nullopt;
    }
    if (value.isString()) {
        return value.asString();
    }
    // Scripting clients routinely send numbers where strings are expected.
    if (is_integer(value)) {
        return value.type() == Json::uintValue ? std::to_string(value.asUInt64())
                                               : std::to_string(value.asInt64());
    }
    if (value.isDouble()) {
        std::string text = std::to_string(value.asDouble());
        text.erase(text.find_last_not_of('0') + 1);
        if (!text.empty() && text.back() == '.') {
            text.pop_back();
        }
        return text;
    }
    throw_wrong_type(key, "a string");
}

std::string require_string(const Value& params, std::string_view key) {
    auto value = optional_string(params, key);
    if (!value) {
        throw_validation_error("Missing required parameter: " + std::string(key));
    }
    return *value;
}

std::string string_or(const Value& params, std::string_view key, std::string fallback) {
    auto value = optional_string(params, key);
    return value ? *value : std::move(fallback);
}

std::int64_t integer_or(const Value& params, std::string_view key, std::int64_t fallback) {
    const auto& value = member(params, key);
    if (value.isNull()) {
        return fallback;
    }
    if (is_integer(value)) {
        return integral_value(value, key);
    }
    if (value.isDouble() && std::isfinite(value.asDouble()) && std::fabs(value.asDouble()) < 9.2e18) {
        return static_cast<std::int64_t>(value.asDouble());
    }
    if (value.isBool()) {
        return value.asBool() ? 1 : 0;
    }
    if (value.isString()) {
        const auto text = value.asString();
        if (text.empty()) {
            return fallback;
        }
        if (const auto parsed = parse_integer_text(text)) {
            return *parsed;
        }
    }
    throw_wrong_type(key, "an integer");
}

std::int64_t require_integer(const Value& params, std::string_view key) {
    if (member(params, key).isNull()) {
        throw_validation_error("Missing required parameter: " + std::string(key));
    }
    return integer_or(params, key, 0);
}

bool boolean_or(const Value& params, std::string_view key, bool fallback) {
    const auto& value = member(params, key);
    if (value.isNull()) {
        return fallback;
    }
    if (value.isBool()) {
        return value.asBool();
    }
    if (value.isNumeric()) {
        return value.asDouble() != 0.0;
    }
    if (value.isString()) {
        const auto text = value.asString();
        if (text.empty() || text == "0" || text == "false" || text == "no") {
            return false;
        }
        return true;
    }
    throw_wrong_type(key, "a boolean");
}

std::optional<std::string> first_string(const Value& params, std::initializer_list<std::string_view> keys) {
    for (const auto key : keys) {
        if (auto value = optional_string(params, key)) {
            return value;
        }
    }
    return std::nullopt;
}

}  // namespace params

}  // namespace cpanbridge
