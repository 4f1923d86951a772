#include "cpanbridge/security/Validator.hpp"

#include <cassert>
#include <string>

using namespace cpanbridge;
using cpanbridge::security::Validator;

namespace {

Value nested(std::size_t levels) {
    Value root(Json::objectValue);
    Value* cursor = &root;
    for (std::size_t i = 0; i < levels; ++i) {
        cursor = &(*cursor)["child"];
        *cursor = Value(Json::objectValue);
    }
    return root;
}

}  // namespace

int main() {
    ValidationLimits limits;
    limits.max_string_length = 16;
    limits.max_array_length = 4;
    limits.max_object_depth = 3;
    limits.max_param_count = 6;
    const Validator validator(limits);

    assert(!validator.validate(Value(Json::objectValue)).has_value());
    assert(!validator.validate(Value()).has_value());

    Value ok = Value(Json::objectValue);
    ok["name"] = Value("short");
    ok["list"].append(Value(static_cast<std::int64_t>(1)));
    assert(!validator.validate(ok).has_value());

    Value long_string = Value(Json::objectValue);
    long_string["name"] = Value(std::string(17, 'x'));
    const auto string_failure = validator.validate(long_string);
    assert(string_failure.has_value());
    assert(string_failure->find("params.name") != std::string::npos);

    Value long_array = Value(Json::objectValue);
    for (int i = 0; i < 5; ++i) {
        long_array["items"].append(Value(i));
    }
    assert(validator.validate(long_array).has_value());

    // Params object is depth 1, so two nested objects sit at the limit.
    assert(!validator.validate(nested(2)).has_value());
    const auto depth_failure = validator.validate(nested(3));
    assert(depth_failure.has_value());
    assert(depth_failure->find("depth") != std::string::npos);

    Value many = Value(Json::objectValue);
    for (int i = 0; i < 4; ++i) {
        many["k" + std::to_string(i)].append(Value(i));
    }
    const auto count_failure = validator.validate(many);
    assert(count_failure.has_value());
    assert(count_failure->find("count") != std::string::npos);

    Value long_key = Value(Json::objectValue);
    long_key[std::string(20, 'k')] = Value(true);
    assert(validator.validate(long_key).has_value());

    assert(validator.validate(Value("not an object")).has_value());

    const Validator defaults;
    Value big = Value(Json::objectValue);
    big["blob"] = Value(std::string(1024 * 1024, 'a'));
    assert(!defaults.validate(big).has_value());
    big["blob"] = Value(std::string(1024 * 1024 + 1, 'a'));
    assert(defaults.validate(big).has_value());

    return 0;
}
