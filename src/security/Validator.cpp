#include "cpanbridge/security/Validator.hpp"

namespace cpanbridge::security {

namespace {

struct Walk {
    const ValidationLimits& limits;
    std::size_t count{0};
    std::optional<std::string> failure;

    // |depth| is the nesting level of |value|; the params object itself is level 1.
    void visit(const Value& value, std::size_t depth, const std::string& path) {
        if (failure) {
            return;
        }
        if (depth > limits.max_object_depth) {
            failure = "Parameter nesting exceeds maximum depth of " + std::to_string(limits.max_object_depth) +
                      " at " + path;
            return;
        }

        switch (value.type()) {
            case Json::stringValue:
                if (value.asString().size() > limits.max_string_length) {
                    failure = "String parameter " + path + " exceeds maximum length of " +
                              std::to_string(limits.max_string_length);
                }
                return;
            case Json::arrayValue: {
                if (value.size() > limits.max_array_length) {
                    failure = "Array parameter " + path + " exceeds maximum length of " +
                              std::to_string(limits.max_array_length);
                    return;
                }
                for (Json::ArrayIndex i = 0; i < value.size() && !failure; ++i) {
                    count_one(path);
                    visit(value[i], depth + 1, path + "[" + std::to_string(i) + "]");
                }
                return;
            }
            case Json::objectValue: {
                if (value.size() > limits.max_array_length) {
                    failure = "Object parameter " + path + " exceeds maximum size of " +
                              std::to_string(limits.max_array_length);
                    return;
                }
                for (auto it = value.begin(); it != value.end(); ++it) {
                    const auto key = it.name();
                    if (failure) {
                        return;
                    }
                    if (key.size() > limits.max_string_length) {
                        failure = "Parameter name under " + path + " exceeds maximum length of " +
                                  std::to_string(limits.max_string_length);
                        return;
                    }
                    count_one(path);
                    visit(*it, depth + 1, path + "." + key);
                }
                return;
            }
            default:
                return;
        }
    }

    void count_one(const std::string& path) {
        if (failure) {
            return;
        }
        if (++count > limits.max_param_count) {
            failure = "Parameter count exceeds maximum of " + std::to_string(limits.max_param_count) + " near " + path;
        }
    }
};

}  // namespace

std::optional<std::string> Validator::validate(const Value& params) const {
    if (!params.isObject() && !params.isNull()) {
        return std::string("Parameters must be an object");
    }
    Walk walk{limits_};
    walk.visit(params, 1, "params");
    return walk.failure;
}

}  // namespace cpanbridge::security
