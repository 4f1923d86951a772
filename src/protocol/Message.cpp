#include "cpanbridge/protocol/Message.hpp"

#include "cpanbridge/protocol/Json.hpp"

#include <utility>

namespace cpanbridge::protocol {

namespace {

[[noreturn]] void throw_transport(const std::string& message) {
    throw BridgeError(ErrorKind::Transport, message);
}

std::string require_name(const Value& root, std::string_view key) {
    const auto* value = find_member(root, key);
    if (!value || !value->isString()) {
        throw_transport("Invalid request: '" + std::string(key) + "' must be a string");
    }
    auto name = value->asString();
    if (name.empty()) {
        throw_transport("Invalid request: '" + std::string(key) + "' is empty");
    }
    return name;
}

ErrorKind error_kind_from_string(std::string_view text) {
    for (const auto kind : {ErrorKind::Transport,
                            ErrorKind::Authorization,
                            ErrorKind::Validation,
                            ErrorKind::Handle,
                            ErrorKind::Execution,
                            ErrorKind::Resource,
                            ErrorKind::Internal}) {
        if (error_kind_to_string(kind) == text) {
            return kind;
        }
    }
    return ErrorKind::Internal;
}

}  // namespace

Response Response::ok(Value result) {
    Response response;
    response.success = true;
    response.result = result.isNull() ? Value(Json::objectValue) : std::move(result);
    return response;
}

Response Response::failure(ErrorKind kind, std::string message) {
    Response response;
    response.success = false;
    response.error = std::move(message);
    response.error_kind = kind;
    return response;
}

Request decode_request(std::string_view payload) {
    Value root;
    try {
        root = parse_json(payload);
    } catch (const JsonParseError& ex) {
        throw_transport(std::string("Malformed request: ") + ex.what());
    }
    if (!root.isObject()) {
        throw_transport("Malformed request: expected a JSON object");
    }

    Request request;
    request.module = require_name(root, "module");
    request.function = require_name(root, "function");

    if (const auto* params = find_member(root, "params"); params && !params->isNull()) {
        if (!params->isObject()) {
            throw_transport("Invalid request: 'params' must be an object");
        }
        request.params = *params;
    }
    if (const auto* timestamp = find_member(root, "timestamp"); timestamp && timestamp->isNumeric()) {
        request.timestamp = timestamp->asDouble();
    }
    return request;
}

std::string encode_request(const Request& request) {
    Value root(Json::objectValue);
    root["module"] = request.module;
    root["function"] = request.function;
    root["params"] = request.params.isNull() ? Value(Json::objectValue) : request.params;
    root["timestamp"] = request.timestamp;
    return to_json(root);
}

std::string encode_response(const Response& response) {
    Value root(Json::objectValue);
    root["success"] = response.success;
    if (response.success) {
        root["result"] = response.result.isNull() ? Value(Json::objectValue) : response.result;
    } else {
        root["error"] = response.error;
        root["error_type"] = std::string(error_kind_to_string(response.error_kind));
    }
    return to_json(root);
}

Response decode_response(std::string_view payload) {
    Value root;
    try {
        root = parse_json(payload);
    } catch (const JsonParseError& ex) {
        throw_transport(std::string("Malformed response: ") + ex.what());
    }
    if (!root.isObject()) {
        throw_transport("Malformed response: expected a JSON object");
    }

    Response response;
    const auto* success = find_member(root, "success");
    response.success = success && success->isBool() && success->asBool();
    if (response.success) {
        const auto* result = find_member(root, "result");
        response.result = result ? *result : Value(Json::objectValue);
    } else {
        const auto* error = find_member(root, "error");
        response.error = error && error->isString() ? error->asString() : std::string("Unknown error");
        const auto* kind = find_member(root, "error_type");
        response.error_kind = kind && kind->isString() ? error_kind_from_string(kind->asString())
                                                       : ErrorKind::Internal;
    }
    return response;
}

}  // namespace cpanbridge::protocol
