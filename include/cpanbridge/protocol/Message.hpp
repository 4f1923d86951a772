#pragma once

#include "cpanbridge/core/BridgeError.hpp"
#include "cpanbridge/core/Value.hpp"

#include <string>
#include <string_view>

namespace cpanbridge::protocol {

struct Request {
    std::string module;
    std::string function;
    Value params{Json::objectValue};
    double timestamp{0.0};
};

struct Response {
    bool success{false};
    Value result;
    std::string error;
    ErrorKind error_kind{ErrorKind::Internal};

    static Response ok(Value result);
    static Response failure(ErrorKind kind, std::string message);
};

// Decodes one request document. Absent or null params become an empty object.
// Throws BridgeError(ErrorKind::Transport) when the payload is not a request.
Request decode_request(std::string_view payload);
std::string encode_request(const Request& request);

std::string encode_response(const Response& response);
Response decode_response(std::string_view payload);

}  // namespace cpanbridge::protocol
