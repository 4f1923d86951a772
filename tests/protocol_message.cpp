#include "cpanbridge/protocol/Json.hpp"
#include "cpanbridge/protocol/Message.hpp"

#include <cassert>
#include <string>

using namespace cpanbridge;
using namespace cpanbridge::protocol;

namespace {

bool decode_fails(const std::string& payload) {
    try {
        (void)decode_request(payload);
    } catch (const BridgeError& error) {
        assert(error.kind() == ErrorKind::Transport);
        return true;
    }
    return false;
}

}  // namespace

int main() {
    const auto full = decode_request(R"({"module":"test","function":"ping","params":{"x":1},"timestamp":1700000000.25})");
    assert(full.module == "test");
    assert(full.function == "ping");
    assert(full.params["x"].asInt64() == 1);
    assert(full.timestamp == 1700000000.25);

    // Missing and null params both mean an empty object.
    const auto bare = decode_request(R"({"module":"test","function":"ping"})");
    assert(bare.params.isObject());
    assert(bare.params.empty());
    const auto null_params = decode_request(R"({"module":"test","function":"ping","params":null})");
    assert(null_params.params.isObject());

    assert(decode_fails("not json"));
    assert(decode_fails("[1,2]"));
    assert(decode_fails(R"({"function":"ping"})"));
    assert(decode_fails(R"({"module":"test"})"));
    assert(decode_fails(R"({"module":"","function":"ping"})"));
    assert(decode_fails(R"({"module":7,"function":"ping"})"));
    assert(decode_fails(R"({"module":"test","function":"ping","params":[1]})"));

    Request request;
    request.module = "database";
    request.function = "connect";
    request.params["dsn"] = Value("dbi:SQLite:dbname=:memory:");
    request.timestamp = 12.5;
    const auto again = decode_request(encode_request(request));
    assert(again.module == request.module);
    assert(again.function == request.function);
    assert(again.params == request.params);

    Value result(Json::objectValue);
    result["message"] = Value("pong");
    const auto ok = encode_response(Response::ok(result));
    const auto ok_document = parse_json(ok);
    assert(ok_document["success"].asBool());
    assert(ok_document["result"]["message"].asString() == "pong");
    assert(find_member(ok_document, "error") == nullptr);

    const auto failed = encode_response(Response::failure(ErrorKind::Authorization, "Function x.y is not allowed"));
    const auto failed_document = parse_json(failed);
    assert(!failed_document["success"].asBool());
    assert(failed_document["error_type"].asString() == "authorization");
    assert(find_member(failed_document, "result") == nullptr);

    const auto decoded = decode_response(failed);
    assert(!decoded.success);
    assert(decoded.error_kind == ErrorKind::Authorization);
    assert(decoded.error == "Function x.y is not allowed");

    // A null result is reported as an empty object.
    const auto empty = decode_response(encode_response(Response::ok(Value())));
    assert(empty.success);
    assert(empty.result.isObject());

    // Bare scalar results pass through unchanged.
    const auto flag = decode_response(encode_response(Response::ok(Value(false))));
    assert(flag.success);
    assert(flag.result.isBool() && !flag.result.asBool());

    return 0;
}
