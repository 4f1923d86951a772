#include "cpanbridge/core/BridgeError.hpp"
#include "cpanbridge/core/Value.hpp"
#include "cpanbridge/protocol/Json.hpp"

#include <cassert>
#include <string>

using namespace cpanbridge;
using cpanbridge::protocol::JsonParseError;
using cpanbridge::protocol::parse_json;
using cpanbridge::protocol::to_json;

namespace {

bool rejects(const std::string& text) {
    try {
        (void)parse_json(text);
    } catch (const JsonParseError&) {
        return true;
    }
    return false;
}

bool is_ascii(const std::string& text) {
    for (const unsigned char c : text) {
        if (c >= 0x80) {
            return false;
        }
    }
    return true;
}

}  // namespace

int main() {
    const auto document = parse_json(R"({"name":"bridge","count":3,"ratio":0.5,"ok":true,"none":null,"list":[1,"two",[3]]})");
    assert(document.isObject());
    assert(document["name"].asString() == "bridge");
    assert(is_integer(document["count"]));
    assert(document["count"].asInt64() == 3);
    assert(document["ratio"].type() == Json::realValue);
    assert(!is_integer(document["ratio"]));
    assert(document["ratio"].asDouble() == 0.5);
    assert(document["ok"].asBool());
    assert(document["none"].isNull());
    assert(find_member(document, "missing") == nullptr);
    assert(find_member(document["name"], "name") == nullptr);
    const auto& list = document["list"];
    assert(list.isArray());
    assert(list.size() == 3);
    assert(list[1].asString() == "two");
    assert(list[2][0].asInt64() == 3);

    // Keys serialize in sorted order and re-parse to an equal value.
    const auto encoded = to_json(document);
    assert(encoded.find("\"count\":3") != std::string::npos);
    assert(encoded.find("\"count\"") < encoded.find("\"name\""));
    assert(parse_json(encoded) == document);

    const auto escaped = parse_json(R"("line\nbreak \"quoted\" é 😀")");
    assert(escaped.asString() == "line\nbreak \"quoted\" \xC3\xA9 \xF0\x9F\x98\x80");
    assert(is_ascii(to_json(escaped)));
    assert(parse_json(to_json(escaped)) == escaped);
    assert(to_json(Value("tab\there")) == "\"tab\\there\"");

    // Bytes that are not UTF-8 still serialize to a document the reader accepts.
    const auto raw = to_json(Value(std::string("abc \xff\xfe")));
    assert(is_ascii(raw));
    const auto reparsed = parse_json(raw);
    assert(reparsed.isString());
    const auto text = reparsed.asString();
    assert(text.size() > 4 && text.rfind("abc ", 0) == 0);
    assert(protocol::quote_json_string("a\"b") == "\"a\\\"b\"");

    assert(to_json(Value(static_cast<std::int64_t>(-42))) == "-42");
    assert(parse_json("-1.5e2").asDouble() == -150.0);
    assert(parse_json("2.0").type() == Json::realValue);

    assert(rejects(""));
    assert(rejects("{"));
    assert(rejects("{\"a\":1,}"));
    assert(rejects("[1 2]"));
    assert(rejects("tru"));
    assert(rejects("{} trailing"));
    assert(rejects("\"unterminated"));
    assert(rejects("{\"a\":1,\"a\":2}"));
    assert(rejects("// comment\n{}"));
    assert(rejects(std::string(2000, '[')));

    Value built(Json::objectValue);
    built["nested"]["deeper"] = Value(true);
    built["items"].append(Value("a"));
    built["items"].append(Value(static_cast<std::int64_t>(7)));
    assert(to_json(built) == R"({"items":["a",7],"nested":{"deeper":true}})");
    assert(string_array({"x", "y"}).size() == 2);

    Value request = parse_json(R"({"s":"text","i":9,"b":false,"big":18446744073709551615,"f":4.0})");
    assert(params::require_string(request, "s") == "text");
    assert(params::integer_or(request, "i", 0) == 9);
    assert(params::integer_or(request, "absent", 4) == 4);
    assert(params::integer_or(request, "f", 0) == 4);
    assert(!params::boolean_or(request, "b", true));
    assert(!params::optional_string(request, "absent").has_value());
    assert(params::require_string(request, "i") == "9");
    assert(params::require_string(request, "big") == "18446744073709551615");
    bool threw = false;
    try {
        (void)params::require_string(request, "b");
    } catch (const BridgeError& error) {
        threw = error.kind() == ErrorKind::Validation;
    }
    assert(threw);
    threw = false;
    try {
        (void)params::integer_or(request, "big", 0);
    } catch (const BridgeError& error) {
        threw = error.kind() == ErrorKind::Validation;
    }
    assert(threw);

    // Member access on a non-object params value reports absence instead of failing.
    const Value scalar("not an object");
    assert(params::member(scalar, "s").isNull());
    assert(params::string_or(scalar, "s", "fallback") == "fallback");

    return 0;
}
