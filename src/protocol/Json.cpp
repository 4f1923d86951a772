#include "cpanbridge/protocol/Json.hpp"

#include <memory>

namespace cpanbridge::protocol {

namespace {

// Request shape limits are enforced later by the validator.
constexpr int kMaxParseDepth = 512;

Json::CharReaderBuilder make_reader_builder() {
    Json::CharReaderBuilder builder;
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    // Scalars are valid documents; callers check the root type themselves.
    builder["strictRoot"] = false;
    builder["stackLimit"] = kMaxParseDepth;
    return builder;
}

Json::StreamWriterBuilder make_writer_builder() {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = false;
    builder["precision"] = 16;
    return builder;
}

std::string trim_errors(const std::string& errors) {
    auto text = errors;
    while (!text.empty() && (text.back() == '\n' || text.back() == ' ')) {
        text.pop_back();
    }
    return text.empty() ? std::string("Invalid JSON") : text;
}

}  // namespace

Value parse_json(std::string_view text) {
    static const Json::CharReaderBuilder builder = make_reader_builder();
    const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Value root;
    std::string errors;
    bool parsed = false;
    try {
        parsed = reader->parse(text.data(), text.data() + text.size(), &root, &errors);
    } catch (const Json::Exception& ex) {
        throw JsonParseError(ex.what());
    }
    if (!parsed) {
        throw JsonParseError(trim_errors(errors));
    }
    return root;
}

std::string to_json(const Value& value) {
    static const Json::StreamWriterBuilder builder = make_writer_builder();
    return Json::writeString(builder, value);
}

std::string quote_json_string(std::string_view value) {
    return to_json(Value(std::string(value)));
}

}  // namespace cpanbridge::protocol
