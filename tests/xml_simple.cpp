#include "bridge_fixture.hpp"

#include <cassert>
#include <cstdio>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace cpanbridge;
using cpanbridge::test::BridgeFixture;

namespace {

Value source(const std::string& xml) {
    Value params(Json::objectValue);
    params["source"] = Value(xml);
    return params;
}

Value read_xml(BridgeFixture& bridge, Value params) {
    auto response = bridge.call("xml", "xml_in", std::move(params));
    assert(response.success);
    return std::move(response.result);
}

std::string write_xml(BridgeFixture& bridge, Value params) {
    const auto response = bridge.call("xml", "xml_out", std::move(params));
    assert(response.success);
    assert(response.result.isString());
    return response.result.asString();
}

ErrorKind failure(BridgeFixture& bridge, const std::string& function, Value params) {
    const auto response = bridge.call("xml", function, std::move(params));
    assert(!response.success);
    return response.error_kind;
}

}  // namespace

int main() {
    BridgeFixture bridge;

    // Children fold into members, repeated tags into arrays.
    const auto config = read_xml(bridge, source(
        "<config><name>demo</name><port>8080</port>"
        "<server id=\"a\">primary</server><server id=\"b\"/></config>"));
    assert(config.isObject());
    assert(config["name"].asString() == "demo");
    assert(config["port"].asString() == "8080");
    assert(config["server"].isArray());
    assert(config["server"].size() == 2);
    assert(config["server"][0]["@id"].asString() == "a");
    assert(config["server"][0]["content"].asString() == "primary");
    assert(config["server"][1]["@id"].asString() == "b");
    assert(!config.isMember("config"));

    // Text-only roots collapse to a string.
    assert(read_xml(bridge, source("<note>  just text </note>")).asString() == "just text");

    const auto mixed = read_xml(bridge, source("<r>hello<b>1</b></r>"));
    assert(mixed["b"].asString() == "1");
    assert(mixed["content"].asString() == "hello");

    {
        auto params = source("<wrapper><inner><a>1</a></inner></wrapper>");
        params["options"]["KeepRoot"] = Value(false);
        const auto unwrapped = read_xml(bridge, params);
        assert(unwrapped["a"].asString() == "1");
        assert(!unwrapped.isMember("inner"));
    }

    // Empty elements: null by default, otherwise the SuppressEmpty value's shape.
    {
        const std::string xml = "<r><empty/><x>1</x></r>";
        assert(read_xml(bridge, source(xml))["empty"].isNull());

        auto blank = source(xml);
        blank["options"]["SuppressEmpty"] = Value("");
        const auto as_blank = read_xml(bridge, blank);
        assert(as_blank["empty"].isString());
        assert(as_blank["empty"].asString().empty());

        auto kept = source(xml);
        kept["options"]["SuppressEmpty"] = Value(1);
        const auto as_object = read_xml(bridge, kept);
        assert(as_object["empty"].isObject());
        assert(as_object["empty"].empty());

        auto attributed = source("<r><flag on=\"yes\"/></r>");
        attributed["options"]["SuppressEmpty"] = Value("");
        assert(read_xml(bridge, attributed)["flag"]["@on"].asString() == "yes");
    }

    {
        const std::string path = "/tmp/cpanbridge_xml_simple_" + std::to_string(::getpid()) + ".xml";
        {
            std::ofstream out(path);
            out << "<?xml version=\"1.0\"?>\n<settings>\n  <mode>fast</mode>\n</settings>\n";
        }
        assert(read_xml(bridge, source(path))["mode"].asString() == "fast");

        auto explicit_type = source(path);
        explicit_type["source_type"] = Value("file");
        assert(read_xml(bridge, explicit_type)["mode"].asString() == "fast");
        std::remove(path.c_str());
    }

    assert(failure(bridge, "xml_in", source("/nonexistent/settings.xml")) == ErrorKind::Execution);
    assert(failure(bridge, "xml_in", source("http://example.com/feed.xml")) == ErrorKind::Validation);
    {
        auto handle = source("<a/>");
        handle["source_type"] = Value("filehandle");
        assert(failure(bridge, "xml_in", handle) == ErrorKind::Validation);
        handle["source_type"] = Value("socket");
        assert(failure(bridge, "xml_in", handle) == ErrorKind::Validation);
    }
    {
        const auto broken = bridge.call("xml", "xml_in", source("<a><b></a>"));
        assert(!broken.success);
        assert(broken.error_kind == ErrorKind::Execution);
        assert(broken.error.find("XML Parse Error") != std::string::npos);
    }
    {
        auto bad_options = source("<a/>");
        bad_options["options"] = Value("KeepRoot");
        assert(failure(bridge, "xml_in", bad_options) == ErrorKind::Validation);
    }
    assert(failure(bridge, "xml_in", Value(Json::objectValue)) == ErrorKind::Validation);

    // Generation.
    assert(write_xml(bridge, Value(Json::objectValue)) == "<opt/>");
    {
        Value params(Json::objectValue);
        params["data"]["name"] = Value("demo");
        params["data"]["@version"] = Value(2);
        params["data"]["items"].append(Value("a"));
        params["data"]["items"].append(Value("b"));
        params["data"]["note"] = Value("x < y");
        params["options"]["RootName"] = Value("config");
        const auto xml = write_xml(bridge, params);
        assert(xml.rfind("<config version=\"2\">", 0) == 0);
        assert(xml.find("<items>a</items><items>b</items>") != std::string::npos);
        assert(xml.find("<name>demo</name>") != std::string::npos);
        assert(xml.find("<note>x &lt; y</note>") != std::string::npos);
        assert(xml.find("<?xml") == std::string::npos);

        params["options"]["XMLDecl"] = Value(true);
        const auto declared = write_xml(bridge, params);
        assert(declared.rfind("<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<config", 0) == 0);

        // What xml_out writes, xml_in reads back.
        const auto reread = read_xml(bridge, source(xml));
        assert(reread["name"].asString() == "demo");
        assert(reread["@version"].asString() == "2");
        assert(reread["items"].size() == 2);
    }
    {
        Value params(Json::objectValue);
        params["data"]["x"] = Value(1);
        params["options"]["RootName"] = Value("bad name");
        assert(failure(bridge, "xml_out", params) == ErrorKind::Validation);

        Value nested(Json::objectValue);
        nested["data"]["@attr"]["inner"] = Value(1);
        assert(failure(bridge, "xml_out", nested) == ErrorKind::Validation);
    }

    // Escaping.
    {
        Value params(Json::objectValue);
        params["value"] = Value("<a href=\"x\">&'");
        const auto escaped = bridge.call("xml", "escape_xml", params);
        assert(escaped.success);
        assert(escaped.result.asString() == "&lt;a href=&quot;x&quot;&gt;&amp;&apos;");

        params["value"] = escaped.result;
        const auto restored = bridge.call("xml", "unescape_xml", params);
        assert(restored.success);
        assert(restored.result.asString() == "<a href=\"x\">&'");

        params["value"] = Value("&amp;lt;");
        assert(bridge.call("xml", "unescape_xml", params).result.asString() == "&lt;");
    }

    assert(failure(bridge, "parse_everything", Value(Json::objectValue)) == ErrorKind::Authorization);

    return 0;
}
