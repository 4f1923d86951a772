#include "bridge_fixture.hpp"

#include <cassert>
#include <cstdio>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace cpanbridge;
using cpanbridge::test::BridgeFixture;
using cpanbridge::test::flag;
using cpanbridge::test::integer;
using cpanbridge::test::text;

namespace {

constexpr const char* kCatalog =
    "<catalog>"
    "<book id=\"b1\" lang=\"en\"><title>First</title><price>10.50</price></book>"
    "<book id=\"b2\"><title>Second</title><price>7</price></book>"
    "</catalog>";

Value args(std::initializer_list<std::pair<const char*, std::string>> members) {
    Value params(Json::objectValue);
    for (const auto& [key, value] : members) {
        params[key] = Value(value);
    }
    return params;
}

class Dom {
public:
    explicit Dom(BridgeFixture& bridge) : bridge_(bridge) {}

    Value ok(const std::string& function, Value params) {
        auto response = bridge_.call("xml_dom", function, std::move(params));
        assert(response.success);
        return std::move(response.result);
    }

    ErrorKind fails(const std::string& function, Value params) {
        const auto response = bridge_.call("xml_dom", function, std::move(params));
        assert(!response.success);
        return response.error_kind;
    }

    std::string node(const std::string& function, Value params) {
        return text(ok(function, std::move(params)), "node_id");
    }

    std::string tag(const std::string& node_id) {
        return text(ok("get_tag_name", args({{"node_id", node_id}})), "tag_name");
    }

    std::int64_t child_count(const std::string& node_id) {
        return integer(ok("get_child_nodes", args({{"node_id", node_id}})), "length");
    }

    std::string serialize(const std::string& node_id) {
        return text(ok("to_string", args({{"node_id", node_id}})), "xml_string");
    }

private:
    BridgeFixture& bridge_;
};

Value xpath_ok(BridgeFixture& bridge, const std::string& function, Value params) {
    auto response = bridge.call("xpath", function, std::move(params));
    assert(response.success);
    return std::move(response.result);
}

ErrorKind xpath_fails(BridgeFixture& bridge, const std::string& function, Value params) {
    const auto response = bridge.call("xpath", function, std::move(params));
    assert(!response.success);
    return response.error_kind;
}

void xpath_module(BridgeFixture& bridge) {
    const auto loaded = xpath_ok(bridge, "load_xml_string", args({{"xml_string", kCatalog}}));
    const auto document = text(loaded, "document_id");
    assert(document.rfind("doc_", 0) == 0);
    assert(text(loaded, "root_node_id").rfind("node_", 0) == 0);

    const auto books = xpath_ok(bridge, "find_nodes", args({{"document_id", document}, {"xpath", "//book"}}));
    assert(integer(books, "size") == 2);
    const auto& first = books["nodes"][0];
    assert(first["name"].asString() == "book");
    assert(first["value"].asString() == "First10.50");
    assert(first["attributes"]["id"].asString() == "b1");
    assert(first["attributes"]["lang"].asString() == "en");
    assert(books["nodes"][1]["attributes"].size() == 1);

    const auto first_book = first["node_id"].asString();
    const auto titles = xpath_ok(bridge, "find_in_node", args({{"node_id", first_book}, {"xpath", "title"}}));
    assert(integer(titles, "size") == 1);
    assert(titles["nodes"][0]["value"].asString() == "First");
    assert(titles["nodes"][0]["attributes"].empty());

    const auto texts = xpath_ok(bridge, "find_nodes", args({{"document_id", document}, {"query", "//price/text()"}}));
    assert(integer(texts, "size") == 2);
    assert(texts["nodes"][1]["name"].asString() == "#text");
    assert(texts["nodes"][1]["value"].asString() == "7");

    // Attribute matches carry no node of their own.
    assert(integer(xpath_ok(bridge, "find_nodes", args({{"document_id", document}, {"xpath", "//book/@id"}})), "size") == 0);
    assert(integer(xpath_ok(bridge, "find_nodes", args({{"document_id", document}, {"xpath", "//missing"}})), "size") == 0);

    assert(xpath_fails(bridge, "find_nodes", args({{"document_id", document}, {"xpath", "count(//book)"}})) == ErrorKind::Validation);
    assert(xpath_fails(bridge, "find_nodes", args({{"document_id", document}, {"xpath", "///["}})) == ErrorKind::Validation);
    assert(xpath_fails(bridge, "load_xml_string", args({{"xml_string", "   "}})) == ErrorKind::Validation);
    assert(xpath_fails(bridge, "load_xml_string", args({{"xml_string", "<a><b></a>"}})) == ErrorKind::Execution);
    assert(xpath_fails(bridge, "load_file", args({{"filename", "/nonexistent/doc.xml"}})) == ErrorKind::Execution);

    {
        const std::string path = "/tmp/cpanbridge_xpath_test_" + std::to_string(::getpid()) + ".xml";
        {
            std::ofstream out(path);
            out << "<?xml version=\"1.0\"?>\n<servers><server name=\"a\"> alpha </server></servers>\n";
        }
        const auto from_file = xpath_ok(bridge, "load_file", args({{"filename", path}}));
        const auto servers = xpath_ok(bridge, "find_nodes",
                                      args({{"document_id", text(from_file, "document_id")}, {"xpath", "/servers/server"}}));
        assert(servers["nodes"][0]["value"].asString() == "alpha");
        assert(servers["nodes"][0]["attributes"]["name"].asString() == "a");
        std::remove(path.c_str());
    }

    const auto disposed = xpath_ok(bridge, "dispose_document", args({{"document_id", document}}));
    assert(flag(disposed, "disposed"));
    assert(integer(disposed, "nodes_cleaned") > 0);
    assert(xpath_fails(bridge, "find_in_node", args({{"node_id", first_book}, {"xpath", "title"}})) == ErrorKind::Handle);
    assert(xpath_fails(bridge, "find_nodes", args({{"document_id", document}, {"xpath", "//book"}})) == ErrorKind::Handle);
}

}  // namespace

int main() {
    BridgeFixture bridge;
    Dom dom(bridge);

    const auto parser = text(dom.ok("create_parser", Value(Json::objectValue)), "parser_id");
    assert(parser.rfind("parser_", 0) == 0);

    const auto parsed = dom.ok("parse_string", args({{"parser_id", parser}, {"xml_string", kCatalog}}));
    const auto document = text(parsed, "document_id");
    const auto root = text(parsed, "root_node_id");
    assert(document.rfind("doc_", 0) == 0);
    assert(root.rfind("node_", 0) == 0);

    // The same native node always maps to the same handle.
    assert(text(dom.ok("get_document_root", args({{"document_id", document}})), "root_node_id") == root);
    assert(dom.tag(root) == "catalog");

    const auto books = dom.ok("get_elements_by_tag_name", args({{"document_id", document}, {"tag_name", "book"}}));
    assert(integer(books, "length") == 2);
    const auto nodelist = text(books, "nodelist_id");
    assert(nodelist.rfind("nodelist_", 0) == 0);
    assert(integer(dom.ok("get_nodelist_length", args({{"nodelist_id", nodelist}})), "length") == 2);

    Value item = args({{"nodelist_id", nodelist}});
    item["index"] = Value(0);
    const auto first_book = dom.node("get_nodelist_item", item);
    item["index"] = Value(1);
    const auto second_book = dom.node("get_nodelist_item", item);
    item["index"] = Value(5);
    assert(dom.ok("get_nodelist_item", item)["node_id"].isNull());

    // Attributes.
    assert(text(dom.ok("get_attribute", args({{"node_id", first_book}, {"attr_name", "id"}})), "value") == "b1");
    assert(flag(dom.ok("has_attribute", args({{"node_id", first_book}, {"attr_name", "lang"}})), "has_attribute"));
    assert(flag(dom.ok("remove_attribute", args({{"node_id", first_book}, {"attr_name", "lang"}})), "removed"));
    assert(!flag(dom.ok("has_attribute", args({{"node_id", first_book}, {"attr_name", "lang"}})), "has_attribute"));
    dom.ok("set_attribute", args({{"node_id", first_book}, {"attr_name", "status"}, {"value", "sold"}}));
    assert(text(dom.ok("get_attribute", args({{"node_id", first_book}, {"name", "status"}})), "value") == "sold");
    assert(text(dom.ok("get_attribute", args({{"node_id", first_book}, {"attr_name", "missing"}})), "value").empty());
    assert(dom.fails("set_attribute", args({{"node_id", first_book}, {"attr_name", "1 bad"}})) == ErrorKind::Validation);

    // Navigation and text.
    const auto titles = dom.ok("get_elements_by_tag_name_from_node", args({{"node_id", first_book}, {"tag_name", "title"}}));
    assert(integer(titles, "length") == 1);
    const auto title = titles["node_ids"][0].asString();
    assert(text(dom.ok("get_text_contents", args({{"node_id", title}})), "text_content") == "First");
    assert(text(dom.ok("get_node_value", args({{"node_id", title}})), "value") == "First");
    assert(text(dom.ok("get_text_contents", args({{"node_id", second_book}})), "text_content") == "Second7");

    const auto title_text = dom.node("get_first_child", args({{"node_id", title}}));
    assert(dom.tag(title_text) == "#text");
    assert(!flag(dom.ok("is_element_node", args({{"node_id", title_text}})), "is_element"));
    assert(flag(dom.ok("is_element_node", args({{"node_id", title}})), "is_element"));
    assert(dom.node("get_parent_node", args({{"node_id", title}})) == first_book);
    assert(dom.ok("get_parent_node", args({{"node_id", root}}))["node_id"].isNull());
    assert(dom.child_count(root) == 2);

    // Building new content.
    const auto third_book = dom.node("create_element", args({{"document_id", document}, {"tag_name", "book"}}));
    const auto third_title = dom.node("create_element", args({{"document_id", document}, {"tag_name", "title"}}));
    const auto third_text = dom.node("create_text_node", args({{"document_id", document}, {"data", "Third"}}));
    dom.ok("append_child", args({{"parent_id", third_title}, {"child_id", third_text}}));
    dom.ok("append_child", args({{"parent_id", third_book}, {"child_id", third_title}}));
    dom.ok("append_child", args({{"parent_id", root}, {"child_id", third_book}}));
    assert(dom.child_count(root) == 3);
    assert(dom.serialize(third_book) == "<book><title>Third</title></book>");

    // A node cannot be placed inside itself.
    assert(dom.fails("append_child", args({{"parent_id", third_title}, {"child_id", third_book}})) == ErrorKind::Validation);

    const auto copy = dom.node("clone_node", args({{"node_id", second_book}}));
    assert(copy != second_book);
    assert(dom.serialize(copy).find("Second") != std::string::npos);
    dom.ok("insert_before", args({{"parent_id", root}, {"new_child_id", copy}, {"ref_child_id", first_book}}));
    assert(dom.node("get_first_child", args({{"node_id", root}})) == copy);
    assert(dom.child_count(root) == 4);

    assert(dom.node("remove_child", args({{"parent_id", root}, {"child_id", copy}})) == copy);
    assert(dom.child_count(root) == 3);
    assert(dom.fails("remove_child", args({{"parent_id", root}, {"child_id", copy}})) == ErrorKind::Validation);

    const auto magazine = dom.node("create_element", args({{"document_id", document}, {"tag_name", "magazine"}}));
    dom.ok("replace_child", args({{"parent_id", root}, {"new_child_id", magazine}, {"old_child_id", third_book}}));
    assert(dom.child_count(root) == 3);

    // XPath.
    assert(integer(dom.ok("xql_find_nodes", args({{"document_id", document}, {"xpath", "//magazine"}})), "length") == 1);
    assert(integer(dom.ok("xql_find_nodes", args({{"document_id", document}, {"xpath", "//book"}})), "length") == 2);
    assert(integer(dom.ok("xql_find_nodes", args({{"document_id", document}, {"xpath", "//book/@id"}})), "length") == 0);
    assert(integer(dom.ok("xql_find_nodes", args({{"node_id", first_book}, {"xpath", "title"}})), "length") == 1);
    assert(text(dom.ok("xql_find_value", args({{"document_id", document}, {"xpath", "/catalog/book[@id='b2']/price"}})), "value") == "7");
    assert(text(dom.ok("xql_find_value", args({{"document_id", document}, {"xpath", "count(//book)"}})), "value") == "2");
    assert(text(dom.ok("xql_find_value", args({{"document_id", document}, {"xpath", "//nothing"}})), "value").empty());
    assert(flag(dom.ok("xql_exists", args({{"document_id", document}, {"xpath", "//book[@id='b1']"}})), "exists"));
    assert(!flag(dom.ok("xql_exists", args({{"document_id", document}, {"xpath", "//nothing"}})), "exists"));
    assert(dom.fails("xql_find_nodes", args({{"document_id", document}, {"xpath", "///["}})) == ErrorKind::Validation);
    assert(dom.fails("xql_exists", args({{"document_id", document}})) == ErrorKind::Validation);

    const auto whole = text(dom.ok("to_string", args({{"document_id", document}})), "xml_string");
    assert(whole.find("<magazine/>") != std::string::npos);
    assert(whole.find("status=\"sold\"") != std::string::npos);

    // Nodes from another document are rejected.
    const auto other = dom.ok("parse_string", args({{"parser_id", parser}, {"xml_string", "<other/>"}}));
    const auto other_root = text(other, "root_node_id");
    assert(dom.fails("append_child", args({{"parent_id", root}, {"child_id", other_root}})) == ErrorKind::Validation);

    assert(dom.fails("parse_string", args({{"parser_id", parser}, {"xml_string", "<open><unclosed></open>"}})) == ErrorKind::Execution);
    assert(dom.fails("parse_file", args({{"parser_id", parser}, {"filename", "/nonexistent/doc.xml"}})) == ErrorKind::Execution);
    assert(dom.fails("get_tag_name", args({{"node_id", document}})) == ErrorKind::Handle);

    {
        const std::string path = "/tmp/cpanbridge_xml_test_" + std::to_string(::getpid()) + ".xml";
        {
            std::ofstream out(path);
            out << "<?xml version=\"1.0\"?>\n<config>\n  <entry key=\"a\">1</entry>\n</config>\n";
        }
        const auto from_file = dom.ok("parse_file", args({{"parser_id", parser}, {"filename", path}}));
        const auto config_root = text(from_file, "root_node_id");
        assert(dom.tag(config_root) == "config");
        // Whitespace text nodes are kept by default.
        assert(dom.child_count(config_root) == 3);

        Value compact(Json::objectValue);
        compact["options"]["keep_blanks"] = Value(false);
        const auto compact_parser = text(dom.ok("create_parser", compact), "parser_id");
        const auto stripped = dom.ok("parse_file", args({{"parser_id", compact_parser}, {"filename", path}}));
        assert(dom.child_count(text(stripped, "root_node_id")) == 1);
        std::remove(path.c_str());
    }

    // Disposing a document releases every handle derived from it.
    const auto disposed = dom.ok("dispose_document", args({{"document_id", document}}));
    assert(flag(disposed, "disposed"));
    assert(integer(disposed, "nodes_cleaned") > 0);
    assert(dom.fails("get_tag_name", args({{"node_id", root}})) == ErrorKind::Handle);
    assert(dom.fails("get_nodelist_length", args({{"nodelist_id", nodelist}})) == ErrorKind::Handle);
    assert(dom.fails("dispose_document", args({{"document_id", document}})) == ErrorKind::Handle);

    assert(flag(dom.ok("dispose_node", args({{"node_id", other_root}})), "disposed"));
    assert(dom.fails("get_tag_name", args({{"node_id", other_root}})) == ErrorKind::Handle);

    xpath_module(bridge);

    return 0;
}
