#include "cpanbridge/handlers/XmlDomHandler.hpp"

#include "cpanbridge/daemon/StructuredLogger.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>
#include <libxml/xpath.h>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <map>
#include <mutex>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace cpanbridge::handlers {

using daemon::StructuredLogger;
using daemon::log_event;

namespace {

const xmlChar* to_xml(const std::string& text) {
    return reinterpret_cast<const xmlChar*>(text.c_str());
}

std::string from_xml(const xmlChar* text) {
    return text ? std::string(reinterpret_cast<const char*>(text)) : std::string{};
}

struct XmlFreeDeleter {
    void operator()(xmlChar* text) const {
        if (text != nullptr) {
            xmlFree(text);
        }
    }
};
using UniqueXmlString = std::unique_ptr<xmlChar, XmlFreeDeleter>;

std::string take_string(xmlChar* raw) {
    UniqueXmlString owned(raw);
    return from_xml(owned.get());
}

struct ParserContextDeleter {
    void operator()(xmlParserCtxt* ctxt) const {
        if (ctxt != nullptr) {
            xmlFreeParserCtxt(ctxt);
        }
    }
};
using UniqueParserContext = std::unique_ptr<xmlParserCtxt, ParserContextDeleter>;

struct XPathContextDeleter {
    void operator()(xmlXPathContext* ctx) const {
        if (ctx != nullptr) {
            xmlXPathFreeContext(ctx);
        }
    }
};
using UniqueXPathContext = std::unique_ptr<xmlXPathContext, XPathContextDeleter>;

struct XPathObjectDeleter {
    void operator()(xmlXPathObject* object) const {
        if (object != nullptr) {
            xmlXPathFreeObject(object);
        }
    }
};
using UniqueXPathObject = std::unique_ptr<xmlXPathObject, XPathObjectDeleter>;

void discard_libxml_message(void*, const char*, ...) {}

// libxml2 keeps its error callback per thread; dispatch threads come and go.
void silence_libxml_errors() {
    xmlSetGenericErrorFunc(nullptr, &discard_libxml_message);
}

// Native tree shared by a document handle and every node handle into it.
// Nodes unlinked from the tree are tracked so they can be freed with it.
struct XmlDocument {
    xmlDocPtr doc{nullptr};
    std::mutex mutex;
    std::unordered_set<xmlNodePtr> detached;
    std::unordered_map<xmlNodePtr, std::string> node_ids;

    XmlDocument() = default;
    XmlDocument(const XmlDocument&) = delete;
    XmlDocument& operator=(const XmlDocument&) = delete;

    ~XmlDocument() {
        // Collect first: freeing a detached root also frees detached nodes below it.
        std::vector<xmlNodePtr> roots;
        for (auto* node : detached) {
            if (node->parent == nullptr) {
                roots.push_back(node);
            }
        }
        for (auto* node : roots) {
            xmlFreeNode(node);
        }
        if (doc != nullptr) {
            xmlFreeDoc(doc);
        }
    }
};

using XmlDocumentPtr = std::shared_ptr<XmlDocument>;

constexpr int kDefaultParseOptions = XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING;

struct ParserState final : NativeState {
    int options{kDefaultParseOptions};
    bool keep_blanks{true};
};

struct DocumentState final : NativeState {
    XmlDocumentPtr document;
    std::string source;
};

struct NodeState final : NativeState {
    XmlDocumentPtr document;
    xmlNodePtr node{nullptr};  // guarded by document->mutex
};

struct NodeListState final : NativeState {
    XmlDocumentPtr document;
    std::vector<std::string> node_ids;
};

std::string qualified_name(xmlNodePtr node) {
    std::string name = from_xml(node->name);
    if (node->ns != nullptr && node->ns->prefix != nullptr) {
        name = from_xml(node->ns->prefix) + ":" + name;
    }
    return name;
}

bool matches_tag(xmlNodePtr node, const std::string& tag) {
    return node->type == XML_ELEMENT_NODE && (tag == "*" || qualified_name(node) == tag);
}

void collect_elements(xmlNodePtr node, const std::string& tag, std::vector<xmlNodePtr>& out) {
    for (xmlNodePtr child = node->children; child != nullptr; child = child->next) {
        if (matches_tag(child, tag)) {
            out.push_back(child);
        }
        if (child->type == XML_ELEMENT_NODE) {
            collect_elements(child, tag, out);
        }
    }
}

bool is_ancestor_or_self(xmlNodePtr candidate, xmlNodePtr node) {
    for (xmlNodePtr current = node; current != nullptr; current = current->parent) {
        if (current == candidate) {
            return true;
        }
    }
    return false;
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string parse_error_message(xmlParserCtxtPtr ctxt, const std::string& fallback) {
    const xmlError* error = ctxt ? xmlCtxtGetLastError(ctxt) : nullptr;
    if (error == nullptr || error->message == nullptr) {
        return fallback;
    }
    std::string message = trim(error->message);
    if (error->line > 0) {
        message = "line " + std::to_string(error->line) + ": " + message;
    }
    return message;
}

void require_element(xmlNodePtr node, const std::string& id) {
    if (node->type != XML_ELEMENT_NODE) {
        throw_validation_error("Node " + id + " is not an element");
    }
}

void require_name(const std::string& name) {
    if (name.empty() || xmlValidateName(to_xml(name), 0) != 0) {
        throw_validation_error("Invalid XML name: " + name);
    }
}

}  // namespace

// One engine serves both the "xml_dom" and "xpath" modules; |module| picks
// the operation table.
class XmlEngine {
public:
    using Operation = Value (XmlEngine::*)(const Value&, HandlerContext&);

    explicit XmlEngine(std::string module)
        : module_(std::move(module)) {
        xmlInitParser();
        if (module_ == "xpath") {
            operations_ = {
                {"load_file", &XmlEngine::load_file},
                {"load_xml_string", &XmlEngine::load_xml_string},
                {"find_nodes", &XmlEngine::find_nodes},
                {"find_in_node", &XmlEngine::find_in_node},
                {"dispose_document", &XmlEngine::dispose_document},
            };
            return;
        }
        operations_ = {
            {"create_parser", &XmlEngine::create_parser},
            {"parse_string", &XmlEngine::parse_string},
            {"parse_file", &XmlEngine::parse_file},
            {"get_document_root", &XmlEngine::get_document_root},
            {"get_elements_by_tag_name", &XmlEngine::get_elements_by_tag_name},
            {"get_elements_by_tag_name_from_node", &XmlEngine::get_elements_by_tag_name_from_node},
            {"get_nodelist_length", &XmlEngine::get_nodelist_length},
            {"get_nodelist_item", &XmlEngine::get_nodelist_item},
            {"get_child_nodes", &XmlEngine::get_child_nodes},
            {"get_first_child", &XmlEngine::get_first_child},
            {"get_parent_node", &XmlEngine::get_parent_node},
            {"get_tag_name", &XmlEngine::get_tag_name},
            {"get_node_value", &XmlEngine::get_node_value},
            {"get_text_contents", &XmlEngine::get_text_contents},
            {"is_element_node", &XmlEngine::is_element_node},
            {"get_attribute", &XmlEngine::get_attribute},
            {"set_attribute", &XmlEngine::set_attribute},
            {"has_attribute", &XmlEngine::has_attribute},
            {"remove_attribute", &XmlEngine::remove_attribute},
            {"create_element", &XmlEngine::create_element},
            {"create_text_node", &XmlEngine::create_text_node},
            {"append_child", &XmlEngine::append_child},
            {"remove_child", &XmlEngine::remove_child},
            {"replace_child", &XmlEngine::replace_child},
            {"insert_before", &XmlEngine::insert_before},
            {"clone_node", &XmlEngine::clone_node},
            {"to_string", &XmlEngine::to_string},
            {"xql_find_nodes", &XmlEngine::xql_find_nodes},
            {"xql_find_value", &XmlEngine::xql_find_value},
            {"xql_exists", &XmlEngine::xql_exists},
            {"dispose_document", &XmlEngine::dispose_document},
            {"dispose_node", &XmlEngine::dispose_node},
        };
    }

    std::vector<std::string> names() const {
        std::vector<std::string> result;
        for (const auto& [name, _] : operations_) {
            result.push_back(name);
        }
        return result;
    }

    Value invoke(const std::string& function, const Value& params, HandlerContext& context) {
        const auto it = operations_.find(function);
        if (it == operations_.end()) {
            throw_validation_error("Unknown " + module_ + " function: " + function);
        }
        silence_libxml_errors();
        return (this->*(it->second))(params, context);
    }

private:
    struct NodeRef {
        HandlePtr handle;
        NodeState* state;

        xmlNodePtr node() const { return state->node; }
        XmlDocument& document() const { return *state->document; }
        const std::string& document_id() const { return handle->parent(); }
    };

    static NodeRef node_param(const Value& params, std::string_view key, HandlerContext& context) {
        auto handle = context.acquire(params::require_string(params, key), HandleKind::DomNode);
        auto* state = &handle->state_as<NodeState>();
        return {std::move(handle), state};
    }

    // Returns the handle id for |node|, reusing a live one. Caller holds the document mutex.
    static std::string node_id_for(HandlerContext& context,
                                   const std::string& document_id,
                                   const XmlDocumentPtr& document,
                                   xmlNodePtr node) {
        const auto it = document->node_ids.find(node);
        if (it != document->node_ids.end()) {
            auto existing = context.pool().get(it->second);
            if (existing && existing->kind() == HandleKind::DomNode && existing->state_as<NodeState>().node == node) {
                existing->touch();
                return it->second;
            }
        }
        auto state = std::make_unique<NodeState>();
        state->document = document;
        state->node = node;
        auto id = context.create(HandleKind::DomNode, std::move(state), document_id);
        document->node_ids[node] = id;
        return id;
    }

    static Value node_value(HandlerContext& context, const NodeRef& ref, xmlNodePtr node) {
        return node ? Value(node_id_for(context, ref.document_id(), ref.state->document, node)) : Value{};
    }

    static Value make_nodelist(HandlerContext& context,
                               const std::string& document_id,
                               const XmlDocumentPtr& document,
                               const std::vector<xmlNodePtr>& nodes) {
        std::vector<std::string> ids;
        ids.reserve(nodes.size());
        for (auto* node : nodes) {
            ids.push_back(node_id_for(context, document_id, document, node));
        }
        auto state = std::make_unique<NodeListState>();
        state->document = document;
        state->node_ids = ids;

        Value result(Json::objectValue);
        result["node_ids"] = string_array(ids);
        result["length"] = Value(static_cast<std::uint64_t>(ids.size()));
        result["nodelist_id"] = Value(context.create(HandleKind::DomNodeList, std::move(state), document_id));
        return result;
    }

    // libxml2 frees a text node that it merges into an adjacent one; keep the
    // handle that named it pointing at the surviving node.
    static void track_insertion(HandlerContext& context, XmlDocument& document, xmlNodePtr inserted, xmlNodePtr result) {
        if (result == nullptr) {
            throw_execution_error("libxml2 refused to insert node");
        }
        if (result == inserted) {
            return;
        }
        document.detached.erase(inserted);
        const auto it = document.node_ids.find(inserted);
        if (it == document.node_ids.end()) {
            return;
        }
        const std::string id = it->second;
        document.node_ids.erase(it);
        if (auto handle = context.pool().get(id)) {
            handle->state_as<NodeState>().node = result;
            document.node_ids.emplace(result, id);
        }
    }

    static void require_same_document(const NodeRef& a, const NodeRef& b) {
        if (a.state->document != b.state->document) {
            throw_validation_error("Nodes " + a.handle->id() + " and " + b.handle->id() + " belong to different documents");
        }
    }

    static void require_child_of(const NodeRef& child, const NodeRef& parent) {
        if (child.node()->parent != parent.node()) {
            throw_validation_error("Node " + child.handle->id() + " is not a child of " + parent.handle->id());
        }
    }

    static void require_insertable(const NodeRef& parent, const NodeRef& child) {
        require_element(parent.node(), parent.handle->id());
        if (is_ancestor_or_self(child.node(), parent.node())) {
            throw_validation_error("Cannot insert node " + child.handle->id() + " into its own subtree");
        }
        if (child.node()->type == XML_DOCUMENT_NODE || child.node()->type == XML_ATTRIBUTE_NODE) {
            throw_validation_error("Node " + child.handle->id() + " cannot be inserted as a child");
        }
    }

    Value create_parser(const Value& params, HandlerContext& context) {
        const auto* options = find_member(params, "options");
        const Value& settings = options && options->isObject() ? *options : params;

        auto state = std::make_unique<ParserState>();
        state->keep_blanks = params::boolean_or(settings, "keep_blanks", true);
        if (!state->keep_blanks) {
            state->options |= XML_PARSE_NOBLANKS;
        }

        Value result(Json::objectValue);
        result["options"]["keep_blanks"] = Value(state->keep_blanks);
        result["parser_id"] = Value(context.create(HandleKind::DomParser, std::move(state)));
        return result;
    }

    Value parse_string(const Value& params, HandlerContext& context) {
        auto parser = context.acquire(params::require_string(params, "parser_id"), HandleKind::DomParser);
        const auto xml = params::require_string(params, "xml_string");
        const auto& settings = parser->state_as<ParserState>();

        UniqueParserContext ctxt(xmlNewParserCtxt());
        if (!ctxt) {
            throw BridgeError(ErrorKind::Resource, "Cannot allocate XML parser");
        }
        xmlDocPtr doc = xmlCtxtReadMemory(ctxt.get(), xml.data(), static_cast<int>(xml.size()), nullptr, nullptr, settings.options);
        if (doc == nullptr) {
            throw_execution_error("XML parse error: " + parse_error_message(ctxt.get(), "document is not well-formed"));
        }
        return register_document(context, doc, "string");
    }

    Value parse_file(const Value& params, HandlerContext& context) {
        auto parser = context.acquire(params::require_string(params, "parser_id"), HandleKind::DomParser);
        const auto filename = params::require_string(params, "filename");
        const auto& settings = parser->state_as<ParserState>();

        UniqueParserContext ctxt(xmlNewParserCtxt());
        if (!ctxt) {
            throw BridgeError(ErrorKind::Resource, "Cannot allocate XML parser");
        }
        xmlDocPtr doc = xmlCtxtReadFile(ctxt.get(), filename.c_str(), nullptr, settings.options);
        if (doc == nullptr) {
            throw_execution_error("XML parse error in " + filename + ": " + parse_error_message(ctxt.get(), "cannot read file"));
        }
        return register_document(context, doc, filename);
    }

    static Value register_document(HandlerContext& context, xmlDocPtr doc, std::string source) {
        auto document = std::make_shared<XmlDocument>();
        document->doc = doc;
        if (xmlDocGetRootElement(doc) == nullptr) {
            throw_execution_error("XML parse error: document has no root element");
        }

        auto state = std::make_unique<DocumentState>();
        state->document = document;
        state->source = std::move(source);
        const auto document_id = context.create(HandleKind::DomDocument, std::move(state));

        std::scoped_lock guard(document->mutex);
        Value result(Json::objectValue);
        result["document_id"] = Value(document_id);
        result["root_node_id"] = Value(node_id_for(context, document_id, document, xmlDocGetRootElement(doc)));
        return result;
    }

    Value get_document_root(const Value& params, HandlerContext& context) {
        const auto document_id = params::require_string(params, "document_id");
        auto handle = context.acquire(document_id, HandleKind::DomDocument);
        const auto& document = handle->state_as<DocumentState>().document;
        std::scoped_lock guard(document->mutex);
        xmlNodePtr root = xmlDocGetRootElement(document->doc);

        Value result(Json::objectValue);
        result["root_node_id"] = root ? Value(node_id_for(context, document_id, document, root)) : Value{};
        return result;
    }

    Value get_elements_by_tag_name(const Value& params, HandlerContext& context) {
        const auto document_id = params::require_string(params, "document_id");
        const auto tag = params::require_string(params, "tag_name");
        auto handle = context.acquire(document_id, HandleKind::DomDocument);
        const auto& document = handle->state_as<DocumentState>().document;
        std::scoped_lock guard(document->mutex);

        std::vector<xmlNodePtr> nodes;
        if (xmlNodePtr root = xmlDocGetRootElement(document->doc)) {
            if (matches_tag(root, tag)) {
                nodes.push_back(root);
            }
            collect_elements(root, tag, nodes);
        }
        return make_nodelist(context, document_id, document, nodes);
    }

    Value get_elements_by_tag_name_from_node(const Value& params, HandlerContext& context) {
        const auto tag = params::require_string(params, "tag_name");
        auto ref = node_param(params, "node_id", context);
        std::scoped_lock guard(ref.document().mutex);

        std::vector<xmlNodePtr> nodes;
        collect_elements(ref.node(), tag, nodes);
        return make_nodelist(context, ref.document_id(), ref.state->document, nodes);
    }

    Value get_nodelist_length(const Value& params, HandlerContext& context) {
        auto handle = context.acquire(params::require_string(params, "nodelist_id"), HandleKind::DomNodeList);
        Value result(Json::objectValue);
        result["length"] = Value(static_cast<std::uint64_t>(handle->state_as<NodeListState>().node_ids.size()));
        return result;
    }

    Value get_nodelist_item(const Value& params, HandlerContext& context) {
        auto handle = context.acquire(params::require_string(params, "nodelist_id"), HandleKind::DomNodeList);
        const auto index = params::require_integer(params, "index");
        const auto& ids = handle->state_as<NodeListState>().node_ids;

        Value result(Json::objectValue);
        if (index < 0 || static_cast<std::size_t>(index) >= ids.size()) {
            result["node_id"] = Value{};
            return result;
        }
        const auto& id = ids[static_cast<std::size_t>(index)];
        context.pool().touch(id);
        result["node_id"] = Value(id);
        return result;
    }

    Value get_child_nodes(const Value& params, HandlerContext& context) {
        auto ref = node_param(params, "node_id", context);
        std::scoped_lock guard(ref.document().mutex);
        std::vector<xmlNodePtr> nodes;
        for (xmlNodePtr child = ref.node()->children; child != nullptr; child = child->next) {
            nodes.push_back(child);
        }
        return make_nodelist(context, ref.document_id(), ref.state->document, nodes);
    }

    Value get_first_child(const Value& params, HandlerContext& context) {
        auto ref = node_param(params, "node_id", context);
        std::scoped_lock guard(ref.document().mutex);
        Value result(Json::objectValue);
        result["node_id"] = node_value(context, ref, ref.node()->children);
        return result;
    }

    Value get_parent_node(const Value& params, HandlerContext& context) {
        auto ref = node_param(params, "node_id", context);
        std::scoped_lock guard(ref.document().mutex);
        xmlNodePtr parent = ref.node()->parent;
        if (parent != nullptr && parent->type == XML_DOCUMENT_NODE) {
            parent = nullptr;
        }
        Value result(Json::objectValue);
        result["node_id"] = node_value(context, ref, parent);
        return result;
    }

    Value get_tag_name(const Value& params, HandlerContext& context) {
        auto ref = node_param(params, "node_id", context);
        std::scoped_lock guard(ref.document().mutex);
        xmlNodePtr node = ref.node();
        std::string name;
        switch (node->type) {
            case XML_ELEMENT_NODE:
                name = qualified_name(node);
                break;
            case XML_TEXT_NODE:
                name = "#text";
                break;
            case XML_CDATA_SECTION_NODE:
                name = "#cdata-section";
                break;
            case XML_COMMENT_NODE:
                name = "#comment";
                break;
            default:
                name = from_xml(node->name);
                break;
        }
        Value result(Json::objectValue);
        result["tag_name"] = Value(name);
        return result;
    }

    // Elements report their leading text; character nodes their content.
    Value get_node_value(const Value& params, HandlerContext& context) {
        auto ref = node_param(params, "node_id", context);
        std::scoped_lock guard(ref.document().mutex);
        xmlNodePtr node = ref.node();
        std::string value;
        if (node->type == XML_ELEMENT_NODE) {
            xmlNodePtr first = node->children;
            if (first != nullptr && (first->type == XML_TEXT_NODE || first->type == XML_CDATA_SECTION_NODE)) {
                value = from_xml(first->content);
            }
        } else {
            value = take_string(xmlNodeGetContent(node));
        }
        Value result(Json::objectValue);
        result["value"] = Value(value);
        return result;
    }

    Value get_text_contents(const Value& params, HandlerContext& context) {
        auto ref = node_param(params, "node_id", context);
        const bool trimmed = params::boolean_or(params, "trim", false);
        std::scoped_lock guard(ref.document().mutex);
        auto content = take_string(xmlNodeGetContent(ref.node()));
        Value result(Json::objectValue);
        result["text_content"] = Value(trimmed ? trim(content) : content);
        return result;
    }

    Value is_element_node(const Value& params, HandlerContext& context) {
        auto ref = node_param(params, "node_id", context);
        std::scoped_lock guard(ref.document().mutex);
        Value result(Json::objectValue);
        result["is_element"] = Value(ref.node()->type == XML_ELEMENT_NODE);
        return result;
    }

    static std::string attribute_name(const Value& params) {
        auto name = params::first_string(params, {"attr_name", "name"});
        if (!name) {
            throw_validation_error("Missing required parameter: attr_name");
        }
        return *name;
    }

    Value get_attribute(const Value& params, HandlerContext& context) {
        auto ref = node_param(params, "node_id", context);
        const auto name = attribute_name(params);
        std::scoped_lock guard(ref.document().mutex);
        require_element(ref.node(), ref.handle->id());
        Value result(Json::objectValue);
        result["value"] = Value(take_string(xmlGetProp(ref.node(), to_xml(name))));
        return result;
    }

    Value set_attribute(const Value& params, HandlerContext& context) {
        auto ref = node_param(params, "node_id", context);
        const auto name = attribute_name(params);
        const auto value = params::string_or(params, "value", "");
        require_name(name);
        std::scoped_lock guard(ref.document().mutex);
        require_element(ref.node(), ref.handle->id());
        if (xmlSetProp(ref.node(), to_xml(name), to_xml(value)) == nullptr) {
            throw_execution_error("Cannot set attribute " + name);
        }
        Value result(Json::objectValue);
        result["attr_name"] = Value(name);
        result["value"] = Value(value);
        return result;
    }

    Value has_attribute(const Value& params, HandlerContext& context) {
        auto ref = node_param(params, "node_id", context);
        const auto name = attribute_name(params);
        std::scoped_lock guard(ref.document().mutex);
        require_element(ref.node(), ref.handle->id());
        Value result(Json::objectValue);
        result["has_attribute"] = Value(xmlHasProp(ref.node(), to_xml(name)) != nullptr);
        return result;
    }

    Value remove_attribute(const Value& params, HandlerContext& context) {
        auto ref = node_param(params, "node_id", context);
        const auto name = attribute_name(params);
        std::scoped_lock guard(ref.document().mutex);
        require_element(ref.node(), ref.handle->id());
        Value result(Json::objectValue);
        result["removed"] = Value(xmlUnsetProp(ref.node(), to_xml(name)) == 0);
        return result;
    }

    Value create_element(const Value& params, HandlerContext& context) {
        const auto document_id = params::require_string(params, "document_id");
        const auto tag = params::require_string(params, "tag_name");
        require_name(tag);
        auto handle = context.acquire(document_id, HandleKind::DomDocument);
        const auto& document = handle->state_as<DocumentState>().document;
        std::scoped_lock guard(document->mutex);

        xmlNodePtr node = xmlNewDocNode(document->doc, nullptr, to_xml(tag), nullptr);
        if (node == nullptr) {
            throw BridgeError(ErrorKind::Resource, "Cannot allocate element " + tag);
        }
        document->detached.insert(node);
        Value result(Json::objectValue);
        result["node_id"] = Value(node_id_for(context, document_id, document, node));
        return result;
    }

    Value create_text_node(const Value& params, HandlerContext& context) {
        const auto document_id = params::require_string(params, "document_id");
        const auto data = params::string_or(params, "data", "");
        auto handle = context.acquire(document_id, HandleKind::DomDocument);
        const auto& document = handle->state_as<DocumentState>().document;
        std::scoped_lock guard(document->mutex);

        xmlNodePtr node = xmlNewDocText(document->doc, to_xml(data));
        if (node == nullptr) {
            throw BridgeError(ErrorKind::Resource, "Cannot allocate text node");
        }
        document->detached.insert(node);
        Value result(Json::objectValue);
        result["node_id"] = Value(node_id_for(context, document_id, document, node));
        return result;
    }

    Value append_child(const Value& params, HandlerContext& context) {
        auto parent = node_param(params, "parent_id", context);
        auto child = node_param(params, "child_id", context);
        require_same_document(parent, child);
        std::scoped_lock guard(parent.document().mutex);
        require_insertable(parent, child);

        xmlNodePtr node = child.node();
        xmlUnlinkNode(node);
        track_insertion(context, parent.document(), node, xmlAddChild(parent.node(), node));
        return Value(Json::objectValue);
    }

    Value remove_child(const Value& params, HandlerContext& context) {
        auto parent = node_param(params, "parent_id", context);
        auto child = node_param(params, "child_id", context);
        require_same_document(parent, child);
        std::scoped_lock guard(parent.document().mutex);
        require_child_of(child, parent);

        xmlUnlinkNode(child.node());
        parent.document().detached.insert(child.node());
        Value result(Json::objectValue);
        result["node_id"] = Value(child.handle->id());
        return result;
    }

    Value replace_child(const Value& params, HandlerContext& context) {
        auto parent = node_param(params, "parent_id", context);
        auto replacement = node_param(params, "new_child_id", context);
        auto old_child = node_param(params, "old_child_id", context);
        require_same_document(parent, replacement);
        require_same_document(parent, old_child);
        std::scoped_lock guard(parent.document().mutex);
        require_child_of(old_child, parent);
        require_insertable(parent, replacement);

        Value result(Json::objectValue);
        result["node_id"] = Value(old_child.handle->id());
        if (replacement.node() == old_child.node()) {
            return result;
        }
        xmlUnlinkNode(replacement.node());
        xmlReplaceNode(old_child.node(), replacement.node());
        parent.document().detached.insert(old_child.node());
        return result;
    }

    // Appends when ref_child_id is absent.
    Value insert_before(const Value& params, HandlerContext& context) {
        auto parent = node_param(params, "parent_id", context);
        auto child = node_param(params, "new_child_id", context);
        require_same_document(parent, child);
        const auto ref_id = params::optional_string(params, "ref_child_id");
        if (!ref_id || ref_id->empty()) {
            std::scoped_lock guard(parent.document().mutex);
            require_insertable(parent, child);
            xmlNodePtr node = child.node();
            xmlUnlinkNode(node);
            track_insertion(context, parent.document(), node, xmlAddChild(parent.node(), node));
            return Value(Json::objectValue);
        }

        auto reference = node_param(params, "ref_child_id", context);
        require_same_document(parent, reference);
        std::scoped_lock guard(parent.document().mutex);
        require_child_of(reference, parent);
        require_insertable(parent, child);
        if (child.node() == reference.node()) {
            return Value(Json::objectValue);
        }
        xmlNodePtr node = child.node();
        xmlUnlinkNode(node);
        track_insertion(context, parent.document(), node, xmlAddPrevSibling(reference.node(), node));
        return Value(Json::objectValue);
    }

    Value clone_node(const Value& params, HandlerContext& context) {
        auto ref = node_param(params, "node_id", context);
        const bool deep = params::boolean_or(params, "deep", true);
        std::scoped_lock guard(ref.document().mutex);

        xmlNodePtr copy = xmlDocCopyNode(ref.node(), ref.document().doc, deep ? 1 : 2);
        if (copy == nullptr) {
            throw_execution_error("Cannot clone node " + ref.handle->id());
        }
        ref.document().detached.insert(copy);
        Value result(Json::objectValue);
        result["node_id"] = Value(node_id_for(context, ref.document_id(), ref.state->document, copy));
        return result;
    }

    Value to_string(const Value& params, HandlerContext& context) {
        const bool format = params::boolean_or(params, "format", params::boolean_or(params, "indent", false));
        Value result(Json::objectValue);

        if (const auto node_id = params::optional_string(params, "node_id")) {
            auto ref = node_param(params, "node_id", context);
            std::scoped_lock guard(ref.document().mutex);
            std::unique_ptr<xmlBuffer, decltype(&xmlBufferFree)> buffer(xmlBufferCreate(), &xmlBufferFree);
            if (!buffer) {
                throw BridgeError(ErrorKind::Resource, "Cannot allocate XML buffer");
            }
            if (xmlNodeDump(buffer.get(), ref.document().doc, ref.node(), 0, format ? 1 : 0) < 0) {
                throw_execution_error("Cannot serialize node " + *node_id);
            }
            result["xml_string"] = Value(from_xml(xmlBufferContent(buffer.get())));
            return result;
        }

        const auto document_id = params::require_string(params, "document_id");
        auto handle = context.acquire(document_id, HandleKind::DomDocument);
        const auto& document = handle->state_as<DocumentState>().document;
        std::scoped_lock guard(document->mutex);
        xmlChar* memory = nullptr;
        int size = 0;
        xmlDocDumpFormatMemoryEnc(document->doc, &memory, &size, "UTF-8", format ? 1 : 0);
        if (memory == nullptr) {
            throw_execution_error("Cannot serialize document " + document_id);
        }
        UniqueXmlString owned(memory);
        result["xml_string"] = Value(std::string(reinterpret_cast<const char*>(memory), static_cast<std::size_t>(size)));
        return result;
    }

    struct XPathTarget {
        HandlePtr handle;
        std::string document_id;
        XmlDocumentPtr document;
        xmlNodePtr node;
    };

    // Context is node_id when given, otherwise the document root.
    XPathTarget xpath_target(const Value& params, HandlerContext& context) {
        if (params::optional_string(params, "node_id")) {
            auto ref = node_param(params, "node_id", context);
            return {ref.handle, ref.document_id(), ref.state->document, nullptr};
        }
        const auto document_id = params::require_string(params, "document_id");
        auto handle = context.acquire(document_id, HandleKind::DomDocument);
        auto document = handle->state_as<DocumentState>().document;
        return {std::move(handle), document_id, std::move(document), nullptr};
    }

    static UniqueXPathObject evaluate(const XPathTarget& target, const std::string& expression) {
        UniqueXPathContext ctx(xmlXPathNewContext(target.document->doc));
        if (!ctx) {
            throw BridgeError(ErrorKind::Resource, "Cannot allocate XPath context");
        }
        ctx->node = target.node;
        UniqueXPathObject object(xmlXPathEval(to_xml(expression), ctx.get()));
        if (!object) {
            throw_validation_error("Invalid XPath expression: " + expression);
        }
        return object;
    }

    static std::string xpath_expression(const Value& params) {
        auto expression = params::first_string(params, {"xpath", "xpath_expression", "query"});
        if (!expression || expression->empty()) {
            throw_validation_error("Missing required parameter: xpath");
        }
        return *expression;
    }

    XPathTarget locked_target(XPathTarget target) {
        if (target.handle->kind() == HandleKind::DomNode) {
            target.node = target.handle->state_as<NodeState>().node;
        } else {
            target.node = xmlDocGetRootElement(target.document->doc);
        }
        return target;
    }

    Value xql_find_nodes(const Value& params, HandlerContext& context) {
        const auto expression = xpath_expression(params);
        auto target = xpath_target(params, context);
        std::scoped_lock guard(target.document->mutex);
        target = locked_target(std::move(target));
        auto object = evaluate(target, expression);

        std::vector<xmlNodePtr> nodes;
        if (object->type == XPATH_NODESET && object->nodesetval != nullptr) {
            for (int i = 0; i < object->nodesetval->nodeNr; ++i) {
                xmlNodePtr node = object->nodesetval->nodeTab[i];
                if (node->type == XML_ATTRIBUTE_NODE || node->type == XML_NAMESPACE_DECL || node->type == XML_DOCUMENT_NODE) {
                    continue;
                }
                nodes.push_back(node);
            }
        }
        Value result = make_nodelist(context, target.document_id, target.document, nodes);
        result["type"] = "nodelist";
        return result;
    }

    Value xql_find_value(const Value& params, HandlerContext& context) {
        const auto expression = xpath_expression(params);
        auto target = xpath_target(params, context);
        std::scoped_lock guard(target.document->mutex);
        target = locked_target(std::move(target));
        auto object = evaluate(target, expression);

        std::string value;
        if (object->type == XPATH_NODESET) {
            if (object->nodesetval != nullptr && object->nodesetval->nodeNr > 0) {
                value = take_string(xmlXPathCastNodeToString(object->nodesetval->nodeTab[0]));
            }
        } else {
            value = take_string(xmlXPathCastToString(object.get()));
        }
        Value result(Json::objectValue);
        result["value"] = Value(value);
        return result;
    }

    Value xql_exists(const Value& params, HandlerContext& context) {
        const auto expression = xpath_expression(params);
        auto target = xpath_target(params, context);
        std::scoped_lock guard(target.document->mutex);
        target = locked_target(std::move(target));
        auto object = evaluate(target, expression);

        bool exists = false;
        switch (object->type) {
            case XPATH_NODESET:
                exists = object->nodesetval != nullptr && object->nodesetval->nodeNr > 0;
                break;
            case XPATH_BOOLEAN:
                exists = object->boolval != 0;
                break;
            case XPATH_NUMBER:
                exists = !std::isnan(object->floatval) && object->floatval != 0.0;
                break;
            case XPATH_STRING:
                exists = object->stringval != nullptr && object->stringval[0] != '\0';
                break;
            default:
                break;
        }
        Value result(Json::objectValue);
        result["exists"] = Value(exists);
        return result;
    }

    Value dispose_document(const Value& params, HandlerContext& context) {
        const auto document_id = params::require_string(params, "document_id");
        context.acquire(document_id, HandleKind::DomDocument);
        const auto dependents = context.pool().children_of(document_id).size();
        context.pool().remove(document_id);

        log_event(StructuredLogger::Level::Debug,
                  "xml_dom.document_disposed",
                  {{"document_id", document_id}, {"handles", std::to_string(dependents)}});

        Value result(Json::objectValue);
        result["disposed"] = Value(true);
        result["nodes_cleaned"] = Value(static_cast<std::uint64_t>(dependents));
        return result;
    }

    Value dispose_node(const Value& params, HandlerContext& context) {
        const auto node_id = params::require_string(params, "node_id");
        context.acquire(node_id, HandleKind::DomNode);
        context.pool().remove(node_id);
        Value result(Json::objectValue);
        result["disposed"] = Value(true);
        return result;
    }

    Value load_file(const Value& params, HandlerContext& context) {
        const auto filename = params::require_string(params, "filename");
        std::error_code ec;
        if (!std::filesystem::is_regular_file(filename, ec)) {
            throw_execution_error("XML file not found: " + filename);
        }
        UniqueParserContext ctxt(xmlNewParserCtxt());
        if (!ctxt) {
            throw BridgeError(ErrorKind::Resource, "Cannot allocate XML parser");
        }
        xmlDocPtr doc = xmlCtxtReadFile(ctxt.get(), filename.c_str(), nullptr, kDefaultParseOptions);
        if (doc == nullptr) {
            throw_execution_error("XML syntax error in " + filename + ": " + parse_error_message(ctxt.get(), "cannot read file"));
        }
        return register_document(context, doc, filename);
    }

    Value load_xml_string(const Value& params, HandlerContext& context) {
        const auto xml = params::string_or(params, "xml_string", "");
        if (trim(xml).empty()) {
            throw_validation_error("Empty XML string provided");
        }
        UniqueParserContext ctxt(xmlNewParserCtxt());
        if (!ctxt) {
            throw BridgeError(ErrorKind::Resource, "Cannot allocate XML parser");
        }
        xmlDocPtr doc = xmlCtxtReadMemory(ctxt.get(), xml.data(), static_cast<int>(xml.size()), nullptr, nullptr, kDefaultParseOptions);
        if (doc == nullptr) {
            throw_execution_error("XML syntax error in string: " + parse_error_message(ctxt.get(), "document is not well-formed"));
        }
        return register_document(context, doc, "string");
    }

    Value find_nodes(const Value& params, HandlerContext& context) {
        const auto expression = xpath_expression(params);
        const auto document_id = params::require_string(params, "document_id");
        auto handle = context.acquire(document_id, HandleKind::DomDocument);
        XPathTarget target{handle, document_id, handle->state_as<DocumentState>().document, nullptr};
        std::scoped_lock guard(target.document->mutex);
        return describe_matches(context, locked_target(std::move(target)), expression);
    }

    Value find_in_node(const Value& params, HandlerContext& context) {
        const auto expression = xpath_expression(params);
        auto ref = node_param(params, "node_id", context);
        XPathTarget target{ref.handle, ref.document_id(), ref.state->document, nullptr};
        std::scoped_lock guard(target.document->mutex);
        return describe_matches(context, locked_target(std::move(target)), expression);
    }

    // Each match reports its name, attributes, node handle and a string value:
    // the element's own leading text, else its descendant text joined.
    // Caller holds the document mutex.
    Value describe_matches(HandlerContext& context, const XPathTarget& target, const std::string& expression) {
        auto object = evaluate(target, expression);
        if (object->type != XPATH_NODESET) {
            throw_validation_error("XPath expression does not select nodes: " + expression);
        }

        Value nodes(Json::arrayValue);
        const int count = object->nodesetval != nullptr ? object->nodesetval->nodeNr : 0;
        for (int i = 0; i < count; ++i) {
            xmlNodePtr node = object->nodesetval->nodeTab[i];
            if (node->type == XML_ATTRIBUTE_NODE || node->type == XML_NAMESPACE_DECL || node->type == XML_DOCUMENT_NODE) {
                continue;
            }
            Value entry(Json::objectValue);
            Value attributes(Json::objectValue);
            if (node->type == XML_ELEMENT_NODE) {
                entry["name"] = Value(qualified_name(node));
                std::string value;
                xmlNodePtr first = node->children;
                if (first != nullptr && (first->type == XML_TEXT_NODE || first->type == XML_CDATA_SECTION_NODE)) {
                    value = trim(from_xml(first->content));
                }
                if (value.empty()) {
                    append_descendant_text(node, value);
                }
                entry["value"] = Value(value);
                for (xmlAttrPtr attr = node->properties; attr != nullptr; attr = attr->next) {
                    std::string name = from_xml(attr->name);
                    if (attr->ns != nullptr && attr->ns->prefix != nullptr) {
                        name = from_xml(attr->ns->prefix) + ":" + name;
                    }
                    attributes[name] = Value(take_string(xmlNodeListGetString(node->doc, attr->children, 1)));
                }
            } else {
                entry["name"] = Value(node->type == XML_TEXT_NODE ? std::string("#text") : from_xml(node->name));
                entry["value"] = Value(trim(take_string(xmlNodeGetContent(node))));
            }
            entry["attributes"] = attributes;
            entry["node_id"] = Value(node_id_for(context, target.document_id, target.document, node));
            nodes.append(entry);
        }

        Value result(Json::objectValue);
        result["size"] = Value(nodes.size());
        result["nodes"] = nodes;
        return result;
    }

    static void append_descendant_text(xmlNodePtr node, std::string& out) {
        for (xmlNodePtr child = node->children; child != nullptr; child = child->next) {
            if (child->type == XML_TEXT_NODE || child->type == XML_CDATA_SECTION_NODE) {
                out += trim(from_xml(child->content));
            } else if (child->type == XML_ELEMENT_NODE) {
                append_descendant_text(child, out);
            }
        }
    }

    std::string module_;
    std::map<std::string, Operation> operations_;
};

XmlDomHandler::XmlDomHandler()
    : impl_(std::make_unique<XmlEngine>("xml_dom")) {}

XmlDomHandler::~XmlDomHandler() = default;

std::vector<std::string> XmlDomHandler::functions() const {
    return impl_->names();
}

Value XmlDomHandler::invoke(const std::string& function, const Value& params, HandlerContext& context) {
    return impl_->invoke(function, params, context);
}

XPathHandler::XPathHandler()
    : impl_(std::make_unique<XmlEngine>("xpath")) {}

XPathHandler::~XPathHandler() = default;

std::vector<std::string> XPathHandler::functions() const {
    return impl_->names();
}

Value XPathHandler::invoke(const std::string& function, const Value& params, HandlerContext& context) {
    return impl_->invoke(function, params, context);
}

namespace {

struct DocDeleter {
    void operator()(xmlDoc* doc) const {
        if (doc != nullptr) {
            xmlFreeDoc(doc);
        }
    }
};
using UniqueDoc = std::unique_ptr<xmlDoc, DocDeleter>;

std::string attribute_name(xmlAttrPtr attr) {
    std::string name = from_xml(attr->name);
    if (attr->ns != nullptr && attr->ns->prefix != nullptr) {
        name = from_xml(attr->ns->prefix) + ":" + name;
    }
    return name;
}

// Text ahead of the first child element, as a tree builder reports it.
std::string leading_text(xmlNodePtr element) {
    std::string text;
    for (xmlNodePtr child = element->children; child != nullptr; child = child->next) {
        if (child->type == XML_ELEMENT_NODE) {
            break;
        }
        if (child->type == XML_TEXT_NODE || child->type == XML_CDATA_SECTION_NODE) {
            text += from_xml(child->content);
        }
    }
    return text;
}

// XML::Simple folding: attributes as "@name", repeated child tags as arrays,
// text-only elements as strings and mixed text under "content".
Value element_to_value(xmlNodePtr element, const Value& suppress_empty) {
    Value result(Json::objectValue);
    for (xmlAttrPtr attr = element->properties; attr != nullptr; attr = attr->next) {
        result["@" + attribute_name(attr)] = Value(take_string(xmlNodeListGetString(element->doc, attr->children, 1)));
    }

    std::vector<std::string> order;
    std::map<std::string, std::vector<xmlNodePtr>> children;
    for (xmlNodePtr child = element->children; child != nullptr; child = child->next) {
        if (child->type != XML_ELEMENT_NODE) {
            continue;
        }
        auto& group = children[qualified_name(child)];
        if (group.empty()) {
            order.push_back(qualified_name(child));
        }
        group.push_back(child);
    }
    for (const auto& tag : order) {
        const auto& group = children[tag];
        if (group.size() == 1) {
            result[tag] = element_to_value(group.front(), suppress_empty);
            continue;
        }
        Value items(Json::arrayValue);
        for (auto* child : group) {
            items.append(element_to_value(child, suppress_empty));
        }
        result[tag] = items;
    }

    const auto text = trim(leading_text(element));
    if (!text.empty()) {
        if (result.empty()) {
            return Value(text);
        }
        result["content"] = Value(text);
    }
    if (result.empty()) {
        if (suppress_empty.isNull()) {
            return Value{};
        }
        if (suppress_empty.isString() && suppress_empty.asString().empty()) {
            return Value("");
        }
    }
    return result;
}

std::string scalar_text(const Value& value) {
    if (value.isNull()) {
        return {};
    }
    if (value.isString()) {
        return value.asString();
    }
    if (value.type() == Json::realValue) {
        std::ostringstream oss;
        oss << std::setprecision(15) << value.asDouble();
        return oss.str();
    }
    if (value.isBool() || value.isIntegral()) {
        return value.asString();
    }
    throw_validation_error("Cannot render a nested structure as XML text");
}

void append_text(xmlNodePtr parent, const std::string& text) {
    if (!text.empty()) {
        xmlNodeAddContentLen(parent, to_xml(text), static_cast<int>(text.size()));
    }
}

void value_to_element(const Value& data, xmlNodePtr parent) {
    if (data.isObject()) {
        for (const auto& key : data.getMemberNames()) {
            const auto& item = data[key];
            if (key.size() > 1 && key.front() == '@') {
                const auto name = key.substr(1);
                require_name(name);
                xmlSetProp(parent, to_xml(name), to_xml(scalar_text(item)));
            } else if (key == "content") {
                append_text(parent, scalar_text(item));
            } else {
                require_name(key);
                if (item.isArray()) {
                    for (const auto& entry : item) {
                        value_to_element(entry, xmlNewChild(parent, nullptr, to_xml(key), nullptr));
                    }
                } else {
                    value_to_element(item, xmlNewChild(parent, nullptr, to_xml(key), nullptr));
                }
            }
        }
        return;
    }
    if (data.isArray()) {
        for (const auto& entry : data) {
            value_to_element(entry, parent);
        }
        return;
    }
    append_text(parent, scalar_text(data));
}

std::string detect_source_type(const std::string& source) {
    const auto first = source.find_first_not_of(" \t\r\n");
    if (first != std::string::npos && source[first] == '<') {
        return "string";
    }
    if (source.rfind("http://", 0) == 0 || source.rfind("https://", 0) == 0) {
        return "url";
    }
    return "file";
}

std::string read_source(const std::string& source, const std::string& type) {
    if (type == "string") {
        return source;
    }
    if (type == "file") {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(source, ec)) {
            throw_execution_error("XML file not found: " + source);
        }
        std::ifstream in(source, std::ios::binary);
        if (!in) {
            throw_execution_error("Cannot read XML file: " + source);
        }
        std::ostringstream content;
        content << in.rdbuf();
        return content.str();
    }
    if (type == "url" || type == "filehandle") {
        throw_validation_error("XML source type '" + type + "' is not supported");
    }
    throw_validation_error("Unknown source type: " + type);
}

std::string replace_all(std::string text, std::string_view token, std::string_view replacement) {
    std::size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos) {
        text.replace(pos, token.size(), replacement);
        pos += replacement.size();
    }
    return text;
}

const Value& options_param(const Value& params) {
    const auto* options = find_member(params, "options");
    if (options != nullptr && !options->isNull() && !options->isObject()) {
        throw_validation_error("Parameter 'options' must be an object");
    }
    return options != nullptr ? *options : params::member(params, "options");
}

}  // namespace

std::vector<std::string> XmlSimpleHandler::functions() const {
    return {"xml_in", "xml_out", "escape_xml", "unescape_xml"};
}

Value XmlSimpleHandler::invoke(const std::string& function, const Value& params, HandlerContext&) {
    silence_libxml_errors();
    if (function == "xml_in") {
        return xml_in(params);
    }
    if (function == "xml_out") {
        return xml_out(params);
    }
    if (function == "escape_xml") {
        auto text = params::string_or(params, "value", "");
        text = replace_all(std::move(text), "&", "&amp;");
        text = replace_all(std::move(text), "<", "&lt;");
        text = replace_all(std::move(text), ">", "&gt;");
        text = replace_all(std::move(text), "\"", "&quot;");
        return Value(replace_all(std::move(text), "'", "&apos;"));
    }
    if (function == "unescape_xml") {
        auto text = params::string_or(params, "value", "");
        text = replace_all(std::move(text), "&lt;", "<");
        text = replace_all(std::move(text), "&gt;", ">");
        text = replace_all(std::move(text), "&quot;", "\"");
        text = replace_all(std::move(text), "&apos;", "'");
        // &amp; last so "&amp;lt;" decodes to "&lt;".
        return Value(replace_all(std::move(text), "&amp;", "&"));
    }
    throw_validation_error("Unknown xml function: " + function);
}

Value XmlSimpleHandler::xml_in(const Value& params) const {
    const auto source = params::require_string(params, "source");
    auto type = params::string_or(params, "source_type", "auto");
    if (type == "auto") {
        type = detect_source_type(source);
    }
    const auto content = read_source(source, type);
    const auto& options = options_param(params);

    UniqueParserContext ctxt(xmlNewParserCtxt());
    if (!ctxt) {
        throw BridgeError(ErrorKind::Resource, "Cannot allocate XML parser");
    }
    UniqueDoc doc(xmlCtxtReadMemory(ctxt.get(), content.data(), static_cast<int>(content.size()), nullptr, nullptr, kDefaultParseOptions));
    xmlNodePtr root = doc ? xmlDocGetRootElement(doc.get()) : nullptr;
    if (root == nullptr) {
        throw_execution_error("XML Parse Error: " + parse_error_message(ctxt.get(), "document has no root element"));
    }

    Value result = element_to_value(root, params::member(options, "SuppressEmpty"));
    if (!params::boolean_or(options, "KeepRoot", true) && result.isObject() && result.size() == 1) {
        Value inner = result[result.getMemberNames().front()];
        return inner;
    }
    return result;
}

Value XmlSimpleHandler::xml_out(const Value& params) const {
    const auto& options = options_param(params);
    const auto root_name = params::string_or(options, "RootName", "opt");
    require_name(root_name);

    UniqueDoc doc(xmlNewDoc(to_xml("1.0")));
    if (!doc) {
        throw BridgeError(ErrorKind::Resource, "Cannot allocate XML document");
    }
    xmlNodePtr root = xmlNewDocNode(doc.get(), nullptr, to_xml(root_name), nullptr);
    xmlDocSetRootElement(doc.get(), root);
    value_to_element(params::member(params, "data"), root);

    std::unique_ptr<xmlBuffer, decltype(&xmlBufferFree)> buffer(xmlBufferCreate(), &xmlBufferFree);
    if (!buffer) {
        throw BridgeError(ErrorKind::Resource, "Cannot allocate XML buffer");
    }
    if (xmlNodeDump(buffer.get(), doc.get(), root, 0, 0) < 0) {
        throw_execution_error("XML generation error");
    }
    std::string xml = from_xml(xmlBufferContent(buffer.get()));
    if (params::boolean_or(options, "XMLDecl", false)) {
        xml = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n" + xml;
    }
    return Value(xml);
}

}  // namespace cpanbridge::handlers
