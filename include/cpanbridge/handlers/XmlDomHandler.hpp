#pragma once

#include "cpanbridge/handlers/CapabilityHandler.hpp"

#include <memory>

namespace cpanbridge::handlers {

class XmlEngine;

// "xml_dom" module: DOM parsing, traversal, mutation and XPath over libxml2.
// Parsers, documents, nodes and node lists are pooled handles; node and node
// list handles are parented to their document handle.
class XmlDomHandler final : public CapabilityHandler {
public:
    XmlDomHandler();
    ~XmlDomHandler() override;

    std::string_view module() const noexcept override { return "xml_dom"; }
    std::vector<std::string> functions() const override;
    Value invoke(const std::string& function, const Value& params, HandlerContext& context) override;

private:
    std::unique_ptr<XmlEngine> impl_;
};

// "xpath" module: XML::XPath-style load and find. Matches come back as
// {name, value, attributes, node_id} records over the same document and node
// handles the DOM module uses.
class XPathHandler final : public CapabilityHandler {
public:
    XPathHandler();
    ~XPathHandler() override;

    std::string_view module() const noexcept override { return "xpath"; }
    std::vector<std::string> functions() const override;
    Value invoke(const std::string& function, const Value& params, HandlerContext& context) override;

private:
    std::unique_ptr<XmlEngine> impl_;
};

// "xml" module: XML::Simple-style xml_in/xml_out folding between XML and
// plain values, plus entity escaping. Stateless.
class XmlSimpleHandler final : public CapabilityHandler {
public:
    std::string_view module() const noexcept override { return "xml"; }
    std::vector<std::string> functions() const override;
    Value invoke(const std::string& function, const Value& params, HandlerContext& context) override;

private:
    Value xml_in(const Value& params) const;
    Value xml_out(const Value& params) const;
};

}  // namespace cpanbridge::handlers
