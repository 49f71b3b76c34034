#pragma once

#include "node.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace stencil::ir
{
    class Builder
    {
    public:
        explicit Builder(Document& document);

        NodeId createMarkup(std::string_view text);
        NodeId createOpaque(OpaqueKind kind, std::string_view code);
        NodeId createElement(std::string_view tagName);
        // Creates an Attribute together with its single AttributeValue child.
        NodeId createAttribute(std::string_view name);

        NodeId appendMarkup(NodeId parent, std::string_view text);
        NodeId appendOpaque(NodeId parent, OpaqueKind kind, std::string_view code);
        NodeId appendElement(NodeId parent, std::string_view tagName);
        NodeId appendAttribute(NodeId parent, std::string_view name);
        NodeId appendAttributeLiteral(NodeId attribute, std::string_view text);

        NodeId appendConstruct(NodeId parent, std::string_view tagName, std::vector<std::string> descriptors = {});
        NodeId appendConstructAttribute(NodeId construct, std::string_view name);

        [[nodiscard]] NodeId valueOf(NodeId attribute) const;
        [[nodiscard]] NodeId bodyOf(NodeId construct) const;

    private:
        Document& m_document;
    };
} // namespace stencil::ir
