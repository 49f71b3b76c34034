#pragma once

#include "diagnostic.hpp"
#include "source_span.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stencil::ir
{
    using NodeId = std::uint32_t;

    inline constexpr NodeId kInvalidNode = 0xFFFFFFFFu;

    enum class NodeKind : std::uint16_t
    {
        Document,
        RawMarkup,
        Element,
        Attribute,
        AttributeValue,
        StructuredConstruct,
        ConstructAttribute,
        ConstructBody,
        Opaque
    };

    enum class OpaqueKind : std::uint16_t
    {
        Expression,
        CodeBlock,
        Directive
    };

    struct Node
    {
        NodeKind kind{NodeKind::Opaque};
        // Tag name for Element/StructuredConstruct, attribute name for Attribute/ConstructAttribute.
        std::string name;
        // Literal fragments of a RawMarkup node, in the order the upstream parser produced them.
        std::vector<std::string> fragments;
        OpaqueKind opaqueKind{OpaqueKind::Expression};
        std::string code;
        // Descriptor names the construct matcher bound to a StructuredConstruct.
        std::vector<std::string> descriptors;
        std::optional<SourceSpan> span;
        std::vector<NodeId> children;
        std::vector<Diagnostic> diagnostics;
    };

    /**
     * Arena owning every node of one compiled template.
     * Nodes are addressed by index; a node belongs to at most one parent's child list.
     * Rewrites never delete from the arena, a replaced node simply becomes unreachable.
     */
    class Document
    {
    public:
        Document();

        [[nodiscard]] NodeId root() const noexcept;
        [[nodiscard]] std::size_t size() const noexcept;

        NodeId create(NodeKind kind);

        [[nodiscard]] Node& node(NodeId id);
        [[nodiscard]] const Node& node(NodeId id) const;

        void appendChild(NodeId parent, NodeId child);
        void setChildren(NodeId parent, std::vector<NodeId> children);
        void replaceChild(NodeId parent, std::size_t index, NodeId replacement);

    private:
        std::vector<Node> m_nodes;
        NodeId m_root{0};
    };

    [[nodiscard]] std::string_view toString(NodeKind kind);
    [[nodiscard]] std::string_view toString(OpaqueKind kind);

    // Concatenation of a RawMarkup node's fragments.
    [[nodiscard]] std::string markupText(const Node& node);

    [[nodiscard]] std::vector<NodeId> attributesOf(const Document& document, NodeId element);
    [[nodiscard]] std::vector<NodeId> bodyOf(const Document& document, NodeId element);

    // Child of kind ConstructBody, or kInvalidNode when the construct has none.
    [[nodiscard]] NodeId findConstructBody(const Document& document, NodeId construct);

    // Diagnostics of every node reachable from the root, in document order.
    [[nodiscard]] std::vector<Diagnostic> collectDiagnostics(const Document& document);
} // namespace stencil::ir
