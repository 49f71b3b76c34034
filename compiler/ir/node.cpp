#include "node.hpp"

#include <utility>

namespace stencil::ir
{
    Document::Document()
    {
        m_root = create(NodeKind::Document);
    }

    NodeId Document::root() const noexcept
    {
        return m_root;
    }

    std::size_t Document::size() const noexcept
    {
        return m_nodes.size();
    }

    NodeId Document::create(NodeKind kind)
    {
        const auto id = static_cast<NodeId>(m_nodes.size());
        m_nodes.emplace_back();
        m_nodes.back().kind = kind;
        return id;
    }

    Node& Document::node(NodeId id)
    {
        return m_nodes[id];
    }

    const Node& Document::node(NodeId id) const
    {
        return m_nodes[id];
    }

    void Document::appendChild(NodeId parent, NodeId child)
    {
        m_nodes[parent].children.push_back(child);
    }

    void Document::setChildren(NodeId parent, std::vector<NodeId> children)
    {
        m_nodes[parent].children = std::move(children);
    }

    void Document::replaceChild(NodeId parent, std::size_t index, NodeId replacement)
    {
        m_nodes[parent].children[index] = replacement;
    }

    std::string_view toString(NodeKind kind)
    {
        switch (kind)
        {
        case NodeKind::Document:
            return "Document";
        case NodeKind::RawMarkup:
            return "RawMarkup";
        case NodeKind::Element:
            return "Element";
        case NodeKind::Attribute:
            return "Attribute";
        case NodeKind::AttributeValue:
            return "AttributeValue";
        case NodeKind::StructuredConstruct:
            return "StructuredConstruct";
        case NodeKind::ConstructAttribute:
            return "ConstructAttribute";
        case NodeKind::ConstructBody:
            return "ConstructBody";
        case NodeKind::Opaque:
            return "Opaque";
        }

        return "Unknown";
    }

    std::string_view toString(OpaqueKind kind)
    {
        switch (kind)
        {
        case OpaqueKind::Expression:
            return "expression";
        case OpaqueKind::CodeBlock:
            return "code";
        case OpaqueKind::Directive:
            return "directive";
        }

        return "unknown";
    }

    std::string markupText(const Node& node)
    {
        std::string text;
        for (const auto& fragment : node.fragments)
        {
            text += fragment;
        }
        return text;
    }

    std::vector<NodeId> attributesOf(const Document& document, NodeId element)
    {
        std::vector<NodeId> result;
        for (auto child : document.node(element).children)
        {
            if (document.node(child).kind == NodeKind::Attribute)
            {
                result.push_back(child);
            }
        }
        return result;
    }

    std::vector<NodeId> bodyOf(const Document& document, NodeId element)
    {
        std::vector<NodeId> result;
        for (auto child : document.node(element).children)
        {
            if (document.node(child).kind != NodeKind::Attribute)
            {
                result.push_back(child);
            }
        }
        return result;
    }

    NodeId findConstructBody(const Document& document, NodeId construct)
    {
        for (auto child : document.node(construct).children)
        {
            if (document.node(child).kind == NodeKind::ConstructBody)
            {
                return child;
            }
        }
        return kInvalidNode;
    }

    namespace
    {
        void collectFrom(const Document& document, NodeId id, std::vector<Diagnostic>& diagnostics)
        {
            const Node& current = document.node(id);
            diagnostics.insert(diagnostics.end(), current.diagnostics.begin(), current.diagnostics.end());
            for (auto child : current.children)
            {
                collectFrom(document, child, diagnostics);
            }
        }
    } // namespace

    std::vector<Diagnostic> collectDiagnostics(const Document& document)
    {
        std::vector<Diagnostic> diagnostics;
        collectFrom(document, document.root(), diagnostics);
        return diagnostics;
    }
} // namespace stencil::ir
