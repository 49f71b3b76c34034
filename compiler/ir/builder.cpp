#include "builder.hpp"

#include <utility>

namespace stencil::ir
{
    Builder::Builder(Document& document)
        : m_document(document)
    {
    }

    NodeId Builder::createMarkup(std::string_view text)
    {
        const NodeId id = m_document.create(NodeKind::RawMarkup);
        m_document.node(id).fragments.emplace_back(text);
        return id;
    }

    NodeId Builder::createOpaque(OpaqueKind kind, std::string_view code)
    {
        const NodeId id = m_document.create(NodeKind::Opaque);
        Node& node = m_document.node(id);
        node.opaqueKind = kind;
        node.code = std::string{code};
        return id;
    }

    NodeId Builder::createElement(std::string_view tagName)
    {
        const NodeId id = m_document.create(NodeKind::Element);
        m_document.node(id).name = std::string{tagName};
        return id;
    }

    NodeId Builder::createAttribute(std::string_view name)
    {
        const NodeId id = m_document.create(NodeKind::Attribute);
        m_document.node(id).name = std::string{name};
        const NodeId value = m_document.create(NodeKind::AttributeValue);
        m_document.appendChild(id, value);
        return id;
    }

    NodeId Builder::appendMarkup(NodeId parent, std::string_view text)
    {
        const NodeId id = createMarkup(text);
        m_document.appendChild(parent, id);
        return id;
    }

    NodeId Builder::appendOpaque(NodeId parent, OpaqueKind kind, std::string_view code)
    {
        const NodeId id = createOpaque(kind, code);
        m_document.appendChild(parent, id);
        return id;
    }

    NodeId Builder::appendElement(NodeId parent, std::string_view tagName)
    {
        const NodeId id = createElement(tagName);
        m_document.appendChild(parent, id);
        return id;
    }

    NodeId Builder::appendAttribute(NodeId parent, std::string_view name)
    {
        const NodeId id = createAttribute(name);
        m_document.appendChild(parent, id);
        return id;
    }

    NodeId Builder::appendAttributeLiteral(NodeId attribute, std::string_view text)
    {
        return appendMarkup(valueOf(attribute), text);
    }

    NodeId Builder::appendConstruct(NodeId parent, std::string_view tagName, std::vector<std::string> descriptors)
    {
        const NodeId id = m_document.create(NodeKind::StructuredConstruct);
        Node& construct = m_document.node(id);
        construct.name = std::string{tagName};
        construct.descriptors = std::move(descriptors);

        const NodeId body = m_document.create(NodeKind::ConstructBody);
        m_document.appendChild(id, body);
        m_document.appendChild(parent, id);
        return id;
    }

    NodeId Builder::appendConstructAttribute(NodeId construct, std::string_view name)
    {
        const NodeId id = m_document.create(NodeKind::ConstructAttribute);
        m_document.node(id).name = std::string{name};
        m_document.appendChild(construct, id);
        return id;
    }

    NodeId Builder::valueOf(NodeId attribute) const
    {
        for (auto child : m_document.node(attribute).children)
        {
            if (m_document.node(child).kind == NodeKind::AttributeValue)
            {
                return child;
            }
        }
        return kInvalidNode;
    }

    NodeId Builder::bodyOf(NodeId construct) const
    {
        return findConstructBody(m_document, construct);
    }
} // namespace stencil::ir
