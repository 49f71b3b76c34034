#include "verifier.hpp"

#include <algorithm>
#include <vector>

namespace stencil::ir
{
    namespace
    {
        bool attributesPrecedeBody(const Document& document, const Node& element)
        {
            bool sawBody = false;
            for (auto child : element.children)
            {
                if (document.node(child).kind == NodeKind::Attribute)
                {
                    if (sawBody)
                    {
                        return false;
                    }
                }
                else
                {
                    sawBody = true;
                }
            }
            return true;
        }

        bool hasSingleValue(const Document& document, const Node& attribute)
        {
            return attribute.children.size() == 1
                && document.node(attribute.children.front()).kind == NodeKind::AttributeValue;
        }

        bool hasSingleBody(const Document& document, const Node& construct)
        {
            return std::count_if(construct.children.begin(), construct.children.end(), [&document](NodeId child) {
                       return document.node(child).kind == NodeKind::ConstructBody;
                   })
                == 1;
        }

        bool verifyNode(const Document& document, NodeId id, std::vector<bool>& visited)
        {
            if (id >= document.size() || visited[id])
            {
                return false;
            }
            visited[id] = true;

            const Node& node = document.node(id);
            switch (node.kind)
            {
            case NodeKind::Document:
                if (id != document.root())
                {
                    return false;
                }
                break;
            case NodeKind::RawMarkup:
                if (!node.children.empty())
                {
                    return false;
                }
                break;
            case NodeKind::Element:
                if (node.name.empty() || !attributesPrecedeBody(document, node))
                {
                    return false;
                }
                break;
            case NodeKind::Attribute:
                if (!hasSingleValue(document, node))
                {
                    return false;
                }
                break;
            case NodeKind::StructuredConstruct:
                if (!hasSingleBody(document, node))
                {
                    return false;
                }
                break;
            default:
                break;
            }

            for (auto child : node.children)
            {
                if (!verifyNode(document, child, visited))
                {
                    return false;
                }
            }

            return true;
        }
    } // namespace

    bool verify(const Document& document)
    {
        std::vector<bool> visited(document.size(), false);
        return verifyNode(document, document.root(), visited);
    }
} // namespace stencil::ir
