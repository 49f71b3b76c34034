#include "printer.hpp"

#include <ostream>
#include <string>

namespace stencil::ir
{
    namespace
    {
        void printIndent(std::ostream& stream, int level)
        {
            for (int i = 0; i < level; ++i)
            {
                stream << "  ";
            }
        }

        std::string escape(std::string_view text)
        {
            std::string result;
            result.reserve(text.size());
            for (char ch : text)
            {
                switch (ch)
                {
                case '\n':
                    result += "\\n";
                    break;
                case '\r':
                    result += "\\r";
                    break;
                case '\t':
                    result += "\\t";
                    break;
                case '"':
                    result += "\\\"";
                    break;
                default:
                    result.push_back(ch);
                    break;
                }
            }
            return result;
        }

        void printNode(const Document& document, NodeId id, std::ostream& stream, int level)
        {
            const Node& node = document.node(id);

            printIndent(stream, level);
            switch (node.kind)
            {
            case NodeKind::RawMarkup:
                stream << "markup \"" << escape(markupText(node)) << "\"";
                break;
            case NodeKind::Element:
                stream << "element <" << node.name << ">";
                break;
            case NodeKind::Attribute:
            case NodeKind::ConstructAttribute:
                stream << toString(node.kind) << ' ' << node.name;
                break;
            case NodeKind::StructuredConstruct:
                stream << "construct <" << node.name << ">";
                for (std::size_t index = 0; index < node.descriptors.size(); ++index)
                {
                    stream << (index == 0 ? " [" : ", ") << node.descriptors[index];
                }
                if (!node.descriptors.empty())
                {
                    stream << "]";
                }
                break;
            case NodeKind::Opaque:
                stream << toString(node.opaqueKind) << " {" << escape(node.code) << "}";
                break;
            default:
                stream << toString(node.kind);
                break;
            }
            stream << "\n";

            for (const auto& diagnostic : node.diagnostics)
            {
                printIndent(stream, level + 1);
                stream << "! " << diagnostic.code << ' ' << diagnostic.message << "\n";
            }

            for (auto child : node.children)
            {
                printNode(document, child, stream, level + 1);
            }
        }
    } // namespace

    void print(const Document& document, std::ostream& stream)
    {
        printNode(document, document.root(), stream, 0);
    }
} // namespace stencil::ir
