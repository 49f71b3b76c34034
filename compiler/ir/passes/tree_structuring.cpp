#include "tree_structuring.hpp"

#include "../builder.hpp"
#include "../../markup/tokenizer.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <string>
#include <utility>

namespace stencil::passes
{
    namespace
    {
        constexpr std::string_view kPassName = "tree-structuring";

        // Elements that can never have content; <img> is the same as <img />.
        constexpr std::array<std::string_view, 14> kVoidElements{
            "area", "base", "br", "col", "embed", "hr", "img",
            "input", "link", "meta", "param", "source", "track", "wbr"};

        bool equalsIgnoreCase(std::string_view left, std::string_view right)
        {
            if (left.size() != right.size())
            {
                return false;
            }

            for (std::size_t index = 0; index < left.size(); ++index)
            {
                const auto a = std::tolower(static_cast<unsigned char>(left[index]));
                const auto b = std::tolower(static_cast<unsigned char>(right[index]));
                if (a != b)
                {
                    return false;
                }
            }
            return true;
        }

        bool isWhitespace(std::string_view text)
        {
            return std::all_of(text.begin(), text.end(), [](char ch) {
                return std::isspace(static_cast<unsigned char>(ch)) != 0;
            });
        }

        void reportError(std::vector<ir::InternalError>& errors, std::string_view code, std::string detail)
        {
            ir::InternalError error;
            error.code = std::string{code};
            error.stage = std::string{kPassName};
            error.detail = std::move(detail);
            errors.emplace_back(std::move(error));
        }

        std::string describeContainer(const ir::Document& document, ir::NodeId id)
        {
            const ir::Node& node = document.node(id);
            std::string description{ir::toString(node.kind)};
            description += " #" + std::to_string(id);
            if (!node.name.empty())
            {
                description += " '" + node.name + "'";
            }
            return description;
        }

        // A non-markup child that arrived while a start tag was still open.
        // Positional holes remember where in the tag text they appeared.
        struct PendingHole
        {
            ir::NodeId node{ir::kInvalidNode};
            std::optional<std::size_t> offset;
        };

        class Reconciler
        {
        public:
            Reconciler(ir::Document& document, ir::NodeId container, std::vector<ir::InternalError>& errors)
                : m_document(document)
                , m_builder(document)
                , m_container(container)
                , m_errors(errors)
            {
            }

            bool run()
            {
                const std::vector<ir::NodeId> children = m_document.node(m_container).children;
                m_document.setChildren(m_container, {});
                m_stack.push_back(m_container);

                for (auto child : children)
                {
                    const ir::NodeKind kind = m_document.node(child).kind;
                    if (kind == ir::NodeKind::RawMarkup)
                    {
                        if (!consumeMarkup(child))
                        {
                            return false;
                        }
                    }
                    else if (kind == ir::NodeKind::Attribute)
                    {
                        m_pendingHoles.push_back({child, std::nullopt});
                    }
                    else if (m_remainder.has_value())
                    {
                        m_pendingHoles.push_back({child, m_remainder->size()});
                    }
                    else
                    {
                        appendToTop(child);
                    }
                }

                bool success = true;
                if (m_stack.size() != 1)
                {
                    reportError(m_errors,
                                "STENCIL-I5001",
                                describeContainer(m_document, m_container) + " ended with "
                                    + std::to_string(m_stack.size() - 1) + " unclosed element(s), innermost '<"
                                    + m_document.node(m_stack.back()).name + ">'.");
                    success = false;
                }

                if (m_remainder.has_value())
                {
                    reportError(m_errors,
                                "STENCIL-I5002",
                                describeContainer(m_document, m_container) + " ended inside unterminated markup '"
                                    + *m_remainder + "'.");
                    success = false;
                }

                if (!m_pendingHoles.empty())
                {
                    reportError(m_errors,
                                "STENCIL-I5003",
                                describeContainer(m_document, m_container) + " holds "
                                    + std::to_string(m_pendingHoles.size())
                                    + " attribute node(s) with no start tag to attach to.");
                    success = false;
                }

                return success;
            }

        private:
            ir::NodeId top() const
            {
                return m_stack.back();
            }

            void appendToTop(ir::NodeId child)
            {
                m_document.appendChild(top(), child);
            }

            bool consumeMarkup(ir::NodeId markupNode)
            {
                std::string content = m_remainder.value_or(std::string{});
                content += ir::markupText(m_document.node(markupNode));
                m_remainder.reset();
                m_fragmentSpan = m_document.node(markupNode).span;

                markup::Tokenizer tokenizer{content};
                for (markup::Token token = tokenizer.next(); token.kind != markup::TokenKind::EndOfInput;
                     token = tokenizer.next())
                {
                    if (token.kind != markup::TokenKind::StartTag)
                    {
                        flushPositionalHoles();
                    }

                    switch (token.kind)
                    {
                    case markup::TokenKind::Text:
                        // Whitespace between top-level elements carries no content.
                        if (top() == m_container && isWhitespace(token.data))
                        {
                            break;
                        }
                        appendToTop(m_builder.createMarkup(token.data));
                        break;
                    case markup::TokenKind::StartTag:
                        openElement(content, token);
                        if (token.selfClosing || isVoidElement(token.name))
                        {
                            closeElement(content, token);
                        }
                        break;
                    case markup::TokenKind::EndTag:
                        closeElement(content, token);
                        break;
                    case markup::TokenKind::Comment:
                        break;
                    default:
                        reportError(m_errors,
                                    "STENCIL-I5004",
                                    "unsupported markup token kind '" + std::string{markup::toString(token.kind)}
                                        + "' in " + describeContainer(m_document, m_container) + ".");
                        return false;
                    }
                }

                // A start tag left open here continues after the next hole(s).
                if (tokenizer.hasRemainder())
                {
                    const std::size_t stop = tokenizer.stopOffset();
                    m_remainder = content.substr(stop);
                    for (auto& hole : m_pendingHoles)
                    {
                        if (hole.offset.has_value())
                        {
                            hole.offset = *hole.offset >= stop ? *hole.offset - stop : 0;
                        }
                    }
                }

                return true;
            }

            void openElement(std::string_view content, const markup::Token& token)
            {
                // Holes between attributes are content of the enclosing frame, ahead of the new element.
                auto it = m_pendingHoles.begin();
                while (it != m_pendingHoles.end())
                {
                    if (it->offset.has_value() && !insideAttributeValue(token, *it->offset))
                    {
                        appendToTop(it->node);
                        it = m_pendingHoles.erase(it);
                    }
                    else
                    {
                        ++it;
                    }
                }

                // The tokenizer folds case; keep the name as the author typed it.
                const ir::NodeId element = m_builder.createElement(content.substr(token.nameOffset, token.nameLength));
                m_document.node(element).span = m_fragmentSpan;
                appendToTop(element);
                m_stack.push_back(element);

                std::vector<bool> consumed(m_pendingHoles.size(), false);
                for (const auto& attribute : token.attributes)
                {
                    const ir::NodeId node = m_builder.createAttribute(attribute.name);
                    const ir::NodeId value = m_builder.valueOf(node);

                    std::size_t cursor = attribute.valueBegin;
                    bool split = false;
                    for (std::size_t index = 0; index < m_pendingHoles.size(); ++index)
                    {
                        const auto& hole = m_pendingHoles[index];
                        if (consumed[index] || !attribute.hasValue || !hole.offset.has_value())
                        {
                            continue;
                        }

                        if (*hole.offset < attribute.valueBegin || *hole.offset > attribute.valueEnd)
                        {
                            continue;
                        }

                        if (*hole.offset > cursor)
                        {
                            m_builder.appendMarkup(value, content.substr(cursor, *hole.offset - cursor));
                        }
                        m_document.appendChild(value, hole.node);
                        cursor = *hole.offset;
                        consumed[index] = true;
                        split = true;
                    }

                    if (!split && attribute.hasValue)
                    {
                        m_builder.appendMarkup(value, attribute.value);
                    }
                    else if (split && cursor < attribute.valueEnd)
                    {
                        m_builder.appendMarkup(value, content.substr(cursor, attribute.valueEnd - cursor));
                    }

                    appendToTop(node);
                }

                // Only Attribute nodes are left unconsumed here.
                for (std::size_t index = 0; index < m_pendingHoles.size(); ++index)
                {
                    if (!consumed[index])
                    {
                        appendToTop(m_pendingHoles[index].node);
                    }
                }
                m_pendingHoles.clear();
            }

            static bool insideAttributeValue(const markup::Token& token, std::size_t offset)
            {
                return std::any_of(token.attributes.begin(),
                                   token.attributes.end(),
                                   [offset](const markup::Attribute& attribute) {
                                       return attribute.hasValue && offset >= attribute.valueBegin
                                           && offset <= attribute.valueEnd;
                                   });
            }

            void closeElement(std::string_view content, const markup::Token& token)
            {
                const std::string closingName{content.substr(token.nameOffset, token.nameLength)};

                if (top() == m_container)
                {
                    ir::Diagnostic diagnostic;
                    diagnostic.code = "STENCIL-E2003";
                    diagnostic.message = "Unexpected closing tag '</" + closingName + ">' with no open element.";
                    diagnostic.span = m_document.node(m_container).span;
                    m_document.node(m_container).diagnostics.emplace_back(std::move(diagnostic));
                    return;
                }

                const ir::NodeId popped = m_stack.back();
                m_stack.pop_back();

                ir::Node& element = m_document.node(popped);
                if (!equalsIgnoreCase(element.name, token.name))
                {
                    ir::Diagnostic diagnostic;
                    diagnostic.code = "STENCIL-E2001";
                    diagnostic.message = "Mismatched closing tag: found '</" + closingName + ">' but expected '</"
                        + element.name + ">'.";
                    diagnostic.span = element.span;
                    element.diagnostics.emplace_back(std::move(diagnostic));
                }
            }

            // Holes inside an end tag or comment have no attribute to join.
            void flushPositionalHoles()
            {
                auto it = m_pendingHoles.begin();
                while (it != m_pendingHoles.end())
                {
                    if (it->offset.has_value())
                    {
                        appendToTop(it->node);
                        it = m_pendingHoles.erase(it);
                    }
                    else
                    {
                        ++it;
                    }
                }
            }

        private:
            ir::Document& m_document;
            ir::Builder m_builder;
            ir::NodeId m_container;
            std::vector<ir::InternalError>& m_errors;
            std::vector<ir::NodeId> m_stack;
            std::vector<PendingHole> m_pendingHoles;
            std::optional<std::string> m_remainder;
            std::optional<ir::SourceSpan> m_fragmentSpan;
        };

        // Literal attribute values are stored as RawMarkup too; they are never markup.
        bool holdsLiteralValues(ir::NodeKind kind)
        {
            return kind == ir::NodeKind::Attribute || kind == ir::NodeKind::ConstructAttribute;
        }

        bool visit(ir::Document& document, ir::NodeId id, std::vector<ir::InternalError>& errors)
        {
            bool foundMarkup = false;

            const std::vector<ir::NodeId> children = document.node(id).children;
            for (auto child : children)
            {
                const ir::NodeKind kind = document.node(child).kind;
                if (kind == ir::NodeKind::RawMarkup)
                {
                    foundMarkup = true;
                    continue;
                }

                if (holdsLiteralValues(kind))
                {
                    continue;
                }

                if (!visit(document, child, errors))
                {
                    return false;
                }
            }

            if (foundMarkup)
            {
                return structureChildren(document, id, errors);
            }

            return true;
        }
    } // namespace

    bool isVoidElement(std::string_view tagName)
    {
        return std::any_of(kVoidElements.begin(), kVoidElements.end(), [tagName](std::string_view name) {
            return equalsIgnoreCase(name, tagName);
        });
    }

    bool structureChildren(ir::Document& document, ir::NodeId container, std::vector<ir::InternalError>& errors)
    {
        Reconciler reconciler{document, container, errors};
        return reconciler.run();
    }

    bool structureMarkup(ir::Document& document, std::vector<ir::InternalError>& errors)
    {
        return visit(document, document.root(), errors);
    }
} // namespace stencil::passes
