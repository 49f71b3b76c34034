#include "template_reader.hpp"

#include "../ir/builder.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace
{
    bool isIdentifierStart(char ch)
    {
        return std::isalpha(static_cast<unsigned char>(ch)) || ch == '_';
    }

    bool isIdentifierPart(char ch)
    {
        return std::isalnum(static_cast<unsigned char>(ch)) || ch == '_';
    }
} // namespace

namespace stencil::frontend
{
    TemplateReader::TemplateReader(std::string_view source, std::string_view documentName)
        : m_source(source)
        , m_documentName(documentName)
    {
        m_lineStarts.push_back(0);
        for (std::size_t index = 0; index < m_source.size(); ++index)
        {
            if (m_source[index] == '\n')
            {
                m_lineStarts.push_back(index + 1);
            }
        }
    }

    const std::vector<ir::Diagnostic>& TemplateReader::diagnostics() const noexcept
    {
        return m_diagnostics;
    }

    ir::Document TemplateReader::read()
    {
        ir::Document document;
        m_diagnostics.clear();
        m_current = 0;
        m_markup.clear();
        m_markupBegin = 0;

        while (m_current < m_source.size())
        {
            const char ch = m_source[m_current];
            if (ch != '@')
            {
                if (m_markup.empty())
                {
                    m_markupBegin = m_current;
                }
                m_markup.push_back(ch);
                ++m_current;
                continue;
            }

            readTransition(document);
        }

        flushMarkup(document);
        return document;
    }

    void TemplateReader::readTransition(ir::Document& document)
    {
        const std::size_t start = m_current;
        const char next = start + 1 < m_source.size() ? m_source[start + 1] : '\0';

        // user@example.com stays text.
        const bool followsIdentifier = start > 0 && isIdentifierPart(m_source[start - 1]);

        if (next == '@')
        {
            if (m_markup.empty())
            {
                m_markupBegin = start;
            }
            m_markup.push_back('@');
            m_current = start + 2;
            return;
        }

        if (next == '*')
        {
            const std::size_t close = m_source.find("*@", start + 2);
            if (close == std::string_view::npos)
            {
                reportUnterminated("comment", start);
                m_current = m_source.size();
                return;
            }
            m_current = close + 2;
            return;
        }

        if (next == '{' || next == '(')
        {
            const char close = next == '{' ? '}' : ')';
            const std::size_t end = scanBalanced(start + 1, next, close);
            if (end == std::string_view::npos)
            {
                reportUnterminated(next == '{' ? "code block" : "expression", start);
                if (m_markup.empty())
                {
                    m_markupBegin = start;
                }
                m_markup.append(m_source.substr(start));
                m_current = m_source.size();
                return;
            }

            flushMarkup(document);
            appendOpaque(document,
                         next == '{' ? ir::OpaqueKind::CodeBlock : ir::OpaqueKind::Expression,
                         start + 2,
                         end - 1,
                         spanOf(start, end));
            m_current = end;
            return;
        }

        if (!followsIdentifier && isIdentifierStart(next))
        {
            const std::size_t end = scanImplicitExpression(start + 1);
            flushMarkup(document);
            appendOpaque(document, ir::OpaqueKind::Expression, start + 1, end, spanOf(start, end));
            m_current = end;
            return;
        }

        if (m_markup.empty())
        {
            m_markupBegin = start;
        }
        m_markup.push_back('@');
        m_current = start + 1;
    }

    void TemplateReader::flushMarkup(ir::Document& document)
    {
        if (m_markup.empty())
        {
            return;
        }

        ir::Builder builder{document};
        const ir::NodeId id = builder.appendMarkup(document.root(), m_markup);
        document.node(id).span = spanOf(m_markupBegin, m_current);
        m_markup.clear();
    }

    void TemplateReader::appendOpaque(ir::Document& document,
                                      ir::OpaqueKind kind,
                                      std::size_t begin,
                                      std::size_t end,
                                      ir::SourceSpan span)
    {
        ir::Builder builder{document};
        const ir::NodeId id = builder.appendOpaque(document.root(), kind, m_source.substr(begin, end - begin));
        document.node(id).span = span;
    }

    void TemplateReader::reportUnterminated(std::string_view construct, std::size_t begin)
    {
        ir::Diagnostic diagnostic;
        diagnostic.code = "STENCIL-E0001";
        diagnostic.message = "Unterminated " + std::string{construct} + " starting with '@'";
        if (!m_documentName.empty())
        {
            diagnostic.message += " in '" + std::string{m_documentName} + "'";
        }
        diagnostic.message += ".";
        diagnostic.span = spanOf(begin, m_source.size());
        m_diagnostics.emplace_back(std::move(diagnostic));
    }

    // Returns the offset just past the bracket closing the one at position, or npos.
    std::size_t TemplateReader::scanBalanced(std::size_t position, char open, char close) const
    {
        int depth = 0;
        std::size_t index = position;
        while (index < m_source.size())
        {
            const char ch = m_source[index];
            if (ch == '"' || ch == '\'')
            {
                ++index;
                while (index < m_source.size() && m_source[index] != ch)
                {
                    if (m_source[index] == '\\')
                    {
                        ++index;
                    }
                    ++index;
                }
                if (index >= m_source.size())
                {
                    return std::string_view::npos;
                }
            }
            else if (ch == open)
            {
                ++depth;
            }
            else if (ch == close)
            {
                --depth;
                if (depth == 0)
                {
                    return index + 1;
                }
            }
            ++index;
        }

        return std::string_view::npos;
    }

    std::size_t TemplateReader::scanImplicitExpression(std::size_t position) const
    {
        std::size_t index = position;
        while (index < m_source.size() && isIdentifierPart(m_source[index]))
        {
            ++index;
        }

        while (index < m_source.size())
        {
            const char ch = m_source[index];
            if (ch == '.' && index + 1 < m_source.size() && isIdentifierStart(m_source[index + 1]))
            {
                index += 1;
                while (index < m_source.size() && isIdentifierPart(m_source[index]))
                {
                    ++index;
                }
                continue;
            }

            if (ch == '(' || ch == '[')
            {
                const std::size_t end = scanBalanced(index, ch, ch == '(' ? ')' : ']');
                if (end == std::string_view::npos)
                {
                    break;
                }
                index = end;
                continue;
            }

            break;
        }

        return index;
    }

    ir::SourceLocation TemplateReader::locationAt(std::size_t offset) const
    {
        const auto line = std::upper_bound(m_lineStarts.begin(), m_lineStarts.end(), offset) - 1;

        ir::SourceLocation location;
        location.offset = static_cast<std::uint32_t>(offset);
        location.line = static_cast<std::uint32_t>(line - m_lineStarts.begin()) + 1;
        location.column = static_cast<std::uint32_t>(offset - *line) + 1;
        return location;
    }

    ir::SourceSpan TemplateReader::spanOf(std::size_t begin, std::size_t end) const
    {
        ir::SourceSpan span;
        span.begin = locationAt(begin);
        span.end = locationAt(end);
        return span;
    }
} // namespace stencil::frontend
