#pragma once

#include "../ir/diagnostic.hpp"
#include "../ir/node.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace stencil::frontend
{
    /**
     * Splits template source into the flat tree the structuring pass consumes:
     * RawMarkup runs interrupted by Opaque expression and code-block nodes.
     *
     *   @name.member(args)[index]   implicit expression
     *   @( ... )                    explicit expression
     *   @{ ... }                    code block
     *   @* ... *@                   comment, dropped
     *   @@                          literal '@'
     */
    class TemplateReader
    {
    public:
        explicit TemplateReader(std::string_view source, std::string_view documentName = {});

        [[nodiscard]] ir::Document read();
        [[nodiscard]] const std::vector<ir::Diagnostic>& diagnostics() const noexcept;

    private:
        void readTransition(ir::Document& document);
        void flushMarkup(ir::Document& document);
        void appendOpaque(ir::Document& document, ir::OpaqueKind kind, std::size_t begin, std::size_t end,
                          ir::SourceSpan span);
        void reportUnterminated(std::string_view construct, std::size_t begin);

        std::size_t scanBalanced(std::size_t position, char open, char close) const;
        std::size_t scanImplicitExpression(std::size_t position) const;
        ir::SourceLocation locationAt(std::size_t offset) const;
        ir::SourceSpan spanOf(std::size_t begin, std::size_t end) const;

    private:
        std::string_view m_source;
        std::string_view m_documentName;
        std::vector<ir::Diagnostic> m_diagnostics;
        std::vector<std::size_t> m_lineStarts;
        std::size_t m_current{0};
        std::string m_markup;
        std::size_t m_markupBegin{0};
    };
} // namespace stencil::frontend
