#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace stencil::emit
{
    class CodeWriter
    {
    public:
        explicit CodeWriter(std::size_t indentSize = 4);

        CodeWriter& write(std::string_view text);
        CodeWriter& writeLine(std::string_view text = {});
        CodeWriter& writeStringLiteral(std::string_view text);

        void indent();
        void dedent();

        [[nodiscard]] const std::string& str() const noexcept;

    private:
        void writeIndentIfNeeded();

    private:
        std::string m_buffer;
        std::size_t m_indentSize{4};
        std::size_t m_level{0};
        bool m_atLineStart{true};
    };
} // namespace stencil::emit
