#pragma once

#include "token.hpp"

#include <cstddef>
#include <string_view>

namespace stencil::markup
{
    /**
     * Streaming markup tokenizer over one chunk of template text.
     * Scanning stops at a tag or comment left open by the end of the chunk; the
     * chunk then ends with EndOfInput and stopOffset() marks the unconsumed tail.
     */
    class Tokenizer
    {
    public:
        explicit Tokenizer(std::string_view input);

        [[nodiscard]] Token next();

        [[nodiscard]] std::size_t stopOffset() const noexcept;
        [[nodiscard]] bool hasRemainder() const noexcept;

    private:
        bool startsMarkup(std::size_t position) const;
        bool scanStartTag(Token& token);
        bool scanEndTag(Token& token);
        bool scanComment(Token& token);
        bool scanAttribute(Token& token);
        std::size_t scanName(std::size_t position) const;
        void skipWhitespace();
        Token makeEndOfInput() const;

        char peek(std::size_t ahead = 0) const;
        bool isAtEnd() const;

    private:
        std::string_view m_input;
        std::size_t m_current{0};
        std::size_t m_stop{0};
        bool m_stopped{false};
    };
} // namespace stencil::markup
