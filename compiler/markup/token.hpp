#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace stencil::markup
{
    enum class TokenKind : std::uint16_t
    {
        Text,
        StartTag,
        EndTag,
        Comment,
        EndOfInput
    };

    struct Attribute
    {
        std::string name;
        std::string value;
        bool hasValue{false};
        // Offsets into the scanned input; for quoted values the range excludes the quotes.
        std::size_t nameOffset{0};
        std::size_t valueBegin{0};
        std::size_t valueEnd{0};
    };

    struct Token
    {
        TokenKind kind{TokenKind::EndOfInput};
        std::size_t offset{0};
        std::size_t length{0};
        // Text and Comment payload, byte-for-byte as written.
        std::string data;
        // Tag name folded to lower case; nameOffset/nameLength locate the author-typed spelling.
        std::string name;
        std::size_t nameOffset{0};
        std::size_t nameLength{0};
        bool selfClosing{false};
        std::vector<Attribute> attributes;
    };

    [[nodiscard]] std::string_view toString(TokenKind kind);
} // namespace stencil::markup
