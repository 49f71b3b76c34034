#include "token.hpp"

namespace stencil::markup
{
    std::string_view toString(TokenKind kind)
    {
        switch (kind)
        {
        case TokenKind::Text:
            return "Text";
        case TokenKind::StartTag:
            return "StartTag";
        case TokenKind::EndTag:
            return "EndTag";
        case TokenKind::Comment:
            return "Comment";
        case TokenKind::EndOfInput:
            return "EndOfInput";
        }

        return "Unknown";
    }
} // namespace stencil::markup
