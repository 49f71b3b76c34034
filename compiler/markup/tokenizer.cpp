#include "tokenizer.hpp"

#include <cctype>
#include <string>
#include <utility>

namespace
{
    bool isMarkupWhitespace(char ch)
    {
        return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f';
    }

    bool isTagNameStart(char ch)
    {
        return std::isalpha(static_cast<unsigned char>(ch));
    }

    std::string toLower(std::string_view text)
    {
        std::string result;
        result.reserve(text.size());
        for (char ch : text)
        {
            result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
        }
        return result;
    }
} // namespace

namespace stencil::markup
{
    Tokenizer::Tokenizer(std::string_view input)
        : m_input(input)
        , m_stop(input.size())
    {
    }

    std::size_t Tokenizer::stopOffset() const noexcept
    {
        return m_stop;
    }

    bool Tokenizer::hasRemainder() const noexcept
    {
        return m_stop < m_input.size();
    }

    Token Tokenizer::next()
    {
        if (m_stopped || isAtEnd())
        {
            return makeEndOfInput();
        }

        if (startsMarkup(m_current))
        {
            const std::size_t start = m_current;

            Token token;
            token.offset = start;

            bool complete = false;
            if (peek(1) == '!')
            {
                complete = scanComment(token);
            }
            else if (peek(1) == '/')
            {
                complete = scanEndTag(token);
            }
            else
            {
                complete = scanStartTag(token);
            }

            if (!complete)
            {
                // The tag continues in a later chunk; leave it unconsumed.
                m_current = start;
                m_stop = start;
                m_stopped = true;
                return makeEndOfInput();
            }

            token.length = m_current - start;
            return token;
        }

        Token token;
        token.kind = TokenKind::Text;
        token.offset = m_current;
        ++m_current;
        while (!isAtEnd() && !startsMarkup(m_current))
        {
            ++m_current;
        }
        token.length = m_current - token.offset;
        token.data = std::string{m_input.substr(token.offset, token.length)};
        return token;
    }

    bool Tokenizer::startsMarkup(std::size_t position) const
    {
        if (position + 1 >= m_input.size() || m_input[position] != '<')
        {
            return false;
        }

        const char next = m_input[position + 1];
        if (isTagNameStart(next) || next == '!')
        {
            return true;
        }

        return next == '/' && position + 2 < m_input.size() && isTagNameStart(m_input[position + 2]);
    }

    bool Tokenizer::scanStartTag(Token& token)
    {
        token.kind = TokenKind::StartTag;

        ++m_current;
        token.nameOffset = m_current;
        m_current = scanName(m_current);
        token.nameLength = m_current - token.nameOffset;
        token.name = toLower(m_input.substr(token.nameOffset, token.nameLength));

        while (true)
        {
            skipWhitespace();
            if (isAtEnd())
            {
                return false;
            }

            const char ch = peek();
            if (ch == '>')
            {
                ++m_current;
                return true;
            }

            if (ch == '/')
            {
                if (peek(1) == '>')
                {
                    token.selfClosing = true;
                    m_current += 2;
                    return true;
                }

                if (m_current + 1 >= m_input.size())
                {
                    return false;
                }

                ++m_current;
                continue;
            }

            if (!scanAttribute(token))
            {
                return false;
            }
        }
    }

    bool Tokenizer::scanAttribute(Token& token)
    {
        Attribute attribute;
        attribute.nameOffset = m_current;

        // A leading '=' belongs to the name, any later one starts the value.
        std::size_t nameEnd = m_current + 1;
        while (nameEnd < m_input.size())
        {
            const char ch = m_input[nameEnd];
            if (isMarkupWhitespace(ch) || ch == '/' || ch == '>' || ch == '=')
            {
                break;
            }
            ++nameEnd;
        }

        attribute.name = std::string{m_input.substr(m_current, nameEnd - m_current)};
        m_current = nameEnd;

        skipWhitespace();
        if (isAtEnd())
        {
            return false;
        }

        if (peek() != '=')
        {
            attribute.valueBegin = nameEnd;
            attribute.valueEnd = nameEnd;
            token.attributes.emplace_back(std::move(attribute));
            return true;
        }

        ++m_current;
        skipWhitespace();
        if (isAtEnd())
        {
            return false;
        }

        attribute.hasValue = true;

        const char quote = peek();
        if (quote == '"' || quote == '\'')
        {
            const std::size_t begin = m_current + 1;
            const std::size_t end = m_input.find(quote, begin);
            if (end == std::string_view::npos)
            {
                return false;
            }

            attribute.valueBegin = begin;
            attribute.valueEnd = end;
            m_current = end + 1;
        }
        else
        {
            attribute.valueBegin = m_current;
            while (!isAtEnd() && !isMarkupWhitespace(peek()) && peek() != '>')
            {
                ++m_current;
            }

            if (isAtEnd())
            {
                return false;
            }

            attribute.valueEnd = m_current;
        }

        attribute.value = std::string{m_input.substr(attribute.valueBegin, attribute.valueEnd - attribute.valueBegin)};
        token.attributes.emplace_back(std::move(attribute));
        return true;
    }

    bool Tokenizer::scanEndTag(Token& token)
    {
        token.kind = TokenKind::EndTag;

        m_current += 2;
        token.nameOffset = m_current;
        m_current = scanName(m_current);
        token.nameLength = m_current - token.nameOffset;
        token.name = toLower(m_input.substr(token.nameOffset, token.nameLength));

        const std::size_t close = m_input.find('>', m_current);
        if (close == std::string_view::npos)
        {
            return false;
        }

        m_current = close + 1;
        return true;
    }

    bool Tokenizer::scanComment(Token& token)
    {
        token.kind = TokenKind::Comment;

        if (m_input.compare(m_current, 4, "<!--") == 0)
        {
            const std::size_t close = m_input.find("-->", m_current + 4);
            if (close == std::string_view::npos)
            {
                return false;
            }

            token.data = std::string{m_input.substr(m_current + 4, close - m_current - 4)};
            m_current = close + 3;
            return true;
        }

        // <!DOCTYPE ...> and other declarations are treated as comments.
        const std::size_t close = m_input.find('>', m_current + 2);
        if (close == std::string_view::npos)
        {
            return false;
        }

        token.data = std::string{m_input.substr(m_current + 2, close - m_current - 2)};
        m_current = close + 1;
        return true;
    }

    std::size_t Tokenizer::scanName(std::size_t position) const
    {
        while (position < m_input.size())
        {
            const char ch = m_input[position];
            if (isMarkupWhitespace(ch) || ch == '/' || ch == '>')
            {
                break;
            }
            ++position;
        }
        return position;
    }

    void Tokenizer::skipWhitespace()
    {
        while (!isAtEnd() && isMarkupWhitespace(peek()))
        {
            ++m_current;
        }
    }

    Token Tokenizer::makeEndOfInput() const
    {
        Token token;
        token.kind = TokenKind::EndOfInput;
        token.offset = m_stop;
        return token;
    }

    char Tokenizer::peek(std::size_t ahead) const
    {
        const std::size_t position = m_current + ahead;
        if (position >= m_input.size())
        {
            return '\0';
        }
        return m_input[position];
    }

    bool Tokenizer::isAtEnd() const
    {
        return m_current >= m_input.size();
    }
} // namespace stencil::markup
