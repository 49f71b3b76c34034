#include "code_writer.hpp"

#include <cstdio>

namespace stencil::emit
{
    CodeWriter::CodeWriter(std::size_t indentSize)
        : m_indentSize(indentSize)
    {
    }

    CodeWriter& CodeWriter::write(std::string_view text)
    {
        if (text.empty())
        {
            return *this;
        }

        writeIndentIfNeeded();
        m_buffer.append(text.data(), text.size());
        return *this;
    }

    CodeWriter& CodeWriter::writeLine(std::string_view text)
    {
        write(text);
        m_buffer.push_back('\n');
        m_atLineStart = true;
        return *this;
    }

    CodeWriter& CodeWriter::writeStringLiteral(std::string_view text)
    {
        writeIndentIfNeeded();
        m_buffer.push_back('"');
        for (char ch : text)
        {
            switch (ch)
            {
            case '\\':
                m_buffer += "\\\\";
                break;
            case '"':
                m_buffer += "\\\"";
                break;
            case '\n':
                m_buffer += "\\n";
                break;
            case '\r':
                m_buffer += "\\r";
                break;
            case '\t':
                m_buffer += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20)
                {
                    // Fixed-width octal, so a following digit is not read as part of the escape.
                    char escaped[8];
                    std::snprintf(escaped, sizeof(escaped), "\\%03o", static_cast<unsigned int>(static_cast<unsigned char>(ch)));
                    m_buffer += escaped;
                }
                else
                {
                    m_buffer.push_back(ch);
                }
                break;
            }
        }
        m_buffer.push_back('"');
        return *this;
    }

    void CodeWriter::indent()
    {
        ++m_level;
    }

    void CodeWriter::dedent()
    {
        if (m_level > 0)
        {
            --m_level;
        }
    }

    const std::string& CodeWriter::str() const noexcept
    {
        return m_buffer;
    }

    void CodeWriter::writeIndentIfNeeded()
    {
        if (m_atLineStart)
        {
            m_buffer.append(m_level * m_indentSize, ' ');
            m_atLineStart = false;
        }
    }
} // namespace stencil::emit
