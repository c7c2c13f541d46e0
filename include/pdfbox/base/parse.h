#pragma once

#include <pdfbox/base/stringview.h>

namespace pdfbox
{
    // A byte cursor over ASCII compatible text such as HTML listings and checksum files.
    struct ParserBase
    {
        static constexpr char32_t end_of_file = 0xFFFF'FFFF;

        explicit ParserBase(StringView text) : m_text(text), m_it(text.begin()) { }

        static constexpr bool is_whitespace(char32_t ch) { return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n'; }
        static constexpr bool is_ascii_digit(char32_t ch) { return ch >= '0' && ch <= '9'; }
        static constexpr bool is_ascii_alpha(char32_t ch) { return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z'); }
        static constexpr bool is_alphanum(char32_t ch) { return is_ascii_alpha(ch) || is_ascii_digit(ch); }
        static constexpr bool is_alphanumdash(char32_t ch) { return is_alphanum(ch) || ch == '-'; }
        static constexpr bool is_hex_digit(char32_t ch)
        {
            return is_ascii_digit(ch) || (ch >= 'a' && ch <= 'f') || (ch >= 'A' && ch <= 'F');
        }

        char32_t cur() const { return at_eof() ? end_of_file : static_cast<unsigned char>(*m_it); }
        bool at_eof() const { return m_it == m_text.end(); }

        // Advances one byte and returns the new current character.
        char32_t next()
        {
            if (!at_eof()) ++m_it;
            return cur();
        }

        template<class Pred>
        StringView match_while(Pred p)
        {
            const char* const start = m_it;
            while (!at_eof() && p(cur()))
            {
                ++m_it;
            }

            return StringView{start, m_it};
        }

        template<class Pred>
        StringView match_until(Pred p)
        {
            return match_while([p](char32_t ch) { return !p(ch); });
        }

        StringView skip_whitespace() { return match_while(is_whitespace); }

        // Consumes keyword if the input continues with it, ignoring ASCII case.
        bool try_match_keyword_icase(StringView keyword);

    private:
        StringView m_text;
        const char* m_it;
    };
}
