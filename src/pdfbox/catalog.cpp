#include <pdfbox/base/diagnostics.h>
#include <pdfbox/base/downloads.h>
#include <pdfbox/base/message_sinks.h>
#include <pdfbox/base/parse.h>
#include <pdfbox/base/strings.h>
#include <pdfbox/base/system.debug.h>

#include <pdfbox/catalog.h>
#include <pdfbox/versions.h>

#include <algorithm>

namespace
{
    using namespace pdfbox;

    bool is_qualifier_char(char ch) noexcept
    {
        return ParserBase::is_alphanum(static_cast<unsigned char>(ch)) || ch == '.' || ch == '-' || ch == '+';
    }

    void append_decoded_entities(std::string& target, StringView value)
    {
        static constexpr struct
        {
            StringLiteral entity;
            char ch;
        } entities[] = {
            {"&amp;", '&'},
            {"&lt;", '<'},
            {"&gt;", '>'},
            {"&quot;", '"'},
            {"&#39;", '\''},
            {"&apos;", '\''},
        };

        auto first = value.begin();
        const auto last = value.end();
        while (first != last)
        {
            if (*first == '&')
            {
                const StringView rest{first, last};
                bool matched = false;
                for (auto&& entry : entities)
                {
                    if (rest.starts_with(entry.entity))
                    {
                        target.push_back(entry.ch);
                        first += entry.entity.size();
                        matched = true;
                        break;
                    }
                }

                if (matched)
                {
                    continue;
                }
            }

            target.push_back(*first);
            ++first;
        }
    }

    struct AnchorParser : ParserBase
    {
        explicit AnchorParser(StringView html) : ParserBase(html) { }

        std::set<std::string> parse_versions()
        {
            std::set<std::string> result;
            for (;;)
            {
                match_until([](char32_t ch) { return ch == '<'; });
                if (at_eof())
                {
                    return result;
                }

                next(); // consume <
                if (try_match_keyword_icase("!--"))
                {
                    skip_comment();
                    continue;
                }

                const auto tag_name = match_while(is_alphanum);
                if (tag_name.empty())
                {
                    // closing tags, doctype, processing instructions
                    match_until([](char32_t ch) { return ch == '>'; });
                    continue;
                }

                parse_attributes(Strings::case_insensitive_ascii_equals(tag_name, "a"), result);
            }
        }

    private:
        void skip_comment()
        {
            for (;;)
            {
                match_until([](char32_t ch) { return ch == '-'; });
                if (at_eof() || try_match_keyword_icase("-->"))
                {
                    return;
                }

                next();
            }
        }

        static bool is_attribute_name_end(char32_t ch)
        {
            return is_whitespace(ch) || ch == '=' || ch == '>' || ch == '/';
        }

        // Consumes attributes through the closing '>' of the tag.
        void parse_attributes(bool is_anchor, std::set<std::string>& result)
        {
            for (;;)
            {
                skip_whitespace();
                const auto ch = cur();
                if (ch == end_of_file)
                {
                    return;
                }

                if (ch == '>')
                {
                    next();
                    return;
                }

                const auto attribute_name = match_until(is_attribute_name_end);
                if (attribute_name.empty())
                {
                    // stray '/' or '='
                    next();
                    continue;
                }

                skip_whitespace();
                if (cur() != '=')
                {
                    continue;
                }

                next();
                skip_whitespace();
                StringView value;
                const auto quote = cur();
                if (quote == '"' || quote == '\'')
                {
                    next();
                    value = match_until([quote](char32_t c) { return c == quote; });
                    next();
                }
                else
                {
                    value = match_until([](char32_t c) { return is_whitespace(c) || c == '>'; });
                }

                if (is_anchor && Strings::case_insensitive_ascii_equals(attribute_name, "href"))
                {
                    add_if_version(value, result);
                }
            }
        }

        static void add_if_version(StringView href, std::set<std::string>& result)
        {
            std::string decoded;
            append_decoded_entities(decoded, href);
            const auto first = decoded.find_first_not_of('/');
            if (first == std::string::npos)
            {
                return;
            }

            const auto last = decoded.find_last_not_of('/') + 1;
            const StringView candidate = StringView{decoded}.substr(first, last - first);
            if (is_catalog_version(candidate))
            {
                result.insert(candidate.to_string());
            }
        }
    };
}

namespace pdfbox
{
    bool is_catalog_version(StringView candidate)
    {
        auto first = candidate.begin();
        const auto last = candidate.end();
        for (;;)
        {
            const auto group_start = first;
            while (first != last && ParserBase::is_ascii_digit(static_cast<unsigned char>(*first)))
            {
                ++first;
            }

            if (first == group_start)
            {
                return false;
            }

            if (first == last)
            {
                return DotVersion::try_parse(candidate).has_value();
            }

            if (*first == '.' && first + 1 != last && ParserBase::is_ascii_digit(static_cast<unsigned char>(first[1])))
            {
                ++first;
                continue;
            }

            break;
        }

        if (*first != '-' && *first != '.' && *first != '+')
        {
            return false;
        }

        ++first;
        return first != last && std::all_of(first, last, is_qualifier_char) &&
               DotVersion::try_parse(candidate).has_value();
    }

    std::set<std::string> parse_catalog_versions(StringView html)
    {
        AnchorParser parser{html};
        return parser.parse_versions();
    }

    VersionCatalog::VersionCatalog(const HttpClient& http, MessageSink& status_sink, std::string base_url)
        : m_http(http), m_status_sink(status_sink), m_base_url(std::move(base_url))
    {
    }

    ExpectedP<std::set<std::string>> VersionCatalog::fetch_versions() const
    {
        BufferedDiagnosticContext bdc{m_status_sink};
        bdc.statusln(msg::format(msgFetchingCatalog, msg::url = m_base_url));
        auto maybe_body = m_http.get_text(bdc, m_base_url);
        auto body = maybe_body.get();
        if (!body)
        {
            return PdfBoxError::from_diagnostics(PdfBoxErrorKind::Network, bdc);
        }

        auto versions = parse_catalog_versions(*body);
        Debug::println("catalog ", m_base_url, " lists ", versions.size(), " versions");
        if (versions.empty())
        {
            return PdfBoxError{PdfBoxErrorKind::Resolution, msg::format(msgNoVersionsInCatalog, msg::url = m_base_url)};
        }

        return versions;
    }
}
