#include <pdfbox/base/parse.h>
#include <pdfbox/base/strings.h>

#include <errno.h>
#include <limits.h>
#include <stdlib.h>

#include <algorithm>

namespace
{
    char to_lower_ascii(char c) noexcept { return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c; }

    bool is_trimmed_char(char c) noexcept { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }
}

namespace pdfbox::Strings
{
    std::string join(StringView delimiter, const std::vector<std::string>& items)
    {
        std::string result;
        for (size_t idx = 0; idx < items.size(); ++idx)
        {
            if (idx != 0)
            {
                result.append(delimiter.data(), delimiter.size());
            }

            result.append(items[idx]);
        }

        return result;
    }

    bool case_insensitive_ascii_equals(StringView left, StringView right) noexcept
    {
        return std::equal(left.begin(), left.end(), right.begin(), right.end(), [](char a, char b) {
            return to_lower_ascii(a) == to_lower_ascii(b);
        });
    }

    bool case_insensitive_ascii_less(StringView left, StringView right) noexcept
    {
        return std::lexicographical_compare(left.begin(), left.end(), right.begin(), right.end(), [](char a, char b) {
            return to_lower_ascii(a) < to_lower_ascii(b);
        });
    }

    void inplace_ascii_to_lowercase(std::string& s)
    {
        for (auto& c : s)
        {
            c = to_lower_ascii(c);
        }
    }

    std::string ascii_to_lowercase(StringView s)
    {
        auto result = s.to_string();
        inplace_ascii_to_lowercase(result);
        return result;
    }

    bool starts_with(StringView s, StringView prefix) { return s.starts_with(prefix); }
    bool ends_with(StringView s, StringView suffix) { return s.ends_with(suffix); }

    std::string replace_all(StringView s, StringView search, StringView replacement)
    {
        std::string result = s.to_string();
        if (search.empty())
        {
            return result;
        }

        size_t pos = 0;
        while ((pos = result.find(search.data(), pos, search.size())) != std::string::npos)
        {
            result.replace(pos, search.size(), replacement.data(), replacement.size());
            pos += replacement.size();
        }

        return result;
    }

    StringView trim(StringView sv)
    {
        const char* first = sv.begin();
        const char* last = sv.end();
        while (first != last && is_trimmed_char(*first))
        {
            ++first;
        }

        while (last != first && is_trimmed_char(last[-1]))
        {
            --last;
        }

        return StringView{first, last};
    }

    std::vector<std::string> split(StringView s, const char delimiter)
    {
        std::vector<std::string> fields;
        const char* first = s.begin();
        const char* const last = s.end();
        while (first != last)
        {
            const char* field_end = std::find(first, last, delimiter);
            if (field_end != first)
            {
                fields.emplace_back(first, field_end);
            }

            first = field_end == last ? last : field_end + 1;
        }

        return fields;
    }

    const char* find_first_of(StringView s, StringView candidates)
    {
        return std::find_first_of(s.begin(), s.end(), candidates.begin(), candidates.end());
    }

    const char* search(StringView haystack, StringView needle)
    {
        return std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end());
    }

    template<>
    Optional<int> strto<int>(StringView sv)
    {
        if (sv.empty() || ParserBase::is_whitespace(sv.front()))
        {
            return nullopt;
        }

        const std::string terminated = sv.to_string();
        char* parse_end = nullptr;
        errno = 0;
        const long parsed = ::strtol(terminated.c_str(), &parse_end, 10);
        if (parse_end != terminated.c_str() + terminated.size() || errno == ERANGE || parsed < INT_MIN ||
            parsed > INT_MAX)
        {
            return nullopt;
        }

        return static_cast<int>(parsed);
    }
}
