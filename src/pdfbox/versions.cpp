#include <pdfbox/base/messages.h>
#include <pdfbox/base/parse.h>
#include <pdfbox/base/strings.h>

#include <pdfbox/versions.h>

#include <algorithm>

namespace
{
    using namespace pdfbox;

    bool is_digit(char ch) { return ParserBase::is_ascii_digit(static_cast<unsigned char>(ch)); }
    bool is_identifier_char(char ch) { return ParserBase::is_alphanumdash(static_cast<unsigned char>(ch)); }

    // Decimal digits only; overflow of uint64_t is rejected.
    Optional<uint64_t> parse_decimal(StringView digits)
    {
        if (digits.empty() || !std::all_of(digits.begin(), digits.end(), is_digit))
        {
            return nullopt;
        }

        uint64_t value = 0;
        for (char ch : digits)
        {
            const uint64_t digit = static_cast<uint64_t>(ch - '0');
            if (value > (UINT64_MAX - digit) / 10)
            {
                return nullopt;
            }

            value = value * 10 + digit;
        }

        return value;
    }

    size_t count_while(StringView text, size_t pos, bool (*pred)(char))
    {
        size_t end = pos;
        while (end < text.size() && pred(text[end]))
        {
            ++end;
        }

        return end - pos;
    }

    // Appends the '.' separated identifiers of text starting at pos; returns the position after the last one.
    Optional<size_t> take_identifiers(StringView text, size_t pos, std::vector<std::string>* identifiers)
    {
        for (;;)
        {
            const size_t length = count_while(text, pos, is_identifier_char);
            if (length == 0)
            {
                return nullopt;
            }

            if (identifiers)
            {
                identifiers->push_back(text.substr(pos, length).to_string());
            }

            pos += length;
            if (pos == text.size() || text[pos] != '.')
            {
                return pos;
            }

            ++pos;
        }
    }

    Optional<DotVersion> try_parse_dot_version(StringView text)
    {
        DotVersion result;
        result.original_string = text.to_string();

        // numeric groups; a '.' not followed by a digit starts the qualifier instead
        size_t pos = 0;
        for (;;)
        {
            const size_t length = count_while(text, pos, is_digit);
            auto group = parse_decimal(text.substr(pos, length));
            if (!group)
            {
                return nullopt;
            }

            result.version.push_back(*group.get());
            pos += length;
            if (pos + 1 < text.size() && text[pos] == '.' && is_digit(text[pos + 1]))
            {
                ++pos;
                continue;
            }

            break;
        }

        result.version_string = text.substr(0, pos).to_string();
        if (pos < text.size() && (text[pos] == '-' || text[pos] == '.'))
        {
            const size_t prerelease_start = pos + 1;
            auto prerelease_end = take_identifiers(text, prerelease_start, &result.identifiers);
            if (!prerelease_end)
            {
                return nullopt;
            }

            pos = *prerelease_end.get();
            result.prerelease_string = text.substr(prerelease_start, pos - prerelease_start).to_string();
        }

        if (pos < text.size())
        {
            // build metadata does not take part in ordering
            if (text[pos] != '+')
            {
                return nullopt;
            }

            auto build_end = take_identifiers(text, pos + 1, nullptr);
            if (!build_end || *build_end.get() != text.size())
            {
                return nullopt;
            }
        }

        return result;
    }

    template<class T>
    int three_way(const T& a, const T& b)
    {
        return (b < a) - (a < b);
    }

    // Digit strings of any length, compared by value.
    int compare_digit_strings(StringView a, StringView b)
    {
        const auto strip = [](StringView digits) {
            size_t zeros = 0;
            while (zeros < digits.size() && digits[zeros] == '0')
            {
                ++zeros;
            }

            return digits.substr(zeros);
        };

        a = strip(a);
        b = strip(b);
        if (a.size() != b.size())
        {
            return three_way(a.size(), b.size());
        }

        return three_way(a, b);
    }

    // Purely numeric identifiers sort first, by value. Others are split into a leading label and a trailing number,
    // so that alpha2 < alpha10 < beta1 < RC1; labels compare ignoring case.
    int compare_prerelease_identifier(const std::string& a, const std::string& b)
    {
        const bool a_numeric = std::all_of(a.begin(), a.end(), is_digit);
        const bool b_numeric = std::all_of(b.begin(), b.end(), is_digit);
        if (a_numeric || b_numeric)
        {
            if (a_numeric && b_numeric)
            {
                return compare_digit_strings(a, b);
            }

            return a_numeric ? -1 : 1;
        }

        const auto split_at = [](const std::string& identifier) {
            size_t label_end = identifier.size();
            while (label_end > 0 && is_digit(identifier[label_end - 1]))
            {
                --label_end;
            }

            return label_end;
        };

        const size_t a_split = split_at(a);
        const size_t b_split = split_at(b);
        const StringView a_label = StringView{a}.substr(0, a_split);
        const StringView b_label = StringView{b}.substr(0, b_split);
        if (Strings::case_insensitive_ascii_less(a_label, b_label)) return -1;
        if (Strings::case_insensitive_ascii_less(b_label, a_label)) return 1;

        return compare_digit_strings(StringView{a}.substr(a_split), StringView{b}.substr(b_split));
    }

    // Element by element; when one sequence is a prefix of the other, the shorter one is smaller.
    template<class T, class Compare>
    int compare_sequences(const std::vector<T>& a, const std::vector<T>& b, Compare compare_elements)
    {
        const size_t common = std::min(a.size(), b.size());
        for (size_t idx = 0; idx < common; ++idx)
        {
            if (const int result = compare_elements(a[idx], b[idx]))
            {
                return result;
            }
        }

        return three_way(a.size(), b.size());
    }
}

namespace pdfbox
{
    VerComp int_to_vercomp(int comparison_result)
    {
        if (comparison_result < 0) return VerComp::lt;
        if (comparison_result > 0) return VerComp::gt;
        return VerComp::eq;
    }

    bool operator==(const DotVersion& lhs, const DotVersion& rhs) { return compare(lhs, rhs) == VerComp::eq; }
    bool operator<(const DotVersion& lhs, const DotVersion& rhs) { return compare(lhs, rhs) == VerComp::lt; }

    ExpectedL<DotVersion> DotVersion::try_parse(StringView str)
    {
        auto maybe_version = try_parse_dot_version(str);
        if (auto version = maybe_version.get())
        {
            return std::move(*version);
        }

        return msg::format(msgVersionInvalid, msg::version = str);
    }

    VerComp compare(const DotVersion& a, const DotVersion& b)
    {
        if (a.original_string == b.original_string) return VerComp::eq;

        if (const int numeric = compare_sequences(a.version, b.version, three_way<uint64_t>))
        {
            return int_to_vercomp(numeric);
        }

        // a release sorts after all of its pre-releases: 3.0.0 > 3.0.0-RC1
        if (a.identifiers.empty() != b.identifiers.empty())
        {
            return a.identifiers.empty() ? VerComp::gt : VerComp::lt;
        }

        return int_to_vercomp(compare_sequences(a.identifiers, b.identifiers, compare_prerelease_identifier));
    }
}
