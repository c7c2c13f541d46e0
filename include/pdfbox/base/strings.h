#pragma once

#include <pdfbox/base/fmt.h>
#include <pdfbox/base/optional.h>
#include <pdfbox/base/stringview.h>

#include <iterator>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace pdfbox::Strings::details
{
    template<class T, class = void>
    struct HasToStringInto : std::false_type
    {
    };

    template<class T>
    struct HasToStringInto<T, std::void_t<decltype(std::declval<const T&>().to_string(std::declval<std::string&>()))>>
        : std::true_type
    {
    };

    // Text-like values are copied as is, types that know how to print themselves do so, and everything else
    // (numbers, characters) goes through fmt.
    template<class T>
    void append_one(std::string& into, const T& value)
    {
        if constexpr (std::is_convertible_v<const T&, StringView>)
        {
            const StringView sv = value;
            into.append(sv.data(), sv.size());
        }
        else if constexpr (HasToStringInto<T>::value)
        {
            value.to_string(into);
        }
        else
        {
            fmt::format_to(std::back_inserter(into), "{}", value);
        }
    }
}

namespace pdfbox::Strings
{
    template<class... Args>
    std::string& append(std::string& into, const Args&... args)
    {
        (details::append_one(into, args), ...);
        return into;
    }

    template<class... Args>
    [[nodiscard]] std::string concat(const Args&... args)
    {
        std::string into;
        (details::append_one(into, args), ...);
        return into;
    }

    [[nodiscard]] std::string join(StringView delimiter, const std::vector<std::string>& items);

    bool case_insensitive_ascii_equals(StringView left, StringView right) noexcept;
    bool case_insensitive_ascii_less(StringView left, StringView right) noexcept;

    void inplace_ascii_to_lowercase(std::string& s);
    [[nodiscard]] std::string ascii_to_lowercase(StringView s);

    bool starts_with(StringView s, StringView prefix);
    bool ends_with(StringView s, StringView suffix);

    [[nodiscard]] std::string replace_all(StringView s, StringView search, StringView replacement);

    // Strips spaces, tabs, carriage returns and newlines from both ends.
    [[nodiscard]] StringView trim(StringView sv);

    // Empty fields are dropped, so "a,,b," splits into {"a", "b"}.
    [[nodiscard]] std::vector<std::string> split(StringView s, const char delimiter);

    // Both return s.end() when nothing is found.
    const char* find_first_of(StringView s, StringView candidates);
    const char* search(StringView haystack, StringView needle);

    // Parses the whole of sv as a base 10 number; leading whitespace, trailing garbage and overflow yield nullopt.
    template<class T>
    Optional<T> strto(StringView sv);

    template<>
    Optional<int> strto<int>(StringView sv);
}
