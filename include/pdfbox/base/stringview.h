#pragma once

#include <pdfbox/base/fwd/fmt.h>
#include <pdfbox/base/fwd/stringview.h>

#include <pdfbox/base/fmt.h>

#include <stddef.h>

#include <string>
#include <string_view>

namespace pdfbox
{
    // A non-owning run of chars. Not necessarily null terminated; see ZStringView for that.
    struct StringView
    {
        constexpr StringView() noexcept = default;
        StringView(const std::string& s) noexcept : m_view(s) { }
        constexpr StringView(const char* ptr) noexcept : m_view(ptr) { }
        constexpr StringView(const char* ptr, size_t size) noexcept : m_view(ptr, size) { }
        constexpr StringView(const char* first, const char* last) noexcept
            : m_view(first, static_cast<size_t>(last - first))
        {
        }
        explicit constexpr StringView(std::string_view view) noexcept : m_view(view) { }

        constexpr const char* begin() const noexcept { return m_view.data(); }
        constexpr const char* end() const noexcept { return m_view.data() + m_view.size(); }
        constexpr const char* data() const noexcept { return m_view.data(); }
        constexpr size_t size() const noexcept { return m_view.size(); }
        constexpr bool empty() const noexcept { return m_view.empty(); }
        constexpr char front() const noexcept { return m_view.front(); }
        constexpr char back() const noexcept { return m_view.back(); }
        constexpr char operator[](size_t pos) const noexcept { return m_view[pos]; }

        // Clamps instead of throwing when pos is past the end.
        constexpr StringView substr(size_t pos, size_t count = std::string_view::npos) const noexcept
        {
            if (pos > m_view.size()) return StringView{};
            return StringView{m_view.substr(pos, count)};
        }

        bool starts_with(StringView prefix) const noexcept
        {
            return m_view.size() >= prefix.size() && m_view.compare(0, prefix.size(), prefix.m_view) == 0;
        }

        bool ends_with(StringView suffix) const noexcept
        {
            return m_view.size() >= suffix.size() &&
                   m_view.compare(m_view.size() - suffix.size(), suffix.size(), suffix.m_view) == 0;
        }

        constexpr std::string_view view() const noexcept { return m_view; }
        std::string to_string() const { return std::string{m_view}; }
        void to_string(std::string& out) const { out.append(m_view.data(), m_view.size()); }
        explicit operator std::string() const { return to_string(); }

    private:
        std::string_view m_view;
    };

    // Free functions so that types converting to StringView, such as Path, compare too.
    inline bool operator==(StringView lhs, StringView rhs) noexcept { return lhs.view() == rhs.view(); }
    inline bool operator!=(StringView lhs, StringView rhs) noexcept { return lhs.view() != rhs.view(); }
    inline bool operator<(StringView lhs, StringView rhs) noexcept { return lhs.view() < rhs.view(); }
    inline bool operator>(StringView lhs, StringView rhs) noexcept { return lhs.view() > rhs.view(); }
    inline bool operator<=(StringView lhs, StringView rhs) noexcept { return lhs.view() <= rhs.view(); }
    inline bool operator>=(StringView lhs, StringView rhs) noexcept { return lhs.view() >= rhs.view(); }

    struct ZStringView : StringView
    {
        constexpr ZStringView() noexcept : StringView("", size_t{0}) { }
        ZStringView(const std::string& s) noexcept : StringView(s) { }
        constexpr ZStringView(const char* ptr) noexcept : StringView(ptr) { }
        constexpr ZStringView(const char* ptr, size_t size) noexcept : StringView(ptr, size) { }

        constexpr const char* c_str() const noexcept { return data(); }
    };

    struct StringLiteral : ZStringView
    {
        template<size_t N>
        constexpr StringLiteral(const char (&literal)[N]) noexcept : ZStringView(literal, N - 1)
        {
        }
    };
}

template<class Char>
struct fmt::formatter<pdfbox::StringView, Char, void> : fmt::formatter<std::basic_string_view<Char>, Char, void>
{
    template<class FormatContext>
    auto format(pdfbox::StringView value, FormatContext& ctx) const -> decltype(ctx.out())
    {
        return fmt::formatter<std::basic_string_view<Char>, Char, void>::format(value.view(), ctx);
    }
};

PDFBOX_FORMAT_AS(pdfbox::ZStringView, pdfbox::StringView);
PDFBOX_FORMAT_AS(pdfbox::StringLiteral, pdfbox::StringView);
