#pragma once

#include <pdfbox/base/stringview.h>

#include <string>
#include <utility>

namespace pdfbox
{
    // A '/' separated path held as text; operations are purely lexical.
    struct Path
    {
        Path() = default;
        Path(StringView sv) : m_str(sv.to_string()) { }
        Path(const std::string& s) : m_str(s) { }
        Path(std::string&& s) : m_str(std::move(s)) { }
        Path(const char* s) : m_str(s) { }

        const std::string& native() const noexcept { return m_str; }
        const char* c_str() const noexcept { return m_str.c_str(); }
        operator StringView() const noexcept { return m_str; }
        bool empty() const noexcept { return m_str.empty(); }

        // An absolute rhs replaces the path; otherwise exactly one '/' separates the parts.
        Path& operator/=(StringView rhs);
        Path operator/(StringView rhs) const
        {
            Path result = *this;
            result /= rhs;
            return result;
        }

        // Appends to the last component, as in "x.jar" + ".part".
        Path operator+(StringView rhs) const
        {
            Path result = *this;
            result.m_str.append(rhs.data(), rhs.size());
            return result;
        }

        // Everything before the last component, without trailing separators; "/" stays "/".
        StringView parent_path() const;

        // The last component; empty when the path ends with '/'.
        StringView filename() const;

        bool is_absolute() const noexcept { return !m_str.empty() && m_str.front() == '/'; }

        const std::string& to_string() const noexcept { return m_str; }
        void to_string(std::string& out) const { out.append(m_str); }

    private:
        std::string m_str;
    };
}

PDFBOX_FORMAT_AS(pdfbox::Path, pdfbox::StringView);
