#include <pdfbox/base/path.h>

namespace pdfbox
{
    Path& Path::operator/=(StringView rhs)
    {
        if (!rhs.empty() && rhs.front() == '/')
        {
            m_str = rhs.to_string();
            return *this;
        }

        if (!m_str.empty() && m_str.back() != '/')
        {
            m_str.push_back('/');
        }

        m_str.append(rhs.data(), rhs.size());
        return *this;
    }

    StringView Path::filename() const
    {
        const auto last_slash = m_str.find_last_of('/');
        if (last_slash == std::string::npos)
        {
            return m_str;
        }

        return StringView{m_str}.substr(last_slash + 1);
    }

    StringView Path::parent_path() const
    {
        const auto root_end = m_str.find_first_not_of('/');
        if (root_end == std::string::npos)
        {
            // "" or only separators
            return m_str;
        }

        size_t end = m_str.size();
        while (end > root_end && m_str[end - 1] != '/')
        {
            --end;
        }

        while (end > root_end && m_str[end - 1] == '/')
        {
            --end;
        }

        if (end == root_end)
        {
            // a single component: its parent is the root, if any
            return StringView{m_str}.substr(0, root_end);
        }

        return StringView{m_str}.substr(0, end);
    }
}
