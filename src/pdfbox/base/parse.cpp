#include <pdfbox/base/parse.h>
#include <pdfbox/base/strings.h>

namespace pdfbox
{
    bool ParserBase::try_match_keyword_icase(StringView keyword)
    {
        const StringView rest{m_it, m_text.end()};
        if (rest.size() < keyword.size() ||
            !Strings::case_insensitive_ascii_equals(rest.substr(0, keyword.size()), keyword))
        {
            return false;
        }

        m_it += keyword.size();
        return true;
    }
}
