#pragma once

#include <pdfbox/base/fwd/stringview.h>

namespace pdfbox
{
    // The values are the ANSI bright color digits written after "\x1b[9".
    enum class Color : char
    {
        none = 0,
        success = '2',
        error = '1',
        warning = '3',
    };

    struct LocalizedString;
    struct MessageSink;

    namespace msg
    {
        template<class... Tags>
        struct MessageT;

        template<class Tag>
        struct Arg;

        void write_unlocalized_text_to_stdout(Color c, StringView sv);
        void write_unlocalized_text_to_stderr(Color c, StringView sv);
    }
}
