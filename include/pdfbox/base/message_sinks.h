#pragma once

#include <pdfbox/base/messages.h>

#include <string>
#include <vector>

namespace pdfbox
{
    // A destination for whole lines of user facing text.
    struct MessageSink
    {
        // text does not include the line terminator.
        virtual void write_line(Color c, StringView text) = 0;

        void println(const LocalizedString& s) { write_line(Color::none, s); }
        void println(Color c, const LocalizedString& s) { write_line(c, s); }

        template<PDFBOX_DECL_MSG_TEMPLATE>
        void println(PDFBOX_DECL_MSG_ARGS)
        {
            write_line(Color::none, msg::format(PDFBOX_EXPAND_MSG_ARGS));
        }

        MessageSink(const MessageSink&) = delete;
        MessageSink& operator=(const MessageSink&) = delete;

    protected:
        MessageSink() = default;
        ~MessageSink() = default;
    };

    // Keeps every line; colors are dropped.
    struct StringMessageSink final : MessageSink
    {
        StringMessageSink() = default;

        void write_line(Color, StringView text) override;

        std::vector<std::string> lines;
    };

    extern MessageSink& null_sink;
    extern MessageSink& stderr_sink;
}
