#include <pdfbox/base/message_sinks.h>

namespace
{
    using namespace pdfbox;

    struct DiscardingSink final : MessageSink
    {
        void write_line(Color, StringView) override { }
    };

    struct StderrSink final : MessageSink
    {
        void write_line(Color c, StringView text) override
        {
            std::string line = text.to_string();
            line.push_back('\n');
            msg::write_unlocalized_text_to_stderr(c, line);
        }
    };

    DiscardingSink discarding_sink_instance;
    StderrSink stderr_sink_instance;
}

namespace pdfbox
{
    void StringMessageSink::write_line(Color, StringView text) { lines.push_back(text.to_string()); }

    MessageSink& null_sink = discarding_sink_instance;
    MessageSink& stderr_sink = stderr_sink_instance;
}
