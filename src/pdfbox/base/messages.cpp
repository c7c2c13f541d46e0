#include <pdfbox/base/checks.h>
#include <pdfbox/base/messages.h>

#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

#include <iterator>

namespace
{
    using namespace pdfbox;

    struct MessageEntry
    {
        StringLiteral name;
        StringLiteral text;
    };

    constexpr MessageEntry message_table[] = {
#define DECLARE_MESSAGE(NAME, ARGS, COMMENT, ...) {#NAME, __VA_ARGS__},
#include <pdfbox/base/message-data.inc.h>
#undef DECLARE_MESSAGE
    };

    enum class MessageId : size_t
    {
#define DECLARE_MESSAGE(NAME, ARGS, COMMENT, ...) NAME,
#include <pdfbox/base/message-data.inc.h>
#undef DECLARE_MESSAGE
    };

    // Output is unbuffered so that it interleaves correctly with the output of child processes.
    bool write_fully(int fd, const char* data, size_t size)
    {
        while (size != 0)
        {
            const auto written = ::write(fd, data, size);
            if (written < 0)
            {
                if (errno == EINTR) continue;
                return false;
            }

            data += written;
            size -= static_cast<size_t>(written);
        }

        return true;
    }

    void write_colored(int fd, bool colorize, Color c, StringView text)
    {
        if (text.empty()) return;

        std::string buffer;
        const bool use_color = colorize && c != Color::none;
        if (use_color)
        {
            buffer.append("\x1b[9");
            buffer.push_back(static_cast<char>(c));
            buffer.push_back('m');
        }

        buffer.append(text.data(), text.size());
        if (use_color)
        {
            buffer.append("\x1b[0m");
        }

        if (!write_fully(fd, buffer.data(), buffer.size()))
        {
            ::fprintf(stderr, "pdfbox: failed to write to file descriptor %d: errno %d\n", fd, errno);
            ::abort();
        }
    }
}

namespace pdfbox
{
    LocalizedString LocalizedString::from_raw(std::string&& text) noexcept { return LocalizedString(std::move(text)); }
    LocalizedString LocalizedString::from_raw(StringView text) { return LocalizedString(text.to_string()); }

    LocalizedString& LocalizedString::append_raw(char ch) &
    {
        m_text.push_back(ch);
        return *this;
    }

    LocalizedString& LocalizedString::append_raw(StringView text) &
    {
        m_text.append(text.data(), text.size());
        return *this;
    }

    LocalizedString& LocalizedString::append(const LocalizedString& other) &
    {
        m_text.append(other.m_text);
        return *this;
    }

    LocalizedString& LocalizedString::append_indent(size_t levels) &
    {
        m_text.append(levels * 2, ' ');
        return *this;
    }

    LocalizedString format_environment_variable(StringView variable_name)
    {
        return LocalizedString::from_raw(fmt::format("${}", variable_name));
    }

    LocalizedString error_prefix() { return LocalizedString::from_raw(ErrorPrefix); }
    LocalizedString warning_prefix() { return LocalizedString::from_raw(WarningPrefix); }

#define DECLARE_MESSAGE(NAME, ARGS, COMMENT, ...)                                                                      \
    const decltype(::pdfbox::msg::detail::make_message_base ARGS) msg##NAME{static_cast<size_t>(MessageId::NAME)};
#include <pdfbox/base/message-data.inc.h>
#undef DECLARE_MESSAGE
}

namespace pdfbox::msg
{
    std::string detail::format_message(size_t index, fmt::format_args args)
    {
        if (index >= std::size(message_table)) Checks::unreachable(PDFBOX_LINE_INFO);

        const auto& entry = message_table[index];
        try
        {
            return fmt::vformat(entry.text.view(), args);
        }
        catch (const fmt::format_error& e)
        {
            write_unlocalized_text_to_stderr(
                Color::error,
                fmt::format("{}could not format message {} (\"{}\"): {}\n",
                            InternalErrorPrefix,
                            entry.name,
                            entry.text,
                            e.what()));
        }

        Checks::exit_fail(PDFBOX_LINE_INFO);
    }

    void write_unlocalized_text_to_stdout(Color c, StringView sv)
    {
        static const bool colorize = ::isatty(STDOUT_FILENO) != 0;
        write_colored(STDOUT_FILENO, colorize, c, sv);
    }

    void write_unlocalized_text_to_stderr(Color c, StringView sv)
    {
        static const bool colorize = ::isatty(STDERR_FILENO) != 0;
        write_colored(STDERR_FILENO, colorize, c, sv);
    }

    LocalizedString format_error(const LocalizedString& s) { return error_prefix().append(s); }
    LocalizedString format_warning(const LocalizedString& s) { return warning_prefix().append(s); }

    void println(const LocalizedString& s)
    {
        write_unlocalized_text_to_stdout(Color::none, LocalizedString(s).append_raw('\n'));
    }

    void println_warning(const LocalizedString& s)
    {
        write_unlocalized_text_to_stderr(Color::warning, format_warning(s).append_raw('\n'));
    }
}
