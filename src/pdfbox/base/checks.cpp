#include <pdfbox/base/checks.h>
#include <pdfbox/base/system.debug.h>

#include <stdio.h>
#include <stdlib.h>

#include <atomic>

namespace
{
    using namespace pdfbox;

    [[noreturn]] void report_internal_error(const LineInfo& line_info, StringView text)
    {
        msg::write_unlocalized_text_to_stderr(
            Color::error, fmt::format("{}{}: {}\n", InternalErrorPrefix, line_info, text));
#ifndef NDEBUG
        ::abort();
#else
        Checks::final_cleanup_and_exit(EXIT_FAILURE);
#endif
    }
}

std::string pdfbox::LineInfo::to_string() const { return fmt::format("{}({})", file_name, line_number); }

namespace pdfbox::Checks
{
    void final_cleanup_and_exit(const int exit_code)
    {
        static std::atomic<bool> exiting{false};
        if (exiting.exchange(true))
        {
            ::abort();
        }

        ::fflush(nullptr);
        ::exit(exit_code);
    }

    void unreachable(const LineInfo& line_info) { report_internal_error(line_info, msg::format(msgChecksUnreachableCode)); }

    void unreachable(const LineInfo& line_info, StringView message) { report_internal_error(line_info, message); }

    void exit_with_code(const LineInfo& line_info, const int exit_code)
    {
        Debug::println("exiting with ", exit_code, " from ", line_info.to_string());
        final_cleanup_and_exit(exit_code);
    }

    void exit_fail(const LineInfo& line_info) { exit_with_code(line_info, EXIT_FAILURE); }

    void exit_success(const LineInfo& line_info) { exit_with_code(line_info, EXIT_SUCCESS); }

    void msg_exit_with_message(const LineInfo& line_info, const LocalizedString& error_message)
    {
        msg::write_unlocalized_text_to_stderr(Color::error, LocalizedString(error_message).append_raw('\n'));
        exit_fail(line_info);
    }

    void msg_exit_with_error(const LineInfo& line_info, const LocalizedString& message)
    {
        msg_exit_with_message(line_info, msg::format_error(message));
    }

    void check_exit(const LineInfo& line_info, bool expression)
    {
        if (!expression)
        {
            report_internal_error(line_info, msg::format(msgChecksFailedCheck));
        }
    }

    void check_exit(const LineInfo& line_info, bool expression, StringView error_message)
    {
        if (!expression)
        {
            report_internal_error(line_info, error_message);
        }
    }
}
