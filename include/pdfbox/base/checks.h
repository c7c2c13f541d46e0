#pragma once

#include <pdfbox/base/lineinfo.h>
#include <pdfbox/base/messages.h>
#include <pdfbox/base/stringview.h>

namespace pdfbox::Checks
{
    // Flushes stdio and exits; a second entry (from an atexit handler, say) aborts instead.
    [[noreturn]] void final_cleanup_and_exit(const int exit_code);

    // A broken internal invariant. Aborts in debug builds.
    [[noreturn]] void unreachable(const LineInfo& line_info);
    [[noreturn]] void unreachable(const LineInfo& line_info, StringView message);

    [[noreturn]] void exit_with_code(const LineInfo& line_info, const int exit_code);
    [[noreturn]] void exit_fail(const LineInfo& line_info);
    [[noreturn]] void exit_success(const LineInfo& line_info);

    // Prints error_message to stderr as is and exits with failure.
    [[noreturn]] void msg_exit_with_message(const LineInfo& line_info, const LocalizedString& error_message);

    // Prints "error: " followed by message to stderr and exits with failure.
    [[noreturn]] void msg_exit_with_error(const LineInfo& line_info, const LocalizedString& message);

    template<PDFBOX_DECL_MSG_TEMPLATE>
    [[noreturn]] void msg_exit_with_error(const LineInfo& line_info, PDFBOX_DECL_MSG_ARGS)
    {
        msg_exit_with_error(line_info, msg::format(PDFBOX_EXPAND_MSG_ARGS));
    }

    // Internal consistency checks; a false expression is reported as an internal error.
    void check_exit(const LineInfo& line_info, bool expression);
    void check_exit(const LineInfo& line_info, bool expression, StringView error_message);
}
