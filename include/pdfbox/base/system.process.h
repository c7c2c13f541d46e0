#pragma once

#include <pdfbox/base/fwd/system.process.h>

#include <pdfbox/base/diagnostics.h>
#include <pdfbox/base/optional.h>
#include <pdfbox/base/path.h>
#include <pdfbox/base/stringview.h>

#include <string>
#include <vector>

namespace pdfbox
{
    void append_shell_escaped(std::string& target, StringView content);

    // An argument vector for a child process. The first argument names the executable; no shell is involved.
    struct Command
    {
        Command() = default;
        explicit Command(StringView s) { string_arg(s); }

        Command& string_arg(StringView s) &;
        Command&& string_arg(StringView s) && { return std::move(string_arg(s)); };

        const std::vector<std::string>& arguments() const noexcept { return m_args; }

        // The arguments joined with spaces and quoted as a POSIX shell would need them; for display only.
        std::string command_line() const;

        bool empty() const { return m_args.empty(); }
        void clear() { m_args.clear(); }

    private:
        std::vector<std::string> m_args;
    };

    struct ExitCodeAndOutput
    {
        ExitCodeIntegral exit_code;
        std::string output;
    };

    // A child process whose stdout and stderr are joined into one pipe owned by this handle.
    // Destroying a handle that was neither waited on nor detached detaches it.
    struct RunningProcess
    {
        RunningProcess() noexcept = default;
        RunningProcess(long pid, int output_fd, EchoInDebug echo_in_debug) noexcept;
        RunningProcess(const RunningProcess&) = delete;
        RunningProcess(RunningProcess&& other) noexcept;
        RunningProcess& operator=(const RunningProcess&) = delete;
        RunningProcess& operator=(RunningProcess&& other) noexcept;
        ~RunningProcess();

        // Reads the combined output until end of stream, then reaps the child.
        Optional<ExitCodeAndOutput> wait_and_capture(DiagnosticContext& context);
        // Like wait_and_capture, discarding the output.
        Optional<ExitCodeIntegral> wait(DiagnosticContext& context);
        // Hands the child to a background thread that drains its output and reaps it.
        void detach() noexcept;

        bool valid() const noexcept { return m_pid != -1; }
        long pid() const noexcept { return m_pid; }

    private:
        long m_pid = -1;
        int m_output_fd = -1;
        EchoInDebug m_echo_in_debug = EchoInDebug::Hide;
    };

    Optional<RunningProcess> cmd_spawn_and_capture(DiagnosticContext& context,
                                                   const Command& cmd,
                                                   EchoInDebug echo_in_debug = EchoInDebug::Hide);

    Optional<ExitCodeAndOutput> cmd_execute_and_capture_output(DiagnosticContext& context, const Command& cmd);
}
