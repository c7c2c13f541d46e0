#include <pdfbox/base/checks.h>
#include <pdfbox/base/files.h>
#include <pdfbox/base/strings.h>
#include <pdfbox/base/system.debug.h>
#include <pdfbox/base/system.process.h>

#include <errno.h>
#include <fcntl.h>
#include <spawn.h>
#include <stdio.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <atomic>
#include <mutex>
#include <thread>
#include <utility>

extern char** environ;

namespace
{
    using namespace pdfbox;

    struct AnonymousPipe
    {
        // pipefd[0] is the read end of the pipe, pipefd[1] is the write end
        int pipefd[2];

        AnonymousPipe() : pipefd{-1, -1} { }
        AnonymousPipe(const AnonymousPipe&) = delete;
        AnonymousPipe& operator=(const AnonymousPipe&) = delete;
        ~AnonymousPipe()
        {
            for (size_t idx = 0; idx < 2; ++idx)
            {
                close_mark_invalid(pipefd[idx]);
            }
        }

        bool create(DiagnosticContext& context)
        {
#if defined(__APPLE__)
            static std::mutex pipe_creation_lock;
            std::lock_guard<std::mutex> lck{pipe_creation_lock};
            if (pipe(pipefd))
            {
                context.report_system_error("pipe", errno);
                return false;
            }

            for (size_t idx = 0; idx < 2; ++idx)
            {
                if (fcntl(pipefd[idx], F_SETFD, FD_CLOEXEC))
                {
                    context.report_system_error("fcntl", errno);
                    return false;
                }
            }
#else  // ^^^ Apple // !Apple vvv
            if (pipe2(pipefd, O_CLOEXEC))
            {
                context.report_system_error("pipe2", errno);
                return false;
            }
#endif // ^^^ !Apple

            return true;
        }
    };

    struct PosixSpawnFileActions
    {
        posix_spawn_file_actions_t actions;

        PosixSpawnFileActions() { Checks::check_exit(PDFBOX_LINE_INFO, posix_spawn_file_actions_init(&actions) == 0); }

        ~PosixSpawnFileActions()
        {
            Checks::check_exit(PDFBOX_LINE_INFO, posix_spawn_file_actions_destroy(&actions) == 0);
        }

        PosixSpawnFileActions(const PosixSpawnFileActions&) = delete;
        PosixSpawnFileActions& operator=(const PosixSpawnFileActions&) = delete;

        bool adddup2(DiagnosticContext& context, int fd, int newfd)
        {
            const int error = posix_spawn_file_actions_adddup2(&actions, fd, newfd);
            if (error)
            {
                context.report_system_error("posix_spawn_file_actions_adddup2", error);
                return false;
            }

            return true;
        }
    };

    Optional<ExitCodeIntegral> wait_for_termination(DiagnosticContext& context, pid_t pid)
    {
        int status;
        pid_t child;
        do
        {
            child = waitpid(pid, &status, 0);
        } while (child == -1 && errno == EINTR);
        if (child != pid)
        {
            context.report_system_error("waitpid", errno);
            return nullopt;
        }

        ExitCodeIntegral exit_code = -1;
        if (WIFEXITED(status))
        {
            exit_code = WEXITSTATUS(status);
        }
        else if (WIFSIGNALED(status))
        {
            exit_code = WTERMSIG(status);
        }
        else if (WIFSTOPPED(status))
        {
            exit_code = WSTOPSIG(status);
        }

        return exit_code;
    }

    // Reads fd until end of stream, passing each chunk to data_cb. Returns false on a read error.
    template<class F>
    bool drain_output(DiagnosticContext& context, int fd, F data_cb)
    {
        char buf[1024];
        for (;;)
        {
            auto read_amount = read(fd, buf, sizeof(buf));
            if (read_amount < 0)
            {
                auto error = errno;
                if (error == EINTR)
                {
                    continue;
                }

                if (error == EPIPE)
                {
                    return true;
                }

                context.report_system_error("read", error);
                return false;
            }

            if (read_amount == 0)
            {
                return true;
            }

            data_cb(StringView{buf, static_cast<size_t>(read_amount)});
        }
    }

    std::atomic<uint64_t> g_subprocess_count(0);
}

namespace pdfbox
{
    void append_shell_escaped(std::string& target, StringView content)
    {
        if (content.empty())
        {
            target.append("\"\"");
        }
        else if (Strings::find_first_of(content, " \t\n\r\"\\`$,;&^|'()<>*?") != content.end())
        {
            // `\` is the escape character and always requires doubling. Inner double-quotes must be escaped.
            // Additionally, '`' and '$' must be escaped or they will retain their special meaning in the shell.
            target.push_back('"');
            for (auto ch : content)
            {
                if (ch == '\\' || ch == '"' || ch == '`' || ch == '$') target.push_back('\\');
                target.push_back(ch);
            }
            target.push_back('"');
        }
        else
        {
            target.append(content.data(), content.size());
        }
    }

    Command& Command::string_arg(StringView s) &
    {
        m_args.emplace_back(s.data(), s.size());
        return *this;
    }

    std::string Command::command_line() const
    {
        std::string buf;
        for (auto&& arg : m_args)
        {
            if (!buf.empty()) buf.push_back(' ');
            append_shell_escaped(buf, arg);
        }

        return buf;
    }

    RunningProcess::RunningProcess(long pid, int output_fd, EchoInDebug echo_in_debug) noexcept
        : m_pid(pid), m_output_fd(output_fd), m_echo_in_debug(echo_in_debug)
    {
    }

    RunningProcess::RunningProcess(RunningProcess&& other) noexcept
        : m_pid(std::exchange(other.m_pid, -1))
        , m_output_fd(std::exchange(other.m_output_fd, -1))
        , m_echo_in_debug(other.m_echo_in_debug)
    {
    }

    RunningProcess& RunningProcess::operator=(RunningProcess&& other) noexcept
    {
        if (this != &other)
        {
            detach();
            m_pid = std::exchange(other.m_pid, -1);
            m_output_fd = std::exchange(other.m_output_fd, -1);
            m_echo_in_debug = other.m_echo_in_debug;
        }

        return *this;
    }

    RunningProcess::~RunningProcess() { detach(); }

    Optional<ExitCodeAndOutput> RunningProcess::wait_and_capture(DiagnosticContext& context)
    {
        Checks::check_exit(PDFBOX_LINE_INFO, valid());
        std::string output;
        const bool echo = m_echo_in_debug == EchoInDebug::Show && Debug::g_debugging;
        const bool read_ok = drain_output(context, m_output_fd, [&](StringView this_read_data) {
            output.append(this_read_data.data(), this_read_data.size());
            if (echo)
            {
                msg::write_unlocalized_text_to_stderr(Color::none, this_read_data);
            }
        });

        close_mark_invalid(m_output_fd);
        const auto pid = static_cast<pid_t>(std::exchange(m_pid, -1));
        auto maybe_exit_code = wait_for_termination(context, pid);
        if (!read_ok)
        {
            return nullopt;
        }

        if (auto exit_code = maybe_exit_code.get())
        {
            Debug::print(fmt::format("process {} exited with {}\n", pid, *exit_code));
            return ExitCodeAndOutput{*exit_code, std::move(output)};
        }

        return nullopt;
    }

    Optional<ExitCodeIntegral> RunningProcess::wait(DiagnosticContext& context)
    {
        auto maybe_result = wait_and_capture(context);
        if (auto result = maybe_result.get())
        {
            return result->exit_code;
        }

        return nullopt;
    }

    void RunningProcess::detach() noexcept
    {
        if (!valid())
        {
            return;
        }

        const auto pid = static_cast<pid_t>(std::exchange(m_pid, -1));
        int fd = std::exchange(m_output_fd, -1);
        std::thread([pid, fd]() mutable {
            (void)drain_output(null_diagnostic_context, fd, [](StringView) {});
            close_mark_invalid(fd);
            (void)wait_for_termination(null_diagnostic_context, pid);
        }).detach();
    }

    Optional<RunningProcess> cmd_spawn_and_capture(DiagnosticContext& context,
                                                   const Command& cmd,
                                                   EchoInDebug echo_in_debug)
    {
        if (cmd.empty())
        {
            context.report_error(msgCommandIsEmpty);
            return nullopt;
        }

        const auto debug_id = g_subprocess_count.fetch_add(1);
        Debug::print(fmt::format("{}: execute_process({})\n", debug_id, cmd.command_line()));
        // Flush stdout before launching external process
        fflush(stdout);

        AnonymousPipe child_input;
        if (!child_input.create(context))
        {
            return nullopt;
        }

        AnonymousPipe child_output;
        if (!child_output.create(context))
        {
            return nullopt;
        }

        PosixSpawnFileActions actions;
        if (!actions.adddup2(context, child_input.pipefd[0], 0))
        {
            return nullopt;
        }

        if (!actions.adddup2(context, child_output.pipefd[1], 1))
        {
            return nullopt;
        }

        if (!actions.adddup2(context, child_output.pipefd[1], 2))
        {
            return nullopt;
        }

        std::vector<std::string> argv_builder = cmd.arguments();
        std::vector<char*> argv;
        argv.reserve(argv_builder.size() + 1);
        for (std::string& arg : argv_builder)
        {
            argv.emplace_back(arg.data());
        }

        argv.emplace_back(nullptr);

        pid_t pid = -1;
        // posix_spawnp searches PATH only when the executable name contains no '/'
        const int error = posix_spawnp(&pid, argv[0], &actions.actions, nullptr, argv.data(), environ);
        if (error)
        {
            context.report(DiagnosticLine{DiagKind::Error,
                                          msg::format(msgSpawnFailed, msg::command_line = cmd.command_line())
                                              .append_raw('\n')
                                              .append_raw(std::error_code(error, std::generic_category()).message())});
            return nullopt;
        }

        // the child holds its own copies; the parent keeps only the read end of the output pipe
        close_mark_invalid(child_input.pipefd[0]);
        close_mark_invalid(child_input.pipefd[1]);
        close_mark_invalid(child_output.pipefd[1]);
        const int output_fd = std::exchange(child_output.pipefd[0], -1);
        Debug::print(fmt::format("{}: spawned process {}\n", debug_id, pid));
        return RunningProcess{static_cast<long>(pid), output_fd, echo_in_debug};
    }

    Optional<ExitCodeAndOutput> cmd_execute_and_capture_output(DiagnosticContext& context, const Command& cmd)
    {
        auto maybe_process = cmd_spawn_and_capture(context, cmd, EchoInDebug::Hide);
        if (auto process = maybe_process.get())
        {
            return process->wait_and_capture(context);
        }

        return nullopt;
    }
}
