#include <pdfbox/base/checks.h>
#include <pdfbox/base/diagnostics.h>
#include <pdfbox/base/message_sinks.h>
#include <pdfbox/base/strings.h>
#include <pdfbox/base/system.debug.h>

#include <pdfbox/commandrunner.h>

#include <algorithm>

namespace pdfbox
{
    CommandSpec& CommandSpec::flag(StringView name, bool enabled)
    {
        if (enabled)
        {
            items.push_back(CommandItem{CommandItemKind::Flag, name.to_string(), {}});
        }

        return *this;
    }

    CommandSpec& CommandSpec::option(StringView name, const Optional<std::string>& value)
    {
        if (auto v = value.get())
        {
            if (!v->empty())
            {
                items.push_back(CommandItem{CommandItemKind::Option, name.to_string(), {*v}});
            }
        }

        return *this;
    }

    CommandSpec& CommandSpec::option(StringView name, const Optional<int>& value)
    {
        if (auto v = value.get())
        {
            items.push_back(CommandItem{CommandItemKind::Option, name.to_string(), {std::to_string(*v)}});
        }

        return *this;
    }

    CommandSpec& CommandSpec::option(StringView name, const std::vector<std::string>& values)
    {
        if (values.empty() || std::any_of(values.begin(), values.end(), [](const std::string& v) { return v.empty(); }))
        {
            return *this;
        }

        items.push_back(CommandItem{CommandItemKind::Option, name.to_string(), values});
        return *this;
    }

    CommandSpec& CommandSpec::positional(StringView value)
    {
        if (!value.empty())
        {
            items.push_back(CommandItem{CommandItemKind::Positional, std::string{}, {value.to_string()}});
        }

        return *this;
    }

    CommandSpec& CommandSpec::positionals(const std::vector<std::string>& values)
    {
        for (auto&& value : values)
        {
            positional(value);
        }

        return *this;
    }

    std::vector<std::string> CommandSpec::to_arguments() const
    {
        std::vector<std::string> result;
        result.push_back(subcommand);
        for (auto&& item : items)
        {
            switch (item.kind)
            {
                case CommandItemKind::Flag: result.push_back(Strings::concat('-', item.name)); break;
                case CommandItemKind::Option:
                    result.push_back(Strings::concat('-', item.name));
                    result.insert(result.end(), item.values.begin(), item.values.end());
                    break;
                case CommandItemKind::Positional:
                    result.insert(result.end(), item.values.begin(), item.values.end());
                    break;
                default: Checks::unreachable(PDFBOX_LINE_INFO);
            }
        }

        return result;
    }

    CommandRunner::CommandRunner(Path runtime, Path artifact, MessageSink& status_sink)
        : m_runtime(std::move(runtime)), m_artifact(std::move(artifact)), m_status_sink(status_sink)
    {
    }

    Command CommandRunner::build_command(const CommandSpec& spec) const
    {
        Command cmd{m_runtime};
        cmd.string_arg("-jar").string_arg(m_artifact);
        for (auto&& arg : spec.to_arguments())
        {
            cmd.string_arg(arg);
        }

        return cmd;
    }

    Command CommandRunner::announce(const CommandSpec& spec) const
    {
        auto cmd = build_command(spec);
        const auto command_line = cmd.command_line();
        m_status_sink.println(msgRunningCommand, msg::command_line = command_line);
        Debug::println("running ", command_line);
        return cmd;
    }

    ExpectedP<std::string> CommandRunner::run_and_capture(const CommandSpec& spec) const
    {
        const auto cmd = announce(spec);
        BufferedDiagnosticContext bdc{m_status_sink};
        auto maybe_output = cmd_execute_and_capture_output(bdc, cmd);
        if (auto output = maybe_output.get())
        {
            Debug::println("exited with ", output->exit_code);
            return std::move(output->output);
        }

        return PdfBoxError::from_diagnostics(PdfBoxErrorKind::Execution, bdc);
    }

    ExpectedP<RunningProcess> CommandRunner::spawn(const CommandSpec& spec) const
    {
        const auto cmd = announce(spec);
        BufferedDiagnosticContext bdc{m_status_sink};
        auto maybe_process = cmd_spawn_and_capture(bdc, cmd, EchoInDebug::Show);
        if (auto process = maybe_process.get())
        {
            return std::move(*process);
        }

        return PdfBoxError::from_diagnostics(PdfBoxErrorKind::Execution, bdc);
    }
}
