#pragma once

#include <pdfbox/base/fwd/messages.h>

#include <pdfbox/base/optional.h>
#include <pdfbox/base/path.h>
#include <pdfbox/base/stringview.h>
#include <pdfbox/base/system.process.h>

#include <pdfbox/errors.h>

#include <string>
#include <vector>

namespace pdfbox
{
    enum class CommandItemKind
    {
        Flag,
        Option,
        Positional,
    };

    // One element of a command line for the artifact. An option emits -name followed by each value; a flag emits
    // -name; a positional emits its single value.
    struct CommandItem
    {
        CommandItemKind kind;
        std::string name;
        std::vector<std::string> values;
    };

    // An ordered description of a single invocation: a subcommand and its items in the order they are emitted.
    struct CommandSpec
    {
        explicit CommandSpec(StringView subcommand) : subcommand(subcommand.to_string()) { }

        // Adds -name when enabled.
        CommandSpec& flag(StringView name, bool enabled);
        // Adds -name value when value is present and non-empty.
        CommandSpec& option(StringView name, const Optional<std::string>& value);
        CommandSpec& option(StringView name, const Optional<int>& value);
        // Adds -name v1 v2 ... when at least one value is given and none is empty.
        CommandSpec& option(StringView name, const std::vector<std::string>& values);
        // Adds value when non-empty.
        CommandSpec& positional(StringView value);
        CommandSpec& positionals(const std::vector<std::string>& values);

        // The subcommand followed by every item, in order.
        std::vector<std::string> to_arguments() const;

        std::string subcommand;
        std::vector<CommandItem> items;
    };

    // Runs CommandSpecs as `<runtime> -jar <artifact> <Subcommand> items...`.
    struct CommandRunner
    {
        CommandRunner(Path runtime, Path artifact, MessageSink& status_sink);

        const Path& runtime() const noexcept { return m_runtime; }
        const Path& artifact() const noexcept { return m_artifact; }

        Command build_command(const CommandSpec& spec) const;

        // Blocks until the child closes its output and exits, then returns stdout and stderr combined. The exit
        // code is not inspected.
        ExpectedP<std::string> run_and_capture(const CommandSpec& spec) const;

        // Returns as soon as the child is running. Dropping or detaching the handle leaves the child running to
        // completion.
        ExpectedP<RunningProcess> spawn(const CommandSpec& spec) const;

    private:
        Command announce(const CommandSpec& spec) const;

        Path m_runtime;
        Path m_artifact;
        MessageSink& m_status_sink;
    };
}
