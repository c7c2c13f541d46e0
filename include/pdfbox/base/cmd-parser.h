#pragma once

#include <pdfbox/base/fwd/cmd-parser.h>

#include <pdfbox/base/messages.h>
#include <pdfbox/base/optional.h>
#include <pdfbox/base/stringview.h>

#include <stddef.h>

#include <map>
#include <string>
#include <vector>

namespace pdfbox
{
    // Builds the two column help text; every call appends whole lines.
    struct HelpTableFormatter
    {
        void format(StringView col1, StringView col2);
        void header(StringView name);
        void blank();
        // Appends `text` word wrapped at the line limit, continuing lines at `indent` columns.
        void text(StringView text, size_t indent = 0);

        std::string m_str;
    };

    std::vector<std::string> convert_argc_argv_to_arguments(int argc, const char* const* const argv);

    // Matches --name style switches and options against the command line. Each parse_ call consumes what it matches
    // and records problems instead of exiting; exit_with_errors reports them all at once.
    struct CmdParser
    {
        CmdParser() = default;
        explicit CmdParser(std::vector<std::string>&& inputs);

        CmdParser(const CmdParser&) = delete;
        CmdParser(CmdParser&&) = default;
        CmdParser& operator=(const CmdParser&) = delete;
        CmdParser& operator=(CmdParser&&) = default;

        // --name sets `value` to true, --no-name sets it to false. Returns whether either was given.
        bool parse_switch(StringView switch_name, bool& value, const LocalizedString& help_text = {});

        // Accepts --name=value and --name value. When given more than once the last value wins.
        bool parse_option(StringView option_name, std::string& value, const LocalizedString& help_text = {});
        bool parse_option(StringView option_name, Optional<std::string>& value, const LocalizedString& help_text = {});

        // --help, -h and --version count as the commands help and version.
        Optional<std::string> extract_first_command_like_arg_lowercase();

        std::vector<std::string> get_remaining_args() const;

        // Consumes everything left as positional arguments. Returns an empty vector if anything was wrong with them.
        std::vector<std::string> consume_positionals(StringView command_name, size_t min_arity, size_t max_arity);

        const std::vector<LocalizedString>& get_errors() const noexcept { return m_errors; }

        void append_options_table(LocalizedString& results) const;
        void exit_with_errors(const LocalizedString& example) const;

    private:
        struct Arg
        {
            std::string text;
            std::string lowercase;
            bool consumed = false;
        };

        void add_error(LocalizedString&& message);
        void describe(std::string&& display_name, const LocalizedString& help_text);

        std::vector<Arg> m_args;
        std::vector<LocalizedString> m_errors;
        std::map<std::string, LocalizedString> m_options_table;
    };
}
