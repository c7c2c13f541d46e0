#include <pdfbox/base/checks.h>
#include <pdfbox/base/cmd-parser.h>
#include <pdfbox/base/strings.h>

#include <stdint.h>

namespace
{
    using namespace pdfbox;

    constexpr size_t help_max_line_length = 100;
    constexpr size_t help_first_column_start = 2;
    constexpr size_t help_first_column_width = 22;
    constexpr size_t help_second_column_start = help_first_column_start + help_first_column_width + 1;

    bool is_dashed(const std::string& arg) { return arg.size() >= 2 && arg[0] == '-' && arg[1] == '-'; }
}

namespace pdfbox
{
    void HelpTableFormatter::format(StringView col1, StringView col2)
    {
        m_str.append(help_first_column_start, ' ');
        Strings::append(m_str, col1);
        if (col1.size() > help_first_column_width)
        {
            m_str.push_back('\n');
            m_str.append(help_second_column_start, ' ');
        }
        else
        {
            m_str.append(help_second_column_start - help_first_column_start - col1.size(), ' ');
        }

        text(col2, help_second_column_start);
    }

    void HelpTableFormatter::header(StringView name)
    {
        Strings::append(m_str, name, ":\n");
    }

    void HelpTableFormatter::blank() { m_str.push_back('\n'); }

    // Counts bytes as columns; help text is ASCII.
    void HelpTableFormatter::text(StringView text, size_t indent)
    {
        size_t column = indent;
        bool line_has_words = false;
        const char* cursor = text.begin();
        const char* const last = text.end();
        while (cursor != last)
        {
            if (*cursor == '\n')
            {
                m_str.push_back('\n');
                m_str.append(indent, ' ');
                column = indent;
                line_has_words = false;
                ++cursor;
                continue;
            }

            if (*cursor == ' ')
            {
                ++cursor;
                continue;
            }

            const char* word_end = cursor;
            while (word_end != last && *word_end != ' ' && *word_end != '\n')
            {
                ++word_end;
            }

            const size_t word_size = static_cast<size_t>(word_end - cursor);
            if (line_has_words)
            {
                if (column + 1 + word_size > help_max_line_length)
                {
                    m_str.push_back('\n');
                    m_str.append(indent, ' ');
                    column = indent;
                }
                else
                {
                    m_str.push_back(' ');
                    ++column;
                }
            }

            m_str.append(cursor, word_end);
            column += word_size;
            line_has_words = true;
            cursor = word_end;
        }

        m_str.push_back('\n');
    }

    std::vector<std::string> convert_argc_argv_to_arguments(int argc, const char* const* const argv)
    {
        std::vector<std::string> result;
        for (int idx = 1; idx < argc; ++idx)
        {
            result.emplace_back(argv[idx]);
        }

        return result;
    }

    CmdParser::CmdParser(std::vector<std::string>&& inputs)
    {
        m_args.reserve(inputs.size());
        for (auto&& input : inputs)
        {
            auto lowercase = Strings::ascii_to_lowercase(input);
            m_args.push_back(Arg{std::move(input), std::move(lowercase), false});
        }
    }

    void CmdParser::add_error(LocalizedString&& message)
    {
        m_errors.push_back(error_prefix().append(message));
    }

    void CmdParser::describe(std::string&& display_name, const LocalizedString& help_text)
    {
        if (!help_text.empty())
        {
            m_options_table.insert_or_assign(std::move(display_name), help_text);
        }
    }

    bool CmdParser::parse_switch(StringView switch_name, bool& value, const LocalizedString& help_text)
    {
        describe(Strings::concat("--", switch_name), help_text);
        const auto on = Strings::concat("--", Strings::ascii_to_lowercase(switch_name));
        const auto off = Strings::concat("--no-", Strings::ascii_to_lowercase(switch_name));
        size_t matches = 0;
        for (auto&& arg : m_args)
        {
            if (arg.consumed)
            {
                continue;
            }

            if (arg.lowercase == on || arg.lowercase == off)
            {
                arg.consumed = true;
                value = arg.lowercase == on;
                ++matches;
            }
        }

        if (matches > 1)
        {
            add_error(msg::format(msgSwitchUsedMultipleTimes, msg::option = switch_name));
        }

        return matches != 0;
    }

    bool CmdParser::parse_option(StringView option_name, std::string& value, const LocalizedString& help_text)
    {
        describe(Strings::concat("--", option_name, "=..."), help_text);
        const auto bare = Strings::concat("--", Strings::ascii_to_lowercase(option_name));
        const auto with_equals = Strings::concat(bare, '=');
        size_t matches = 0;
        for (size_t idx = 0; idx < m_args.size(); ++idx)
        {
            auto& arg = m_args[idx];
            if (arg.consumed)
            {
                continue;
            }

            if (Strings::starts_with(arg.lowercase, with_equals))
            {
                arg.consumed = true;
                value = arg.text.substr(with_equals.size());
                ++matches;
                continue;
            }

            if (arg.lowercase != bare)
            {
                continue;
            }

            arg.consumed = true;
            if (idx + 1 == m_args.size() || m_args[idx + 1].consumed)
            {
                add_error(msg::format(msgOptionRequiresAValue, msg::option = option_name));
                continue;
            }

            auto& next = m_args[idx + 1];
            if (is_dashed(next.text))
            {
                add_error(msg::format(msgOptionRequiresANonDashesValue,
                                      msg::option = option_name,
                                      msg::actual = arg.text,
                                      msg::value = next.text));
                continue;
            }

            next.consumed = true;
            value = next.text;
            ++matches;
            ++idx;
        }

        if (matches > 1)
        {
            add_error(msg::format(msgOptionUsedMultipleTimes, msg::option = option_name));
        }

        return matches != 0;
    }

    bool CmdParser::parse_option(StringView option_name,
                                 Optional<std::string>& value,
                                 const LocalizedString& help_text)
    {
        std::string parsed;
        if (!parse_option(option_name, parsed, help_text))
        {
            return false;
        }

        value.emplace(std::move(parsed));
        return true;
    }

    Optional<std::string> CmdParser::extract_first_command_like_arg_lowercase()
    {
        for (auto&& arg : m_args)
        {
            if (arg.consumed)
            {
                continue;
            }

            if (arg.lowercase == "--version")
            {
                arg.consumed = true;
                return std::string{"version"};
            }

            if (arg.lowercase == "--help" || arg.lowercase == "-h")
            {
                arg.consumed = true;
                return std::string{"help"};
            }

            if (!arg.lowercase.empty() && arg.lowercase[0] != '-')
            {
                arg.consumed = true;
                return arg.lowercase;
            }
        }

        return nullopt;
    }

    std::vector<std::string> CmdParser::get_remaining_args() const
    {
        std::vector<std::string> results;
        for (auto&& arg : m_args)
        {
            if (!arg.consumed)
            {
                results.push_back(arg.text);
            }
        }

        return results;
    }

    std::vector<std::string> CmdParser::consume_positionals(StringView command_name,
                                                            size_t min_arity,
                                                            size_t max_arity)
    {
        const auto errors_before = m_errors.size();
        std::vector<std::string> positionals;
        for (auto&& arg : m_args)
        {
            if (arg.consumed)
            {
                continue;
            }

            arg.consumed = true;
            if (is_dashed(arg.text))
            {
                if (arg.text.find('=') == std::string::npos)
                {
                    add_error(msg::format(msgUnexpectedSwitch, msg::option = arg.text));
                }
                else
                {
                    add_error(msg::format(msgUnexpectedOption, msg::option = arg.text));
                }

                continue;
            }

            positionals.push_back(std::move(arg.text));
        }

        const auto actual = positionals.size();
        if (actual < min_arity || actual > max_arity)
        {
            if (max_arity == 0)
            {
                add_error(msg::format(msgNonZeroRemainingArgs, msg::command_name = command_name));
            }
            else if (min_arity == 1 && max_arity == 1)
            {
                add_error(msg::format(msgNonOneRemainingArgs, msg::command_name = command_name));
            }
            else if (min_arity == 0 && max_arity == 1)
            {
                add_error(msg::format(msgNonZeroOrOneRemainingArgs, msg::command_name = command_name));
            }
            else if (min_arity == max_arity)
            {
                add_error(msg::format(msgNonExactlyArgs,
                                      msg::command_name = command_name,
                                      msg::expected = min_arity,
                                      msg::actual = actual));
            }
            else if (max_arity == SIZE_MAX)
            {
                add_error(msg::format(msgNonRangeArgsGreater,
                                      msg::command_name = command_name,
                                      msg::lower = min_arity,
                                      msg::actual = actual));
            }
            else
            {
                add_error(msg::format(msgNonRangeArgs,
                                      msg::command_name = command_name,
                                      msg::lower = min_arity,
                                      msg::upper = max_arity,
                                      msg::actual = actual));
            }

            for (size_t idx = max_arity; idx < actual; ++idx)
            {
                add_error(msg::format(msgUnexpectedArgument, msg::option = positionals[idx]));
            }
        }

        if (m_errors.size() != errors_before)
        {
            positionals.clear();
        }

        return positionals;
    }

    void CmdParser::append_options_table(LocalizedString& results) const
    {
        if (m_options_table.empty())
        {
            return;
        }

        HelpTableFormatter table;
        table.header(msg::format(msgOptions));
        for (auto&& entry : m_options_table)
        {
            table.format(entry.first, entry.second);
        }

        results.append_raw(table.m_str);
    }

    void CmdParser::exit_with_errors(const LocalizedString& example) const
    {
        if (m_errors.empty())
        {
            return;
        }

        LocalizedString report;
        for (auto&& error : m_errors)
        {
            report.append(error).append_raw('\n');
        }

        report.append(example).append_raw('\n');
        append_options_table(report);
        msg::write_unlocalized_text_to_stderr(Color::none, report);
        Checks::exit_with_code(PDFBOX_LINE_INFO, 1);
    }
}
