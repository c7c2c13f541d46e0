#include <pdfbox-test/util.h>

#include <pdfbox/base/cmd-parser.h>

#include <stdint.h>

using namespace pdfbox;

static std::vector<LocalizedString> localized(const std::vector<std::string>& strings)
{
    std::vector<LocalizedString> result;
    for (auto&& str : strings)
    {
        result.emplace_back(LocalizedString::from_raw(str));
    }

    return result;
}

TEST_CASE ("Smoke test help table formatter", "[cmd-parser]")
{
    HelpTableFormatter uut;

    uut.header("Options");
    uut.format("--jar=...", "use this pdfbox-app jar instead of the cache");
    uut.format("--a-very-long-option-name=...", "short");
    uut.format("--cache-dir=...",
               "the directory that holds downloaded pdfbox-app jars; defaults to the platform cache directory joined "
               "with pdfbox");

    uut.blank();
    uut.text("pdfbox extract-text in.pdf");
    uut.text("first line\nsecond line", 4);

    const char* const expected = R"(Options:
  --jar=...              use this pdfbox-app jar instead of the cache
  --a-very-long-option-name=...
                         short
  --cache-dir=...        the directory that holds downloaded pdfbox-app jars; defaults to the
                         platform cache directory joined with pdfbox

pdfbox extract-text in.pdf
first line
    second line
)";

    CHECK(uut.m_str == expected);
}

TEST_CASE ("Arguments can be converted from argc/argv", "[cmd-parser]")
{
    const char* argv[] = {"pdfbox", "extract-text", "in.pdf"};
    CHECK(convert_argc_argv_to_arguments(3, argv) == std::vector<std::string>{"extract-text", "in.pdf"});
}

TEST_CASE ("Arguments can be parsed as switches", "[cmd-parser]")
{
    std::vector<std::string> v;
    v.emplace_back("a");
    v.emplace_back("-b");
    v.emplace_back("--c");
    v.emplace_back("---d");
    std::vector<std::string> expected_remaining = v;
    v.emplace_back("--switch");
    v.emplace_back("--duplicate");
    v.emplace_back("--duplicate");
    v.emplace_back("--no-disabled-switch");
    v.emplace_back("--caSeySwitCh");
    v.emplace_back("--simple");
    CmdParser uut{std::move(v)};

    bool unset_switch_value = true;
    CHECK(!uut.parse_switch("unset-switch", unset_switch_value));
    CHECK(unset_switch_value);

    bool switch_value = false;
    CHECK(uut.parse_switch("switch", switch_value));
    CHECK(switch_value);
    // parsing the same value again does not reparse
    CHECK(!uut.parse_switch("switch", switch_value));
    CHECK(switch_value);

    // Duplicate switches emit errors and consume all duplicates
    bool duplicate_value = false;
    CHECK(uut.get_errors().empty());
    CHECK(uut.parse_switch("duplicate", duplicate_value));
    CHECK(duplicate_value);
    CHECK(!uut.parse_switch("duplicate", duplicate_value));

    bool disabled_switch = true;
    CHECK(uut.parse_switch("disabled-switch", disabled_switch));
    CHECK(!disabled_switch);

    // Switches are case insensitive
    bool casey_switch = false;
    CHECK(uut.parse_switch("caseyswitch", casey_switch));
    CHECK(casey_switch);

    bool simple = false;
    CHECK(uut.parse_switch("simple", simple));
    CHECK(!uut.parse_switch("simple", simple));
    CHECK(simple);

    CHECK(uut.get_remaining_args() == expected_remaining);
    CHECK(uut.get_errors() == localized({"error: the switch 'duplicate' was specified multiple times"}));
}

TEST_CASE ("Options can be parsed", "[cmd-parser]")
{
    CmdParser uut{std::vector<std::string>{"--jar=/opt/Pdfbox.jar",
                                           "--cache-dir",
                                           "/var/cache/pdfbox",
                                           "--password",
                                           "--html",
                                           "--pdfbox-version=3.0.3",
                                           "--duplicate=a",
                                           "--duplicate",
                                           "b",
                                           "--duplicate=last"}};

    std::string option_value;
    CHECK(uut.parse_option("jar", option_value));
    // values keep their case
    CHECK(option_value == "/opt/Pdfbox.jar");
    option_value = "kittens";
    CHECK(!uut.parse_option("jar", option_value));
    CHECK(option_value == "kittens");

    CHECK(uut.parse_option("cache-dir", option_value));
    CHECK(option_value == "/var/cache/pdfbox");

    // Trying to set the value of an option to a --dashed thing consumes the option but not the value
    Optional<std::string> password;
    CHECK(!uut.parse_option("password", password));
    CHECK(!password.has_value());

    Optional<std::string> pinned;
    CHECK(!uut.parse_option("unset-option", pinned));
    CHECK(!pinned.has_value());
    CHECK(uut.parse_option("pdfbox-version", pinned, LocalizedString::from_raw(StringView("use exactly this version"))));
    CHECK(pinned.value_or("") == "3.0.3");

    auto expected_errors = localized(
        {"error: the option password requires an argument, but was given --password; if you intended to pass "
         "--html, use --password=--html instead"});
    CHECK(uut.get_errors() == expected_errors);

    // Duplicate options emit errors, consume all duplicates, and take the last value
    std::string duplicate_value;
    CHECK(uut.parse_option("duplicate", duplicate_value));
    CHECK(duplicate_value == "last");
    expected_errors.push_back(LocalizedString::from_raw(StringView("error: the option 'duplicate' was specified multiple times")));
    CHECK(uut.get_errors() == expected_errors);

    CHECK(uut.get_remaining_args() == std::vector<std::string>{"--html"});
}

TEST_CASE ("Options missing values generate errors", "[cmd-parser]")
{
    CmdParser uut{std::vector<std::string>{"--output"}};
    std::string value;
    CHECK(!uut.parse_option("output", value));
    CHECK(value.empty());
    CHECK(uut.get_errors() == localized({"error: the option 'output' requires a value"}));
}

TEST_CASE ("The command is the first non-option argument", "[cmd-parser]")
{
    {
        CmdParser uut{std::vector<std::string>{"--debug", "Extract-Text", "In.pdf"}};
        CHECK(uut.extract_first_command_like_arg_lowercase().value_or("") == "extract-text");
        CHECK(uut.get_remaining_args() == std::vector<std::string>{"--debug", "In.pdf"});
    }

    {
        CmdParser uut{std::vector<std::string>{"--version"}};
        CHECK(uut.extract_first_command_like_arg_lowercase().value_or("") == "version");
    }

    {
        CmdParser uut{std::vector<std::string>{"-h", "merge"}};
        CHECK(uut.extract_first_command_like_arg_lowercase().value_or("") == "help");
        CHECK(uut.get_remaining_args() == std::vector<std::string>{"merge"});
    }

    {
        CmdParser uut{std::vector<std::string>{"--jar=x.jar"}};
        CHECK(!uut.extract_first_command_like_arg_lowercase().has_value());
    }
}

TEST_CASE ("Positionals with exactly one argument", "[cmd-parser]")
{
    {
        CmdParser uut{std::vector<std::string>{"doc.pdf"}};
        CHECK(uut.consume_positionals("split", 1, 1) == std::vector<std::string>{"doc.pdf"});
        CHECK(uut.get_errors().empty());
    }

    {
        CmdParser uut;
        CHECK(uut.consume_positionals("split", 1, 1).empty());
        CHECK(uut.get_errors() == localized({"error: the command 'split' requires exactly one argument"}));
    }

    {
        CmdParser uut{std::vector<std::string>{"a.pdf", "b.pdf"}};
        CHECK(uut.consume_positionals("split", 1, 1).empty());
        CHECK(uut.get_errors() == localized({"error: the command 'split' requires exactly one argument",
                                             "error: unexpected argument: b.pdf"}));
    }

    {
        CmdParser uut{std::vector<std::string>{"--bogus", "doc.pdf"}};
        CHECK(uut.consume_positionals("split", 1, 1).empty());
        CHECK(uut.get_errors() == localized({"error: unexpected switch: --bogus"}));
        CHECK(uut.get_remaining_args().empty());
    }
}

TEST_CASE ("Positionals with an optional argument", "[cmd-parser]")
{
    {
        CmdParser uut;
        CHECK(uut.consume_positionals("help", 0, 1).empty());
        CHECK(uut.get_errors().empty());
    }

    {
        CmdParser uut{std::vector<std::string>{"merge"}};
        CHECK(uut.consume_positionals("help", 0, 1) == std::vector<std::string>{"merge"});
        CHECK(uut.get_errors().empty());
    }

    {
        CmdParser uut{std::vector<std::string>{"merge", "split"}};
        CHECK(uut.consume_positionals("help", 0, 1).empty());
        CHECK(uut.get_errors() == localized({"error: the command 'help' requires zero or one arguments",
                                             "error: unexpected argument: split"}));
    }
}

TEST_CASE ("Positionals with an arity range", "[cmd-parser]")
{
    {
        CmdParser uut{std::vector<std::string>{"in.pdf", "out.txt"}};
        CHECK(uut.consume_positionals("extract-text", 1, 2) == std::vector<std::string>{"in.pdf", "out.txt"});
        CHECK(uut.get_errors().empty());
    }

    {
        CmdParser uut{std::vector<std::string>{"in.pdf", "out.txt", "extra"}};
        CHECK(uut.consume_positionals("extract-text", 1, 2).empty());
        CHECK(uut.get_errors() ==
              localized({"error: the command 'extract-text' requires between 1 and 2 arguments, inclusive, but 3 "
                         "were provided",
                         "error: unexpected argument: extra"}));
    }

    {
        CmdParser uut{std::vector<std::string>{"a.pdf"}};
        CHECK(uut.consume_positionals("merge", 2, SIZE_MAX).empty());
        CHECK(uut.get_errors() ==
              localized({"error: the command 'merge' requires at least 2 arguments, but 1 were provided"}));
    }

    {
        CmdParser uut{std::vector<std::string>{"a.pdf"}};
        CHECK(uut.consume_positionals("compare", 2, 2).empty());
        CHECK(uut.get_errors() ==
              localized({"error: the command 'compare' requires exactly 2 arguments, but 1 were provided"}));
    }

    {
        CmdParser uut{std::vector<std::string>{"a.pdf", "--x"}};
        CHECK(uut.consume_positionals("merge", 1, SIZE_MAX).empty());
        CHECK(uut.get_errors() == localized({"error: unexpected switch: --x"}));
    }
}

TEST_CASE ("Positionals when none are accepted", "[cmd-parser]")
{
    {
        CmdParser uut;
        CHECK(uut.consume_positionals("version", 0, 0).empty());
        CHECK(uut.get_errors().empty());
    }

    {
        CmdParser uut{std::vector<std::string>{"a", "--b=c"}};
        CHECK(uut.consume_positionals("version", 0, 0).empty());
        CHECK(uut.get_errors() == localized({"error: unexpected option: --b=c",
                                             "error: the command 'version' does not accept any additional arguments",
                                             "error: unexpected argument: a"}));
    }
}

TEST_CASE ("Options table lists described options", "[cmd-parser]")
{
    CmdParser uut{std::vector<std::string>{}};
    std::string value;
    (void)uut.parse_option("output", value, LocalizedString::from_raw(StringView("where to write")));
    bool list = false;
    (void)uut.parse_switch("list", list, LocalizedString::from_raw(StringView("list cached versions")));
    // options without help text stay out of the table
    (void)uut.parse_switch("debug", list);
    LocalizedString table;
    uut.append_options_table(table);
    CHECK(table.data() == "Options:\n"
                          "  --list                 list cached versions\n"
                          "  --output=...           where to write\n");
}
