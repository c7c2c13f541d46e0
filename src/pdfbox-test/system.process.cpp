#include <pdfbox-test/util.h>

#include <pdfbox/base/system.process.h>

using namespace pdfbox;

namespace
{
    Command shell(StringView script) { return Command{"/bin/sh"}.string_arg("-c").string_arg(script); }

    ExitCodeAndOutput run_to_completion(const Command& cmd)
    {
        BufferedDiagnosticContext bdc{null_sink};
        auto maybe_run = cmd_execute_and_capture_output(bdc, cmd);
        INFO(bdc.to_string());
        REQUIRE(maybe_run.has_value());
        return std::move(*maybe_run.get());
    }
}

TEST_CASE ("captures-output", "[system.process]")
{
    auto run = run_to_completion(shell("printf 'hello\\n'; printf 'oops\\n' >&2; exit 3"));
    REQUIRE(run.exit_code == 3);
    REQUIRE(run.output == "hello\noops\n");
}

TEST_CASE ("captures more than a pipe buffer", "[system.process]")
{
    auto run = run_to_completion(shell("i=0; while [ $i -lt 20000 ]; do echo 0123456789; i=$((i+1)); done"));
    REQUIRE(run.exit_code == 0);
    REQUIRE(run.output.size() == 20000 * 11);
}

TEST_CASE ("child stdin is empty", "[system.process]")
{
    auto run = run_to_completion(Command{"cat"});
    REQUIRE(run.exit_code == 0);
    REQUIRE(run.output.empty());
}

TEST_CASE ("arguments reach the child unchanged", "[system.process]")
{
    auto cmd = shell("printf '%s|' \"$@\"")
                   .string_arg("sh")
                   .string_arg("a b")
                   .string_arg("$HOME")
                   .string_arg("")
                   .string_arg("quote\"d");
    auto run = run_to_completion(cmd);
    REQUIRE(run.output == "a b|$HOME||quote\"d|");
}

TEST_CASE ("signalled child", "[system.process]")
{
    auto run = run_to_completion(shell("kill -9 $$"));
    REQUIRE(run.exit_code == 9);
}

TEST_CASE ("spawn failures", "[system.process]")
{
    BufferedDiagnosticContext bdc{null_sink};
    SECTION ("missing executable")
    {
        CHECK(!cmd_spawn_and_capture(bdc, Command{"/nonexistent/pdfbox-test-program"}).has_value());
        REQUIRE(bdc.any_errors());
        CHECK(bdc.to_string().find("/nonexistent/pdfbox-test-program") != std::string::npos);
    }

    SECTION ("empty command")
    {
        CHECK(!cmd_execute_and_capture_output(bdc, Command{}).has_value());
        CHECK(bdc.to_string() == "error: cannot run an empty command");
    }
}

TEST_CASE ("spawned processes", "[system.process]")
{
    BufferedDiagnosticContext bdc{null_sink};
    SECTION ("wait")
    {
        auto process = cmd_spawn_and_capture(bdc, shell("echo started; exit 7")).value_or_exit(PDFBOX_LINE_INFO);
        CHECK(process.valid());
        CHECK(process.pid() > 0);
        auto result = process.wait_and_capture(bdc).value_or_exit(PDFBOX_LINE_INFO);
        CHECK(result.exit_code == 7);
        CHECK(result.output == "started\n");
        CHECK(!process.valid());
    }

    SECTION ("detach")
    {
        auto process = cmd_spawn_and_capture(bdc, shell("echo detached")).value_or_exit(PDFBOX_LINE_INFO);
        process.detach();
        CHECK(!process.valid());
    }

    SECTION ("move")
    {
        auto process = cmd_spawn_and_capture(bdc, shell("exit 0")).value_or_exit(PDFBOX_LINE_INFO);
        RunningProcess moved = std::move(process);
        CHECK(!process.valid());
        CHECK(moved.wait(bdc).value_or(-1) == 0);
    }

    CHECK(bdc.empty());
}

TEST_CASE ("command_line", "[system.process]")
{
    CHECK(Command{"java"}.string_arg("-jar").string_arg("/opt/pdfbox/pdfbox-app-3.0.3.jar").command_line() ==
          "java -jar /opt/pdfbox/pdfbox-app-3.0.3.jar");
    CHECK(Command{"java"}.string_arg("/path with space/doc.pdf").command_line() == "java \"/path with space/doc.pdf\"");
    CHECK(Command{"java"}.string_arg("").command_line() == "java \"\"");
    CHECK(Command{"java"}.string_arg("$x\"y").command_line() == "java \"\\$x\\\"y\"");
    CHECK(Command{}.command_line().empty());
}
