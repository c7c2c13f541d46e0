#include <pdfbox-test/util.h>

#include <pdfbox/base/message_sinks.h>
#include <pdfbox/base/strings.h>

#include <pdfbox/commandrunner.h>

using namespace pdfbox;

namespace
{
    constexpr StringLiteral echo_arguments = "printf '%s\\n' \"$@\"";

    std::vector<std::string> output_lines(StringView output) { return Strings::split(output, '\n'); }
}

TEST_CASE ("command spec items", "[commandrunner]")
{
    CommandSpec spec{"PDFToImage"};
    spec.positional("in.pdf")
        .option("password", Optional<std::string>{"secret"})
        .option("imageType", Optional<std::string>{})
        .option("outputPrefix", Optional<std::string>{""})
        .option("dpi", Optional<int>{0})
        .option("page", Optional<int>{})
        .option("cropbox", std::vector<std::string>{"1", "2", "3", "4"})
        .option("other", std::vector<std::string>{"1", ""})
        .option("none", std::vector<std::string>{})
        .flag("time", true)
        .flag("color", false)
        .positional("");

    REQUIRE(spec.items.size() == 5);
    CHECK(spec.items[0].kind == CommandItemKind::Positional);
    CHECK(spec.items[1].kind == CommandItemKind::Option);
    CHECK(spec.items[4].kind == CommandItemKind::Flag);
    CHECK(spec.to_arguments() == std::vector<std::string>{"PDFToImage",
                                                          "in.pdf",
                                                          "-password",
                                                          "secret",
                                                          "-dpi",
                                                          "0",
                                                          "-cropbox",
                                                          "1",
                                                          "2",
                                                          "3",
                                                          "4",
                                                          "-time"});
}

TEST_CASE ("positionals keep their order", "[commandrunner]")
{
    CommandSpec spec{"PDFMerger"};
    spec.positionals({"c.pdf", "", "a.pdf", "b.pdf"}).positional("out.pdf");
    CHECK(spec.to_arguments() == std::vector<std::string>{"PDFMerger", "c.pdf", "a.pdf", "b.pdf", "out.pdf"});
}

TEST_CASE ("build_command", "[commandrunner]")
{
    const CommandRunner runner{"/usr/bin/java", "/cache/pdfbox-app-3.0.3.jar", null_sink};
    CommandSpec spec{"PDFDebugger"};
    spec.positional("my file.pdf").flag("viewstructure", true);
    const auto cmd = runner.build_command(spec);
    CHECK(cmd.arguments() == std::vector<std::string>{"/usr/bin/java",
                                                      "-jar",
                                                      "/cache/pdfbox-app-3.0.3.jar",
                                                      "PDFDebugger",
                                                      "my file.pdf",
                                                      "-viewstructure"});
    CHECK(cmd.command_line() ==
          "/usr/bin/java -jar /cache/pdfbox-app-3.0.3.jar PDFDebugger \"my file.pdf\" -viewstructure");
}

TEST_CASE ("run_and_capture", "[commandrunner]")
{
    Test::TemporaryDirectory temp{"runner"};
    StringMessageSink status;
    const auto runtime = Test::write_shell_script(temp.path, "fake-java", echo_arguments);
    const CommandRunner runner{runtime, temp.path / "pdfbox-app-3.0.3.jar", status};

    CommandSpec spec{"ExtractText"};
    spec.flag("console", true).positional("input file.pdf");
    const auto output = runner.run_and_capture(spec).value_or_exit(PDFBOX_LINE_INFO);
    CHECK(output_lines(output) == std::vector<std::string>{"-jar",
                                                           (temp.path / "pdfbox-app-3.0.3.jar").native(),
                                                           "ExtractText",
                                                           "-console",
                                                           "input file.pdf"});

    REQUIRE(status.lines.size() == 1);
    CHECK(status.lines[0] == "PDFBox is running command: " + runner.build_command(spec).command_line());
}

TEST_CASE ("a failing exit code is not an error", "[commandrunner]")
{
    Test::TemporaryDirectory temp{"runner-exit"};
    const auto runtime = Test::write_shell_script(temp.path, "fake-java", "echo 'Error: file not found' >&2\nexit 1");
    const CommandRunner runner{runtime, temp.path / "pdfbox.jar", null_sink};
    CHECK(runner.run_and_capture(CommandSpec{"ExtractText"}).value_or_exit(PDFBOX_LINE_INFO) ==
          "Error: file not found\n");
}

TEST_CASE ("spawn", "[commandrunner]")
{
    Test::TemporaryDirectory temp{"runner-spawn"};
    const auto runtime = Test::write_shell_script(temp.path, "fake-java", echo_arguments);
    const CommandRunner runner{runtime, "pdfbox.jar", null_sink};
    CommandSpec spec{"PDFSplit"};
    spec.option("split", Optional<int>{2}).positional("doc.pdf");
    auto process = runner.spawn(spec).value_or_exit(PDFBOX_LINE_INFO);
    REQUIRE(process.valid());
    auto result = process.wait_and_capture(null_diagnostic_context).value_or_exit(PDFBOX_LINE_INFO);
    CHECK(result.exit_code == 0);
    CHECK(output_lines(result.output) ==
          std::vector<std::string>{"-jar", "pdfbox.jar", "PDFSplit", "-split", "2", "doc.pdf"});
}

TEST_CASE ("a missing runtime is an execution error", "[commandrunner]")
{
    Test::TemporaryDirectory temp{"runner-missing"};
    const CommandRunner runner{temp.path / "no-such-java", temp.path / "pdfbox.jar", null_sink};

    auto captured = runner.run_and_capture(CommandSpec{"ExtractText"});
    REQUIRE(!captured.has_value());
    CHECK(captured.error().kind == PdfBoxErrorKind::Execution);

    auto spawned = runner.spawn(CommandSpec{"PDFDebugger"});
    REQUIRE(!spawned.has_value());
    CHECK(spawned.error().kind == PdfBoxErrorKind::Execution);
}
