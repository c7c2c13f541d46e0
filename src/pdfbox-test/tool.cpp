#include <pdfbox-test/util.h>

#include <pdfbox/base/message_sinks.h>
#include <pdfbox/base/strings.h>

#include <pdfbox/tool.h>

using namespace pdfbox;

using Args = std::vector<std::string>;

TEST_CASE ("extract text arguments", "[tool]")
{
    SECTION ("defaults write to the console")
    {
        CHECK(extract_text_spec("in.pdf", "", {}).to_arguments() == Args{"ExtractText", "-console", "in.pdf"});
    }

    SECTION ("to a file")
    {
        CHECK(extract_text_spec("in.pdf", "out.txt", {}).to_arguments() == Args{"ExtractText", "in.pdf", "out.txt"});
    }

    SECTION ("every option")
    {
        ExtractTextOptions options;
        options.password = "pw";
        options.encoding = "UTF-8";
        options.html = true;
        options.sort = true;
        options.ignore_beads = true;
        options.start_page = 2;
        options.end_page = 5;
        options.always_next = true;
        CHECK(extract_text_spec("in.pdf", "out.html", options).to_arguments() == Args{"ExtractText",
                                                                                      "-password",
                                                                                      "pw",
                                                                                      "-encoding",
                                                                                      "UTF-8",
                                                                                      "-html",
                                                                                      "-sort",
                                                                                      "-ignoreBeads",
                                                                                      "-startPage",
                                                                                      "2",
                                                                                      "-endPage",
                                                                                      "5",
                                                                                      "-alwaysNext",
                                                                                      "in.pdf",
                                                                                      "out.html"});
    }

    SECTION ("empty values are omitted")
    {
        ExtractTextOptions options;
        options.password = "";
        options.encoding = "";
        CHECK(extract_text_spec("in.pdf", "", options).to_arguments() == Args{"ExtractText", "-console", "in.pdf"});
    }
}

TEST_CASE ("split arguments", "[tool]")
{
    CHECK(split_spec("doc.pdf", {}).to_arguments() == Args{"PDFSplit", "doc.pdf"});

    SplitOptions options;
    options.password = "pw";
    options.start_page = 1;
    options.end_page = 4;
    options.split = 2;
    CHECK(split_spec("doc.pdf", options).to_arguments() ==
          Args{"PDFSplit", "-password", "pw", "-startPage", "1", "-endPage", "4", "-split", "2", "doc.pdf"});
}

TEST_CASE ("merge arguments", "[tool]")
{
    CHECK(merge_spec({"a.pdf", "b.pdf", "c.pdf"}, "out.pdf").value_or_exit(PDFBOX_LINE_INFO).to_arguments() ==
          Args{"PDFMerger", "a.pdf", "b.pdf", "c.pdf", "out.pdf"});
    CHECK(merge_spec({"a.pdf", "b.pdf"}, "").value_or_exit(PDFBOX_LINE_INFO).to_arguments() ==
          Args{"PDFMerger", "a.pdf", "b.pdf", "merged.pdf"});

    for (auto&& sources : {Args{}, Args{"only.pdf"}})
    {
        auto maybe_spec = merge_spec(sources, "out.pdf");
        REQUIRE(!maybe_spec.has_value());
        CHECK(maybe_spec.error().kind == PdfBoxErrorKind::InvalidArgument);
    }
}

TEST_CASE ("debug arguments", "[tool]")
{
    CHECK(debug_spec("doc.pdf", {}).to_arguments() == Args{"PDFDebugger", "doc.pdf"});
    DebugOptions options;
    options.password = "pw";
    options.view_structure = true;
    CHECK(debug_spec("doc.pdf", options).to_arguments() ==
          Args{"PDFDebugger", "doc.pdf", "-password", "pw", "-viewstructure"});
}

TEST_CASE ("to image arguments", "[tool]")
{
    CHECK(to_image_spec("doc.pdf", {}).value_or_exit(PDFBOX_LINE_INFO).to_arguments() ==
          Args{"PDFToImage", "doc.pdf"});

    ToImageOptions options;
    options.password = "pw";
    options.image_type = "png";
    options.output_prefix = "page-";
    options.start_page = 1;
    options.end_page = 3;
    options.page = 2;
    options.dpi = 150;
    options.color = "gray";
    options.cropbox = {"0", "0", "300", "400"};
    options.time = true;
    CHECK(to_image_spec("doc.pdf", options).value_or_exit(PDFBOX_LINE_INFO).to_arguments() == Args{"PDFToImage",
                                                                                                   "doc.pdf",
                                                                                                   "-password",
                                                                                                   "pw",
                                                                                                   "-imageType",
                                                                                                   "png",
                                                                                                   "-outputPrefix",
                                                                                                   "page-",
                                                                                                   "-startPage",
                                                                                                   "1",
                                                                                                   "-endPage",
                                                                                                   "3",
                                                                                                   "-page",
                                                                                                   "2",
                                                                                                   "-dpi",
                                                                                                   "150",
                                                                                                   "-color",
                                                                                                   "gray",
                                                                                                   "-cropbox",
                                                                                                   "0",
                                                                                                   "0",
                                                                                                   "300",
                                                                                                   "400",
                                                                                                   "-time"});

    options.cropbox = {"0", "0", "300"};
    auto maybe_spec = to_image_spec("doc.pdf", options);
    REQUIRE(!maybe_spec.has_value());
    CHECK(maybe_spec.error().kind == PdfBoxErrorKind::InvalidArgument);
}

TEST_CASE ("runtime discovery", "[tool]")
{
    auto& fs = get_real_filesystem();
    Test::TemporaryDirectory temp{"runtime"};
    PdfBoxSettings settings;

    SECTION ("override")
    {
        const auto java = Test::write_shell_script(temp.path, "java", "exit 0");
        settings.java_path = java.native();
        CHECK(find_runtime(fs, settings).value_or_exit(PDFBOX_LINE_INFO).native() == java.native());
    }

    SECTION ("missing override")
    {
        settings.java_path = (temp.path / "java").native();
        auto maybe_runtime = find_runtime(fs, settings);
        REQUIRE(!maybe_runtime.has_value());
        CHECK(maybe_runtime.error().kind == PdfBoxErrorKind::Config);
    }

    SECTION ("a directory is not a runtime")
    {
        settings.java_path = temp.path.native();
        auto maybe_runtime = find_runtime(fs, settings);
        REQUIRE(!maybe_runtime.has_value());
        CHECK(maybe_runtime.error().kind == PdfBoxErrorKind::Config);
    }
}

TEST_CASE ("create", "[tool]")
{
    auto& fs = get_real_filesystem();
    Test::TemporaryDirectory temp{"create"};
    Test::FakeHttpClient http{fs};
    PdfBoxSettings settings;
    settings.cache_dir = (temp.path / "cache").native();
    settings.archive_url = "https://example.com/dist/pdfbox/";

    SECTION ("missing runtime is reported before the artifact")
    {
        settings.java_path = (temp.path / "no-java").native();
        settings.jar_path = (temp.path / "no.jar").native();
        auto maybe_tool = PdfBox::create(settings, fs, http, null_sink);
        REQUIRE(!maybe_tool.has_value());
        CHECK(maybe_tool.error().kind == PdfBoxErrorKind::Config);
        CHECK(maybe_tool.error().message.data().find("no-java") != std::string::npos);
    }

    SECTION ("missing artifact override")
    {
        settings.java_path = "/bin/sh";
        settings.jar_path = (temp.path / "no.jar").native();
        auto maybe_tool = PdfBox::create(settings, fs, http, null_sink);
        REQUIRE(!maybe_tool.has_value());
        CHECK(maybe_tool.error().kind == PdfBoxErrorKind::Config);
        CHECK(maybe_tool.error().message.data().find("no.jar") != std::string::npos);
    }

    SECTION ("cached artifact")
    {
        settings.java_path = "/bin/sh";
        fs.create_directories(temp.path / "cache", PDFBOX_LINE_INFO);
        fs.write_contents(temp.path / "cache" / "pdfbox-app-3.0.3.jar", "x", PDFBOX_LINE_INFO);
        auto tool = PdfBox::create(settings, fs, http, null_sink).value_or_exit(PDFBOX_LINE_INFO);
        CHECK(tool.runtime().native() == "/bin/sh");
        CHECK(tool.artifact().native() == (temp.path / "cache" / "pdfbox-app-3.0.3.jar").native());
    }

    CHECK(http.requests.empty());
}

TEST_CASE ("operations run the artifact", "[tool]")
{
    Test::TemporaryDirectory temp{"operations"};
    StringMessageSink status;
    const auto runtime = Test::write_shell_script(temp.path, "fake-java", "shift 2\nprintf '%s\\n' \"$@\"");
    const PdfBox tool{runtime, temp.path / "pdfbox-app-3.0.3.jar", status};

    SECTION ("extract text")
    {
        ExtractTextOptions options;
        options.sort = true;
        CHECK(Strings::split(tool.extract_text("doc.pdf", options).value_or_exit(PDFBOX_LINE_INFO), '\n') ==
              Args{"ExtractText", "-sort", "-console", "doc.pdf"});
    }

    SECTION ("extract text to a file")
    {
        auto process = tool.extract_text_to_file("doc.pdf", "doc.txt").value_or_exit(PDFBOX_LINE_INFO);
        auto result = process.wait_and_capture(null_diagnostic_context).value_or_exit(PDFBOX_LINE_INFO);
        CHECK(Strings::split(result.output, '\n') == Args{"ExtractText", "doc.pdf", "doc.txt"});
    }

    SECTION ("merge")
    {
        auto process = tool.merge({"a.pdf", "b.pdf"}).value_or_exit(PDFBOX_LINE_INFO);
        auto result = process.wait_and_capture(null_diagnostic_context).value_or_exit(PDFBOX_LINE_INFO);
        CHECK(Strings::split(result.output, '\n') == Args{"PDFMerger", "a.pdf", "b.pdf", "merged.pdf"});
    }

    SECTION ("validation happens before anything runs")
    {
        auto merged = tool.merge({"a.pdf"});
        REQUIRE(!merged.has_value());
        CHECK(merged.error().kind == PdfBoxErrorKind::InvalidArgument);

        ToImageOptions options;
        options.cropbox = {"1"};
        auto imaged = tool.to_image("doc.pdf", options);
        REQUIRE(!imaged.has_value());
        CHECK(imaged.error().kind == PdfBoxErrorKind::InvalidArgument);
        CHECK(status.lines.empty());
    }

    SECTION ("split, debug and to image return running processes")
    {
        auto split = tool.split("doc.pdf").value_or_exit(PDFBOX_LINE_INFO);
        CHECK(split.wait(null_diagnostic_context).value_or(-1) == 0);
        auto debug = tool.debug("doc.pdf").value_or_exit(PDFBOX_LINE_INFO);
        CHECK(debug.valid());
        debug.detach();
        auto image = tool.to_image("doc.pdf").value_or_exit(PDFBOX_LINE_INFO);
        auto result = image.wait_and_capture(null_diagnostic_context).value_or_exit(PDFBOX_LINE_INFO);
        CHECK(Strings::split(result.output, '\n') == Args{"PDFToImage", "doc.pdf"});
        CHECK(status.lines.size() == 3);
    }
}
