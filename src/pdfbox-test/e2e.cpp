#include <pdfbox-test/util.h>

#include <pdfbox/base/message_sinks.h>
#include <pdfbox/base/strings.h>
#include <pdfbox/base/system.h>

#include <pdfbox/settings.h>
#include <pdfbox/tool.h>

using namespace pdfbox;

namespace
{
    constexpr StringLiteral test_line = "this is a test PDF";

    // Whether a real artifact and runtime are available.
    bool can_run_end_to_end()
    {
        if (!get_environment_variable(EnvironmentVariableJar).has_value())
        {
            WARN("PDFBOX is not set; skipping end-to-end tests");
            return false;
        }

        if (get_real_filesystem().find_from_PATH(RuntimeExecutableName).empty())
        {
            WARN("java is not on PATH; skipping end-to-end tests");
            return false;
        }

        return true;
    }

    std::vector<Path> files_matching(const Path& dir, StringView infix, StringView extension)
    {
        std::vector<Path> result;
        for (auto&& file : get_real_filesystem().get_regular_files_non_recursive(dir, PDFBOX_LINE_INFO))
        {
            const auto name = file.filename();
            if (Strings::ends_with(name, extension) &&
                Strings::search(name, infix) != name.end())
            {
                result.push_back(file);
            }
        }

        return result;
    }

    void wait_success(ExpectedP<RunningProcess>&& maybe_process)
    {
        auto process = std::move(maybe_process).value_or_exit(PDFBOX_LINE_INFO);
        auto result = process.wait_and_capture(console_diagnostic_context).value_or_exit(PDFBOX_LINE_INFO);
        INFO(result.output);
        REQUIRE(result.exit_code == 0);
    }
}

TEST_CASE ("end to end", "[.e2e]")
{
    if (!can_run_end_to_end())
    {
        return;
    }

    auto& fs = get_real_filesystem();
    Test::TemporaryDirectory temp{"e2e"};
    Test::FakeHttpClient http{fs};
    const auto tool =
        PdfBox::create(PdfBoxSettings::from_environment(), fs, http, null_sink).value_or_exit(PDFBOX_LINE_INFO);
    CHECK(http.requests.empty());

    const auto first = temp.path / "first.pdf";
    const auto second = temp.path / "second.pdf";
    const auto merged = temp.path / "merged.pdf";
    fs.write_contents(first, Test::make_text_pdf({test_line.to_string()}), PDFBOX_LINE_INFO);
    fs.write_contents(second, Test::make_text_pdf({test_line.to_string()}), PDFBOX_LINE_INFO);

    SECTION ("extract text")
    {
        CHECK(tool.extract_text(first).value_or_exit(PDFBOX_LINE_INFO) == "this is a test PDF\n");
    }

    SECTION ("merge, split and rasterize")
    {
        wait_success(tool.merge({first.native(), second.native()}, merged));
        REQUIRE(fs.exists(merged, PDFBOX_LINE_INFO));
        CHECK(tool.extract_text(merged).value_or_exit(PDFBOX_LINE_INFO) ==
              "this is a test PDF\nthis is a test PDF\n");

        wait_success(tool.split(merged));
        CHECK(files_matching(temp.path, "-", ".pdf").size() == 2);

        ToImageOptions options;
        options.dpi = 20;
        wait_success(tool.to_image(merged, options));
        CHECK(files_matching(temp.path, "", ".jpg").size() == 2);
    }
}
