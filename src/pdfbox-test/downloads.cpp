#include <pdfbox-test/util.h>

#include <pdfbox/base/downloads.h>
#include <pdfbox/base/message_sinks.h>
#include <pdfbox/base/strings.h>

using namespace pdfbox;

TEST_CASE ("url_join", "[downloads]")
{
    CHECK(url_join("https://example.com/dist/", "2.0.27/") == "https://example.com/dist/2.0.27/");
    CHECK(url_join("https://example.com/dist", "/2.0.27") == "https://example.com/dist/2.0.27");
    CHECK(url_join("https://example.com/dist//", "//x.jar") == "https://example.com/dist/x.jar");
}

TEST_CASE ("url_encode_spaces", "[downloads]")
{
    CHECK(url_encode_spaces("file:///tmp/my dir/a b.jar") == "file:///tmp/my%20dir/a%20b.jar");
    CHECK(url_encode_spaces("https://example.com/") == "https://example.com/");
}

TEST_CASE ("download a file URL", "[downloads]")
{
    auto& fs = get_real_filesystem();
    Test::TemporaryDirectory temp{"downloads"};
    const auto source = temp.path / "source.bin";
    fs.write_contents(source, "payload", PDFBOX_LINE_INFO);

    const CurlHttpClient client{fs};
    BufferedDiagnosticContext bdc{null_sink};
    const auto target = temp.path / "nested" / "target.bin";
    REQUIRE(client.download_file(bdc, Strings::concat("file://", source), target));
    CHECK(bdc.empty());
    CHECK(fs.read_contents(target, PDFBOX_LINE_INFO) == "payload");

    auto text = client.get_text(bdc, Strings::concat("file://", source));
    REQUIRE(text.has_value());
    CHECK(*text.get() == "payload");
}

TEST_CASE ("download reports a failure to flush the target", "[downloads]")
{
    auto& fs = get_real_filesystem();
    if (!fs.exists("/dev/full", PDFBOX_LINE_INFO))
    {
        return;
    }

    Test::TemporaryDirectory temp{"downloads"};
    const auto source = temp.path / "source.bin";
    fs.write_contents(source, "payload", PDFBOX_LINE_INFO);

    // writes to /dev/full are buffered, so the failure only shows when the file is closed
    const CurlHttpClient client{fs};
    BufferedDiagnosticContext bdc{null_sink};
    CHECK(!client.download_file(bdc, Strings::concat("file://", source), "/dev/full"));
    REQUIRE(bdc.any_errors());
    CHECK(Strings::starts_with(bdc.to_string(), "error: fclose(\"/dev/full\"): "));
}
