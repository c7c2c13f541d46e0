#include <pdfbox-test/util.h>

#include <pdfbox/base/message_sinks.h>

#include <pdfbox/artifact.h>
#include <pdfbox/catalog.h>

using namespace pdfbox;

TEST_CASE ("version patterns", "[catalog]")
{
    CHECK(is_catalog_version("2.0.27"));
    CHECK(is_catalog_version("3.0.0-RC1"));
    CHECK(is_catalog_version("3.0.0.beta1"));
    CHECK(is_catalog_version("2.0.0+build.5"));
    CHECK(is_catalog_version("1"));
    CHECK(!is_catalog_version(""));
    CHECK(!is_catalog_version("KEYS"));
    CHECK(!is_catalog_version("dist"));
    CHECK(!is_catalog_version("?C=N;O=D"));
    CHECK(!is_catalog_version("2.0.27-"));
    CHECK(!is_catalog_version("2.0.27/extra"));
    CHECK(!is_catalog_version("2.0.27 "));
    CHECK(!is_catalog_version("2.0.0-a..b"));
    CHECK(!is_catalog_version("2.0.0-a."));
    CHECK(!is_catalog_version("2.0.0+a+b"));
    CHECK(!is_catalog_version("99999999999999999999"));
}

TEST_CASE ("listed names must parse as versions", "[catalog]")
{
    const auto versions = parse_catalog_versions(Test::make_listing_html({"2.0.27/", "3.0.0-RC1/", "2.0.0-a..b/"}));
    CHECK(versions == std::set<std::string>{"2.0.27", "3.0.0-RC1"});

    const ArtifactResolver resolver{"https://example.com/dist/pdfbox/"};
    CHECK(resolver.select_version(versions).value_or_exit(PDFBOX_LINE_INFO) == "3.0.0-RC1");
}

TEST_CASE ("parse an Apache directory listing", "[catalog]")
{
    const auto html = Test::make_listing_html({"1.8.17/", "2.0.27/", "2.0.9/", "3.0.0-RC1/", "3.0.3/"});
    const std::set<std::string> expected{"1.8.17", "2.0.27", "2.0.9", "3.0.0-RC1", "3.0.3"};
    CHECK(parse_catalog_versions(html) == expected);
}

TEST_CASE ("anchor markup variations", "[catalog]")
{
    CHECK(parse_catalog_versions("<A HREF=\"2.0.1/\">x</A>") == std::set<std::string>{"2.0.1"});
    CHECK(parse_catalog_versions("<a class=x href='2.0.2'>x</a>") == std::set<std::string>{"2.0.2"});
    CHECK(parse_catalog_versions("<a href=2.0.3/>x</a>") == std::set<std::string>{"2.0.3"});
    CHECK(parse_catalog_versions("<a title=\"a &amp; b\" href=\"/2.0.4/\">x</a>") ==
          std::set<std::string>{"2.0.4"});
    CHECK(parse_catalog_versions("<a href=\"2.0.5&#43;x/\">").empty());
    CHECK(parse_catalog_versions("<a href=\"2.0.6/\"><a href=\"2.0.6\">") == std::set<std::string>{"2.0.6"});
}

TEST_CASE ("only anchor hrefs count", "[catalog]")
{
    const StringView html = "<!-- <a href=\"9.9.9/\"> -->\n"
                            "<link href=\"8.8.8/\">\n"
                            "<img src=\"7.7.7/\">\n"
                            "<abbr href=\"6.6.6/\">\n"
                            "<a name=\"5.5.5\">\n"
                            "<a href=\"4.4.4/\">4.4.4</a>\n";
    CHECK(parse_catalog_versions(html) == std::set<std::string>{"4.4.4"});
}

TEST_CASE ("malformed markup never fails", "[catalog]")
{
    CHECK(parse_catalog_versions("").empty());
    CHECK(parse_catalog_versions("<").empty());
    CHECK(parse_catalog_versions("<a href=\"\">").empty());
    CHECK(parse_catalog_versions("<a href=\"///\">").empty());
    CHECK(parse_catalog_versions("<a href=").empty());
    CHECK(parse_catalog_versions("plain text 2.0.1") == std::set<std::string>{});
}

TEST_CASE ("fetch versions", "[catalog]")
{
    Test::FakeHttpClient http{get_real_filesystem()};
    const std::string base_url = "https://example.com/dist/pdfbox/";
    http.responses[base_url] = Test::make_listing_html({"2.0.27/", "3.0.3/"});

    StringMessageSink status;
    const VersionCatalog catalog{http, status, base_url};
    auto versions = catalog.fetch_versions().value_or_exit(PDFBOX_LINE_INFO);
    CHECK(versions == std::set<std::string>{"2.0.27", "3.0.3"});
    CHECK(http.requests == std::vector<std::string>{base_url});
    REQUIRE(status.lines.size() == 1);
    CHECK(status.lines[0] == "Fetching the list of PDFBox versions from https://example.com/dist/pdfbox/");
}

TEST_CASE ("fetch failures", "[catalog]")
{
    Test::FakeHttpClient http{get_real_filesystem()};
    const std::string base_url = "https://example.com/dist/pdfbox/";

    SECTION ("unreachable listing")
    {
        auto maybe_versions = VersionCatalog{http, null_sink, base_url}.fetch_versions();
        REQUIRE(!maybe_versions.has_value());
        CHECK(maybe_versions.error().kind == PdfBoxErrorKind::Network);
    }

    SECTION ("listing without versions")
    {
        http.responses[base_url] = Test::make_listing_html({"KEYS", "current/"});
        auto maybe_versions = VersionCatalog{http, null_sink, base_url}.fetch_versions();
        REQUIRE(!maybe_versions.has_value());
        CHECK(maybe_versions.error().kind == PdfBoxErrorKind::Resolution);
    }
}
