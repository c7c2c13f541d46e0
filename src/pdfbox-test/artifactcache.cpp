#include <pdfbox-test/util.h>

#include <pdfbox/base/hash.h>
#include <pdfbox/base/message_sinks.h>
#include <pdfbox/base/strings.h>

#include <pdfbox/artifact.h>
#include <pdfbox/artifactcache.h>

#include <algorithm>
#include <ctype.h>

using namespace pdfbox;

namespace
{
    constexpr StringLiteral base_url = "https://example.com/dist/pdfbox/";
    constexpr StringLiteral jar_contents = "PK\x03\x04 not really a jar";

    void add_release(Test::FakeHttpClient& http, StringView version, StringView checksum_text)
    {
        const auto urls = ArtifactResolver{base_url.to_string()}.urls_for(version);
        http.responses[urls.artifact_url] = jar_contents.to_string();
        http.responses[urls.checksum_url] = checksum_text.to_string();
    }

    std::string correct_checksum(StringView version)
    {
        return Strings::concat(Hash::get_string_hash(jar_contents, Hash::Algorithm::Sha512),
                               "  ",
                               artifact_file_name(version),
                               '\n');
    }

    std::vector<std::string> file_names(const Filesystem& fs, const Path& dir)
    {
        std::vector<std::string> result;
        for (auto&& file : fs.get_regular_files_non_recursive(dir, PDFBOX_LINE_INFO))
        {
            result.push_back(file.filename().to_string());
        }

        std::sort(result.begin(), result.end());
        return result;
    }
}

TEST_CASE ("scan the cache", "[artifactcache]")
{
    auto& fs = get_real_filesystem();
    Test::TemporaryDirectory temp{"scan"};
    Test::FakeHttpClient http{fs};
    for (auto&& name : {"pdfbox-app-2.0.27.jar",
                        "pdfbox-app-2.0.9.jar",
                        "pdfbox-app-3.0.0-RC1.jar",
                        "pdfbox-app-latest.jar",
                        "pdfbox-app-3.0.3.jar.1234.part",
                        "notes.txt"})
    {
        fs.write_contents(temp.path / name, "x", PDFBOX_LINE_INFO);
    }

    fs.create_directories(temp.path / "pdfbox-app-9.9.9.jar", PDFBOX_LINE_INFO);

    StringMessageSink status;
    const ArtifactCache cache{fs, http, status, temp.path, base_url.to_string()};
    const auto artifacts = cache.scan().value_or_exit(PDFBOX_LINE_INFO);
    REQUIRE(artifacts.size() == 3);
    CHECK(artifacts[0].version.original_string == "2.0.9");
    CHECK(artifacts[1].version.original_string == "2.0.27");
    CHECK(artifacts[2].version.original_string == "3.0.0-RC1");
    CHECK(artifacts[2].path.native() == (temp.path / "pdfbox-app-3.0.0-RC1.jar").native());

    REQUIRE(status.lines.size() == 1);
    CHECK(Strings::starts_with(status.lines[0], "warning: skipping "));
    CHECK(http.requests.empty());
}

TEST_CASE ("a missing cache directory is empty", "[artifactcache]")
{
    auto& fs = get_real_filesystem();
    Test::TemporaryDirectory temp{"missing-cache"};
    Test::FakeHttpClient http{fs};
    const ArtifactCache cache{fs, http, null_sink, temp.path / "does-not-exist", base_url.to_string()};
    CHECK(cache.scan().value_or_exit(PDFBOX_LINE_INFO).empty());
    CHECK(!cache.find_latest_cached().value_or_exit(PDFBOX_LINE_INFO).has_value());
}

TEST_CASE ("resolving a populated cache performs no requests", "[artifactcache]")
{
    auto& fs = get_real_filesystem();
    Test::TemporaryDirectory temp{"populated"};
    Test::FakeHttpClient http{fs};
    fs.write_contents(temp.path / "pdfbox-app-2.9.0.jar", "x", PDFBOX_LINE_INFO);
    fs.write_contents(temp.path / "pdfbox-app-2.10.0.jar", "x", PDFBOX_LINE_INFO);

    const ArtifactCache cache{fs, http, null_sink, temp.path, base_url.to_string()};
    const auto first = cache.resolve().value_or_exit(PDFBOX_LINE_INFO);
    const auto second = cache.resolve().value_or_exit(PDFBOX_LINE_INFO);
    CHECK(first.native() == (temp.path / "pdfbox-app-2.10.0.jar").native());
    CHECK(second.native() == first.native());
    CHECK(http.requests.empty());
}

TEST_CASE ("pinned version in the cache", "[artifactcache]")
{
    auto& fs = get_real_filesystem();
    Test::TemporaryDirectory temp{"pinned"};
    Test::FakeHttpClient http{fs};
    fs.write_contents(temp.path / "pdfbox-app-2.0.27.jar", "x", PDFBOX_LINE_INFO);
    fs.write_contents(temp.path / "pdfbox-app-3.0.3.jar", "x", PDFBOX_LINE_INFO);

    const ArtifactCache pinned_cached{fs, http, null_sink, temp.path, base_url.to_string(), std::string{"2.0.27"}};
    CHECK(pinned_cached.resolve().value_or_exit(PDFBOX_LINE_INFO).native() ==
          (temp.path / "pdfbox-app-2.0.27.jar").native());
    CHECK(http.requests.empty());

    const ArtifactCache pinned_absent{fs, http, null_sink, temp.path, base_url.to_string(), std::string{"2.0.26"}};
    CHECK(!pinned_absent.find_latest_cached().value_or_exit(PDFBOX_LINE_INFO).has_value());
}

TEST_CASE ("download and verify the latest version", "[artifactcache]")
{
    auto& fs = get_real_filesystem();
    Test::TemporaryDirectory temp{"download"};
    Test::FakeHttpClient http{fs};
    http.responses[base_url.to_string()] = Test::make_listing_html({"2.0.27/", "2.9.0/", "2.10.0/", "3.0.0-RC1/"});
    add_release(http, "2.10.0", correct_checksum("2.10.0"));

    const auto cache_dir = temp.path / "nested" / "cache";
    StringMessageSink status;
    const ArtifactCache cache{fs, http, status, cache_dir, base_url.to_string()};
    const auto path = cache.resolve().value_or_exit(PDFBOX_LINE_INFO);
    CHECK(path.native() == (cache_dir / "pdfbox-app-2.10.0.jar").native());
    CHECK(fs.read_contents(path, PDFBOX_LINE_INFO) == jar_contents);
    CHECK(file_names(fs, cache_dir) == std::vector<std::string>{"pdfbox-app-2.10.0.jar"});
    CHECK(http.requests == std::vector<std::string>{
                               base_url.to_string(),
                               "https://example.com/dist/pdfbox/2.10.0/pdfbox-app-2.10.0.jar",
                               "https://example.com/dist/pdfbox/2.10.0/pdfbox-app-2.10.0.jar.sha512",
                           });

    REQUIRE(status.lines.size() == 2);
    CHECK(Strings::starts_with(status.lines[1], "Downloading https://example.com/dist/pdfbox/2.10.0/"));

    http.requests.clear();
    CHECK(cache.resolve().value_or_exit(PDFBOX_LINE_INFO).native() == path.native());
    CHECK(http.requests.empty());
}

TEST_CASE ("gpg style checksums are accepted", "[artifactcache]")
{
    auto& fs = get_real_filesystem();
    Test::TemporaryDirectory temp{"gpg"};
    Test::FakeHttpClient http{fs};
    http.responses[base_url.to_string()] = Test::make_listing_html({"2.0.27/"});
    std::string digest = Hash::get_string_hash(jar_contents, Hash::Algorithm::Sha512);
    std::transform(digest.begin(), digest.end(), digest.begin(), [](char c) { return static_cast<char>(::toupper(c)); });
    std::string gpg = "pdfbox-app-2.0.27.jar:";
    for (size_t idx = 0; idx < digest.size(); idx += 8)
    {
        Strings::append(gpg, idx == 64 ? "\n " : " ", digest.substr(idx, 8));
    }

    add_release(http, "2.0.27", gpg);
    const ArtifactCache cache{fs, http, null_sink, temp.path, base_url.to_string()};
    CHECK(cache.download_latest().value_or_exit(PDFBOX_LINE_INFO).version.original_string == "2.0.27");
}

TEST_CASE ("checksum mismatch persists nothing", "[artifactcache]")
{
    auto& fs = get_real_filesystem();
    Test::TemporaryDirectory temp{"mismatch"};
    Test::FakeHttpClient http{fs};
    http.responses[base_url.to_string()] = Test::make_listing_html({"3.0.3/"});

    SECTION ("wrong digest")
    {
        add_release(http, "3.0.3", Hash::get_string_hash("something else", Hash::Algorithm::Sha512));
        const ArtifactCache cache{fs, http, null_sink, temp.path, base_url.to_string()};
        auto maybe_path = cache.resolve();
        REQUIRE(!maybe_path.has_value());
        CHECK(maybe_path.error().kind == PdfBoxErrorKind::Integrity);
        CHECK(maybe_path.error().message.data().find("does not match the SHA-512 digest") != std::string::npos);
    }

    SECTION ("unparseable checksum")
    {
        add_release(http, "3.0.3", "<html>Not Found</html>");
        const ArtifactCache cache{fs, http, null_sink, temp.path, base_url.to_string()};
        auto maybe_path = cache.resolve();
        REQUIRE(!maybe_path.has_value());
        CHECK(maybe_path.error().kind == PdfBoxErrorKind::Integrity);
    }

    CHECK(file_names(fs, temp.path).empty());
}

TEST_CASE ("download failures", "[artifactcache]")
{
    auto& fs = get_real_filesystem();
    Test::TemporaryDirectory temp{"download-failure"};
    Test::FakeHttpClient http{fs};
    const ArtifactCache cache{fs, http, null_sink, temp.path, base_url.to_string()};

    SECTION ("listing")
    {
        auto maybe_path = cache.resolve();
        REQUIRE(!maybe_path.has_value());
        CHECK(maybe_path.error().kind == PdfBoxErrorKind::Network);
    }

    SECTION ("artifact")
    {
        http.responses[base_url.to_string()] = Test::make_listing_html({"3.0.3/"});
        auto maybe_path = cache.resolve();
        REQUIRE(!maybe_path.has_value());
        CHECK(maybe_path.error().kind == PdfBoxErrorKind::Network);
        CHECK(http.requests.size() == 2);
    }

    SECTION ("checksum")
    {
        http.responses[base_url.to_string()] = Test::make_listing_html({"3.0.3/"});
        http.responses[ArtifactResolver{base_url.to_string()}.urls_for("3.0.3").artifact_url] = "jar";
        auto maybe_path = cache.resolve();
        REQUIRE(!maybe_path.has_value());
        CHECK(maybe_path.error().kind == PdfBoxErrorKind::Network);
    }

    CHECK(file_names(fs, temp.path).empty());
}

TEST_CASE ("artifact override", "[artifactcache]")
{
    auto& fs = get_real_filesystem();
    Test::TemporaryDirectory temp{"override"};
    Test::FakeHttpClient http{fs};
    PdfBoxSettings settings;
    settings.cache_dir = (temp.path / "cache").native();
    settings.archive_url = base_url.to_string();

    SECTION ("existing")
    {
        const auto jar = temp.path / "custom.jar";
        fs.write_contents(jar, "x", PDFBOX_LINE_INFO);
        settings.jar_path = jar.native();
        CHECK(resolve_artifact_path(fs, http, null_sink, settings).value_or_exit(PDFBOX_LINE_INFO).native() == jar.native());
    }

    SECTION ("missing")
    {
        settings.jar_path = (temp.path / "missing.jar").native();
        auto maybe_path = resolve_artifact_path(fs, http, null_sink, settings);
        REQUIRE(!maybe_path.has_value());
        CHECK(maybe_path.error().kind == PdfBoxErrorKind::Config);
    }

    CHECK(http.requests.empty());
    CHECK(!fs.exists(temp.path / "cache", PDFBOX_LINE_INFO));
}

TEST_CASE ("cache directory selection", "[artifactcache]")
{
    PdfBoxSettings settings;
    settings.cache_dir = "/var/cache/pdfbox-custom";
    CHECK(determine_cache_dir(settings).value_or_exit(PDFBOX_LINE_INFO).native() == "/var/cache/pdfbox-custom");

    settings.cache_dir = nullopt;
    auto maybe_dir = determine_cache_dir(settings);
    if (auto dir = maybe_dir.get())
    {
        CHECK(dir->filename() == CacheDirectoryName);
        CHECK(dir->is_absolute());
    }
    else
    {
        CHECK(maybe_dir.error().kind == PdfBoxErrorKind::Config);
    }
}
