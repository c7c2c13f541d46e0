#include <pdfbox-test/util.h>

#include <pdfbox/base/hash.h>
#include <pdfbox/base/strings.h>

#include <pdfbox/artifact.h>

using namespace pdfbox;

namespace
{
    const std::string digest_of_abc = Hash::get_string_hash("abc", Hash::Algorithm::Sha512);
}

TEST_CASE ("artifact file names", "[artifact]")
{
    CHECK(artifact_file_name("3.0.3") == "pdfbox-app-3.0.3.jar");
    CHECK(version_from_artifact_file_name("pdfbox-app-3.0.3.jar").value_or("") == "3.0.3");
    CHECK(version_from_artifact_file_name("pdfbox-app-3.0.0-RC1.jar").value_or("") == "3.0.0-RC1");
    CHECK(!version_from_artifact_file_name("pdfbox-app-.jar").has_value());
    CHECK(!version_from_artifact_file_name("pdfbox-3.0.3.jar").has_value());
    CHECK(!version_from_artifact_file_name("pdfbox-app-3.0.3.jar.1234.part").has_value());
    CHECK(!version_from_artifact_file_name("pdfbox-app-3.0.3.zip").has_value());
}

TEST_CASE ("checksum text formats", "[artifact]")
{
    SECTION ("bare digest")
    {
        CHECK(parse_sha512_checksum_text(digest_of_abc).value_or("") == digest_of_abc);
        CHECK(parse_sha512_checksum_text(digest_of_abc + "\n").value_or("") == digest_of_abc);
    }

    SECTION ("sha512sum output")
    {
        CHECK(parse_sha512_checksum_text(digest_of_abc + "  pdfbox-app-3.0.3.jar\n").value_or("") == digest_of_abc);
    }

    SECTION ("upper case digest")
    {
        std::string upper = digest_of_abc;
        for (auto& ch : upper)
        {
            if (ch >= 'a' && ch <= 'f') ch = static_cast<char>(ch - 'a' + 'A');
        }

        CHECK(parse_sha512_checksum_text(upper).value_or("") == digest_of_abc);
    }

    SECTION ("gpg --print-md output")
    {
        std::string gpg = "pdfbox-app-2.0.27.jar: ";
        for (size_t idx = 0; idx < digest_of_abc.size(); idx += 8)
        {
            if (idx == 64)
            {
                gpg.append("\n                       ");
            }

            gpg.append(Strings::ascii_to_lowercase(digest_of_abc.substr(idx, 8)));
            gpg.push_back(' ');
        }

        CHECK(parse_sha512_checksum_text(gpg).value_or("") == digest_of_abc);
    }

    SECTION ("not a checksum")
    {
        CHECK(!parse_sha512_checksum_text("").has_value());
        CHECK(!parse_sha512_checksum_text("<html><body>Not Found</body></html>").has_value());
        CHECK(!parse_sha512_checksum_text(digest_of_abc.substr(1)).has_value());
        CHECK(!parse_sha512_checksum_text("file: " + digest_of_abc + "00").has_value());
        CHECK(!parse_sha512_checksum_text("file: " + digest_of_abc.substr(2) + "zz").has_value());
    }
}

TEST_CASE ("artifact urls", "[artifact]")
{
    const ArtifactResolver with_slash{"https://archive.apache.org/dist/pdfbox/"};
    const auto urls = with_slash.urls_for("2.0.27");
    CHECK(urls.version == "2.0.27");
    CHECK(urls.artifact_url == "https://archive.apache.org/dist/pdfbox/2.0.27/pdfbox-app-2.0.27.jar");
    CHECK(urls.checksum_url == "https://archive.apache.org/dist/pdfbox/2.0.27/pdfbox-app-2.0.27.jar.sha512");

    const ArtifactResolver without_slash{"https://archive.apache.org/dist/pdfbox"};
    CHECK(without_slash.urls_for("2.0.27").artifact_url == urls.artifact_url);
}

TEST_CASE ("select the greatest version", "[artifact]")
{
    const ArtifactResolver resolver{"https://example.com/pdfbox/"};
    CHECK(resolver.select_version({"2.9.0", "2.10.0"}).value_or_exit(PDFBOX_LINE_INFO) == "2.10.0");
    CHECK(resolver.select_version({"1.8.17", "2.0.27", "3.0.0-RC1"}).value_or_exit(PDFBOX_LINE_INFO) ==
          "3.0.0-RC1");
    CHECK(resolver.select_version({"3.0.0-RC1", "3.0.0", "2.0.32"}).value_or_exit(PDFBOX_LINE_INFO) == "3.0.0");
    CHECK(resolver.select_version({"7"}).value_or_exit(PDFBOX_LINE_INFO) == "7");

    const auto urls = resolver.resolve({"2.0.9", "2.0.27"}).value_or_exit(PDFBOX_LINE_INFO);
    CHECK(urls.version == "2.0.27");
    CHECK(urls.artifact_url == "https://example.com/pdfbox/2.0.27/pdfbox-app-2.0.27.jar");
}

TEST_CASE ("selection failures", "[artifact]")
{
    const ArtifactResolver resolver{"https://example.com/pdfbox/"};

    auto empty = resolver.select_version({});
    REQUIRE(!empty.has_value());
    CHECK(empty.error().kind == PdfBoxErrorKind::Resolution);

    auto malformed = resolver.select_version({"2.0.27", "2.0.27_1"});
    REQUIRE(!malformed.has_value());
    CHECK(malformed.error().kind == PdfBoxErrorKind::VersionParse);
    CHECK(malformed.error().message == LocalizedString::from_raw(StringView("'2.0.27_1' is not a valid version")));
}

TEST_CASE ("pinned versions", "[artifact]")
{
    const ArtifactResolver resolver{"https://example.com/pdfbox/", std::string{"2.0.27"}};
    CHECK(resolver.select_version({"2.0.27", "3.0.3"}).value_or_exit(PDFBOX_LINE_INFO) == "2.0.27");

    auto missing = resolver.select_version({"2.0.26", "3.0.3"});
    REQUIRE(!missing.has_value());
    CHECK(missing.error().kind == PdfBoxErrorKind::Resolution);
}
