#include <pdfbox-test/util.h>

#include <pdfbox/artifact.h>
#include <pdfbox/versions.h>

#include <algorithm>
#include <string>
#include <vector>

using namespace pdfbox;

namespace
{
    DotVersion parse(StringView text) { return DotVersion::try_parse(text).value_or_exit(PDFBOX_LINE_INFO); }
}

TEST_CASE ("parse dot versions", "[versions]")
{
    auto v = parse("2.0.27");
    CHECK(v.original_string == "2.0.27");
    CHECK(v.version_string == "2.0.27");
    CHECK(v.prerelease_string.empty());
    CHECK(v.version == std::vector<uint64_t>{2, 0, 27});
    CHECK(v.identifiers.empty());

    v = parse("3.0.0-RC1");
    CHECK(v.version_string == "3.0.0");
    CHECK(v.prerelease_string == "RC1");
    CHECK(v.identifiers == std::vector<std::string>{"RC1"});

    v = parse("3.0.0.beta1");
    CHECK(v.version == std::vector<uint64_t>{3, 0, 0});
    CHECK(v.identifiers == std::vector<std::string>{"beta1"});

    v = parse("2.0.0-alpha.2+build.5");
    CHECK(v.identifiers == std::vector<std::string>{"alpha", "2"});
    CHECK(v.to_string() == "2.0.0-alpha.2+build.5");

    v = parse("7");
    CHECK(v.version == std::vector<uint64_t>{7});
}

TEST_CASE ("reject malformed versions", "[versions]")
{
    CHECK(!DotVersion::try_parse("").has_value());
    CHECK(!DotVersion::try_parse("KEYS").has_value());
    CHECK(!DotVersion::try_parse("v2.0.0").has_value());
    CHECK(!DotVersion::try_parse("2..0").has_value());
    CHECK(!DotVersion::try_parse("2.0.0-").has_value());
    CHECK(!DotVersion::try_parse("2.0.0+").has_value());
    CHECK(!DotVersion::try_parse("2.0.0 ").has_value());
    CHECK(!DotVersion::try_parse("99999999999999999999.0").has_value());

    auto maybe_bad = DotVersion::try_parse("latest");
    REQUIRE(!maybe_bad.has_value());
    CHECK(maybe_bad.error() == LocalizedString::from_raw(StringView("'latest' is not a valid version")));
}

TEST_CASE ("numeric components compare as numbers", "[versions]")
{
    CHECK(parse("2.9.0") < parse("2.10.0"));
    CHECK(parse("2.0.9") < parse("2.0.27"));
    CHECK(parse("1.8.17") < parse("2.0.0"));
    CHECK(parse("10.0.0") > parse("9.9.9"));
    CHECK(compare(parse("2.0.27"), parse("2.0.27")) == VerComp::eq);
}

TEST_CASE ("pre-releases sort before the release", "[versions]")
{
    CHECK(parse("3.0.0-RC1") < parse("3.0.0"));
    CHECK(parse("3.0.0-alpha2") < parse("3.0.0-beta1"));
    CHECK(parse("3.0.0-beta1") < parse("3.0.0-RC1"));
    CHECK(parse("3.0.0-alpha.2") < parse("3.0.0-alpha.10"));
    CHECK(parse("3.0.0-1") < parse("3.0.0-alpha"));
    CHECK(parse("3.0.0-RC1") > parse("2.0.32"));
    CHECK(parse("3.0.0-rc1") == parse("3.0.0-RC1"));
}

TEST_CASE ("qualifier numbers compare as numbers", "[versions]")
{
    CHECK(parse("3.0.0-alpha2") < parse("3.0.0-alpha10"));
    CHECK(parse("3.0.0-RC9") < parse("3.0.0-RC10"));
    CHECK(parse("3.0.0-beta02") == parse("3.0.0-beta2"));
    CHECK(parse("3.0.0-alpha") < parse("3.0.0-alpha1"));
    CHECK(parse("3.0.0-alpha10") < parse("3.0.0-beta1"));
    CHECK(parse("3.0.0-alpha99999999999999999999") > parse("3.0.0-alpha9"));

    const ArtifactResolver resolver{"https://x"};
    CHECK(resolver.select_version({"3.0.0-alpha2", "3.0.0-alpha10"}).value_or_exit(PDFBOX_LINE_INFO) ==
          "3.0.0-alpha10");
}

TEST_CASE ("build metadata is ignored for ordering", "[versions]")
{
    CHECK(compare(parse("2.0.0+build.1"), parse("2.0.0+build.2")) == VerComp::eq);
    CHECK(parse("2.0.0+build.9") < parse("2.0.1"));
}

TEST_CASE ("sorting a catalog", "[versions]")
{
    std::vector<DotVersion> versions;
    for (auto&& text : {"2.10.0", "1.8.17", "3.0.0", "2.9.0", "3.0.0-RC1", "2.0.27"})
    {
        versions.push_back(parse(text));
    }

    std::sort(versions.begin(), versions.end());
    std::vector<std::string> sorted;
    for (auto&& v : versions)
    {
        sorted.push_back(v.original_string);
    }

    CHECK(sorted == std::vector<std::string>{"1.8.17", "2.0.27", "2.9.0", "2.10.0", "3.0.0-RC1", "3.0.0"});
}
