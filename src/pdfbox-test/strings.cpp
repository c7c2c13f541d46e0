#include <pdfbox-test/util.h>

#include <pdfbox/base/strings.h>

#include <string>
#include <vector>

using namespace pdfbox;

TEST_CASE ("trim", "[strings]")
{
    CHECK(Strings::trim("").to_string().empty());
    CHECK(Strings::trim(" \t\r\n").to_string().empty());
    CHECK(Strings::trim("  digest  file.jar\r\n").to_string() == "digest  file.jar");
    CHECK(Strings::trim("x").to_string() == "x");
    CHECK(Strings::trim("\nx").to_string() == "x");
    CHECK(Strings::trim("x\n").to_string() == "x");
}

TEST_CASE ("split drops empty fields", "[strings]")
{
    CHECK(Strings::split("", ',').empty());
    CHECK(Strings::split("a,,b,", ',') == std::vector<std::string>{"a", "b"});
    CHECK(Strings::split("0,0,100,50", ',') == std::vector<std::string>{"0", "0", "100", "50"});
}

TEST_CASE ("strto int", "[strings]")
{
    CHECK(Strings::strto<int>("300").value_or(0) == 300);
    CHECK(Strings::strto<int>("-2").value_or(0) == -2);
    CHECK(!Strings::strto<int>("").has_value());
    CHECK(!Strings::strto<int>(" 3").has_value());
    CHECK(!Strings::strto<int>("3dpi").has_value());
    CHECK(!Strings::strto<int>("99999999999").has_value());
}

TEST_CASE ("concat formats values", "[strings]")
{
    CHECK(Strings::concat("dpi=", 300, ' ', StringView{"x"}) == "dpi=300 x");
    CHECK(Strings::join(", ", {"a", "b"}) == "a, b");
    CHECK(Strings::replace_all("a b c", " ", "%20") == "a%20b%20c");
}
