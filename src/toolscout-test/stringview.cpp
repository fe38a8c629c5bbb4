#include <toolscout-test/util.h>

#include <toolscout/base/stringview.h>

using namespace toolscout;

TEST_CASE ("StringView prefixes and contents", "[stringview]")
{
    const StringView sv = "arm-none-eabi-gcc";
    CHECK(sv.starts_with("arm-"));
    CHECK(sv.starts_with(""));
    CHECK_FALSE(sv.starts_with("gcc"));
    CHECK_FALSE(StringView{"arm"}.starts_with("arm-none"));
    CHECK(sv.contains('-'));
    CHECK_FALSE(sv.contains('/'));
}

TEST_CASE ("StringView substr and compare", "[stringview]")
{
    const StringView sv = "openocd";
    CHECK(sv.substr(4) == "ocd");
    CHECK(sv.substr(0) == sv);
    CHECK(sv.substr(7).empty());
    CHECK(sv.substr(100).empty());

    CHECK(StringView{} == StringView{""});
    CHECK(StringView{"a"} != StringView{"b"});
    CHECK(StringView{"ab"} != StringView{"a"});
    CHECK(sv.to_string() == "openocd");

    static constexpr StringLiteral literal = "@xpack-dev-tools";
    CHECK(literal.size() == 16);
    CHECK(literal.c_str()[16] == '\0');
    CHECK(fmt::format("{}/{}", literal, sv) == "@xpack-dev-tools/openocd");
}
