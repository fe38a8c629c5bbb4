#include <toolscout-test/util.h>

#include <toolscout/base/strings.h>

#include <limits.h>

using namespace toolscout;

TEST_CASE ("split_once", "[strings]")
{
    auto parts = Strings::split_once("12.2.1-1.2.1", '-');
    CHECK(parts.first == "12.2.1");
    CHECK(parts.second == "1.2.1");

    parts = Strings::split_once("a-b-c", '-');
    CHECK(parts.first == "a");
    CHECK(parts.second == "b-c");

    parts = Strings::split_once("nodash", '-');
    CHECK(parts.first == "nodash");
    CHECK(parts.second.empty());

    parts = Strings::split_once("-leading", '-');
    CHECK(parts.first.empty());
    CHECK(parts.second == "leading");
}

TEST_CASE ("split_paths keeps empty entries as the working directory", "[strings]")
{
    using result_t = std::vector<std::string>;
    CHECK(Strings::split_paths("/usr/local/bin:/usr/bin") == result_t{"/usr/local/bin", "/usr/bin"});
    CHECK(Strings::split_paths("/a::/b:") == result_t{"/a", ".", "/b", "."});
    CHECK(Strings::split_paths(":/a") == result_t{".", "/a"});
    CHECK(Strings::split_paths(":") == result_t{".", "."});
    CHECK(Strings::split_paths("").empty());
}

TEST_CASE ("parse_leading_int", "[strings]")
{
    CHECK(Strings::parse_leading_int("12").value_or_exit(TOOLSCOUT_LINE_INFO) == 12);
    CHECK(Strings::parse_leading_int("12rc1").value_or_exit(TOOLSCOUT_LINE_INFO) == 12);
    CHECK(Strings::parse_leading_int("007").value_or_exit(TOOLSCOUT_LINE_INFO) == 7);
    CHECK_FALSE(Strings::parse_leading_int("rc1").has_value());
    CHECK_FALSE(Strings::parse_leading_int("").has_value());
    CHECK_FALSE(Strings::parse_leading_int("-1").has_value());
}

TEST_CASE ("parse_leading_int clamps values that overflow", "[strings]")
{
    CHECK(Strings::parse_leading_int("2147483647").value_or_exit(TOOLSCOUT_LINE_INFO) == INT_MAX);
    CHECK(Strings::parse_leading_int("2147483648").value_or_exit(TOOLSCOUT_LINE_INFO) == INT_MAX);
    CHECK(Strings::parse_leading_int("99999999999").value_or_exit(TOOLSCOUT_LINE_INFO) == INT_MAX);
    CHECK(Strings::parse_leading_int("99999999999999999999999rc").value_or_exit(TOOLSCOUT_LINE_INFO) == INT_MAX);
    CHECK(Strings::parse_leading_int("214748364").value_or_exit(TOOLSCOUT_LINE_INFO) == 214748364);
}

TEST_CASE ("concat and join", "[strings]")
{
    CHECK(Strings::concat("a", 'b', std::string("c"), StringView{"d"}, 5) == "abcd5");

    std::string target = "x";
    Strings::append(target, '=', 1.5);
    CHECK(target == "x=1.5");

    const std::vector<std::string> empty;
    CHECK(Strings::join(", ", empty).empty());
    CHECK(Strings::join(", ", std::vector<std::string>{"gmake"}) == "gmake");
    CHECK(Strings::join(", ", std::vector<std::string>{"mingw32-make", "gmake"}) == "mingw32-make, gmake");
}
