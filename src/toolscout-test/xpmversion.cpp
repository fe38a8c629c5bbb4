#include <toolscout-test/util.h>

#include <toolscout/xpmversion.h>

#include <limits.h>

using namespace toolscout;

TEST_CASE ("parse_xpm_version", "[xpmversion]")
{
    auto v = parse_xpm_version("12.2.1-1.2.1");
    CHECK(v.tool_version == std::array<int, 3>{12, 2, 1});
    CHECK(v.xpm_version == std::array<int, 3>{1, 2, 1});
    CHECK(v.source_name == "12.2.1-1.2.1");

    v = parse_xpm_version("0.12.0-1");
    CHECK(v.tool_version == std::array<int, 3>{0, 12, 0});
    CHECK(v.xpm_version == std::array<int, 3>{1, 0, 0});

    v = parse_xpm_version("4.3");
    CHECK(v.tool_version == std::array<int, 3>{4, 3, 0});
    CHECK(v.xpm_version == std::array<int, 3>{0, 0, 0});
    CHECK(v.source_name == "4.3");
}

TEST_CASE ("parse_xpm_version treats non-numeric segments as zero", "[xpmversion]")
{
    auto v = parse_xpm_version("abc");
    CHECK(v.tool_version == std::array<int, 3>{0, 0, 0});
    CHECK(v.xpm_version == std::array<int, 3>{0, 0, 0});

    v = parse_xpm_version("12rc1.x.3-beta.2");
    CHECK(v.tool_version == std::array<int, 3>{12, 0, 3});
    CHECK(v.xpm_version == std::array<int, 3>{0, 2, 0});

    v = parse_xpm_version("");
    CHECK(v.tool_version == std::array<int, 3>{0, 0, 0});
    CHECK(v.source_name.empty());
}

TEST_CASE ("parse_xpm_version splits on the first dash only", "[xpmversion]")
{
    const auto v = parse_xpm_version("1.2.3-4.5.6-7");
    CHECK(v.tool_version == std::array<int, 3>{1, 2, 3});
    CHECK(v.xpm_version == std::array<int, 3>{4, 5, 6});
    CHECK(v.source_name == "1.2.3-4.5.6-7");
}

TEST_CASE ("parse_xpm_version ignores segments past the third", "[xpmversion]")
{
    const auto v = parse_xpm_version("1.2.3.4-5.6.7.8");
    CHECK(v.tool_version == std::array<int, 3>{1, 2, 3});
    CHECK(v.xpm_version == std::array<int, 3>{5, 6, 7});
}

TEST_CASE ("parse_xpm_version clamps huge components", "[xpmversion]")
{
    const auto huge = parse_xpm_version("99999999999.0.0-1");
    CHECK(huge.tool_version == std::array<int, 3>{INT_MAX, 0, 0});
    CHECK(is_real_version(huge));
    CHECK(newer_version(parse_xpm_version("12.2.1-1.2.1"), huge) == huge);
}

TEST_CASE ("is_real_version", "[xpmversion]")
{
    CHECK(is_real_version(parse_xpm_version("1.0.0-0.0.0")));
    CHECK(is_real_version(parse_xpm_version("0.0.1")));
    CHECK(is_real_version(parse_xpm_version("0.1.0-1")));
    CHECK_FALSE(is_real_version(parse_xpm_version("0.0.0-1.0.0")));
    CHECK_FALSE(is_real_version(parse_xpm_version("readme.txt")));
    CHECK_FALSE(is_real_version(XpmToolVersion{}));
}

TEST_CASE ("newer_version", "[xpmversion]")
{
    const auto older = parse_xpm_version("10.3.1-2.3.1");
    const auto newer = parse_xpm_version("12.2.1-1.2.1");

    CHECK(newer_version(nullopt, older) == older);
    CHECK(newer_version(older, older) == older);
    CHECK(newer_version(older, newer) == newer);
    CHECK(newer_version(newer, older) == newer);

    SECTION ("the package version breaks ties in the tool version")
    {
        const auto first_release = parse_xpm_version("12.2.1-1.1.1");
        const auto second_release = parse_xpm_version("12.2.1-1.2.1");
        CHECK(newer_version(first_release, second_release) == second_release);
        CHECK(newer_version(second_release, first_release) == second_release);
    }

    SECTION ("a full tie keeps the current version")
    {
        const auto padded = parse_xpm_version("12.2.1-1.2.1-extra");
        CHECK(newer_version(newer, padded) == newer);
        CHECK(newer_version(padded, newer) == padded);
    }

    SECTION ("components compare numerically")
    {
        CHECK(newer_version(parse_xpm_version("9.0.0"), parse_xpm_version("10.0.0")).source_name == "10.0.0");
        CHECK(newer_version(parse_xpm_version("1.10.0"), parse_xpm_version("1.9.9")).source_name == "1.10.0");
    }
}

TEST_CASE ("XpmToolVersion::to_string", "[xpmversion]")
{
    CHECK(parse_xpm_version("12.2.1-1.2").to_string() == "12.2.1-1.2.0");
    CHECK(parse_xpm_version("junk").to_string() == "0.0.0-0.0.0");
    CHECK(fmt::format("{}", parse_xpm_version("0.12.0-1")) == "0.12.0-1.0.0");
}
