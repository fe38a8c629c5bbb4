#include <toolscout-test/util.h>

#include <toolscout/base/path.h>

using namespace toolscout;

TEST_CASE ("Path joins with a single separator", "[path]")
{
    CHECK((Path{"a"} / "b").native() == "a/b");
    CHECK((Path{"a/"} / "b").native() == "a/b");
    CHECK((Path{""} / "b").native() == "b");
    CHECK((Path{"a"} / "/b").native() == "/b");
    CHECK((Path{"a"} / "").native() == "a/");

    Path p = "/opt";
    p /= "xpm";
    p /= "tools";
    CHECK(p.native() == "/opt/xpm/tools");
}

TEST_CASE ("Path::lexically_normal", "[path]")
{
    CHECK(Path{"/a/./b/../c"}.lexically_normal().native() == "/a/c");
    CHECK(Path{"a//b"}.lexically_normal().native() == "a/b");
    CHECK(Path{"a/b/"}.lexically_normal().native() == "a/b/");
    CHECK(Path{"a/.."}.lexically_normal().native() == ".");
    CHECK(Path{"../a"}.lexically_normal().native() == "../a");
    CHECK(Path{"/.."}.lexically_normal().native() == "/");
    CHECK(Path{"a/../.."}.lexically_normal().native() == "..");
    CHECK(Path{"./"}.lexically_normal().native() == ".");
    CHECK(Path{"/"}.lexically_normal().native() == "/");
    CHECK(Path{"a/b/.."}.lexically_normal().native() == "a");
    CHECK(Path{}.lexically_normal().empty());
}

TEST_CASE ("Path decomposition", "[path]")
{
    CHECK(Path{"/opt/bin/gcc"}.parent_path() == "/opt/bin");
    CHECK(Path{"/opt/bin/gcc"}.filename() == "gcc");
    CHECK(Path{"gcc"}.parent_path().empty());
    CHECK(Path{"/gcc"}.parent_path() == "/");
    CHECK(Path{"/opt/bin/"}.filename().empty());
    CHECK(Path{"/opt/bin/"}.parent_path() == "/opt/bin");
    CHECK(Path{"/"}.parent_path() == "/");
    CHECK(Path{"//opt"}.parent_path() == "//");

    CHECK(Path{"/opt"}.is_absolute());
    CHECK_FALSE(Path{"opt"}.is_absolute());
    CHECK_FALSE(Path{""}.is_absolute());
}

TEST_CASE ("Path formats as its native string", "[path]")
{
    CHECK(fmt::format("{}", Path{"/opt/xpm"}) == "/opt/xpm");
}
