#include <toolscout-test/util.h>

#include <toolscout/base/expected.h>
#include <toolscout/base/optional.h>

#include <memory>
#include <string>

using namespace toolscout;

TEST_CASE ("equal", "[optional]")
{
    CHECK(Optional<int>{} == Optional<int>{});
    CHECK_FALSE(Optional<int>{} == Optional<int>{42});
    CHECK_FALSE(Optional<int>{42} == Optional<int>{});
    CHECK_FALSE(Optional<int>{1729} == Optional<int>{42});
    CHECK(Optional<int>{42} == Optional<int>{42});
    CHECK(Optional<int>{1729} != Optional<int>{42});
}

TEST_CASE ("value_or", "[optional]")
{
    Optional<std::string> empty;
    Optional<std::string> full = std::string("12.2.1");
    CHECK(empty.value_or("none") == "none");
    CHECK(full.value_or("none") == "12.2.1");
    CHECK(std::move(full).value_or("none") == "12.2.1");
}

TEST_CASE ("copy, move and clear", "[optional]")
{
    Optional<std::unique_ptr<int>> owner = std::make_unique<int>(5);
    Optional<std::unique_ptr<int>> moved = std::move(owner);
    REQUIRE(moved.has_value());
    CHECK(**moved.get() == 5);

    Optional<std::string> a = std::string("a");
    Optional<std::string> b;
    b = a;
    CHECK(b == a);
    b.clear();
    CHECK_FALSE(b.has_value());
    b.emplace(3, 'x');
    CHECK(b.value_or_exit(TOOLSCOUT_LINE_INFO) == "xxx");
    a = nullopt;
    CHECK_FALSE(a);
}

TEST_CASE ("ExpectedT holds a value or an error", "[expected]")
{
    ExpectedT<std::string, int> with_value = std::string("hello");
    REQUIRE(with_value.has_value());
    CHECK(*with_value.get() == "hello");
    CHECK(with_value.value_or_exit(TOOLSCOUT_LINE_INFO) == "hello");

    ExpectedT<std::string, int> with_error = 42;
    CHECK_FALSE(with_error.has_value());
    CHECK(with_error.get() == nullptr);
    CHECK(with_error.error() == 42);

    const ExpectedT<std::string, int> copied = with_error;
    CHECK_FALSE(copied);
    CHECK(copied.error() == 42);

    with_error = std::move(with_value);
    CHECK(with_error.value_or_exit(TOOLSCOUT_LINE_INFO) == "hello");
}

TEST_CASE ("ExpectedT with an enumeration error", "[expected]")
{
    enum class Failure
    {
        Missing,
    };

    ExpectedT<int, Failure> missing = Failure::Missing;
    CHECK_FALSE(missing.has_value());
    CHECK(missing.error() == Failure::Missing);

    ExpectedT<int, Failure> present = 7;
    CHECK(*present.get() == 7);
    missing = std::move(present);
    CHECK(*missing.get() == 7);
}
