#include <memory>
#include <stdexcept>
#include <string>
#include <catch2/catch.hpp>
#include <qx/qx.hpp>

namespace
{

qx::func<int> add(int a, int b)
{
    co_return a + b;
}

qx::func<int> add_twice(int a, int b)
{
    const int first = co_await add(a, b);
    const int second = co_await add(first, b);
    co_return second;
}

}  // namespace

TEST_CASE("func chain", "[runtime]")
{
    int sum = 0;
    qx::loop(
        [&]() -> qx::func<void>
        {
            sum = co_await add_twice(1, 2);
        });
    REQUIRE(sum == 5);
}

TEST_CASE("invoke owns arguments and captures", "[runtime]")
{
    auto value = std::make_unique<int>(42);
    auto with_argument = qx::invoke(
        [](std::unique_ptr<int> value) -> qx::func<void>
        {
            REQUIRE(value != nullptr);
            REQUIRE(*value == 42);
            co_return;
        },
        std::move(value));
    qx::loop(std::move(with_argument));

    std::string captured = "lock me";
    auto with_capture = qx::invoke(
        [captured]() -> qx::func<void>
        {
            co_await qx::this_thread::yield();
            REQUIRE(captured == "lock me");
        });
    captured.clear();
    qx::loop(std::move(with_capture));
}

TEST_CASE("func returns move only value", "[runtime]")
{
    auto make = []() -> qx::func<std::unique_ptr<std::string>> { co_return std::make_unique<std::string>("qx"); };

    qx::loop(
        [&]() -> qx::func<void>
        {
            auto res = co_await make();
            REQUIRE(res != nullptr);
            REQUIRE(*res == "qx");
        });
}

TEST_CASE("func rethrows into the awaiting coroutine", "[runtime]")
{
    auto throwing = []() -> qx::func<int>
    {
        throw std::out_of_range("no such slot");
        co_return 0;
    };

    auto throwing_void = []() -> qx::func<void>
    {
        co_await qx::this_thread::yield();
        throw std::invalid_argument("bad argument");
    };

    qx::loop(
        [&]() -> qx::func<void>
        {
            REQUIRE_THROWS_AS(co_await throwing(), std::out_of_range);
            REQUIRE_THROWS_AS(co_await throwing_void(), std::invalid_argument);
        });
}

TEST_CASE("func of result", "[runtime]")
{
    auto grant = [](bool granted) -> qx::func<qx::result<int>>
    {
        if (granted)
            co_return qx::ok(1);
        co_return qx::err(qx::pending);
    };

    qx::loop(
        [&]() -> qx::func<void>
        {
            REQUIRE((co_await grant(true)).unwrap() == 1);
            auto res = co_await grant(false);
            REQUIRE(res == qx::pending);
            REQUIRE_THROWS_AS(res.unwrap(), qx::exception);
        });
}
