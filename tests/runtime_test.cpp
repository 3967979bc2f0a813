#include <string>
#include <vector>
#include <catch2/catch.hpp>
#include <qx/qx.hpp>

TEST_CASE("thread join", "[runtime]")
{
    int counter = 0;
    qx::loop(
        [&]() -> qx::func<void>
        {
            auto th = qx::thread(
                [&]() -> qx::func<void>
                {
                    counter++;
                    co_return;
                },
                "worker");
            REQUIRE(th.name() == "worker");
            REQUIRE(!th.is_joined());
            co_await th.join();
            REQUIRE(th.is_joined());
            REQUIRE(counter == 1);
        });
}

TEST_CASE("thread detach", "[runtime]")
{
    int counter = 0;
    qx::loop(
        [&]() -> qx::func<void>
        {
            qx::thread(
                [&]() -> qx::func<void>
                {
                    co_await qx::this_thread::yield();
                    counter++;
                })
                .detach();
            co_return;
        });
    REQUIRE(counter == 1);
}

TEST_CASE("this_thread name and id", "[runtime]")
{
    qx::loop(
        []() -> qx::func<void>
        {
            REQUIRE(qx::this_thread::name() == "main");
            const auto main_id = qx::this_thread::id();

            auto th = qx::thread(
                [main_id]() -> qx::func<void>
                {
                    REQUIRE(qx::this_thread::id() != main_id);
                    REQUIRE(qx::this_thread::name() == "qx::thread" + std::to_string(qx::this_thread::id()));
                    co_return;
                });
            co_await th.join();
            REQUIRE(qx::this_thread::name() == "main");
        });

    REQUIRE_THROWS_AS(qx::this_thread::name(), std::runtime_error);
}

TEST_CASE("yield interleaves threads", "[runtime]")
{
    std::vector<int> trace;
    qx::loop(
        [&]() -> qx::func<void>
        {
            auto make_worker = [&](int tag)
            {
                return qx::thread(
                    [&trace, tag]() -> qx::func<void>
                    {
                        trace.push_back(tag);
                        co_await qx::this_thread::yield();
                        trace.push_back(tag);
                    });
            };
            auto th1 = make_worker(1);
            auto th2 = make_worker(2);
            co_await th1.join();
            co_await th2.join();
        });
    REQUIRE(trace == std::vector<int>{ 1, 2, 1, 2 });
}
