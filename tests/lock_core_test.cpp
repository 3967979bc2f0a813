#include <thread>
#include <vector>
#include <catch2/catch.hpp>
#include <qx/impl/lock_core.hpp>

using qx::impl::notifier_receiver;
using qx::impl::request;

namespace
{

notifier_receiver push_request(qx::impl::pending_queue& queue)
{
    auto [sender, receiver] = qx::impl::make_notifier();
    queue.push(request(std::move(sender)));
    return std::move(receiver);
}

notifier_receiver push_request(qx::impl::lock_core& core)
{
    auto [sender, receiver] = qx::impl::make_notifier();
    core.push_request(request(std::move(sender)));
    return std::move(receiver);
}

}  // namespace

TEST_CASE("pending_queue is fifo", "[core]")
{
    qx::impl::pending_queue queue(2);
    REQUIRE(queue.empty());
    REQUIRE(queue.try_pop() == nullptr);

    std::vector<notifier_receiver> receivers;
    for (int i = 0; i < 5; i++)
        receivers.push_back(push_request(queue));
    REQUIRE(!queue.empty());

    for (int i = 0; i < 5; i++)
    {
        auto req = queue.try_pop();
        REQUIRE(req != nullptr);
        REQUIRE(req->grant().is_ok());
        for (int j = 0; j < 5; j++)
            REQUIRE(receivers[j].state().is_fired() == (j <= i));
    }
    REQUIRE(queue.empty());
}

TEST_CASE("pending_queue drops leftovers", "[core]")
{
    notifier_receiver receiver(nullptr);
    {
        qx::impl::pending_queue queue(1);
        receiver = push_request(queue);
    }
    REQUIRE(receiver.state().status() == qx::impl::notifier_status::sender_dropped);
}

TEST_CASE("pending_queue concurrent producers", "[core]")
{
    constexpr int producers_count = 4;
    constexpr int per_producer = 500;

    qx::impl::pending_queue queue(16);
    std::vector<std::vector<notifier_receiver>> receivers(producers_count);
    std::vector<std::thread> producers;
    for (int p = 0; p < producers_count; p++)
    {
        producers.emplace_back(
            [&queue, &mine = receivers[p]]
            {
                for (int i = 0; i < per_producer; i++)
                    mine.push_back(push_request(queue));
            });
    }
    for (auto& th : producers)
        th.join();

    int popped = 0;
    while (auto req = queue.try_pop())
    {
        REQUIRE(req->grant().is_ok());
        popped++;
    }
    REQUIRE(popped == producers_count * per_producer);
    for (const auto& mine : receivers)
        for (const auto& receiver : mine)
            REQUIRE(receiver.state().is_fired());
}

TEST_CASE("lock_core grant and release", "[core]")
{
    qx::impl::lock_core core(qx::options{});
    REQUIRE(!core.is_locked());

    auto first = push_request(core);
    auto second = push_request(core);
    REQUIRE(core.process_queue().is_ok());
    REQUIRE(core.is_locked());
    REQUIRE(first.state().is_fired());
    REQUIRE(!second.state().is_fired());

    // locked: nothing to do
    REQUIRE(core.process_queue().is_ok());
    REQUIRE(!second.state().is_fired());

    REQUIRE(core.unlock().is_ok());
    REQUIRE(core.is_locked());
    REQUIRE(second.state().is_fired());

    REQUIRE(core.unlock().is_ok());
    REQUIRE(!core.is_locked());
}

TEST_CASE("lock_core grant policies", "[core]")
{
    SECTION("stop on abandoned")
    {
        qx::impl::lock_core core(qx::options{});
        push_request(core).release();
        auto alive = push_request(core);

        auto res = core.process_queue();
        REQUIRE(res == qx::abandoned);
        REQUIRE(!core.is_locked());
        REQUIRE(!alive.state().is_fired());

        REQUIRE(core.process_queue().is_ok());
        REQUIRE(alive.state().is_fired());
    }

    SECTION("skip abandoned")
    {
        qx::impl::lock_core core(qx::options{ .policy = qx::grant_policy::skip_abandoned });
        push_request(core).release();
        push_request(core).release();
        auto alive = push_request(core);

        REQUIRE(core.process_queue().is_ok());
        REQUIRE(core.is_locked());
        REQUIRE(alive.state().is_fired());
        REQUIRE(core.options().policy == qx::grant_policy::skip_abandoned);
    }
}
