#pragma once

#include <atomic>
#include <coroutine>
#include <cstdint>
#include <memory>
#include <string>
#include <qx/func.hpp>
#include <qx/impl/notifier.hpp>
#include <qx/impl/thread_storage.hpp>

namespace qx
{

namespace impl
{

// Body of a qx::thread. Started by the scheduler, destroys its own frame when done.
class detached_task
{
public:
    class promise_type
    {
    public:
        detached_task get_return_object() noexcept
        {
            return detached_task{ std::coroutine_handle<promise_type>::from_promise(*this) };
        }

        std::suspend_always initial_suspend() noexcept
        {
            return {};
        }

        std::suspend_never final_suspend() noexcept
        {
            return {};
        }

        void return_void() noexcept {}

        void unhandled_exception();
    };

    std::coroutine_handle<promise_type> handle;
};

}  // namespace impl

/// \brief a task running concurrently with the other qx::threads of the calling std::thread's event loop
///
/// Has to be either joined or detached before destruction.
/// \code
///     auto th = qx::thread([&q]() -> qx::func<void>
///     {
///         auto g = (co_await q.lock()).unwrap();
///         *g += 1;
///     });
///     co_await th.join();
///
///     qx::thread([]() -> qx::func<void> { co_await qx::this_thread::yield(); }).detach();
/// \endcode
/// An exception escaping the task is logged, the thread counts as finished then.
class thread
{
public:
    template <FuncLambdaConcept F>
    explicit thread(F&& f, const std::string& name = "")
        : thread(qx::invoke(std::forward<F>(f)), name)
    {}

    explicit thread(func<void>&& body, const std::string& name = "");

    thread(thread&&) noexcept = default;
    thread& operator=(thread&&) = delete;
    thread(const thread&) = delete;
    thread& operator=(const thread&) = delete;

    ~thread();

    /// \brief the thread no longer needs to be joined
    void detach() noexcept
    {
        _detached = true;
    }

    /// \brief completes when the thread has finished
    qx::func<void> join();

    [[nodiscard]] bool is_joined() const;

    [[nodiscard]] const std::string& name() const;

private:
    static impl::detached_task run(func<void> body,
                                   impl::notifier_sender finished,
                                   std::shared_ptr<impl::thread_storage> storage);

    // qx::threads are created on many std::threads
    static inline std::atomic<uint64_t> last_id = 0;

    bool _detached = false;
    std::shared_ptr<impl::thread_storage> _storage;
    impl::notifier_receiver _finished;
};

}  // namespace qx
