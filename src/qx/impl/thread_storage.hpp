#pragma once

#include <coroutine>
#include <cstdint>
#include <memory>
#include <string>
#include <qx/impl/async_signal.hpp>

namespace qx::impl
{

class scheduler;

/// \brief per qx::thread context: identity, the event loop it lives on, its suspended coroutine
///
/// The storage of the running qx::thread is published in a thread_local pointer. Awaiters clear it on
/// suspension and put it back on resumption, so current() is null between two qx::threads.
class thread_storage
{
public:
    static std::shared_ptr<thread_storage> create(std::string name, uint64_t id, scheduler* scheduler_ptr);

    thread_storage(std::string name, uint64_t id, scheduler* scheduler_ptr);

    thread_storage(const thread_storage&) = delete;
    thread_storage& operator=(const thread_storage&) = delete;

    /// \brief the running qx::thread of the calling std::thread, nullptr outside of qx::thread
    static thread_storage* current() noexcept;

    static void set_current(thread_storage* storage) noexcept;

    /// \brief same as current(), throws std::runtime_error outside of qx::thread
    static thread_storage& current_ref();

    /// \brief remember the coroutine to be resumed by wake() and leave the qx::thread context
    void suspend(std::coroutine_handle<> coroutine);

    /// \brief enter the qx::thread context again
    void on_resume() noexcept;

    /// \brief schedule the suspended coroutine. Can be called from any std::thread
    void wake();

    const std::string name;
    const uint64_t id;
    async_signal signal;

private:
    scheduler* _scheduler;
    std::coroutine_handle<> _suspended;
};

}  // namespace qx::impl
