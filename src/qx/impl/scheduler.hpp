#pragma once

#include <coroutine>
#include <deque>
#include <uv.h>

namespace qx::impl
{

/// \brief per std::thread event loop. Resumes qx::threads which are ready to run
///
/// Not a user facing class: qx::loop() runs it, awaiters feed it.
class scheduler
{
public:
    /// \brief blocks the calling std::thread until every qx::thread of this loop has finished
    void run();

    /// \brief queue a suspended coroutine to be resumed on the next loop iteration
    void ready(std::coroutine_handle<> handle);

    uv_loop_t* uv_loop() noexcept
    {
        return &_uv_loop;
    }

private:
    static void on_prepare(uv_prepare_t* handle);

    // Resumes the coroutines queued before the call. Coroutines queued while resuming wait for the next
    // iteration so that the loop polls for cross std::thread wakeups in between.
    void resume_ready();

private:
    uv_loop_t _uv_loop;
    uv_prepare_t _prepare;
    // active while coroutines are queued: makes the poll phase return immediately
    uv_idle_t _idle;
    std::deque<std::coroutine_handle<>> _ready;
};

/// \brief the scheduler of the calling std::thread
scheduler& get_scheduler();

}  // namespace qx::impl
