#pragma once

#include <coroutine>
#include <cstdint>
#include <string>

namespace qx::impl
{
struct thread_storage;
}

namespace qx::this_thread
{

/// \brief get the name of the current qx::thread. Throws if called outside of qx::thread
const std::string& name();

/// \brief get the id of the current qx::thread. Throws if called outside of qx::thread
uint64_t id();

namespace impl
{

class yield_awaiter
{
public:
    yield_awaiter();

    bool await_ready() const noexcept
    {
        return false;
    }

    void await_suspend(std::coroutine_handle<> awaiting_coroutine);

    void await_resume();

private:
    qx::impl::thread_storage* _thread_storage = nullptr;  // the qx::thread to which the awaiter belongs
};

}  // namespace impl

/// \brief let the other ready qx::threads of this event loop run before continuing
///
/// \code
///     co_await qx::this_thread::yield();
/// \endcode
inline impl::yield_awaiter yield()
{
    return {};
}

}  // namespace qx::this_thread
