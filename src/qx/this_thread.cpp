#include <qx/this_thread.hpp>

#include <qx/check.hpp>
#include <qx/impl/thread_storage.hpp>

namespace qx::this_thread
{

const std::string& name()
{
    return qx::impl::thread_storage::current_ref().name;
}

uint64_t id()
{
    return qx::impl::thread_storage::current_ref().id;
}

impl::yield_awaiter::yield_awaiter()
    : _thread_storage(qx::impl::thread_storage::current())
{
    QX_CHECK(_thread_storage != nullptr) << "yield outside of qx::thread";
}

void impl::yield_awaiter::await_suspend(std::coroutine_handle<> awaiting_coroutine)
{
    _thread_storage->suspend(awaiting_coroutine);
    // back of the ready queue
    _thread_storage->wake();
}

void impl::yield_awaiter::await_resume()
{
    _thread_storage->on_resume();
}

}  // namespace qx::this_thread
