#include <qx/impl/thread_storage.hpp>

#include <stdexcept>
#include <qx/check.hpp>
#include <qx/impl/scheduler.hpp>

namespace qx::impl
{

namespace
{

thread_local thread_storage* current_storage = nullptr;

}  // namespace

std::shared_ptr<thread_storage> thread_storage::create(std::string name, uint64_t id, scheduler* scheduler_ptr)
{
    if (name.empty())
        name = "qx::thread" + std::to_string(id);
    return std::make_shared<thread_storage>(std::move(name), id, scheduler_ptr);
}

thread_storage::thread_storage(std::string name, uint64_t id, scheduler* scheduler_ptr)
    : name(std::move(name))
    , id(id)
    , signal([](void* self) { static_cast<thread_storage*>(self)->wake(); }, this)
    , _scheduler(scheduler_ptr)
{
    QX_DCHECK(_scheduler != nullptr);
}

thread_storage* thread_storage::current() noexcept
{
    return current_storage;
}

void thread_storage::set_current(thread_storage* storage) noexcept
{
    current_storage = storage;
}

thread_storage& thread_storage::current_ref()
{
    if (current_storage == nullptr)
        throw std::runtime_error("qx::thread context only exists inside the event loop");
    return *current_storage;
}

void thread_storage::suspend(std::coroutine_handle<> coroutine)
{
    QX_DCHECK(current_storage == this);
    QX_DCHECK(!_suspended);
    _suspended = coroutine;
    current_storage = nullptr;
}

void thread_storage::on_resume() noexcept
{
    current_storage = this;
    // An awaiter may suspend() and then decide not to suspend after all (the awaited event happened in between).
    // The handle is stale in that case.
    _suspended = nullptr;
}

void thread_storage::wake()
{
    if (&get_scheduler() != _scheduler)
    {
        // another std::thread: the loop of the qx::thread picks it up in on_async
        signal.send();
        return;
    }

    QX_DCHECK(_suspended);
    _scheduler->ready(_suspended);
    _suspended = nullptr;
}

}  // namespace qx::impl
