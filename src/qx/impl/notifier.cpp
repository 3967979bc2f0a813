#include <qx/impl/notifier.hpp>

namespace qx::impl
{

void thread_notifier::notify()
{
    std::unique_lock lk(_mutex);
    _notified = true;
    _cv.notify_one();
}

void thread_notifier::wait()
{
    std::unique_lock lk(_mutex);
    _cv.wait(lk, [this] { return _notified; });
}

notifier_awaiter::notifier_awaiter(notifier_state& state)
    : _thread_storage(thread_storage::current())
    , _state(state)
{
    // we can't run async code outside of qx::thread
    QX_CHECK(_thread_storage != nullptr) << "notifier awaited outside of qx::thread";
}

bool notifier_awaiter::await_ready() const noexcept
{
    return _state.is_resolved();
}

bool notifier_awaiter::await_suspend(std::coroutine_handle<> awaiting_coroutine) noexcept
{
    _thread_storage->suspend(awaiting_coroutine);
    if (_state.set_waker(co_thread_waker{ _thread_storage }))
        return true;

    // the notifier has been resolved in between, resume the current coroutine
    return false;
}

notifier_status notifier_awaiter::await_resume()
{
    _thread_storage->on_resume();

    const notifier_status status = _state.status();
    QX_DCHECK(status == notifier_status::fired || status == notifier_status::sender_dropped);
    return status;
}

result<void> notifier_state::fire()
{
    notifier_status status = _status.load(std::memory_order_acquire);
    while (true)
    {
        switch (status)
        {
        case notifier_status::init:
            if (_status.compare_exchange_weak(status, notifier_status::fired, std::memory_order_acq_rel))
                return qx::ok();  // fired before being waited
            break;
        case notifier_status::waiting:
            if (_status.compare_exchange_weak(status, notifier_status::fired, std::memory_order_acq_rel))
            {
                wake();
                return qx::ok();
            }
            break;
        case notifier_status::receiver_dropped:
            return qx::err(qx::abandoned, "notifier receiver has been dropped");
        case notifier_status::fired:
        case notifier_status::sender_dropped:
            QX_CHECK(false) << "notifier fired after it has been resolved";
            return qx::err(qx::other, "notifier fired twice");
        }
    }
}

void notifier_state::drop_sender() noexcept
{
    notifier_status status = _status.load(std::memory_order_acquire);
    while (status == notifier_status::init || status == notifier_status::waiting)
    {
        const bool was_waiting = status == notifier_status::waiting;
        if (_status.compare_exchange_weak(status, notifier_status::sender_dropped, std::memory_order_acq_rel))
        {
            if (was_waiting)
                wake();
            return;
        }
    }
    // fired or the receiver is gone already
}

notifier_status notifier_state::drop_receiver() noexcept
{
    notifier_status status = _status.load(std::memory_order_acquire);
    while (status == notifier_status::init || status == notifier_status::waiting)
    {
        if (_status.compare_exchange_weak(status, notifier_status::receiver_dropped, std::memory_order_acq_rel))
            return notifier_status::receiver_dropped;
    }
    return status;
}

bool notifier_state::set_waker(waker_variant waker)
{
    notifier_status status = _status.load(std::memory_order_acquire);
    if (status == notifier_status::waiting)
    {
        // take the old waker back. Fails if the sender has resolved the notifier in between
        if (!advance_status(notifier_status::waiting, notifier_status::init))
            return false;
        status = notifier_status::init;
    }
    if (status != notifier_status::init)
        return false;

    // The status is init: the sender never touches _waker in this state.
    _waker = std::move(waker);
    return advance_status(notifier_status::init, notifier_status::waiting);
}

void notifier_state::wake()
{
    std::visit(
        [](auto& waker)
        {
            using type = std::decay_t<decltype(waker)>;
            if constexpr (std::is_same_v<type, co_thread_waker>)
                waker.wake();
            else if constexpr (std::is_same_v<type, thread_notifier*>)
                waker->notify();
            else if constexpr (std::is_same_v<type, qx::waker>)
            {
                if (waker)
                    waker();
            }
            else
                QX_DCHECK(false) << "notifier has been waited without a waker";
        },
        _waker);
}

notifier_sender& notifier_sender::operator=(notifier_sender&& other) noexcept
{
    if (this != &other)
    {
        if (_state != nullptr)
            _state->drop_sender();
        _state = std::move(other._state);
    }
    return *this;
}

notifier_sender::~notifier_sender()
{
    if (_state != nullptr)
        _state->drop_sender();
}

result<void> notifier_sender::send()
{
    QX_CHECK(valid()) << "notifier sender is already spent";
    auto state = std::move(_state);
    return state->fire();
}

notifier_receiver& notifier_receiver::operator=(notifier_receiver&& other) noexcept
{
    if (this != &other)
    {
        release();
        _state = std::move(other._state);
    }
    return *this;
}

notifier_receiver::~notifier_receiver()
{
    release();
}

notifier_status notifier_receiver::release() noexcept
{
    if (_state == nullptr)
        return notifier_status::receiver_dropped;

    auto state = std::move(_state);
    return state->drop_receiver();
}

std::pair<notifier_sender, notifier_receiver> make_notifier()
{
    auto state = std::make_shared<notifier_state>();
    return { notifier_sender(state), notifier_receiver(state) };
}

}  // namespace qx::impl
