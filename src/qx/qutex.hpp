#pragma once

#include <coroutine>
#include <memory>
#include <stdexcept>
#include <utility>

#include <qx/options.hpp>
#include <qx/result.hpp>
#include <qx/impl/lock_core.hpp>
#include <qx/impl/notifier.hpp>
#include <qx/impl/thread_storage.hpp>

namespace qx
{

template <typename T>
class qutex;

template <typename T>
class guard;

template <typename T>
class future_guard;

namespace impl
{

// The value is reachable through every handle. Only the lock status and the guard discipline make
// mutable access to it exclusive.
template <typename T>
class qutex_state : public lock_core
{
public:
    template <typename... Args>
    explicit qutex_state(const qx::options& opts, Args&&... args)
        : lock_core(opts)
        , _value(std::forward<Args>(args)...)
    {}

    T* value_ptr() noexcept
    {
        return &_value;
    }

private:
    T _value;
};

template <typename T>
class lock_awaiter;

}  // namespace impl

/// \brief queue-backed exclusive lock around a value of type T
///
/// qutex is a shared handle: copies refer to the same lock and the same value. The value is destroyed
/// with the last handle (futures and guards hold handles too).
///
/// Usage:
/// \code
///     qx::qutex<int> counter(0);
///
///     // from a plain std::thread
///     auto g = counter.lock().wait().unwrap();
///     *g += 1;
///
///     // from a qx::thread
///     auto res = co_await counter.lock();
///     if (res.is_ok())
///         *res.unwrap() += 1;
/// \endcode
template <typename T>
class qutex
{
    friend class guard<T>;
    friend class future_guard<T>;

public:
    using value_type = T;

    explicit qutex(T value, const qx::options& opts = {})
        : _state(std::make_shared<impl::qutex_state<T>>(opts, std::move(value)))
    {}

    /// \brief construct the value in place
    template <typename... Args>
    qutex(std::in_place_t, const qx::options& opts, Args&&... args)
        : _state(std::make_shared<impl::qutex_state<T>>(opts, std::forward<Args>(args)...))
    {}

    qutex(const qutex&) = default;
    qutex& operator=(const qutex&) = default;
    qutex(qutex&&) noexcept = default;
    qutex& operator=(qutex&&) noexcept = default;

    /// \brief another handle to the same lock
    [[nodiscard]] qutex clone() const
    {
        return *this;
    }

    /// \brief queue a request for the lock. The request is granted through the returned future
    [[nodiscard]] future_guard<T> lock() const&
    {
        return qutex(*this).lock();
    }

    /// \brief queue a request for the lock, the handle moves into the returned future
    [[nodiscard]] future_guard<T> lock() &&
    {
        check_shared_state();
        auto [sender, receiver] = impl::make_notifier();
        _state->push_request(impl::request(std::move(sender)));
        return future_guard<T>(std::move(*this), std::move(receiver));
    }

    /// \brief direct access to the value, without locking, if this is the only handle to the lock.
    /// Returns nullptr otherwise.
    T* get_mut()
    {
        check_shared_state();
        if (_state.use_count() != 1)
            return nullptr;
        return _state->value_ptr();
    }

    /// \brief raw pointer to the value. No synchronisation at all: reading through it is a data race unless the
    /// caller guarantees that nobody holds a guard.
    const T* as_ptr() const
    {
        check_shared_state();
        return _state->value_ptr();
    }

    /// \brief raw mutable pointer to the value. No synchronisation at all: writing through it while somebody
    /// else holds a guard breaks the exclusivity the lock is there for.
    T* as_mut_ptr() const
    {
        check_shared_state();
        return _state->value_ptr();
    }

    /// \brief grant the next queued request if the lock is free
    ///
    /// Every poll and every guard release calls it. It is public for lock types built on top of qutex.
    /// Returns qx::abandoned if the popped request had been dropped by its owner.
    result<void> process_queue() const
    {
        check_shared_state();
        return _state->process_queue();
    }

    [[nodiscard]] bool is_locked() const
    {
        check_shared_state();
        return _state->is_locked();
    }

    /// \brief number of handles to the lock, including the ones held by futures and guards
    [[nodiscard]] long use_count() const noexcept
    {
        return _state.use_count();
    }

    /// \brief false for a moved-from handle
    [[nodiscard]] bool valid() const noexcept
    {
        return _state != nullptr;
    }

private:
    void check_shared_state() const
    {
        if (_state == nullptr)
            throw std::runtime_error("qutex shared state is nullptr");
    }

private:
    std::shared_ptr<impl::qutex_state<T>> _state;
};

/// \brief construct the guarded value in place with default options
template <typename T, typename... Args>
qutex<T> make_qutex(Args&&... args)
{
    return qutex<T>(std::in_place, qx::options{}, std::forward<Args>(args)...);
}

/// \brief exclusive access to the value of a qutex. Releasing the guard hands the lock to the next request
template <typename T>
class [[nodiscard]] guard
{
    friend class future_guard<T>;

    explicit guard(qutex<T> lock)
        : _lock(std::move(lock))
    {}

public:
    guard(const guard&) = delete;
    guard& operator=(const guard&) = delete;
    guard(guard&&) noexcept = default;

    guard& operator=(guard&& other) noexcept
    {
        if (this != &other)
        {
            unlock();
            _lock = std::move(other._lock);
        }
        return *this;
    }

    ~guard()
    {
        unlock();
    }

    T& operator*()
    {
        return *value();
    }

    const T& operator*() const
    {
        return *value();
    }

    T* operator->()
    {
        return value();
    }

    const T* operator->() const
    {
        return value();
    }

    T* get()
    {
        return value();
    }

    const T* get() const
    {
        return value();
    }

    /// \brief release the lock before the guard goes out of scope. Does nothing on the second call
    void unlock() noexcept
    {
        if (!_lock.valid())
            return;

        auto lock = std::move(_lock);
        auto res = lock._state->unlock();
        if (res.is_err())
            impl::log_queue_error("guard release", res.err());
    }

    /// \brief false after unlock() or when moved from
    [[nodiscard]] bool owns_lock() const noexcept
    {
        return _lock.valid();
    }

private:
    T* value() const
    {
        QX_CHECK(_lock.valid()) << "guard does not own the lock";
        return _lock._state->value_ptr();
    }

private:
    qutex<T> _lock;
};

/// \brief a queued request for a qutex, resolves into a guard
///
/// The future can be driven three ways:
/// - poll() / poll(waker): non blocking, returns qx::pending until the lock is granted
/// - wait(): blocks the calling std::thread
/// - co_await: suspends the calling qx::thread
///
/// Every poll also tries to advance the queue, so any participant can hand the lock on.
/// Dropping a pending future leaves its request in the queue: granting that request later fails with
/// qx::abandoned (see qx::grant_policy).
template <typename T>
class [[nodiscard]] future_guard
{
    friend class qutex<T>;
    friend class impl::lock_awaiter<T>;

    future_guard(qutex<T> lock, impl::notifier_receiver receiver)
        : _lock(std::move(lock))
        , _receiver(std::move(receiver))
    {}

public:
    future_guard(const future_guard&) = delete;
    future_guard& operator=(const future_guard&) = delete;
    future_guard(future_guard&&) noexcept = default;

    future_guard& operator=(future_guard&& other) noexcept
    {
        if (this != &other)
        {
            abandon();
            _lock = std::move(other._lock);
            _receiver = std::move(other._receiver);
        }
        return *this;
    }

    ~future_guard()
    {
        abandon();
    }

    /// \brief advance the queue and check whether the request has been granted
    ///
    /// Returns the guard once granted, qx::pending before that and qx::cancel if the request was discarded
    /// without being granted. Polling again after the guard was returned terminates the process.
    result<guard<T>> poll()
    {
        check_not_completed();
        drive_queue();
        return resolve();
    }

    /// \brief same as poll(), w is called once when the request is granted or discarded.
    /// The waker of the previous poll(waker) call is replaced.
    result<guard<T>> poll(qx::waker w)
    {
        check_not_completed();
        if (!_receiver.state().set_waker(std::move(w)))
            return resolve();

        drive_queue();
        return resolve();
    }

    /// \brief block the calling std::thread until the request is granted or discarded
    result<guard<T>> wait() &&
    {
        check_not_completed();
        impl::thread_notifier notifier;
        if (_receiver.state().set_waker(&notifier))
        {
            drive_queue();
            notifier.wait();
        }
        return resolve();
    }

    /// \brief suspend the calling qx::thread until the request is granted or discarded
    ///
    /// \code
    ///     qx::result<qx::guard<int>> res = co_await q.lock();
    /// \endcode
    impl::lock_awaiter<T> operator co_await() &&
    {
        return impl::lock_awaiter<T>(std::move(*this));
    }

    /// \brief check the grant without advancing the queue
    [[nodiscard]] bool is_granted() const
    {
        return _lock.valid() && _receiver.state().is_fired();
    }

    /// \brief true once the guard has been handed out
    [[nodiscard]] bool is_completed() const noexcept
    {
        return !_lock.valid();
    }

private:
    void check_not_completed() const
    {
        QX_CHECK(_lock.valid()) << "future_guard polled after it has been completed";
    }

    void drive_queue()
    {
        auto res = _lock._state->process_queue();
        if (res.is_err())
            impl::log_queue_error("future_guard poll", res.err());
    }

    result<guard<T>> resolve()
    {
        switch (_receiver.state().status())
        {
        case impl::notifier_status::fired:
            _receiver.release();
            return qx::ok(guard<T>(std::move(_lock)));
        case impl::notifier_status::sender_dropped:
            return qx::err(qx::cancel, "lock request has been discarded");
        case impl::notifier_status::init:
        case impl::notifier_status::waiting:
            return qx::err(qx::pending);
        case impl::notifier_status::receiver_dropped:
            break;
        }
        QX_CHECK(false) << "future_guard receiver has been dropped while pending";
        return qx::err(qx::other);
    }

    // The request stays queued. If it has been granted already the lock is handed on right away.
    void abandon() noexcept
    {
        if (!_lock.valid())
            return;

        if (_receiver.release() == impl::notifier_status::fired)
        {
            guard<T> unclaimed(std::move(_lock));
        }
    }

private:
    qutex<T> _lock;
    impl::notifier_receiver _receiver;
};

namespace impl
{

template <typename T>
class lock_awaiter
{
public:
    explicit lock_awaiter(future_guard<T>&& future)
        : _thread_storage(thread_storage::current())
        , _future(std::move(future))
    {
        // we can't run async code outside of qx::thread. Use future_guard::wait() there.
        QX_CHECK(_thread_storage != nullptr) << "qutex lock awaited outside of qx::thread";
        _future.check_not_completed();
    }

    lock_awaiter& operator=(const lock_awaiter&) = delete;
    lock_awaiter& operator=(lock_awaiter&&) = delete;
    lock_awaiter(lock_awaiter&&) = delete;
    lock_awaiter(const lock_awaiter&) = delete;

    bool await_ready()
    {
        _future.drive_queue();
        return _future._receiver.state().is_resolved();
    }

    bool await_suspend(std::coroutine_handle<> awaiting_coroutine) noexcept
    {
        _thread_storage->suspend(awaiting_coroutine);
        if (!_future._receiver.state().set_waker(co_thread_waker{ _thread_storage }))
            return false;  // resolved in between, resume the current coroutine

        // Our own request may be the one granted here, the waker reschedules us then.
        _future.drive_queue();
        return true;
    }

    result<guard<T>> await_resume()
    {
        _thread_storage->on_resume();
        return _future.resolve();
    }

private:
    thread_storage* _thread_storage = nullptr;  // the qx::thread to which the awaiter belongs
    future_guard<T> _future;
};

}  // namespace impl

}  // namespace qx
