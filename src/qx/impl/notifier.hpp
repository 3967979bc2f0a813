#pragma once

#include <atomic>
#include <condition_variable>
#include <coroutine>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <variant>

#include <qx/result.hpp>
#include <qx/impl/thread_storage.hpp>

namespace qx
{

/// \brief task-wake callback. Invoked at most once, from the thread that resolves the notifier
using waker = std::function<void()>;

}  // namespace qx

namespace qx::impl
{

// Possible transitions:
// 1. init -> waiting (the receiver registered a waker)
// 2. waiting -> init (the receiver takes the waker back to replace it)
// 3. init|waiting -> fired
// 4. init|waiting -> sender_dropped
// 5. init|waiting -> receiver_dropped
// fired, sender_dropped and receiver_dropped are final.
enum class notifier_status
{
    init,
    waiting,
    fired,
    sender_dropped,
    receiver_dropped
};

// Wakes a receiver parked on a std::thread
struct thread_notifier
{
    void notify();
    void wait();

    std::mutex _mutex;
    std::condition_variable _cv;
    bool _notified = false;
};

// Reschedules a suspended qx::thread
struct co_thread_waker
{
    void wake() const
    {
        _thread_storage->wake();
    }

    thread_storage* _thread_storage = nullptr;
};

class notifier_state;

class notifier_awaiter
{
public:
    explicit notifier_awaiter(notifier_state& state);

    notifier_awaiter& operator=(const notifier_awaiter&) = delete;
    notifier_awaiter& operator=(notifier_awaiter&&) = delete;
    notifier_awaiter(notifier_awaiter&&) = delete;
    notifier_awaiter(const notifier_awaiter&) = delete;

    bool await_ready() const noexcept;
    bool await_suspend(std::coroutine_handle<> awaiting_coroutine) noexcept;
    notifier_status await_resume();

private:
    thread_storage* _thread_storage = nullptr;  // the qx::thread to which the awaiter belongs
    notifier_state& _state;
};

/// \brief single-use signal shared by exactly one sender and one receiver.
///
/// The sender side fires once or is dropped. The receiver side observes the firing, observes that the
/// sender was dropped without firing, or drops itself so that a later fire fails.
/// Both sides may run on different std::threads.
class notifier_state
{
public:
    using waker_variant = std::variant<std::monostate, co_thread_waker, thread_notifier*, qx::waker>;

    notifier_state() = default;
    notifier_state(const notifier_state&) = delete;
    notifier_state& operator=(const notifier_state&) = delete;

    /// \brief sender side: resolve the receiver. Fails with qx::abandoned if the receiver is gone
    result<void> fire();

    /// \brief sender side: the sender goes away. The receiver (if any) observes qx::cancel
    void drop_sender() noexcept;

    /// \brief receiver side: the receiver goes away. Returns the final status, fired means the signal was
    /// delivered before the receiver left
    notifier_status drop_receiver() noexcept;

    /// \brief receiver side: install the waker to be called on fire or sender drop. Replaces the previous one.
    /// Returns false if the notifier is already resolved, the waker is not installed in that case.
    bool set_waker(waker_variant waker);

    /// \brief receiver side: suspend the calling qx::thread until fired or the sender is dropped
    [[nodiscard("co_await me")]] notifier_awaiter wait()
    {
        return notifier_awaiter(*this);
    }

    [[nodiscard]] notifier_status status() const noexcept
    {
        return _status.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool is_fired() const noexcept
    {
        return status() == notifier_status::fired;
    }

    /// \brief true when the receiver has nothing more to wait for
    [[nodiscard]] bool is_resolved() const noexcept
    {
        const auto st = status();
        return st == notifier_status::fired || st == notifier_status::sender_dropped;
    }

private:
    bool advance_status(notifier_status expected, notifier_status wanted)
    {
        return _status.compare_exchange_strong(expected, wanted, std::memory_order_acq_rel);
    }

    // Must be called only by the side which moved the status out of waiting.
    void wake();

private:
    std::atomic<notifier_status> _status = notifier_status::init;
    waker_variant _waker;
};

/// \brief producer half of a notifier. Dropping it without send() cancels the receiver
class notifier_sender
{
public:
    explicit notifier_sender(std::shared_ptr<notifier_state> state)
        : _state(std::move(state))
    {}

    notifier_sender(const notifier_sender&) = delete;
    notifier_sender& operator=(const notifier_sender&) = delete;
    notifier_sender(notifier_sender&&) noexcept = default;
    notifier_sender& operator=(notifier_sender&& other) noexcept;

    ~notifier_sender();

    /// \brief fire the notifier. The sender is spent after this call whatever the outcome
    result<void> send();

    [[nodiscard]] bool valid() const noexcept
    {
        return _state != nullptr;
    }

private:
    std::shared_ptr<notifier_state> _state;
};

/// \brief consumer half of a notifier
class notifier_receiver
{
public:
    explicit notifier_receiver(std::shared_ptr<notifier_state> state)
        : _state(std::move(state))
    {}

    notifier_receiver(const notifier_receiver&) = delete;
    notifier_receiver& operator=(const notifier_receiver&) = delete;
    notifier_receiver(notifier_receiver&&) noexcept = default;
    notifier_receiver& operator=(notifier_receiver&& other) noexcept;

    ~notifier_receiver();

    /// \brief drop the receiver now. Returns the final status of the notifier
    notifier_status release() noexcept;

    [[nodiscard]] bool valid() const noexcept
    {
        return _state != nullptr;
    }

    notifier_state& state() const
    {
        QX_CHECK(valid()) << "notifier receiver is released";
        return *_state;
    }

private:
    std::shared_ptr<notifier_state> _state;
};

/// \brief create a connected sender/receiver pair
std::pair<notifier_sender, notifier_receiver> make_notifier();

}  // namespace qx::impl
