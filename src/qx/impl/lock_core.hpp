#pragma once

#include <atomic>
#include <cstdint>
#include <qx/options.hpp>
#include <qx/result.hpp>
#include <qx/impl/pending_queue.hpp>

namespace qx::impl
{

enum lock_status : uint32_t
{
    unlocked = 0,
    locked = 1
};

/// \brief the value independent part of a qutex: the lock status and the queue of requests
///
/// The status CAS is the only serialization point. Whoever moves the status from unlocked to locked
/// pops one request and grants it, or puts the status back if there is nobody to grant.
class lock_core
{
public:
    explicit lock_core(const qx::options& opts);

    lock_core(const lock_core&) = delete;
    lock_core& operator=(const lock_core&) = delete;

    /// \brief enqueue a request to be granted by some future process_queue() call
    void push_request(request req);

    /// \brief grant the next request if the lock is free. Idempotent, can be called concurrently
    result<void> process_queue();

    /// \brief set the status to unlocked and grant the next request
    result<void> unlock();

    [[nodiscard]] bool is_locked() const noexcept
    {
        return _status.load(std::memory_order_acquire) == lock_status::locked;
    }

    [[nodiscard]] const qx::options& options() const noexcept
    {
        return _options;
    }

private:
    result<void> grant_next();

private:
    std::atomic<uint32_t> _status = lock_status::unlocked;
    const qx::options _options;
    pending_queue _queue;
};

/// \brief report a failed queue advancement that has no caller to return it to
void log_queue_error(const char* context, const error_desc& err);

}  // namespace qx::impl
