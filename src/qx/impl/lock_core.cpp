#include <qx/impl/lock_core.hpp>

#include <qx/check.hpp>

namespace qx::impl
{

lock_core::lock_core(const qx::options& opts)
    : _options(opts)
    , _queue(opts.initial_queue_capacity)
{}

void lock_core::push_request(request req)
{
    _queue.push(std::move(req));
}

result<void> lock_core::process_queue()
{
    uint32_t expected = lock_status::unlocked;
    if (_status.compare_exchange_strong(expected, lock_status::locked))
        return grant_next();

    // Already locked: the holder or an in-flight grant will advance the queue.
    QX_CHECK(expected == lock_status::locked) << "qutex status has unexpected value " << expected;
    return qx::ok();
}

result<void> lock_core::unlock()
{
    _status.store(lock_status::unlocked, std::memory_order_release);
    return process_queue();
}

// Called with the status locked by the caller.
result<void> lock_core::grant_next()
{
    while (true)
    {
        auto req = _queue.try_pop();
        if (req == nullptr)
        {
            // A request pushed between the pop and the store saw the lock taken and will not retry.
            // seq_cst pairs the store and the emptiness check with the pusher's push and status CAS.
            _status.store(lock_status::unlocked);
            if (!_queue.empty())
                return process_queue();
            return qx::ok();
        }

        auto res = req->grant();
        if (res.is_ok())
            return res;  // the lock now belongs to the granted future

        // nobody waits for the grant
        if (_options.policy == grant_policy::stop_on_abandoned)
        {
            _status.store(lock_status::unlocked, std::memory_order_release);
            return res;
        }
    }
}

void log_queue_error(const char* context, const error_desc& err)
{
    get_logger() << "qx: " << context << ": " << err << "\n";
}

}  // namespace qx::impl
