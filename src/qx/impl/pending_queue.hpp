#pragma once

#include <memory>
#include <boost/lockfree/queue.hpp>
#include <qx/impl/notifier.hpp>

namespace qx::impl
{

/// \brief a queued lock request. Granting it fires the notifier of the waiting future
class request
{
public:
    explicit request(notifier_sender sender)
        : _sender(std::move(sender))
    {}

    /// \brief fire the notifier. Returns qx::abandoned if the future has been dropped
    result<void> grant()
    {
        return _sender.send();
    }

private:
    notifier_sender _sender;
};

/// \brief unbounded lock-free multi-producer/multi-consumer FIFO of requests
///
/// push() and try_pop() can be called concurrently from any number of std::threads.
/// Requests left in the queue on destruction are dropped, their receivers observe qx::cancel.
class pending_queue
{
public:
    explicit pending_queue(std::size_t initial_capacity);

    pending_queue(const pending_queue&) = delete;
    pending_queue& operator=(const pending_queue&) = delete;

    ~pending_queue();

    /// \brief throws std::bad_alloc if a queue node can't be allocated
    void push(request req);

    /// \brief returns nullptr if the queue is empty
    std::unique_ptr<request> try_pop();

    /// \brief the answer may be outdated by the time it is returned if other threads use the queue
    [[nodiscard]] bool empty() const
    {
        return _queue.empty();
    }

private:
    // boost::lockfree::queue requires trivially copyable elements, the queue owns the pointees
    boost::lockfree::queue<request*> _queue;
};

}  // namespace qx::impl
