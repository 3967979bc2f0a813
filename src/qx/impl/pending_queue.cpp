#include <qx/impl/pending_queue.hpp>

#include <new>

namespace qx::impl
{

pending_queue::pending_queue(std::size_t initial_capacity)
    : _queue(initial_capacity)
{}

pending_queue::~pending_queue()
{
    while (try_pop() != nullptr)
    {
    }
}

void pending_queue::push(request req)
{
    auto node = std::make_unique<request>(std::move(req));
    if (!_queue.push(node.get()))
        throw std::bad_alloc();
    node.release();
}

std::unique_ptr<request> pending_queue::try_pop()
{
    request* raw = nullptr;
    if (!_queue.pop(raw))
        return nullptr;
    return std::unique_ptr<request>(raw);
}

}  // namespace qx::impl
