#include <qx/thread.hpp>

#include <qx/check.hpp>
#include <qx/impl/scheduler.hpp>

namespace qx
{

void impl::detached_task::promise_type::unhandled_exception()
{
    // run() catches std::exception, anything else is not ours to handle
    QX_CHECK(false) << "a non std::exception escaped from qx::thread";
}

impl::detached_task thread::run(func<void> body,
                                impl::notifier_sender finished,
                                std::shared_ptr<impl::thread_storage> storage)
{
    impl::thread_storage::set_current(storage.get());
    storage->signal.open(impl::get_scheduler().uv_loop());
    try
    {
        co_await body;
    }
    catch (const std::exception& exc)
    {
        impl::get_logger() << "qx: unhandled exception in " << storage->name << ": " << exc.what() << "\n";
    }
    co_await storage->signal.close();

    // qx::abandoned: the thread object is gone, nobody is going to join
    auto res = finished.send();
    if (res.is_err() && res != qx::abandoned)
        impl::get_logger() << "qx: " << storage->name << " finish signal: " << res.err() << "\n";
    impl::thread_storage::set_current(nullptr);
}

thread::thread(func<void>&& body, const std::string& name)
    : _storage(impl::thread_storage::create(name, ++last_id, &impl::get_scheduler()))
    , _finished(nullptr)
{
    auto [sender, receiver] = impl::make_notifier();
    _finished = std::move(receiver);
    impl::get_scheduler().ready(run(std::move(body), std::move(sender), _storage).handle);
}

thread::~thread()
{
    if (_storage == nullptr)
        return;  // moved from

    QX_CHECK(_detached || is_joined()) << "qx::thread " << _storage->name << " (id " << _storage->id
                                       << ") is destroyed without being joined or detached";
}

qx::func<void> thread::join()
{
    const auto status = co_await _finished.state().wait();
    QX_CHECK(status == impl::notifier_status::fired) << "qx::thread " << name() << " finished without a signal";
}

bool thread::is_joined() const
{
    return _finished.state().is_fired();
}

const std::string& thread::name() const
{
    return _storage->name;
}

}  // namespace qx
