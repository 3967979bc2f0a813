#include <qx/impl/scheduler.hpp>

#include <qx/check.hpp>

namespace qx::impl
{

void scheduler::run()
{
    int rc = uv_loop_init(&_uv_loop);
    QX_CHECK(rc == 0) << "uv_loop_init failed: " << uv_strerror(rc);

    rc = uv_prepare_init(&_uv_loop, &_prepare);
    QX_CHECK(rc == 0) << "uv_prepare_init failed: " << uv_strerror(rc);
    _prepare.data = static_cast<void*>(this);
    uv_prepare_start(&_prepare, &scheduler::on_prepare);

    rc = uv_idle_init(&_uv_loop, &_idle);
    QX_CHECK(rc == 0) << "uv_idle_init failed: " << uv_strerror(rc);

    uv_run(&_uv_loop, UV_RUN_DEFAULT);

    rc = uv_loop_close(&_uv_loop);
    QX_CHECK(rc == 0) << "uv_loop_close failed: " << uv_strerror(rc);
}

void scheduler::on_prepare(uv_prepare_t* handle)
{
    auto& self = *static_cast<scheduler*>(handle->data);
    self.resume_ready();

    if (!self._ready.empty())
    {
        uv_idle_start(&self._idle, [](uv_idle_t*) {});
        return;
    }
    uv_idle_stop(&self._idle);

    // The prepare handle alone must not keep the loop alive: the loop is done when nothing else is active.
    auto* prepare = reinterpret_cast<uv_handle_t*>(handle);
    uv_unref(prepare);
    if (uv_loop_alive(&self._uv_loop) == 0)
    {
        uv_close(prepare, nullptr);
        uv_close(reinterpret_cast<uv_handle_t*>(&self._idle), nullptr);
    }
    else
    {
        uv_ref(prepare);
    }
}

void scheduler::ready(std::coroutine_handle<> handle)
{
    QX_DCHECK(handle);
    _ready.push_back(handle);
}

void scheduler::resume_ready()
{
    for (auto n = _ready.size(); n > 0; n--)
    {
        auto handle = _ready.front();
        _ready.pop_front();
        handle.resume();
    }
}

scheduler& get_scheduler()
{
    thread_local scheduler instance;
    return instance;
}

}  // namespace qx::impl
