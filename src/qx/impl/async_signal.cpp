#include <qx/impl/async_signal.hpp>

#include <coroutine>
#include <qx/check.hpp>

namespace qx::impl
{

namespace
{

// Resumes the coroutine waiting for uv_close() completion. Runs in the loop thread only.
class close_awaiter
{
public:
    explicit close_awaiter(uv_handle_t* handle)
        : _handle(handle)
    {}

    bool await_ready() const noexcept
    {
        return false;
    }

    void await_suspend(std::coroutine_handle<> awaiting_coroutine) noexcept
    {
        _awaiting_coroutine = awaiting_coroutine;
        _handle->data = static_cast<void*>(this);
        uv_close(_handle,
                 [](uv_handle_t* handle)
                 {
                     QX_DCHECK(handle != nullptr);
                     QX_DCHECK(handle->data != nullptr);
                     auto& self = *static_cast<close_awaiter*>(handle->data);
                     self._awaiting_coroutine.resume();
                 });
    }

    void await_resume() noexcept {}

private:
    uv_handle_t* _handle;
    std::coroutine_handle<> _awaiting_coroutine;
};

}  // namespace

void async_signal::open(uv_loop_t* uv_loop)
{
    const int rc = uv_async_init(uv_loop, &_handle, &async_signal::on_async);
    QX_CHECK(rc == 0) << "uv_async_init failed: " << uv_strerror(rc);
    _handle.data = static_cast<void*>(this);
}

void async_signal::send()
{
    const int rc = uv_async_send(&_handle);
    QX_CHECK(rc == 0) << "uv_async_send failed: " << uv_strerror(rc);
}

qx::func<void> async_signal::close()
{
    co_await close_awaiter(reinterpret_cast<uv_handle_t*>(&_handle));
}

void async_signal::on_async(uv_async_t* handle)
{
    QX_DCHECK(handle->data != nullptr);
    auto& self = *static_cast<async_signal*>(handle->data);
    self._callback(self._data);
}

}  // namespace qx::impl
