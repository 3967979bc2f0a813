#pragma once

#include <uv.h>
#include <qx/func.hpp>

namespace qx::impl
{

/// \brief uv_async_t wrapper. send() may be called from any std::thread, the callback runs on the loop's thread
///
/// The loop keeps a pointer to the handle: the object stays in place between open() and the end of close().
class async_signal
{
public:
    using callback_type = void (*)(void*);

    async_signal(callback_type callback, void* data) noexcept
        : _callback(callback)
        , _data(data)
    {}

    async_signal(const async_signal&) = delete;
    async_signal& operator=(const async_signal&) = delete;

    void open(uv_loop_t* uv_loop);

    void send();

    /// \brief completes once the loop has released the handle
    qx::func<void> close();

private:
    static void on_async(uv_async_t* handle);

private:
    uv_async_t _handle;
    callback_type _callback;
    void* _data;
};

}  // namespace qx::impl
