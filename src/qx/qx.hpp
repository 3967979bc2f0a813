#pragma once

#include <qx/exception.hpp>
#include <qx/func.hpp>
#include <qx/options.hpp>
#include <qx/qutex.hpp>
#include <qx/result.hpp>
#include <qx/status_codes.hpp>
#include <qx/this_thread.hpp>
#include <qx/thread.hpp>
#include <qx/impl/scheduler.hpp>

namespace qx
{

/// \brief run the event loop of the calling std::thread until every qx::thread started on it has finished
inline void loop()
{
    impl::get_scheduler().run();
}

/// \brief start f as the "main" qx::thread and run the event loop
///
/// \code
///     qx::loop([&]() -> qx::func<void>
///     {
///         auto g = (co_await q.lock()).unwrap();
///     });
/// \endcode
template <FuncLambdaConcept F>
void loop(F&& f)
{
    qx::thread(std::forward<F>(f), "main").detach();
    loop();
}

inline void loop(func<void>&& main_func)
{
    qx::thread(std::move(main_func), "main").detach();
    loop();
}

}  // namespace qx
