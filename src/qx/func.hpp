#pragma once

#include <coroutine>
#include <type_traits>
#include <utility>
#include <qx/check.hpp>
#include <qx/impl/func_state.hpp>

namespace qx
{

template <typename T>
class func;

namespace impl
{

// Hands control back to the awaiting frame when a func finishes.
// The active qx::thread stays the same: it is the same chain of frames.
class continuation_awaiter
{
public:
    explicit continuation_awaiter(std::coroutine_handle<> continuation) noexcept
        : _continuation(continuation)
    {}

    bool await_ready() const noexcept
    {
        return false;
    }

    std::coroutine_handle<> await_suspend(std::coroutine_handle<>) noexcept
    {
        return _continuation;
    }

    void await_resume() noexcept
    {
        // the finished frame is destroyed by ~func, never resumed
        QX_DCHECK(false);
    }

private:
    std::coroutine_handle<> _continuation;
};

template <typename T>
class func_promise_base
{
public:
    std::suspend_always initial_suspend() noexcept
    {
        return {};
    }

    continuation_awaiter final_suspend() noexcept
    {
        return continuation_awaiter{ _continuation };
    }

    void unhandled_exception()
    {
        _state.set_exception(std::current_exception());
    }

    void set_continuation(std::coroutine_handle<> continuation) noexcept
    {
        _continuation = continuation;
    }

    func_state<T>& state() noexcept
    {
        return _state;
    }

protected:
    std::coroutine_handle<> _continuation = std::noop_coroutine();
    func_state<T> _state;
};

template <typename T>
class func_promise : public func_promise_base<T>
{
public:
    func<T> get_return_object() noexcept;

    void return_value(T value)
    {
        this->_state.set_value(std::move(value));
    }
};

template <>
class func_promise<void> : public func_promise_base<void>
{
public:
    func<void> get_return_object() noexcept;

    void return_void()
    {
        this->_state.set_value();
    }
};

// Starts the awaited func and resumes the awaiting frame with its outcome.
template <typename T>
class func_awaiter
{
    using handle_type = std::coroutine_handle<func_promise<T>>;

public:
    explicit func_awaiter(handle_type coroutine) noexcept
        : _coroutine(coroutine)
    {}

    bool await_ready() const noexcept
    {
        return _coroutine.done();
    }

    std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiting) noexcept
    {
        _coroutine.promise().set_continuation(awaiting);
        return _coroutine;
    }

    T await_resume()
    {
        if constexpr (std::is_void_v<T>)
            _coroutine.promise().state().value();
        else
            return std::move(_coroutine.promise().state().value());
    }

private:
    handle_type _coroutine;
};

}  // namespace impl

/// \brief lazily started coroutine. The body runs once the func is co_awaited, its value or exception is
/// delivered to the awaiting coroutine.
///
/// \code
///     qx::func<int> answer()
///     {
///         co_return 42;
///     }
///
///     int i = co_await answer();
/// \endcode
template <typename T>
class [[nodiscard("co_await me")]] func
{
public:
    using promise_type = impl::func_promise<T>;
    using value = T;

    explicit func(std::coroutine_handle<promise_type> coroutine) noexcept
        : _coroutine(coroutine)
    {}

    func(func&& other) noexcept
        : _coroutine(std::exchange(other._coroutine, nullptr))
    {}

    func(const func&) = delete;
    func& operator=(const func&) = delete;
    func& operator=(func&&) = delete;

    ~func()
    {
        if (!_coroutine)
            return;

        QX_DCHECK(_coroutine.done()) << "qx::func is destroyed while running";
        _coroutine.destroy();
    }

    impl::func_awaiter<T> operator co_await() const noexcept
    {
        QX_DCHECK(_coroutine) << "moved from qx::func is awaited";
        return impl::func_awaiter<T>{ _coroutine };
    }

private:
    std::coroutine_handle<promise_type> _coroutine;
};

template <typename T>
func<T> impl::func_promise<T>::get_return_object() noexcept
{
    return func<T>{ std::coroutine_handle<func_promise>::from_promise(*this) };
}

inline func<void> impl::func_promise<void>::get_return_object() noexcept
{
    return func<void>{ std::coroutine_handle<func_promise>::from_promise(*this) };
}

namespace impl
{

template <typename T>
struct is_func : std::false_type
{};

template <typename T>
struct is_func<func<T>> : std::true_type
{};

}  // namespace impl

template <typename T>
inline constexpr bool is_func_v = impl::is_func<T>::value;

template <typename T>
concept FuncConcept = is_func_v<T>;

// clang-format off
template <typename F>
concept FuncLambdaConcept = requires(F f)
{
    { f() } -> FuncConcept;
};
// clang-format on

/// \brief call a coroutine lambda so that the lambda object (with its captures) and the arguments live in
/// the coroutine frame rather than in the caller
template <typename F, typename... Args>
auto invoke(F&& f, Args&&... args)
{
    using lambda_type = std::decay_t<F>;
    using func_type = std::invoke_result_t<lambda_type&, std::decay_t<Args>...>;
    return [](lambda_type lambda, std::decay_t<Args>... args) -> func_type
    {
        co_return co_await lambda(std::move(args)...);
    }(std::forward<F>(f), std::forward<Args>(args)...);
}

}  // namespace qx
