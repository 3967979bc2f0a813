#pragma once

#include <type_traits>
#include <utility>
#include <variant>
#include <qx/exception.hpp>

namespace qx
{

namespace impl
{

// Carries the value from qx::ok() to the result constructor, the value is constructed in place there.
template <typename T>
struct success_type
{
    T value;
};

template <>
struct success_type<void>
{};

template <typename T>
using ok_storage_t = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

template <typename T>
class result_base
{
public:
    explicit result_base(const error_desc& err)
        : _res(std::in_place_index<1>, err)
    {}

    template <typename... Args>
    explicit result_base(std::in_place_t, Args&&... args)
        : _res(std::in_place_index<0>, std::forward<Args>(args)...)
    {}

    [[nodiscard]] bool is_ok() const noexcept
    {
        return _res.index() == 0;
    }

    [[nodiscard]] bool is_err() const noexcept
    {
        return _res.index() == 1;
    }

    /// \brief the error. Throws std::bad_variant_access on a successful result
    [[nodiscard]] const error_desc& err() const
    {
        return std::get<1>(_res);
    }

    [[nodiscard]] const char* what() const
    {
        return err().what();
    }

protected:
    void throw_if_err() const
    {
        if (is_err())
            throw qx::exception(err());
    }

    std::variant<ok_storage_t<T>, error_desc> _res;
};

}  // namespace impl

/// \brief either a value of type T or an error description
///
/// \code
///     qx::result<int> res = qx::ok(3);
///     int i = res.unwrap();
///
///     res = qx::err(qx::pending);
///     if (res == qx::pending)  // same as res.is_err() && res.err() == qx::pending
///         ...
/// \endcode
template <typename T>
class [[nodiscard]] result : public impl::result_base<T>
{
    using base = impl::result_base<T>;

public:
    result(const error_desc& err)  // NOLINT(google-explicit-constructor)
        : base(err)
    {}

    result(const status_code& status)  // NOLINT(google-explicit-constructor)
        : base(error_desc(status))
    {}

    template <typename Arg>
    result(impl::success_type<Arg>&& success) requires(  // NOLINT(google-explicit-constructor)
        std::is_constructible_v<T, Arg>)
        : base(std::in_place, std::forward<Arg>(success.value))
    {}

    /// \brief the value. Throws qx::exception if the result holds an error
    T& unwrap() &
    {
        this->throw_if_err();
        return std::get<0>(this->_res);
    }

    const T& unwrap() const&
    {
        this->throw_if_err();
        return std::get<0>(this->_res);
    }

    T&& unwrap() &&
    {
        this->throw_if_err();
        return std::move(std::get<0>(this->_res));
    }
};

template <>
class [[nodiscard]] result<void> : public impl::result_base<void>
{
    using base = impl::result_base<void>;

public:
    result(const error_desc& err)  // NOLINT(google-explicit-constructor)
        : base(err)
    {}

    result(const status_code& status)  // NOLINT(google-explicit-constructor)
        : base(error_desc(status))
    {}

    result(impl::success_type<void>&&)  // NOLINT(google-explicit-constructor)
        : base(std::in_place)
    {}

    /// \brief throws qx::exception if the result holds an error
    void unwrap() const
    {
        throw_if_err();
    }
};

template <typename T>
bool operator==(const result<T>& res, const status_code& status)
{
    return res.is_err() && res.err() == status;
}

template <typename T>
bool operator!=(const result<T>& res, const status_code& status)
{
    return !(res == status);
}

inline auto ok()
{
    return impl::success_type<void>{};
}

template <typename T>
auto ok(T&& value)
{
    return impl::success_type<T&&>{ std::forward<T>(value) };
}

template <typename... Args>
error_desc err(Args&&... args)
{
    return error_desc(std::forward<Args>(args)...);
}

}  // namespace qx
