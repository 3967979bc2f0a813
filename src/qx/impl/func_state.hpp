#pragma once

#include <exception>
#include <stdexcept>
#include <type_traits>
#include <variant>

namespace qx::impl
{

struct void_value
{};

/// \brief outcome of a qx::func: not finished yet, a value or an exception
template <typename T>
class func_state
{
    using value_type = std::conditional_t<std::is_void_v<T>, void_value, T>;

public:
    void set_exception(std::exception_ptr exc)
    {
        _outcome.template emplace<2>(std::move(exc));
    }

    template <typename... Args>
    void set_value(Args&&... args)
    {
        _outcome.template emplace<1>(std::forward<Args>(args)...);
    }

    [[nodiscard]] bool is_done() const noexcept
    {
        return _outcome.index() != 0;
    }

    /// \brief rethrows the stored exception
    std::add_lvalue_reference_t<T> value()
    {
        if (auto* exc = std::get_if<2>(&_outcome); exc != nullptr)
            std::rethrow_exception(*exc);
        if (!is_done())
            throw std::logic_error("qx::func result is read before the func is finished");

        if constexpr (!std::is_void_v<T>)
            return std::get<1>(_outcome);
    }

private:
    std::variant<std::monostate, value_type, std::exception_ptr> _outcome;
};

}  // namespace qx::impl
