#pragma once

#include <concepts>
#include <cstdint>
#include <iosfwd>
#include <type_traits>
#include <qx/check.hpp>

namespace qx
{

/// \brief names a set of status codes and renders them as text
///
/// Categories are told apart by id, not by address: every translation unit may hold its own instance.
class status_category
{
public:
    explicit status_category(uint64_t id)
        : _id(id)
    {}

    [[nodiscard]] virtual const char* name() const noexcept = 0;
    [[nodiscard]] virtual const char* message(int code) const noexcept = 0;

    [[nodiscard]] uint64_t id() const noexcept
    {
        return _id;
    }

private:
    uint64_t _id;
};

class status_code;

// An enum takes part in status comparisons once make_status_code(e) can be found for it by ADL.
// clang-format off
template <typename E>
concept StatusEnum = std::is_enum_v<E> && requires(E e)
{
    { make_status_code(e) } -> std::convertible_to<status_code>;
};
// clang-format on

/// \brief integer code tagged with its category
class status_code
{
public:
    template <StatusEnum E>
    constexpr status_code(E e)  // NOLINT(google-explicit-constructor)
        : status_code(make_status_code(e))
    {}

    template <StatusEnum E>
    constexpr status_code(E e, const status_category* category)
        : _category(category)
        , _code(static_cast<int>(e))
    {
        QX_DCHECK(category != nullptr);
    }

    [[nodiscard]] bool same_as(const status_code& other) const noexcept
    {
        return _code == other._code && _category->id() == other._category->id();
    }

    friend bool operator==(const status_code& lhs, const status_code& rhs) noexcept
    {
        return lhs.same_as(rhs);
    }

    friend bool operator!=(const status_code& lhs, const status_code& rhs) noexcept
    {
        return !lhs.same_as(rhs);
    }

    [[nodiscard]] const char* category_name() const
    {
        return _category->name();
    }

    [[nodiscard]] const char* message() const
    {
        return _category->message(_code);
    }

    [[nodiscard]] int code() const noexcept
    {
        return _code;
    }

private:
    const status_category* _category;
    int _code;
};

/// \brief a status code and a short text about the failure
///
/// The text is not owned: it must be a string literal or have static storage duration otherwise.
class error_desc : public status_code
{
public:
    error_desc(const status_code& status, const char* desc = "")  // NOLINT(google-explicit-constructor)
        : status_code(status)
        , _desc(desc)
    {
        QX_DCHECK(_desc != nullptr);
    }

    [[nodiscard]] const status_code& status() const noexcept
    {
        return *this;
    }

    [[nodiscard]] const char* what() const noexcept
    {
        return _desc;
    }

private:
    const char* _desc;
};

/// prints "category::message(code) description"
std::ostream& operator<<(std::ostream& out, const status_code& status);
std::ostream& operator<<(std::ostream& out, const error_desc& desc);

}  // namespace qx
