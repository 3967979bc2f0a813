#pragma once

#include <exception>
#include <iosfwd>
#include <qx/status_codes.hpp>

namespace qx
{

/// \brief thrown when an error result is unwrapped
///
/// Expected outcomes (a request is still pending, it has been discarded) travel as qx::result.
/// Broken invariants do not throw at all, they terminate through QX_CHECK.
/// \code
///     throw qx::exception(qx::other, "something bad happened");
/// \endcode
class exception : public std::exception
{
public:
    exception(const status_code& status, const char* desc = "")  // NOLINT(google-explicit-constructor)
        : _err(status, desc)
    {}

    explicit exception(const error_desc& err)
        : _err(err)
    {}

    [[nodiscard]] const char* what() const noexcept override
    {
        return _err.what();
    }

    [[nodiscard]] const status_code& status() const noexcept
    {
        return _err.status();
    }

    [[nodiscard]] const error_desc& err() const noexcept
    {
        return _err;
    }

private:
    error_desc _err;
};

std::ostream& operator<<(std::ostream& out, const exception& exc);

}  // namespace qx
