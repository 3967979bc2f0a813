#pragma once

#include <exception>
#include <iostream>
#include <string_view>
// TODO: switch to c++20's std::source_location when clang is ready.
#include <boost/assert/source_location.hpp>
#define BOOST_STACKTRACE_USE_ADDR2LINE
#include <boost/stacktrace.hpp>

namespace qx::impl
{

/// \brief sink for every diagnostic the library prints
inline std::ostream& get_logger()
{
    return std::cerr;
}

struct FatalStream
{
    FatalStream(std::string_view condition, boost::source_location loc)
    {
        get_logger() << "Check failed: \"" << condition << "\""
                     << " function " << loc.function_name() << " at " << loc.file_name() << ":" << loc.line()
                     << " ";
    }

    ~FatalStream()
    {
        get_logger() << "\n";
        get_logger() << boost::stacktrace::stacktrace();
        std::terminate();
    }
};

const FatalStream& operator<<(const FatalStream& s, const auto& t)
{
    get_logger() << t;
    return s;
}

}  // namespace qx::impl

// Checks an expression during runtime. Checks are performed in release builds too.
// Example:
//      QX_CHECK(status <= 1) << "unexpected status " << status;
#define QX_CHECK(condition) \
    if (!(condition))       \
    ::qx::impl::FatalStream(#condition, BOOST_CURRENT_LOCATION)

// Checks an expression during runtime. Checks are performed only in debug builds.
#ifdef NDEBUG
#define QX_DCHECK(condition) QX_CHECK(true)
#else
#define QX_DCHECK(condition) QX_CHECK(condition)
#endif
