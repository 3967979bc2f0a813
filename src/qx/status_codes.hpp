#pragma once

#include <qx/status.hpp>

namespace qx::impl
{

enum core_codes
{
    cancel = 1,     // the request was discarded before it could be granted
    pending = 2,    // the request is still queued
    abandoned = 3,  // the grant found nobody waiting for it
    other = 4
};

class core_codes_category : public status_category
{
public:
    core_codes_category()
        : status_category(0x8c3e51d2a06f4b17)
    {}

    [[nodiscard]] const char* name() const noexcept override
    {
        return "qx";
    }

    [[nodiscard]] const char* message(int code) const noexcept override
    {
        switch (static_cast<core_codes>(code))
        {
        case cancel:
            return "cancel";
        case pending:
            return "pending";
        case abandoned:
            return "abandoned";
        case other:
            return "other";
        }
        return "unknown";
    }
};

inline const core_codes_category core_category{};

inline constexpr status_code make_status_code(core_codes e)
{
    return status_code{ e, &core_category };
}

}  // namespace qx::impl

namespace qx
{

constexpr status_code cancel = impl::core_codes::cancel;
constexpr status_code pending = impl::core_codes::pending;
constexpr status_code abandoned = impl::core_codes::abandoned;
constexpr status_code other = impl::core_codes::other;

}  // namespace qx
