#pragma once

#include <cstddef>

namespace qx
{

/// \brief what process_queue does when the popped request has no receiver anymore
enum class grant_policy
{
    /// report qx::abandoned from that process_queue call, unlock and leave the rest of the queue alone.
    /// Requests behind the abandoned one are granted by the next process_queue call
    stop_on_abandoned,
    /// drop the abandoned request and grant the next one in the same call
    skip_abandoned
};

/// \brief construction time settings of a qx::qutex
struct options
{
    grant_policy policy = grant_policy::stop_on_abandoned;

    /// nodes preallocated for the pending queue. The queue grows past it on demand
    std::size_t initial_queue_capacity = 16;
};

}  // namespace qx
