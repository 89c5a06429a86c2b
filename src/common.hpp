#pragma once

#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace crdtsim
{
    // Simulation time in milliseconds.
    using SimTime = std::uint64_t;

    using ReplicaId = std::string;

    // Submitting to, or reconfiguring, a replica id the simulator does not know.
    class UnknownReplicaError : public std::runtime_error
    {
    public:
        explicit UnknownReplicaError(const ReplicaId &id)
            : std::runtime_error("unknown replica id=" + id), m_id(id)
        {
        }

        const ReplicaId &replica() const noexcept { return m_id; }

    private:
        ReplicaId m_id;
    };

    // An operation a variant cannot apply (e.g. coordinates outside the grid).
    // Thrown to the caller on local submission; a received one is rejected and counted.
    class InvalidOperationError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };
}
