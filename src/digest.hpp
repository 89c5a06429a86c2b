#pragma once

#include "common.hpp"

#include <cstdint>
#include <string_view>

namespace crdtsim
{
    // Order-insensitive digest of an emission trace: each emitted (replica, time, operation)
    // contributes one 64-bit hash combined by SUM (keeps multiplicity) and XOR.
    struct TraceDigest
    {
        std::uint64_t sum = 0;
        std::uint64_t xorAll = 0;
        std::uint64_t count = 0;

        bool operator==(const TraceDigest &o) const noexcept
        {
            return sum == o.sum && xorAll == o.xorAll && count == o.count;
        }
    };

    namespace detail
    {
        inline std::uint64_t fnv1a64(std::string_view bytes, std::uint64_t h = 1469598103934665603ULL) noexcept
        {
            for (const char b : bytes)
            {
                h ^= static_cast<std::uint64_t>(static_cast<unsigned char>(b));
                h *= 1099511628211ULL;
            }
            return h;
        }

        inline std::uint64_t fnv1a64_u64(std::uint64_t v, std::uint64_t h) noexcept
        {
            for (int i = 0; i < 8; ++i)
            {
                h ^= (v >> (8 * i)) & 0xFFu;
                h *= 1099511628211ULL;
            }
            return h;
        }
    }

    class TraceAccumulator
    {
    public:
        void on_emitted(std::string_view replica, SimTime at, std::string_view operation)
        {
            std::uint64_t h = detail::fnv1a64(replica);
            h = detail::fnv1a64_u64(at, h);
            h = detail::fnv1a64(operation, h);
            m_digest.sum += h;
            m_digest.xorAll ^= h;
            ++m_digest.count;
        }

        const TraceDigest &digest() const noexcept { return m_digest; }

    private:
        TraceDigest m_digest{};
    };
}
