#pragma once

#include "common.hpp"

#include <cstdint>
#include <string_view>

namespace crdtsim
{
    // Stateless deterministic RNG for scripted replica input.
    //
    // Every draw is a pure function of (seed, stream, replica, tick, draw), so two runs
    // with the same seed produce the same input regardless of how many draws other
    // replicas consumed in between.

    inline std::uint64_t splitmix64(std::uint64_t x) noexcept
    {
        x += 0x9e3779b97f4a7c15ULL;
        x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
        x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
        return x ^ (x >> 31);
    }

    inline std::uint64_t mix_u64(std::uint64_t a, std::uint64_t b) noexcept
    {
        return splitmix64(a ^ splitmix64(b));
    }

    // Stable 64-bit key for a replica id.
    inline std::uint64_t replica_key(std::string_view id) noexcept
    {
        std::uint64_t h = 1469598103934665603ULL;
        for (const char c : id)
        {
            h ^= static_cast<std::uint64_t>(static_cast<unsigned char>(c));
            h *= 1099511628211ULL;
        }
        return h;
    }

    inline std::uint64_t rng_u64(std::uint64_t seed,
                                 std::string_view replica,
                                 std::uint32_t stream,
                                 std::uint64_t tick,
                                 std::uint32_t draw = 0) noexcept
    {
        std::uint64_t x = seed;
        x = mix_u64(x, replica_key(replica));
        x = mix_u64(x, static_cast<std::uint64_t>(stream));
        x = mix_u64(x, tick);
        x = mix_u64(x, static_cast<std::uint64_t>(draw));
        return splitmix64(x);
    }

    // Uniform in [0,1).
    inline double rng_unit_double(std::uint64_t seed,
                                  std::string_view replica,
                                  std::uint32_t stream,
                                  std::uint64_t tick,
                                  std::uint32_t draw = 0) noexcept
    {
        // Use the top 53 bits to construct a double in [0,1).
        const std::uint64_t r = rng_u64(seed, replica, stream, tick, draw);
        const std::uint64_t mantissa = r >> 11;                            // 53 bits
        return static_cast<double>(mantissa) * (1.0 / 9007199254740992.0); // 2^53
    }

    // Uniform integer in [lo, hi] (inclusive). Undefined if lo > hi.
    inline std::uint64_t rng_u64_range(std::uint64_t seed,
                                       std::string_view replica,
                                       std::uint32_t stream,
                                       std::uint64_t tick,
                                       std::uint64_t lo,
                                       std::uint64_t hi,
                                       std::uint32_t draw = 0) noexcept
    {
        const std::uint64_t span = (hi - lo) + 1;
        const std::uint64_t r = rng_u64(seed, replica, stream, tick, draw);
        // Modulo bias is acceptable for scripted input.
        return lo + (r % span);
    }
}
