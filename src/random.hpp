#pragma once

#include "common.hpp"

#include <bit>
#include <cstdint>

namespace quboroute
{
    // Counter-based randomness for the solvers.
    //
    // A draw is a pure function of (seed, stream, key), so an annealing run or a restart
    // sequence replays identically from its seed on any rank. Streams keep independent uses
    // apart: the annealer's acceptance tests and the classical restarts never share draws.

    inline std::uint64_t splitmix64(std::uint64_t x) noexcept
    {
        x += 0x9e3779b97f4a7c15ULL;
        x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
        x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
        return x ^ (x >> 31);
    }

    // Order-sensitive combination; used for seeds and request ids.
    inline std::uint64_t mix_u64(std::uint64_t a, std::uint64_t b) noexcept
    {
        return splitmix64(a ^ splitmix64(b));
    }

    inline std::uint64_t rng_u64(std::uint64_t seed, std::uint32_t stream, std::uint64_t key) noexcept
    {
        return splitmix64(mix_u64(mix_u64(seed, stream), key));
    }

    // Uniform in [0,1), from the top 53 bits.
    inline double rng_unit_double(std::uint64_t seed, std::uint32_t stream, std::uint64_t key) noexcept
    {
        return static_cast<double>(rng_u64(seed, stream, key) >> 11) * (1.0 / 9007199254740992.0);
    }

    // One binary variable of a random starting assignment.
    inline double rng_bit(std::uint64_t seed, std::uint32_t stream, std::uint64_t key) noexcept
    {
        return (rng_u64(seed, stream, key) >> 63) != 0 ? 1.0 : 0.0;
    }

    // Seed for one instance: the same weights always anneal from the same seed.
    inline std::uint64_t instance_seed(std::uint64_t base, const std::vector<double> &weights) noexcept
    {
        std::uint64_t s = mix_u64(base, weights.size());
        for (const double w : weights)
        {
            s = mix_u64(s, std::bit_cast<std::uint64_t>(w));
        }
        return s;
    }
}
