#pragma once
// ============================================================================
// Core: Deterministic RNG (SplitMix64 seeding + xoshiro256++)
// File: cpp/midas/core/rng.hpp
// ============================================================================
//
// Purpose:
// - Draw the per-row hash coefficients (a, b) of every Count-Min sketch.
// - Same seed => same coefficients on every platform/build, so out.csv is
//   reproducible and diffable.
//
// Notes:
// - The four xoshiro state words are the first four SplitMix64 outputs.
// - next_u32() is the upper half of next_u64().
//
// ============================================================================

#include <bit>
#include <cstdint>

namespace midas {

struct SplitMix64 final {
    std::uint64_t s = 0;

    explicit SplitMix64(std::uint64_t seed = 0x9E3779B97F4A7C15ull) : s(seed) {}

    std::uint64_t next_u64() noexcept {
        std::uint64_t z = (s += 0x9E3779B97F4A7C15ull);
        z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ull;
        z = (z ^ (z >> 27)) * 0x94D049BB133111EBull;
        return z ^ (z >> 31);
    }
};

class Xoshiro256pp final {
public:
    explicit Xoshiro256pp(std::uint64_t seed) noexcept {
        SplitMix64 sm(seed);
        for (auto& w : s_) w = sm.next_u64();
    }

    std::uint64_t next_u64() noexcept {
        const std::uint64_t result = std::rotl(s_[0] + s_[3], 23) + s_[0];
        const std::uint64_t t = s_[1] << 17;

        s_[2] ^= s_[0];
        s_[3] ^= s_[1];
        s_[1] ^= s_[2];
        s_[0] ^= s_[3];
        s_[2] ^= t;
        s_[3] = std::rotl(s_[3], 45);

        return result;
    }

    std::uint32_t next_u32() noexcept {
        return static_cast<std::uint32_t>(next_u64() >> 32);
    }

private:
    std::uint64_t s_[4]{};
};

} // namespace midas
