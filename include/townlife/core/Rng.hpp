#pragma once
// include/townlife/core/Rng.hpp
#include <cstdint>

namespace townlife::rng {

using Seed = std::uint64_t;

// 64-bit mixing (turns agent ids and counters into well-scrambled seeds)
inline std::uint64_t mix64(std::uint64_t x) {
    x += 0x9E3779B97F4A7C15ull;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ull;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBull;
    return x ^ (x >> 31);
}

// Minimal PCG32 (XSH-RR). One 64-bit state + 64-bit stream/sequence.
struct Pcg32 {
    std::uint64_t state = 0;
    std::uint64_t inc   = 0; // must be odd

    Pcg32() = default;
    explicit Pcg32(Seed initstate, Seed sequence = 0) { seed(initstate, sequence); }

    void seed(Seed initstate, Seed sequence = 0) {
        state = 0;
        inc   = (mix64(sequence) << 1u) | 1u;
        next_u32();
        state += mix64(initstate);
        next_u32();
    }

    std::uint32_t next_u32() {
        std::uint64_t old = state;
        state = old * 6364136223846793005ull + inc;
        std::uint32_t xorshifted = static_cast<std::uint32_t>(((old >> 18u) ^ old) >> 27u);
        std::uint32_t rot        = static_cast<std::uint32_t>(old >> 59u);
        return (xorshifted >> rot) | (xorshifted << ((-static_cast<int>(rot)) & 31));
    }

    // [0,1)
    double next_double01() {
        const std::uint64_t hi = next_u32();
        const std::uint64_t lo = next_u32();
        return (((hi << 32) | lo) >> 11) * (1.0 / 9007199254740992.0);
    }

    // Uniform on [0, bound) without modulo bias (rejection method)
    std::uint32_t next_bounded(std::uint32_t bound) {
        if (bound == 0) return 0;
        std::uint32_t threshold = static_cast<std::uint32_t>(-bound) % bound;
        for (;;) {
            std::uint32_t r = next_u32();
            if (r >= threshold) return r % bound;
        }
    }
};

} // namespace townlife::rng
