#pragma once
#include <cstddef>
#include <cstdint>
#include <limits>

namespace core {

// SplitMix64: one 64-bit word of state, full period 2^64, passes BigCrush.
// Used both as the per-read stream and as the seed mixer that derives those
// streams from a run seed.
struct SplitMix64 {
    using result_type = std::uint64_t;
    std::uint64_t state;

    static constexpr std::uint64_t gamma = 0x9E3779B97F4A7C15ULL;

    explicit SplitMix64(std::uint64_t seed = gamma) noexcept : state(seed) {}

    static constexpr result_type min() noexcept { return std::numeric_limits<result_type>::min(); }
    static constexpr result_type max() noexcept { return std::numeric_limits<result_type>::max(); }

    static constexpr std::uint64_t mix(std::uint64_t z) noexcept {
        z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
        z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
        return z ^ (z >> 31);
    }

    inline std::uint64_t next_u64() noexcept { return mix(state += gamma); }
    inline result_type operator()() noexcept { return next_u64(); }

    // Unbiased fair bit (top bit of the output word).
    inline bool coin() noexcept { return (next_u64() >> 63) != 0; }

    // Uniform in [0, 1) with a 53-bit mantissa.
    inline double next_unit_double() noexcept {
        return static_cast<double>(next_u64() >> 11) * (1.0 / static_cast<double>(1ULL << 53));
    }

    // Uniform in [0, n), n > 0. Lemire's multiply-high with a tiny rejection loop.
    inline std::uint64_t uniform_index(std::uint64_t n) noexcept {
        using u128 = unsigned __int128;
        std::uint64_t x = next_u64();
        u128 m = static_cast<u128>(x) * static_cast<u128>(n);
        std::uint64_t l = static_cast<std::uint64_t>(m);
        if (l < n) {
            const std::uint64_t t = (0 - n) % n;
            while (l < t) {
                x = next_u64();
                m = static_cast<u128>(x) * static_cast<u128>(n);
                l = static_cast<std::uint64_t>(m);
            }
        }
        return static_cast<std::uint64_t>(m >> 64);
    }
};

inline std::uint64_t splitmix_hash(std::uint64_t x) noexcept {
    return SplitMix64(x).next_u64();
}

// Seed for stream `stream` of a run seeded with `seed`. Depends only on the
// pair, so a read's trajectory is the same whatever the number of reads, the
// worker count or the completion order.
inline std::uint64_t derive_stream_seed(std::uint64_t seed, std::uint64_t stream) noexcept {
    return splitmix_hash(seed ^ ((stream + 1) * SplitMix64::gamma));
}

inline SplitMix64 make_read_rng(std::uint64_t seed, std::size_t read) noexcept {
    return SplitMix64(derive_stream_seed(seed, static_cast<std::uint64_t>(read)));
}

} // namespace core
