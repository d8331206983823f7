#pragma once
#include <cstdint>
#include <cstddef>
#include <limits>

// Compile-time tag hashing (FNV-1a) for readable domain separation.
// Salting a substream with a tag keeps unrelated generators from sharing
// sequences even when they start from the same level seed.
//
// Example:
//   RandomSource rng = RandomSource::substream(seed, tag32("ATTEMPT"), attempt);
constexpr uint32_t fnv1a32(const char* data, std::size_t len) {
    uint32_t h = 2166136261u; // FNV offset basis
    for (std::size_t i = 0; i < len; ++i) {
        h ^= static_cast<uint8_t>(static_cast<unsigned char>(data[i]));
        h *= 16777619u; // FNV prime
    }
    return h;
}

template <std::size_t N>
constexpr uint32_t tag32(const char (&str)[N]) {
    // N includes the null terminator for string literals.
    return fnv1a32(str, (N > 0) ? (N - 1) : 0);
}

inline uint32_t hash32(uint32_t x) {
    x ^= x >> 16;
    x *= 0x7feb352du;
    x ^= x >> 15;
    x *= 0x846ca68bu;
    x ^= x >> 16;
    return x;
}

inline uint32_t hashCombine(uint32_t a, uint32_t b) {
    return hash32(a ^ (b + 0x9e3779b9u + (a << 6) + (a >> 2)));
}

template <typename... Rest>
inline uint32_t hashCombine(uint32_t a, uint32_t b, uint32_t c, Rest... rest) {
    uint32_t h = hashCombine(hashCombine(a, b), c);
    ((h = hashCombine(h, static_cast<uint32_t>(rest))), ...);
    return h;
}

// Deterministic number stream shared by every stochastic step of generation.
// xorshift32: identical output on every platform/compiler, not cryptographic.
//
// There is no global instance. Callers own a RandomSource and pass it down by
// reference so two runs with the same seed replay bit-for-bit.
class RandomSource {
public:
    explicit RandomSource(uint32_t seed = 0x12345678u) : state_(seed ? seed : 0x12345678u) {}

    // Independent stream for (seed, salt...). Used for whole-level retries so
    // attempt k never depends on how many numbers attempt k-1 consumed.
    template <typename... Salt>
    static RandomSource substream(uint32_t seed, uint32_t salt, Salt... more) {
        return RandomSource(hashCombine(seed, salt, static_cast<uint32_t>(more)...));
    }

    static RandomSource substream(uint32_t seed, uint32_t salt) {
        return RandomSource(hashCombine(seed, salt));
    }

    uint32_t nextU32() {
        uint32_t x = state_;
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        state_ = x;
        return x;
    }

    // Uniform in [lo, hiInclusive]. Returns lo for an empty/inverted range.
    int range(int lo, int hiInclusive) {
        if (hiInclusive <= lo) return lo;
        const uint32_t span = static_cast<uint32_t>(hiInclusive - lo) + 1u;
        return lo + static_cast<int>(nextU32() % span);
    }

    // Uniform index in [0, n). n must be > 0.
    std::size_t index(std::size_t n) {
        return static_cast<std::size_t>(nextU32() % static_cast<uint32_t>(n));
    }

    float next01() {
        return (nextU32() / (static_cast<float>(std::numeric_limits<uint32_t>::max()) + 1.0f));
    }

    bool chance(float p) {
        return next01() < p;
    }

    bool coinFlip() {
        return (nextU32() & 1u) != 0u;
    }

    uint32_t state() const { return state_; }

private:
    uint32_t state_;
};
