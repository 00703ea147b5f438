#pragma once

#include <cstdint>

// Core Rng subsystem
// Responsible for: small deterministic random streams for world seeding and tests.
// Should NOT do: cryptography or global shared state.
namespace delve::core {

// PCG-XSH-RR 32-bit output, 64-bit state.
class Pcg32 {
public:
    explicit Pcg32(std::uint64_t seed = 0x853c49e6748fea9bULL) : m_state(seed) {}

    std::uint32_t nextU32() {
        const std::uint64_t old = m_state;
        m_state = old * 6364136223846793005ULL + 1442695040888963407ULL;
        const std::uint32_t xorshifted = static_cast<std::uint32_t>(((old >> 18u) ^ old) >> 27u);
        const std::uint32_t rot = static_cast<std::uint32_t>(old >> 59u);
        return (xorshifted >> rot) | (xorshifted << ((~rot + 1u) & 31u));
    }

    // Uniform in [minValue, maxValue]; slight modulo bias is acceptable for seeding.
    std::int32_t nextInRange(std::int32_t minValue, std::int32_t maxValue) {
        if (maxValue <= minValue) {
            return minValue;
        }
        const std::uint32_t span = static_cast<std::uint32_t>(maxValue - minValue) + 1u;
        return minValue + static_cast<std::int32_t>(nextU32() % span);
    }

    bool chance(std::uint32_t numerator, std::uint32_t denominator) {
        return denominator != 0 && (nextU32() % denominator) < numerator;
    }

private:
    std::uint64_t m_state;
};

} // namespace delve::core
