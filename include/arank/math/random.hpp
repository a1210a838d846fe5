#pragma once

/// @file random.hpp
/// @brief Deterministic random source for Monte Carlo entropy estimation.
///
/// Every backend instance, in-process or on a worker, must reproduce the
/// same draws from the same base seed. Hence a tiny explicit generator
/// instead of an implementation-defined standard engine.

#include <cstdint>

namespace arank::math {

/// xorshift32 generator producing uniforms strictly inside (0, 1).
class Xorshift32 {
public:
    /// A zero seed is replaced by 1 (zero is a fixed point of xorshift).
    explicit Xorshift32(uint32_t seed) noexcept : state_(seed == 0 ? 1u : seed) {}

    /// Next uniform in (0, 1).
    double next() noexcept {
        state_ ^= state_ << 13;
        state_ ^= state_ >> 17;
        state_ ^= state_ << 5;
        return static_cast<double>(state_) / 4294967296.0;
    }

    [[nodiscard]] uint32_t state() const noexcept { return state_; }

private:
    uint32_t state_;
};

/// Standard normal draw via the Box-Muller transform (consumes two uniforms).
double boxMuller(Xorshift32& rng) noexcept;

/// Per-call seed: MurmurHash3 fmix32 applied to (base ^ counter).
///
/// The orchestrator mixes its configured seed with the current round so
/// that successive pair selections get decorrelated but reproducible
/// streams.
[[nodiscard]] uint32_t deriveSeed(uint32_t base, uint32_t counter) noexcept;

} // namespace arank::math
