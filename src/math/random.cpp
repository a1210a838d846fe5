/// @file random.cpp
/// @brief Box-Muller sampling and seed derivation.

#include "arank/math/random.hpp"

#include <cmath>
#include <numbers>

namespace arank::math {

double boxMuller(Xorshift32& rng) noexcept {
    double u1 = rng.next();
    double u2 = rng.next();
    return std::sqrt(-2.0 * std::log(u1)) * std::cos(2.0 * std::numbers::pi * u2);
}

uint32_t deriveSeed(uint32_t base, uint32_t counter) noexcept {
    uint32_t h = base ^ counter;
    h = (h ^ (h >> 16)) * 0x85ebca6bu;
    h = (h ^ (h >> 13)) * 0xc2b2ae35u;
    h ^= h >> 16;
    return h;
}

} // namespace arank::math
