#pragma once

/// @file preference_model.hpp
/// @brief Bradley-Terry preference model.

#include <cmath>

namespace arank::math {

/// Logistic link: P(win) for a strength difference @p x.
///
/// Strictly increasing, sigmoid(0) == 0.5, sigmoid(x) + sigmoid(-x) == 1.
[[nodiscard]] inline double sigmoid(double x) noexcept {
    return 1.0 / (1.0 + std::exp(-x));
}

/// Probability that an item of strength @p muI beats one of strength @p muJ.
[[nodiscard]] inline double winProbability(double muI, double muJ) noexcept {
    return sigmoid(muI - muJ);
}

} // namespace arank::math
