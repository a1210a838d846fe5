#pragma once

/// @file stopping_policy.hpp
/// @brief Confidence and stability stopping rules plus the remaining-rounds
///        forecaster.
///
/// The hard comparison cap is evaluated by the orchestrator, which owns the
/// round counter.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "arank/math/types.hpp"

namespace arank::math {

/// Indices sorted by value descending; ties keep index order.
[[nodiscard]] std::vector<std::size_t> argsortDescending(const std::vector<double>& values);

/// The top-K set as ascending indices.
[[nodiscard]] std::vector<std::size_t> topKSet(const std::vector<double>& mu, std::size_t k);

/// Weakest member of the top-K set against the strongest outsider.
struct BindingConstraint {
    std::size_t weakestIndex = 0;
    double weakestLcb = 0.0;
    std::size_t strongestIndex = 0;
    double strongestUcb = 0.0;
};

/// @return nullopt when k >= n (there are no outsiders).
[[nodiscard]] std::optional<BindingConstraint> findBindingConstraint(
    const StrengthEstimate& belief, std::size_t k, double z);

/// True when the weakest top-K lower bound clears the strongest outsider's
/// upper bound by more than @p threshold, or when k >= n.
[[nodiscard]] bool checkConfidenceStop(const StrengthEstimate& belief, std::size_t k,
                                       double z, double threshold);

struct StabilityCheck {
    bool stopped = false;
    std::vector<std::size_t> topK;  ///< Ascending indices.
    std::size_t stableCount = 0;
};

/// Compare the current top-K set with the previous round's.
///
/// A match increments @p stableCount, any difference (or a missing
/// predecessor) resets it to 0. Stops once the count reaches @p window.
[[nodiscard]] StabilityCheck checkStabilityStop(
    const std::vector<double>& mu, std::size_t k,
    const std::optional<std::vector<std::size_t>>& previousTopK,
    std::size_t stableCount, std::size_t window);

/// Forecast of rounds until the stability stop fires; low <= mid <= high.
struct RemainingEstimate {
    double low = 0.0;
    double mid = 0.0;
    double high = 0.0;

    bool operator==(const RemainingEstimate&) const = default;
};

/// Flip-rate window used by the forecaster.
inline constexpr std::size_t kForecastWindow = 15;

/// Expected rounds to observe @p needed consecutive non-flips when each
/// round flips with probability @p flipProbability.
[[nodiscard]] double expectedRoundsToStability(double flipProbability, int64_t needed) noexcept;

/// Geometric waiting-time forecast from the recent flip rate.
///
/// @param maxRemaining Optional budget cap; negative values clamp to 0 and a
///        zero cap always yields {0, 0, 0}.
/// @return nullopt with fewer than @p window flips recorded, or when the
///         interval is too wide to be informative.
[[nodiscard]] std::optional<RemainingEstimate> estimateStabilityStop(
    const std::vector<bool>& flipHistory, std::size_t stableCount, std::size_t window,
    std::optional<int64_t> maxRemaining = std::nullopt);

} // namespace arank::math
