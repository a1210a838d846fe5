#pragma once

/// @file ranking_types.hpp
/// @brief Configuration and outcome types for ranking sessions.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "arank/foundation/rank_result.hpp"
#include "arank/math/uncertainty_estimator.hpp"

namespace arank::service {

/// Immutable per-session ranking options.
struct RankingConfig {
    std::size_t k = 5;                         ///< Size of the top set.
    double z = 1.96;                           ///< Confidence z-score.
    std::size_t stabilityWindow = 10;          ///< Stable rounds needed to stop.
    std::size_t maxComparisons = 80;           ///< Hard comparison cap.
    double priorVariance = 1.0;                ///< Gaussian prior variance.
    double confidenceThreshold = 0.0;          ///< Minimum LCB/UCB gap.
    math::EstimatorKind estimator = math::EstimatorKind::Quadrature;
    std::size_t quadratureOrder = 7;           ///< Gauss-Hermite points.
    std::size_t monteCarloSamples = 500;       ///< Samples per entropy estimate.
    double recencyDiscount = 0.5;              ///< In (0, 1]; 1 disables it.
    uint32_t seed = 0;                         ///< Base PRNG seed.
    bool noCache = false;                      ///< Bypass backend caches.
    bool speculate = true;                     ///< Precompute both outcomes.

    /// Sample count or quadrature order, depending on the estimator.
    [[nodiscard]] std::size_t precision() const noexcept {
        return estimator == math::EstimatorKind::MonteCarlo ? monteCarloSamples
                                                            : quadratureOrder;
    }
};

/// @return Success, or InvalidArgument naming the offending option.
foundation::RankResult<void> validateConfig(const RankingConfig& config);

/// Which stopping rule ended the session.
enum class StopReason : uint8_t {
    Confidence,
    Stability,
    MaxComparisons
};

constexpr std::string_view stopReasonName(StopReason reason) {
    switch (reason) {
        case StopReason::Confidence:     return "confidence";
        case StopReason::Stability:      return "stability";
        case StopReason::MaxComparisons: return "max-comparisons";
    }
    return "unknown";
}

/// Result of a committed comparison.
struct RecordOutcome {
    bool stopped = false;
    std::optional<StopReason> stopReason;
};

/// Counters for speculative precomputation.
struct SpeculationStats {
    uint64_t issued = 0;     ///< Speculative requests posted.
    uint64_t completed = 0;  ///< Results stored under the current generation.
    uint64_t discarded = 0;  ///< Results dropped as stale or failed.
};

} // namespace arank::service
