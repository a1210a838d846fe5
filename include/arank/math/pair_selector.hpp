#pragma once

/// @file pair_selector.hpp
/// @brief Information-gain search for the next comparison.

#include <cstddef>

#include "arank/foundation/rank_result.hpp"
#include "arank/math/random.hpp"
#include "arank/math/types.hpp"
#include "arank/math/uncertainty_estimator.hpp"

namespace arank::math {

/// Parameters shared by every candidate evaluation of one selection.
struct SelectionParams {
    std::size_t k = 1;              ///< Size of the top set.
    std::size_t n = 0;              ///< Item count.
    double priorVariance = 1.0;     ///< Prior variance for refits.
    double recencyDiscount = 1.0;   ///< In (0, 1]; 1 disables the discount.
};

/// Negative expected posterior top-K entropy of comparing @p i with @p j.
///
/// Both outcomes are simulated by appending them to @p history and
/// refitting from scratch; each result is scored by @p estimator.
/// Higher is better.
foundation::RankResult<double> computeInformationGain(
    std::size_t i, std::size_t j,
    const StrengthEstimate& belief, const ComparisonHistory& history,
    const SelectionParams& params, const UncertaintyEstimator& estimator,
    Xorshift32& rng);

/// Exhaustive search over all pairs i < j for the maximal gain.
///
/// Pairs sharing an item with the most recent comparison have their gain
/// divided by recencyDiscount once per shared item (gains are negative, so
/// this makes them less attractive). Ties keep the first pair in (i, j)
/// order. One generator is threaded through all candidates in that order.
///
/// @return InvalidArgument for n < 2, k == 0, a discount outside (0, 1] or
///         a belief of the wrong size; any refit error is propagated.
foundation::RankResult<IndexPair> selectPair(
    const StrengthEstimate& belief, const ComparisonHistory& history,
    const SelectionParams& params, const UncertaintyEstimator& estimator,
    Xorshift32& rng);

} // namespace arank::math
