#pragma once

/// @file types.hpp
/// @brief Value types shared by the statistical engine and the orchestrator.

#include <cstddef>
#include <vector>

namespace arank::math {

/// One observed comparison, in item indices.
struct WinLoss {
    std::size_t winner = 0;
    std::size_t loser = 0;

    bool operator==(const WinLoss&) const = default;
};

/// Append-only comparison log; its length is the session round.
using ComparisonHistory = std::vector<WinLoss>;

/// Unordered candidate pair, always first < second.
struct IndexPair {
    std::size_t first = 0;
    std::size_t second = 0;

    bool operator==(const IndexPair&) const = default;
};

/// Posterior summary: MAP strengths and marginal standard deviations.
///
/// Both vectors have one entry per item. mu[0] is pinned at 0.
struct StrengthEstimate {
    std::vector<double> mu;
    std::vector<double> sigma;

    [[nodiscard]] std::size_t size() const noexcept { return mu.size(); }

    bool operator==(const StrengthEstimate&) const = default;
};

} // namespace arank::math
