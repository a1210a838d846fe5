/// @file stopping_policy.cpp
/// @brief Stopping rules and the remaining-rounds forecaster.

#include "arank/math/stopping_policy.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace arank::math {

// ---------------------------------------------------------------------------
// Ordering helpers
// ---------------------------------------------------------------------------

std::vector<std::size_t> argsortDescending(const std::vector<double>& values) {
    std::vector<std::size_t> order(values.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        return values[a] > values[b];
    });
    return order;
}

std::vector<std::size_t> topKSet(const std::vector<double>& mu, std::size_t k) {
    auto order = argsortDescending(mu);
    order.resize(std::min(k, order.size()));
    std::sort(order.begin(), order.end());
    return order;
}

// ---------------------------------------------------------------------------
// Confidence stop
// ---------------------------------------------------------------------------

std::optional<BindingConstraint> findBindingConstraint(
    const StrengthEstimate& belief, std::size_t k, double z) {
    const auto order = argsortDescending(belief.mu);
    if (k >= order.size()) {
        return std::nullopt;
    }

    auto lcb = [&](std::size_t i) { return belief.mu[i] - z * belief.sigma[i]; };
    auto ucb = [&](std::size_t i) { return belief.mu[i] + z * belief.sigma[i]; };

    BindingConstraint c;
    c.weakestIndex = order[0];
    c.weakestLcb = lcb(order[0]);
    for (std::size_t r = 1; r < k; ++r) {
        if (lcb(order[r]) < c.weakestLcb) {
            c.weakestLcb = lcb(order[r]);
            c.weakestIndex = order[r];
        }
    }

    c.strongestIndex = order[k];
    c.strongestUcb = ucb(order[k]);
    for (std::size_t r = k + 1; r < order.size(); ++r) {
        if (ucb(order[r]) > c.strongestUcb) {
            c.strongestUcb = ucb(order[r]);
            c.strongestIndex = order[r];
        }
    }
    return c;
}

bool checkConfidenceStop(const StrengthEstimate& belief, std::size_t k,
                         double z, double threshold) {
    auto constraint = findBindingConstraint(belief, k, z);
    if (!constraint) {
        return true;
    }
    return constraint->weakestLcb - constraint->strongestUcb > threshold;
}

// ---------------------------------------------------------------------------
// Stability stop
// ---------------------------------------------------------------------------

StabilityCheck checkStabilityStop(
    const std::vector<double>& mu, std::size_t k,
    const std::optional<std::vector<std::size_t>>& previousTopK,
    std::size_t stableCount, std::size_t window) {
    StabilityCheck check;
    check.topK = topKSet(mu, k);

    const bool same = previousTopK.has_value() && *previousTopK == check.topK;
    check.stableCount = same ? stableCount + 1 : 0;
    check.stopped = check.stableCount >= window;
    return check;
}

// ---------------------------------------------------------------------------
// Forecaster
// ---------------------------------------------------------------------------

double expectedRoundsToStability(double flipProbability, int64_t needed) noexcept {
    if (needed <= 0) {
        return 0.0;
    }
    if (flipProbability < 0.01) {
        return static_cast<double>(needed);
    }
    const double invQ = 1.0 / (1.0 - flipProbability);
    return invQ * (std::pow(invQ, static_cast<double>(needed)) - 1.0) / (invQ - 1.0);
}

std::optional<RemainingEstimate> estimateStabilityStop(
    const std::vector<bool>& flipHistory, std::size_t stableCount, std::size_t window,
    std::optional<int64_t> maxRemaining) {
    std::optional<double> cap;
    if (maxRemaining) {
        cap = static_cast<double>(std::max<int64_t>(0, *maxRemaining));
        if (*cap == 0.0) {
            return RemainingEstimate{0.0, 0.0, 0.0};
        }
    }

    if (flipHistory.size() < window) {
        return std::nullopt;
    }

    const int64_t needed = static_cast<int64_t>(window) - static_cast<int64_t>(stableCount);

    const std::size_t recent = std::min(kForecastWindow, flipHistory.size());
    const auto flips = std::count(flipHistory.end() - static_cast<std::ptrdiff_t>(recent),
                                  flipHistory.end(), true);
    const double denom = static_cast<double>(recent) + 1.0;
    const double p = (static_cast<double>(flips) + 0.5) / denom;

    const double se = 0.675 * std::sqrt(p * (1.0 - p) / denom);
    const double pLow = std::max(0.0, p - se);
    const double pHigh = std::min(0.99, p + se);

    RemainingEstimate est{
        .low = expectedRoundsToStability(pLow, needed),
        .mid = expectedRoundsToStability(p, needed),
        .high = expectedRoundsToStability(pHigh, needed),
    };
    if (cap) {
        est.low = std::min(est.low, *cap);
        est.mid = std::min(est.mid, *cap);
        est.high = std::min(est.high, *cap);
    }

    if (est.high > 3.0 * est.low && est.high - est.low > static_cast<double>(window)) {
        return std::nullopt;
    }
    return est;
}

} // namespace arank::math
