/// @file uncertainty_estimator.cpp
/// @brief Monte Carlo and Gauss-Hermite top-K entropy estimators.

#include "arank/math/uncertainty_estimator.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <numbers>
#include <numeric>
#include <vector>

namespace arank::math {

using foundation::ErrorCode;
using foundation::RankError;
using foundation::RankResult;

namespace {

/// Below this a posterior is treated as a point mass.
constexpr double kDegenerateSigma = 1e-12;

/// P(score of item j > x) for score ~ Normal(mu, sigma).
double exceedProbability(double x, double mu, double sigma) {
    if (sigma < kDegenerateSigma) {
        return mu > x ? 1.0 : 0.0;
    }
    return 0.5 * std::erfc((x - mu) / (sigma * std::numbers::sqrt2));
}

} // namespace

std::optional<EstimatorKind> parseEstimatorKind(std::string_view name) {
    if (name == "quadrature") return EstimatorKind::Quadrature;
    if (name == "monte_carlo" || name == "monte-carlo") return EstimatorKind::MonteCarlo;
    return std::nullopt;
}

double binaryEntropy(double p) noexcept {
    if (p <= 0.0 || p >= 1.0) {
        return 0.0;
    }
    return -p * std::log(p) - (1.0 - p) * std::log(1.0 - p);
}

// ---------------------------------------------------------------------------
// MonteCarloEstimator
// ---------------------------------------------------------------------------

double MonteCarloEstimator::topKEntropy(const StrengthEstimate& belief,
                                        std::size_t k, Xorshift32& rng) const {
    const std::size_t n = belief.size();
    if (samples_ == 0 || n == 0) {
        return 0.0;
    }
    const std::size_t take = std::min(k, n);

    std::map<std::vector<std::size_t>, std::size_t> setCounts;
    std::vector<double> sampled(n);
    std::vector<std::size_t> indices(n);
    std::vector<std::size_t> topSet(take);

    for (std::size_t s = 0; s < samples_; ++s) {
        for (std::size_t i = 0; i < n; ++i) {
            sampled[i] = belief.mu[i] + belief.sigma[i] * boxMuller(rng);
        }

        std::iota(indices.begin(), indices.end(), std::size_t{0});
        std::stable_sort(indices.begin(), indices.end(),
                         [&](std::size_t a, std::size_t b) { return sampled[a] > sampled[b]; });

        // Canonical key: the top-K indices in ascending order.
        std::copy_n(indices.begin(), take, topSet.begin());
        std::sort(topSet.begin(), topSet.end());
        ++setCounts[topSet];
    }

    double entropy = 0.0;
    const auto total = static_cast<double>(samples_);
    for (const auto& [set, count] : setCounts) {
        double p = static_cast<double>(count) / total;
        entropy -= p * std::log(p);
    }
    return entropy;
}

// ---------------------------------------------------------------------------
// QuadratureEstimator
// ---------------------------------------------------------------------------

std::vector<double> QuadratureEstimator::membershipProbabilities(
    const StrengthEstimate& belief, std::size_t k) const {
    const std::size_t n = belief.size();
    std::vector<double> membership(n, 1.0);
    if (k >= n) {
        return membership;
    }
    if (k == 0) {
        std::fill(membership.begin(), membership.end(), 0.0);
        return membership;
    }

    // tail[c] = P(exactly c of the other items exceed x), c < k.
    std::vector<double> tail(k, 0.0);

    for (std::size_t i = 0; i < n; ++i) {
        double acc = 0.0;
        for (std::size_t q = 0; q < rule_.order(); ++q) {
            double x = belief.mu[i] + std::numbers::sqrt2 * belief.sigma[i] * rule_.nodes[q];

            std::fill(tail.begin(), tail.end(), 0.0);
            tail[0] = 1.0;
            for (std::size_t j = 0; j < n; ++j) {
                if (j == i) {
                    continue;
                }
                double pj = exceedProbability(x, belief.mu[j], belief.sigma[j]);
                // Mass pushed past index k-1 is dropped: those outcomes
                // already put item i out of the top-K.
                for (std::size_t c = k - 1; c > 0; --c) {
                    tail[c] = tail[c] * (1.0 - pj) + tail[c - 1] * pj;
                }
                tail[0] *= 1.0 - pj;
            }

            double atMostKMinusOne = std::accumulate(tail.begin(), tail.end(), 0.0);
            acc += rule_.weights[q] * atMostKMinusOne;
        }
        membership[i] = std::clamp(acc / std::sqrt(std::numbers::pi), 0.0, 1.0);
    }
    return membership;
}

double QuadratureEstimator::topKEntropy(const StrengthEstimate& belief,
                                        std::size_t k, Xorshift32& /*rng*/) const {
    double entropy = 0.0;
    for (double p : membershipProbabilities(belief, k)) {
        entropy += binaryEntropy(p);
    }
    return entropy;
}

// ---------------------------------------------------------------------------
// makeEstimator()
// ---------------------------------------------------------------------------

RankResult<std::shared_ptr<const UncertaintyEstimator>> makeEstimator(
    EstimatorKind kind, std::size_t precision) {
    using Ptr = std::shared_ptr<const UncertaintyEstimator>;
    if (precision == 0) {
        return RankResult<Ptr>::err(
            RankError(ErrorCode::InvalidArgument, "estimator precision must be positive"));
    }

    switch (kind) {
        case EstimatorKind::MonteCarlo:
            return RankResult<Ptr>::ok(std::make_shared<MonteCarloEstimator>(precision));
        case EstimatorKind::Quadrature: {
            auto rule = GaussHermiteRule::create(precision);
            if (!rule) {
                return RankResult<Ptr>::err(rule.error());
            }
            return RankResult<Ptr>::ok(
                std::make_shared<QuadratureEstimator>(std::move(rule).value()));
        }
    }
    return RankResult<Ptr>::err(
        RankError(ErrorCode::InvalidArgument, "unknown estimator kind"));
}

} // namespace arank::math
