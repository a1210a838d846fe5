#pragma once

/// @file uncertainty_estimator.hpp
/// @brief Estimators of how uncertain the identity of the top-K set still is.
///
/// Two interchangeable strategies share one interface:
///   - QuadratureEstimator: Gauss-Hermite marginals + Poisson-binomial
///     tail, summed binary entropies. Default for interactive use.
///   - MonteCarloEstimator: entropy of the empirical top-K set
///     distribution. Reference used to validate the surrogate.
///
/// The surrogate upper-bounds the set entropy (subadditivity) but does not
/// always rank candidate pairs the same way as the reference.

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <utility>
#include <optional>

#include "arank/foundation/rank_result.hpp"
#include "arank/math/gauss_hermite.hpp"
#include "arank/math/random.hpp"
#include "arank/math/types.hpp"

namespace arank::math {

enum class EstimatorKind : uint8_t {
    Quadrature = 0,
    MonteCarlo = 1
};

constexpr std::string_view estimatorKindName(EstimatorKind kind) {
    switch (kind) {
        case EstimatorKind::Quadrature: return "quadrature";
        case EstimatorKind::MonteCarlo: return "monte_carlo";
    }
    return "unknown";
}

std::optional<EstimatorKind> parseEstimatorKind(std::string_view name);

/// Binary entropy in nats; 0 at p = 0 and p = 1.
[[nodiscard]] double binaryEntropy(double p) noexcept;

/// Scores the remaining uncertainty about top-K membership.
class UncertaintyEstimator {
public:
    virtual ~UncertaintyEstimator() = default;

    /// Entropy-like score in nats for the top-@p k set under @p belief.
    /// Deterministic given the generator state; estimators that do not
    /// sample leave @p rng untouched.
    [[nodiscard]] virtual double topKEntropy(const StrengthEstimate& belief,
                                             std::size_t k,
                                             Xorshift32& rng) const = 0;

    [[nodiscard]] virtual EstimatorKind kind() const noexcept = 0;

    /// Sample count or quadrature order.
    [[nodiscard]] virtual std::size_t precision() const noexcept = 0;
};

/// Reference estimator: Shannon entropy of sampled top-K sets.
class MonteCarloEstimator final : public UncertaintyEstimator {
public:
    explicit MonteCarloEstimator(std::size_t samples) : samples_(samples) {}

    [[nodiscard]] double topKEntropy(const StrengthEstimate& belief, std::size_t k,
                                     Xorshift32& rng) const override;

    [[nodiscard]] EstimatorKind kind() const noexcept override {
        return EstimatorKind::MonteCarlo;
    }
    [[nodiscard]] std::size_t precision() const noexcept override { return samples_; }

private:
    std::size_t samples_;
};

/// Fast surrogate: sum over items of the binary entropy of P(item in top-K).
class QuadratureEstimator final : public UncertaintyEstimator {
public:
    explicit QuadratureEstimator(GaussHermiteRule rule) : rule_(std::move(rule)) {}

    [[nodiscard]] double topKEntropy(const StrengthEstimate& belief, std::size_t k,
                                     Xorshift32& rng) const override;

    /// P(item in top-K) for every item.
    [[nodiscard]] std::vector<double> membershipProbabilities(
        const StrengthEstimate& belief, std::size_t k) const;

    [[nodiscard]] EstimatorKind kind() const noexcept override {
        return EstimatorKind::Quadrature;
    }
    [[nodiscard]] std::size_t precision() const noexcept override {
        return rule_.order();
    }

private:
    GaussHermiteRule rule_;
};

/// Build an estimator from configuration.
/// @param precision Sample count (Monte Carlo) or quadrature order.
/// @return InvalidArgument for a zero precision or unsupported order.
foundation::RankResult<std::shared_ptr<const UncertaintyEstimator>> makeEstimator(
    EstimatorKind kind, std::size_t precision);

} // namespace arank::math
