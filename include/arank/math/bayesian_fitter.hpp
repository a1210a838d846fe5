#pragma once

/// @file bayesian_fitter.hpp
/// @brief MAP strength estimation with Laplace uncertainty for the
///        Bradley-Terry model.

#include <cstddef>

#include "arank/foundation/rank_result.hpp"
#include "arank/math/types.hpp"

namespace arank::math {

/// Newton iteration cap; reaching it is not an error.
inline constexpr int kNewtonMaxIterations = 50;

/// Max-norm step size below which Newton is considered converged.
inline constexpr double kNewtonTolerance = 1e-8;

/// Refit result with solver diagnostics.
struct RefitReport {
    StrengthEstimate estimate;
    int iterations = 0;       ///< Newton steps taken (0 for empty history).
    bool converged = true;    ///< False only when the iteration cap was hit.
};

/// Full Bayesian refit of all n strengths from the complete history.
///
/// Maximizes
///   sum_{(w,l)} log sigmoid(mu_w - mu_l) - sum_i mu_i^2 / (2 v)
/// with mu[0] pinned at 0, by Newton-Raphson on the n-1 free parameters.
/// The Hessian is dense, re-factored by Cholesky every iteration. After
/// convergence sigma comes from the diagonal of the inverse Hessian
/// (Laplace approximation); sigma[0] is reported as 0.
///
/// An empty history returns mu = 0 and sigma = sqrt(v) for every index,
/// index 0 included.
///
/// @return InvalidArgument for n == 0, v <= 0 or a malformed history entry;
///         NumericalFailure if a Hessian is not positive-definite.
foundation::RankResult<StrengthEstimate> bayesianRefit(
    const ComparisonHistory& history, std::size_t n, double priorVariance);

/// Same as bayesianRefit(), also reporting Newton diagnostics.
foundation::RankResult<RefitReport> bayesianRefitWithReport(
    const ComparisonHistory& history, std::size_t n, double priorVariance);

} // namespace arank::math
