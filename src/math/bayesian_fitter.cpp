/// @file bayesian_fitter.cpp
/// @brief Newton-Raphson MAP fit and Laplace uncertainty.

#include "arank/math/bayesian_fitter.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

#include "arank/foundation/rank_logger.hpp"
#include "arank/math/cholesky.hpp"
#include "arank/math/preference_model.hpp"

namespace arank::math {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::RankError;
using foundation::RankResult;

namespace {

/// Hessian of the negative log-posterior over the free parameters
/// (indices 1..n-1 mapped to 0..m-1), optionally with its gradient.
void accumulateCurvature(const ComparisonHistory& history,
                         const std::vector<double>& mu,
                         double priorVariance,
                         DenseMatrix& hess,
                         DenseVector* grad) {
    const auto m = hess.rows();
    hess.setZero();
    hess.diagonal().setConstant(1.0 / priorVariance);
    if (grad != nullptr) {
        for (Eigen::Index i = 0; i < m; ++i) {
            (*grad)(i) = mu[static_cast<std::size_t>(i) + 1] / priorVariance;
        }
    }

    for (const auto& [winner, loser] : history) {
        double p = sigmoid(mu[winner] - mu[loser]);
        double pq = p * (1.0 - p);

        // Item 0 is pinned and has no free parameter.
        bool hasW = winner != 0;
        bool hasL = loser != 0;
        auto wi = static_cast<Eigen::Index>(hasW ? winner - 1 : 0);
        auto li = static_cast<Eigen::Index>(hasL ? loser - 1 : 0);

        if (grad != nullptr) {
            if (hasW) {
                (*grad)(wi) -= 1.0 - p;
            }
            if (hasL) {
                (*grad)(li) += 1.0 - p;
            }
        }
        if (hasW) {
            hess(wi, wi) += pq;
        }
        if (hasL) {
            hess(li, li) += pq;
        }
        if (hasW && hasL) {
            hess(wi, li) -= pq;
            hess(li, wi) -= pq;
        }
    }
}

RankResult<void> validateInputs(const ComparisonHistory& history,
                                std::size_t n, double priorVariance) {
    if (n == 0) {
        return RankResult<void>::err(
            RankError(ErrorCode::InvalidArgument, "item count must be positive"));
    }
    if (!(priorVariance > 0.0) || !std::isfinite(priorVariance)) {
        return RankResult<void>::err(
            RankError(ErrorCode::InvalidArgument, "prior variance must be positive"));
    }
    for (std::size_t r = 0; r < history.size(); ++r) {
        const auto& entry = history[r];
        if (entry.winner >= n || entry.loser >= n || entry.winner == entry.loser) {
            return RankResult<void>::err(
                RankError(ErrorCode::InvalidArgument,
                          "malformed comparison at position " + std::to_string(r),
                          entry));
        }
    }
    return RankResult<void>::ok();
}

} // namespace

RankResult<RefitReport> bayesianRefitWithReport(
    const ComparisonHistory& history, std::size_t n, double priorVariance) {
    auto valid = validateInputs(history, n, priorVariance);
    if (!valid) {
        return RankResult<RefitReport>::err(valid.error());
    }

    RefitReport report;
    report.estimate.mu.assign(n, 0.0);
    report.estimate.sigma.assign(n, 0.0);

    if (history.empty()) {
        std::fill(report.estimate.sigma.begin(), report.estimate.sigma.end(),
                  std::sqrt(priorVariance));
        return RankResult<RefitReport>::ok(std::move(report));
    }

    auto& mu = report.estimate.mu;
    const auto m = static_cast<Eigen::Index>(n - 1);
    DenseVector grad = DenseVector::Zero(m);
    DenseMatrix hess = DenseMatrix::Zero(m, m);

    report.converged = false;
    for (int iter = 0; iter < kNewtonMaxIterations; ++iter) {
        accumulateCurvature(history, mu, priorVariance, hess, &grad);

        auto factored = choleskyDecompose(hess);
        if (!factored) {
            return RankResult<RefitReport>::err(factored.error());
        }
        DenseVector delta = choleskySolve(factored.value(), grad);

        for (Eigen::Index i = 0; i < m; ++i) {
            mu[static_cast<std::size_t>(i) + 1] -= delta(i);
        }
        const double maxDelta = delta.cwiseAbs().maxCoeff();
        report.iterations = iter + 1;

        if (maxDelta < kNewtonTolerance) {
            report.converged = true;
            break;
        }
    }

    if (!report.converged) {
        ARANK_LOG_DEBUG(LogCategory::Fitter,
            "Newton cap reached after " + std::to_string(kNewtonMaxIterations) +
            " iterations (history " + std::to_string(history.size()) + ")");
    }

    // Laplace: curvature at the final point, then its inverse diagonal.
    accumulateCurvature(history, mu, priorVariance, hess, nullptr);
    auto factored = choleskyDecompose(hess);
    if (!factored) {
        return RankResult<RefitReport>::err(factored.error());
    }
    const DenseVector inverseDiag = choleskyInverseDiagonal(factored.value());

    auto& sigma = report.estimate.sigma;
    sigma[0] = 0.0;
    for (Eigen::Index i = 0; i < m; ++i) {
        sigma[static_cast<std::size_t>(i) + 1] = std::sqrt(std::max(0.0, inverseDiag(i)));
    }

    return RankResult<RefitReport>::ok(std::move(report));
}

RankResult<StrengthEstimate> bayesianRefit(
    const ComparisonHistory& history, std::size_t n, double priorVariance) {
    auto report = bayesianRefitWithReport(history, n, priorVariance);
    if (!report) {
        return RankResult<StrengthEstimate>::err(report.error());
    }
    return RankResult<StrengthEstimate>::ok(std::move(report).value().estimate);
}

} // namespace arank::math
