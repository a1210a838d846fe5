/// @file pair_selector.cpp
/// @brief Exhaustive information-gain pair selection.

#include "arank/math/pair_selector.hpp"

#include <limits>
#include <string>

#include "arank/foundation/rank_logger.hpp"
#include "arank/math/bayesian_fitter.hpp"
#include "arank/math/preference_model.hpp"

namespace arank::math {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::RankError;
using foundation::RankResult;

namespace {

/// Scores one hypothetical outcome; @p scratch holds history plus one slot.
RankResult<double> outcomeEntropy(ComparisonHistory& scratch, WinLoss outcome,
                                  const SelectionParams& params,
                                  const UncertaintyEstimator& estimator,
                                  Xorshift32& rng) {
    scratch.back() = outcome;
    auto refit = bayesianRefit(scratch, params.n, params.priorVariance);
    if (!refit) {
        return RankResult<double>::err(refit.error());
    }
    return RankResult<double>::ok(estimator.topKEntropy(refit.value(), params.k, rng));
}

RankResult<double> gainWithScratch(std::size_t i, std::size_t j,
                                   const StrengthEstimate& belief,
                                   ComparisonHistory& scratch,
                                   const SelectionParams& params,
                                   const UncertaintyEstimator& estimator,
                                   Xorshift32& rng) {
    const double pIWins = winProbability(belief.mu[i], belief.mu[j]);
    const double pJWins = 1.0 - pIWins;

    auto hI = outcomeEntropy(scratch, WinLoss{i, j}, params, estimator, rng);
    if (!hI) {
        return hI;
    }
    auto hJ = outcomeEntropy(scratch, WinLoss{j, i}, params, estimator, rng);
    if (!hJ) {
        return hJ;
    }
    return RankResult<double>::ok(-(pIWins * hI.value() + pJWins * hJ.value()));
}

RankResult<void> validate(const StrengthEstimate& belief, const SelectionParams& params) {
    if (params.n < 2) {
        return RankResult<void>::err(
            RankError(ErrorCode::InvalidArgument, "pair selection needs at least two items"));
    }
    if (params.k == 0) {
        return RankResult<void>::err(
            RankError(ErrorCode::InvalidArgument, "k must be positive"));
    }
    if (!(params.recencyDiscount > 0.0) || params.recencyDiscount > 1.0) {
        return RankResult<void>::err(
            RankError(ErrorCode::InvalidArgument, "recency discount must be in (0, 1]"));
    }
    if (belief.mu.size() != params.n || belief.sigma.size() != params.n) {
        return RankResult<void>::err(
            RankError(ErrorCode::InvalidArgument, "belief size does not match item count"));
    }
    return RankResult<void>::ok();
}

} // namespace

RankResult<double> computeInformationGain(
    std::size_t i, std::size_t j,
    const StrengthEstimate& belief, const ComparisonHistory& history,
    const SelectionParams& params, const UncertaintyEstimator& estimator,
    Xorshift32& rng) {
    auto valid = validate(belief, params);
    if (!valid) {
        return RankResult<double>::err(valid.error());
    }
    if (i >= params.n || j >= params.n || i == j) {
        return RankResult<double>::err(
            RankError(ErrorCode::InvalidArgument, "candidate pair out of range"));
    }

    ComparisonHistory scratch(history);
    scratch.emplace_back();
    return gainWithScratch(i, j, belief, scratch, params, estimator, rng);
}

RankResult<IndexPair> selectPair(
    const StrengthEstimate& belief, const ComparisonHistory& history,
    const SelectionParams& params, const UncertaintyEstimator& estimator,
    Xorshift32& rng) {
    auto valid = validate(belief, params);
    if (!valid) {
        return RankResult<IndexPair>::err(valid.error());
    }

    const bool discount = !history.empty() && params.recencyDiscount < 1.0;
    const WinLoss last = history.empty() ? WinLoss{} : history.back();
    auto recent = [&](std::size_t idx) {
        return idx == last.winner || idx == last.loser;
    };

    ComparisonHistory scratch(history);
    scratch.emplace_back();

    IndexPair best{0, 1};
    double bestGain = -std::numeric_limits<double>::infinity();

    for (std::size_t i = 0; i < params.n; ++i) {
        for (std::size_t j = i + 1; j < params.n; ++j) {
            auto gain = gainWithScratch(i, j, belief, scratch, params, estimator, rng);
            if (!gain) {
                return RankResult<IndexPair>::err(gain.error());
            }
            double g = gain.value();
            if (discount) {
                if (recent(i)) {
                    g /= params.recencyDiscount;
                }
                if (recent(j)) {
                    g /= params.recencyDiscount;
                }
            }
            if (g > bestGain) {
                bestGain = g;
                best = IndexPair{i, j};
            }
        }
    }

    ARANK_LOG_DEBUG(LogCategory::Selector,
        "selected (" + std::to_string(best.first) + ", " + std::to_string(best.second) +
        ") gain " + std::to_string(bestGain) + " over " +
        std::to_string(params.n * (params.n - 1) / 2) + " pairs");

    return RankResult<IndexPair>::ok(best);
}

} // namespace arank::math
