/// @file backend_engine.cpp
/// @brief BackendEngine request dispatch and cache keys.

#include "arank/service/backend_engine.hpp"

#include <exception>
#include <iomanip>
#include <sstream>
#include <string>

#include "arank/foundation/rank_logger.hpp"
#include "arank/math/bayesian_fitter.hpp"
#include "arank/math/pair_selector.hpp"
#include "arank/math/random.hpp"

namespace arank::service {

using foundation::LogCategory;
using foundation::RankResult;

// ── Cache keys ──────────────────────────────────────────────────────────────

namespace {

void appendHistoryKey(std::ostringstream& os, std::size_t n, double priorVariance,
                      const math::ComparisonHistory& history) {
    os << n << '|' << priorVariance;
    for (const auto& c : history) {
        os << '|' << c.winner << ',' << c.loser;
    }
}

} // namespace

std::string refitCacheKey(const RefitRequest& request) {
    std::ostringstream os;
    os << std::setprecision(17);
    appendHistoryKey(os, request.n, request.priorVariance, request.history);
    return os.str();
}

std::string selectionCacheKey(const SelectPairRequest& request) {
    std::ostringstream os;
    os << std::setprecision(17);
    os << request.k << '|' << request.recencyDiscount << '|'
       << math::estimatorKindName(request.estimator) << '|' << request.precision << '|'
       << request.seed << '|';
    appendHistoryKey(os, request.n, request.priorVariance, request.history);
    os << "|mu";
    for (double m : request.mu) {
        os << ',' << m;
    }
    os << "|sigma";
    for (double s : request.sigma) {
        os << ',' << s;
    }
    return os.str();
}

// ── Construction ────────────────────────────────────────────────────────────

BackendEngine::BackendEngine(CacheConfig cacheConfig)
    : refitCache_(std::make_shared<RefitCache>(cacheConfig)),
      selectionCache_(std::make_shared<SelectionCache>(cacheConfig)) {}

BackendEngine::BackendEngine(std::shared_ptr<RefitCache> refitCache,
                             std::shared_ptr<SelectionCache> selectionCache)
    : refitCache_(std::move(refitCache)),
      selectionCache_(std::move(selectionCache)) {}

// ── Dispatch ────────────────────────────────────────────────────────────────

RankResult<BackendResponse> BackendEngine::handle(const BackendRequest& request) {
    // Every accepted request must be answered, so a throwing computation
    // becomes an error response instead of escaping into the worker.
    try {
        if (const auto* refit = std::get_if<RefitRequest>(&request)) {
            return handleRefit(*refit);
        }
        return handleSelect(std::get<SelectPairRequest>(request));
    } catch (const std::exception& e) {
        ARANK_LOG_WARN(LogCategory::Backend,
            "request " + std::to_string(requestIdOf(request).value()) + " threw: " + e.what());
        return RankResult<BackendResponse>::err(
            foundation::RankError(foundation::ErrorCode::BackendRequestFailed,
                                  std::string("request failed: ") + e.what()));
    }
}

RankResult<BackendResponse> BackendEngine::handleRefit(const RefitRequest& request) {
    std::string key;
    if (!request.noCache && refitCache_) {
        key = refitCacheKey(request);
        if (auto hit = refitCache_->get(key)) {
            return RankResult<BackendResponse>::ok(
                RefitResponse{request.id, std::move(hit->mu), std::move(hit->sigma)});
        }
    }

    auto fit = math::bayesianRefit(request.history, request.n, request.priorVariance);
    if (!fit) {
        return RankResult<BackendResponse>::err(fit.error());
    }

    if (!request.noCache && refitCache_) {
        refitCache_->put(key, fit.value());
    }
    auto estimate = std::move(fit).value();
    return RankResult<BackendResponse>::ok(
        RefitResponse{request.id, std::move(estimate.mu), std::move(estimate.sigma)});
}

RankResult<BackendResponse> BackendEngine::handleSelect(const SelectPairRequest& request) {
    std::string key;
    if (!request.noCache && selectionCache_) {
        key = selectionCacheKey(request);
        if (auto hit = selectionCache_->get(key)) {
            return RankResult<BackendResponse>::ok(SelectPairResponse{request.id, *hit});
        }
    }

    auto estimator = estimatorFor(request.estimator, request.precision);
    if (!estimator) {
        return RankResult<BackendResponse>::err(estimator.error());
    }

    math::StrengthEstimate belief{request.mu, request.sigma};
    math::SelectionParams params{
        .k = request.k,
        .n = request.n,
        .priorVariance = request.priorVariance,
        .recencyDiscount = request.recencyDiscount,
    };
    math::Xorshift32 rng(request.seed);

    auto pair = math::selectPair(belief, request.history, params, *estimator.value(), rng);
    if (!pair) {
        return RankResult<BackendResponse>::err(pair.error());
    }

    if (!request.noCache && selectionCache_) {
        selectionCache_->put(key, pair.value());
    }
    return RankResult<BackendResponse>::ok(SelectPairResponse{request.id, pair.value()});
}

RankResult<std::shared_ptr<const math::UncertaintyEstimator>> BackendEngine::estimatorFor(
    math::EstimatorKind kind, std::size_t precision) {
    std::lock_guard lock(estimatorMutex_);
    auto slot = std::make_pair(kind, precision);
    auto it = estimators_.find(slot);
    if (it != estimators_.end()) {
        return RankResult<std::shared_ptr<const math::UncertaintyEstimator>>::ok(it->second);
    }

    auto made = math::makeEstimator(kind, precision);
    if (!made) {
        return made;
    }
    ARANK_LOG_DEBUG(LogCategory::Backend,
        "built " + std::string(math::estimatorKindName(kind)) +
        " estimator, precision " + std::to_string(precision));
    estimators_.emplace(slot, made.value());
    return made;
}

} // namespace arank::service
