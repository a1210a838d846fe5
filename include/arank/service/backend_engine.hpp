#pragma once

/// @file backend_engine.hpp
/// @brief Executes backend requests against the statistical engine, with
///        memoization.

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "arank/foundation/rank_result.hpp"
#include "arank/math/types.hpp"
#include "arank/math/uncertainty_estimator.hpp"
#include "arank/service/compute_backend.hpp"
#include "arank/service/result_cache.hpp"

namespace arank::service {

using RefitCache = ResultCache<math::StrengthEstimate>;
using SelectionCache = ResultCache<math::IndexPair>;

/// Canonical cache key of a refit: "n|v|w,l|w,l|...".
[[nodiscard]] std::string refitCacheKey(const RefitRequest& request);

/// Canonical cache key of a pair selection:
/// "k|discount|estimator|precision|seed|" followed by the refit key and
/// the belief "|mu,...|sigma,...", all at round-trip precision.
[[nodiscard]] std::string selectionCacheKey(const SelectPairRequest& request);

/// Stateless request executor shared by every backend flavour.
///
/// The caches may be shared with other engines; they are pure-function
/// keyed, so any engine may answer from any entry.
class BackendEngine {
public:
    explicit BackendEngine(CacheConfig cacheConfig = {});
    BackendEngine(std::shared_ptr<RefitCache> refitCache,
                  std::shared_ptr<SelectionCache> selectionCache);

    /// Run one request. The response echoes the request's correlator.
    foundation::RankResult<BackendResponse> handle(const BackendRequest& request);

    [[nodiscard]] const std::shared_ptr<RefitCache>& refitCache() const noexcept {
        return refitCache_;
    }
    [[nodiscard]] const std::shared_ptr<SelectionCache>& selectionCache() const noexcept {
        return selectionCache_;
    }

private:
    foundation::RankResult<BackendResponse> handleRefit(const RefitRequest& request);
    foundation::RankResult<BackendResponse> handleSelect(const SelectPairRequest& request);

    foundation::RankResult<std::shared_ptr<const math::UncertaintyEstimator>> estimatorFor(
        math::EstimatorKind kind, std::size_t precision);

    std::shared_ptr<RefitCache> refitCache_;
    std::shared_ptr<SelectionCache> selectionCache_;

    std::mutex estimatorMutex_;
    std::map<std::pair<math::EstimatorKind, std::size_t>,
             std::shared_ptr<const math::UncertaintyEstimator>> estimators_;
};

} // namespace arank::service
