/// @file ranking_types.cpp
/// @brief RankingConfig validation.

#include "arank/service/ranking_types.hpp"

#include "arank/math/gauss_hermite.hpp"

namespace arank::service {

using foundation::ErrorCode;
using foundation::RankError;
using foundation::RankResult;

namespace {

RankResult<void> reject(std::string message) {
    return RankResult<void>::err(RankError(ErrorCode::InvalidArgument, std::move(message)));
}

} // namespace

RankResult<void> validateConfig(const RankingConfig& config) {
    if (config.k == 0) {
        return reject("k must be positive");
    }
    if (!(config.z >= 0.0)) {
        return reject("z must be non-negative");
    }
    if (config.stabilityWindow == 0) {
        return reject("stability window must be positive");
    }
    if (!(config.priorVariance > 0.0)) {
        return reject("prior variance must be positive");
    }
    if (!(config.recencyDiscount > 0.0) || config.recencyDiscount > 1.0) {
        return reject("recency discount must be in (0, 1]");
    }
    if (config.precision() == 0) {
        return reject("estimator precision must be positive");
    }
    if (config.estimator == math::EstimatorKind::Quadrature &&
        config.quadratureOrder > math::kMaxHermiteOrder) {
        return reject("quadrature order exceeds " + std::to_string(math::kMaxHermiteOrder));
    }
    return RankResult<void>::ok();
}

} // namespace arank::service
