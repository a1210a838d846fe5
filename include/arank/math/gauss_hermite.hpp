#pragma once

/// @file gauss_hermite.hpp
/// @brief Gauss-Hermite quadrature nodes and weights.

#include <cstddef>
#include <vector>

#include "arank/foundation/rank_result.hpp"

namespace arank::math {

/// Largest supported quadrature order.
inline constexpr std::size_t kMaxHermiteOrder = 64;

/// Nodes/weights for integrals of the form  int f(t) exp(-t^2) dt.
///
/// Weights sum to sqrt(pi). Nodes are symmetric about 0 and sorted in
/// descending order.
struct GaussHermiteRule {
    std::vector<double> nodes;
    std::vector<double> weights;

    [[nodiscard]] std::size_t order() const noexcept { return nodes.size(); }

    /// Compute the rule by Newton iteration on orthonormal Hermite
    /// polynomials.
    /// @return InvalidArgument for order 0 or above kMaxHermiteOrder;
    ///         NumericalFailure if a root fails to converge.
    static foundation::RankResult<GaussHermiteRule> create(std::size_t order);
};

} // namespace arank::math
