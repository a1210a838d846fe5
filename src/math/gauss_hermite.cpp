/// @file gauss_hermite.cpp
/// @brief Gauss-Hermite rule construction.

#include "arank/math/gauss_hermite.hpp"

#include <cmath>
#include <string>

namespace arank::math {

using foundation::ErrorCode;
using foundation::RankError;
using foundation::RankResult;

RankResult<GaussHermiteRule> GaussHermiteRule::create(std::size_t order) {
    if (order == 0 || order > kMaxHermiteOrder) {
        return RankResult<GaussHermiteRule>::err(
            RankError(ErrorCode::InvalidArgument,
                      "quadrature order must be in [1, " +
                          std::to_string(kMaxHermiteOrder) + "]"));
    }

    constexpr double kEps = 1e-14;
    constexpr double kPiToMinusQuarter = 0.7511255444649425;
    constexpr int kMaxNewton = 100;

    const auto n = static_cast<double>(order);
    GaussHermiteRule rule;
    rule.nodes.assign(order, 0.0);
    rule.weights.assign(order, 0.0);

    // Roots are symmetric: find the largest half, mirror the rest.
    const std::size_t half = (order + 1) / 2;
    double z = 0.0;
    for (std::size_t i = 0; i < half; ++i) {
        // Initial guesses for the i-th largest root.
        if (i == 0) {
            z = std::sqrt(2.0 * n + 1.0) - 1.85575 * std::pow(2.0 * n + 1.0, -0.16667);
        } else if (i == 1) {
            z -= 1.14 * std::pow(n, 0.426) / z;
        } else if (i == 2) {
            z = 1.86 * z - 0.86 * rule.nodes[0];
        } else if (i == 3) {
            z = 1.91 * z - 0.91 * rule.nodes[1];
        } else {
            z = 2.0 * z - rule.nodes[i - 2];
        }

        double pp = 0.0;
        bool converged = false;
        for (int it = 0; it < kMaxNewton; ++it) {
            // Orthonormal recurrence: p1 = H_n(z), p2 = H_{n-1}(z).
            double p1 = kPiToMinusQuarter;
            double p2 = 0.0;
            for (std::size_t j = 0; j < order; ++j) {
                double p3 = p2;
                p2 = p1;
                auto jd = static_cast<double>(j);
                p1 = z * std::sqrt(2.0 / (jd + 1.0)) * p2 -
                     std::sqrt(jd / (jd + 1.0)) * p3;
            }
            pp = std::sqrt(2.0 * n) * p2;
            double z1 = z;
            z = z1 - p1 / pp;
            if (std::abs(z - z1) <= kEps) {
                converged = true;
                break;
            }
        }
        if (!converged) {
            return RankResult<GaussHermiteRule>::err(
                RankError(ErrorCode::NumericalFailure,
                          "Hermite root " + std::to_string(i) + " did not converge"));
        }

        rule.nodes[i] = z;
        rule.nodes[order - 1 - i] = -z;
        rule.weights[i] = 2.0 / (pp * pp);
        rule.weights[order - 1 - i] = rule.weights[i];
    }

    return RankResult<GaussHermiteRule>::ok(std::move(rule));
}

} // namespace arank::math
