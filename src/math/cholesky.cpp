/// @file cholesky.cpp
/// @brief Cholesky factorization over Eigen's LLT.

#include "arank/math/cholesky.hpp"

#include <utility>

namespace arank::math {

using foundation::ErrorCode;
using foundation::RankError;
using foundation::RankResult;

RankResult<CholeskyFactor> choleskyDecompose(const DenseMatrix& a) {
    // LLT only rejects pivots <= 0; a NaN pivot would slip through.
    if (!a.allFinite()) {
        return RankResult<CholeskyFactor>::err(
            RankError(ErrorCode::NumericalFailure, "matrix has non-finite entries"));
    }

    CholeskyFactor factor(a);
    if (factor.info() != Eigen::Success) {
        return RankResult<CholeskyFactor>::err(
            RankError(ErrorCode::NumericalFailure, "matrix is not positive definite"));
    }
    return RankResult<CholeskyFactor>::ok(std::move(factor));
}

DenseVector choleskySolve(const CholeskyFactor& factor, const DenseVector& b) {
    return factor.solve(b);
}

DenseVector choleskyInverseDiagonal(const CholeskyFactor& factor) {
    const auto n = factor.rows();
    return factor.solve(DenseMatrix::Identity(n, n)).diagonal();
}

} // namespace arank::math
