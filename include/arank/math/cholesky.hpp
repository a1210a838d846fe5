#pragma once

/// @file cholesky.hpp
/// @brief Dense Cholesky factorization helpers used by the Bayesian fitter.
///
/// Matrices are dense, row-major and symmetric. Only the lower triangle is
/// read by the factorization.

#include <Eigen/Cholesky>
#include <Eigen/Core>

#include "arank/foundation/rank_result.hpp"

namespace arank::math {

using DenseMatrix = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using DenseVector = Eigen::VectorXd;
using CholeskyFactor = Eigen::LLT<DenseMatrix>;

/// Factor A = L * L^T.
///
/// @return NumericalFailure if A has a non-finite entry or a pivot is not
///         strictly positive, i.e. A is not symmetric positive-definite.
foundation::RankResult<CholeskyFactor> choleskyDecompose(const DenseMatrix& a);

/// Solve L * L^T * x = b.
[[nodiscard]] DenseVector choleskySolve(const CholeskyFactor& factor, const DenseVector& b);

/// Diagonal of A^{-1}, one column solve per unit vector.
[[nodiscard]] DenseVector choleskyInverseDiagonal(const CholeskyFactor& factor);

} // namespace arank::math
