#include <gtest/gtest.h>

#include <limits>

#include <Eigen/LU>

#include "arank/math/cholesky.hpp"

using namespace arank::math;
using arank::foundation::ErrorCode;

namespace {

DenseMatrix spd3() {
    DenseMatrix a(3, 3);
    a << 4, 2, 1,
         2, 5, 3,
         1, 3, 6;
    return a;
}

} // namespace

TEST(CholeskyTest, IdentityFactorsToIdentity) {
    auto factor = choleskyDecompose(DenseMatrix::Identity(2, 2));
    ASSERT_TRUE(factor.hasValue());
    DenseMatrix l = factor.value().matrixL();
    EXPECT_NEAR(l(0, 0), 1.0, 1e-12);
    EXPECT_NEAR(l(1, 0), 0.0, 1e-12);
    EXPECT_NEAR(l(1, 1), 1.0, 1e-12);
}

TEST(CholeskyTest, FactorReconstructsMatrix) {
    auto a = spd3();
    auto factor = choleskyDecompose(a);
    ASSERT_TRUE(factor.hasValue());
    DenseMatrix l = factor.value().matrixL();
    DenseMatrix product = l * l.transpose();
    EXPECT_TRUE(product.isApprox(a, 1e-10));
}

TEST(CholeskyTest, IndefiniteMatrixIsNumericalFailure) {
    DenseMatrix a(2, 2);
    a << 1, 2,
         2, 1;
    auto result = choleskyDecompose(a);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::NumericalFailure);
}

TEST(CholeskyTest, NonFiniteMatrixIsNumericalFailure) {
    DenseMatrix a = DenseMatrix::Identity(2, 2);
    a(1, 1) = std::numeric_limits<double>::quiet_NaN();
    auto result = choleskyDecompose(a);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::NumericalFailure);
}

TEST(CholeskyTest, SolveRecoversRightHandSide) {
    auto a = spd3();
    auto factor = choleskyDecompose(a);
    ASSERT_TRUE(factor.hasValue());

    DenseVector b(3);
    b << 1, 2, 3;
    DenseVector x = choleskySolve(factor.value(), b);
    DenseVector back = a * x;
    for (Eigen::Index i = 0; i < 3; ++i) {
        EXPECT_NEAR(back(i), b(i), 1e-10);
    }
}

TEST(CholeskyTest, InverseDiagonalMatchesFullInverse) {
    auto a = spd3();
    auto factor = choleskyDecompose(a);
    ASSERT_TRUE(factor.hasValue());
    DenseVector diag = choleskyInverseDiagonal(factor.value());
    DenseMatrix inverse = a.inverse();
    for (Eigen::Index i = 0; i < 3; ++i) {
        EXPECT_NEAR(diag(i), inverse(i, i), 1e-10);
    }
}

TEST(CholeskyTest, DiagonalInverse) {
    DenseMatrix a = DenseMatrix::Zero(3, 3);
    a(0, 0) = 4;
    a(1, 1) = 9;
    a(2, 2) = 16;
    auto factor = choleskyDecompose(a);
    ASSERT_TRUE(factor.hasValue());
    DenseVector diag = choleskyInverseDiagonal(factor.value());
    EXPECT_NEAR(diag(0), 1.0 / 4.0, 1e-12);
    EXPECT_NEAR(diag(1), 1.0 / 9.0, 1e-12);
    EXPECT_NEAR(diag(2), 1.0 / 16.0, 1e-12);
}
