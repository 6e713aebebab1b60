/*
# This code is part of Qiskit.
#
# (C) Copyright IBM 2025.
#
# This code is licensed under the Apache License, Version 2.0. You may
# obtain a copy of this license in the LICENSE.txt file in the root directory
# of this source tree or at http://www.apache.org/licenses/LICENSE-2.0.
#
# Any modifications or derivative works of this code must retain this
# copyright notice, and modified files need to carry a notice indicating
# that they have been altered from the originals.
*/

#ifndef QOC_TESTS_GRADIENT_CHECK_HPP
#define QOC_TESTS_GRADIENT_CHECK_HPP

#include "qoc/random_matrix.hpp"

#include <Eigen/Dense>
#include <algorithm>
#include <complex>

namespace qoc_test
{

using Eigen::Index;
using Eigen::MatrixXcd;

/**
 * @brief Central-difference cotangent of a real-valued function of a complex
 * matrix.
 *
 * Matches the engine's pairing dL = Re(sum(ct .* dX)): the real part is
 * dL/dRe(X) and the imaginary part is -dL/dIm(X).
 */
template <typename F>
MatrixXcd numeric_cotangent(F f, const MatrixXcd& X, double eps = 1e-6)
{
    MatrixXcd ct(X.rows(), X.cols());
    for (Index i = 0; i < X.rows(); ++i)
    {
        for (Index j = 0; j < X.cols(); ++j)
        {
            MatrixXcd step = MatrixXcd::Zero(X.rows(), X.cols());
            step(i, j) = std::complex<double>(eps, 0.0);
            const double d_re = (f(X + step) - f(X - step)) / (2.0 * eps);
            step(i, j) = std::complex<double>(0.0, eps);
            const double d_im = (f(X + step) - f(X - step)) / (2.0 * eps);
            ct(i, j) = std::complex<double>(d_re, -d_im);
        }
    }
    return ct;
}

/**
 * @brief Central-difference derivative of a holomorphic scalar function,
 * entry by entry, along real steps.
 */
template <typename F>
MatrixXcd numeric_derivative(F f, const MatrixXcd& X, double eps = 1e-6)
{
    MatrixXcd d(X.rows(), X.cols());
    for (Index i = 0; i < X.rows(); ++i)
    {
        for (Index j = 0; j < X.cols(); ++j)
        {
            MatrixXcd step = MatrixXcd::Zero(X.rows(), X.cols());
            step(i, j) = eps;
            d(i, j) = (f(X + step) - f(X - step)) / (2.0 * eps);
        }
    }
    return d;
}

// Seeded rows x cols matrix with complex Gaussian entries.
inline MatrixXcd sample(Index rows, Index cols, unsigned int seed)
{
    const int n = static_cast<int>(std::max(rows, cols));
    MatrixXcd full = qoc::random_matrix(n, seed);
    return full.topLeftCorner(rows, cols);
}

inline double relative_error(const MatrixXcd& actual, const MatrixXcd& expected)
{
    return (actual - expected).norm() / expected.norm();
}

} // namespace qoc_test

#endif // QOC_TESTS_GRADIENT_CHECK_HPP
