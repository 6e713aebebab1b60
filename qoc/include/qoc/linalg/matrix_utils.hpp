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

#ifndef QOC_MATRIX_UTILS_HPP
#define QOC_MATRIX_UTILS_HPP

#include <Eigen/Dense>
#include <cmath>
#include <complex>
#include <stdexcept>
#include <string>

namespace qoc
{
namespace linalg
{
using namespace Eigen;
using Complex = std::complex<double>;

inline std::string shape_string(const MatrixXcd& mat)
{
    return "(" + std::to_string(mat.rows()) + ", " + std::to_string(mat.cols()) + ")";
}

/**
 * @brief Throws std::invalid_argument unless `mat` is square.
 * @param mat The matrix to check.
 * @param what Name of the calling operation, used in the message.
 */
inline void require_square(const MatrixXcd& mat, const std::string& what)
{
    if (mat.rows() != mat.cols())
    {
        throw std::invalid_argument(what + ": expected a square matrix, got shape " +
                                    shape_string(mat));
    }
}

/**
 * @brief Throws std::invalid_argument unless `a` and `b` have the same shape.
 */
inline void require_same_shape(const MatrixXcd& a, const MatrixXcd& b, const std::string& what)
{
    if (a.rows() != b.rows() || a.cols() != b.cols())
    {
        throw std::invalid_argument(what + ": shape mismatch " + shape_string(a) + " vs " +
                                    shape_string(b));
    }
}

/**
 * @brief Throws std::invalid_argument unless `a * b` is defined.
 */
inline void require_multipliable(const MatrixXcd& a, const MatrixXcd& b, const std::string& what)
{
    if (a.cols() != b.rows())
    {
        throw std::invalid_argument(what + ": cannot multiply " + shape_string(a) + " by " +
                                    shape_string(b));
    }
}

inline bool array_all_close(const MatrixXcd& mat1, const MatrixXcd& mat2, double rtol = 1e-5,
                            double atol = 1e-8)
{
    if (mat1.rows() != mat2.rows() || mat1.cols() != mat2.cols())
    {
        return false;
    }

    for (Index i = 0; i < mat1.rows(); ++i)
    {
        for (Index j = 0; j < mat1.cols(); ++j)
        {
            const Complex& a = mat1(i, j);
            const Complex& b = mat2(i, j);
            if (std::abs(a - b) > atol + rtol * std::abs(b))
            {
                return false;
            }
        }
    }
    return true;
}

inline bool is_hermitian(const MatrixXcd& mat, double rtol = 1e-5, double atol = 1e-8)
{
    if (mat.rows() != mat.cols())
    {
        return false;
    }
    return array_all_close(mat, mat.adjoint(), rtol, atol);
}

inline bool is_unitary(const MatrixXcd& mat, double rtol = 1e-5, double atol = 1e-8)
{
    if (mat.rows() != mat.cols())
    {
        return false;
    }

    MatrixXcd I = MatrixXcd::Identity(mat.rows(), mat.cols());
    return array_all_close(mat * mat.adjoint(), I, rtol, atol);
}

} // namespace linalg
} // namespace qoc
#endif // QOC_MATRIX_UTILS_HPP
