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

#ifndef QOC_EXPM_HPP
#define QOC_EXPM_HPP

#include "qoc/linalg/matrix_utils.hpp"

#include <Eigen/Dense>
#include <complex>
#include <string>
#include <unsupported/Eigen/MatrixFunctions>
#include <vector>

namespace qoc
{
namespace linalg
{
using namespace Eigen;
using Complex = std::complex<double>;

/**
 * @brief Computes the matrix exponential of a given matrix A.
 * @param A The input matrix for which the exponential is to be computed.
 * @return The matrix exponential of the input matrix A.
 * @throws std::invalid_argument if A is not square.
 */
inline MatrixXcd expm(const MatrixXcd& A)
{
    require_square(A, "expm");
    return A.exp();
}

/**
 * @brief Computes the matrix exponential of a matrix built from control
 * matrices.
 *
 * The forward value is identical to expm(). The control matrices are only
 * validated here; they are consumed by the fast-path backward rule.
 *
 * @param A The input matrix, typically H0 + sum_k u_k H_k.
 * @param control_matrices The generators H_k, each with the shape of A.
 * @return The matrix exponential of A.
 */
inline MatrixXcd expm_fastgrad(const MatrixXcd& A, const std::vector<MatrixXcd>& control_matrices)
{
    require_square(A, "expm_fastgrad");
    for (const auto& control_matrix : control_matrices)
    {
        require_same_shape(A, control_matrix, "expm_fastgrad control matrix");
    }
    return A.exp();
}

/**
 * @brief Vector-Jacobian product of the matrix exponential.
 *
 * Maps `dfinal_dexpm`, the gradient of the final scalar with respect to
 * every entry of `exp_matrix`, to the gradient with respect to every entry of
 * `matrix`. The Frechet derivative of the exponential in the unit direction
 * E_ij is approximated to first order by E_ij * exp_matrix. Because E_ij has a
 * single nonzero entry, the product reduces to row j of `exp_matrix` placed in
 * row i, and entry (i, j) of the result is the dot product of row i of
 * `dfinal_dexpm` with row j of `exp_matrix`.
 *
 * The approximation is exact only for directions that commute with `matrix`.
 *
 * @param exp_matrix The matrix exponential of `matrix`.
 * @param matrix The matrix that was exponentiated.
 * @param dfinal_dexpm Cotangent with the shape of `exp_matrix`.
 * @return Cotangent with the shape of `matrix`.
 */
inline MatrixXcd expm_vjp(const MatrixXcd& exp_matrix, const MatrixXcd& matrix,
                          const MatrixXcd& dfinal_dexpm)
{
    require_same_shape(matrix, exp_matrix, "expm_vjp");
    require_same_shape(exp_matrix, dfinal_dexpm, "expm_vjp cotangent");

    const Index matrix_size = matrix.rows();
    MatrixXcd dfinal_dmatrix = MatrixXcd::Zero(matrix_size, matrix_size);

    for (Index i = 0; i < matrix_size; ++i)
    {
        for (Index j = 0; j < matrix_size; ++j)
        {
            dfinal_dmatrix(i, j) =
                (dfinal_dexpm.row(i).array() * exp_matrix.row(j).array()).sum();
        }
    }

    return dfinal_dmatrix;
}

/**
 * @brief Gradient contribution of every control channel.
 *
 * With M = H0 + sum_k u_k H_k, the first-order derivative of exp(M) along u_k
 * is H_k * exp(M), so dfinal/du_k = sum(dfinal_dexpm .* (H_k * exp_matrix)).
 * The sensitivities are accumulated directly from the control matrices; no
 * full Frechet derivative is formed.
 *
 * @return One entry per control matrix, in list order.
 */
inline VectorXcd control_sensitivities(const MatrixXcd& exp_matrix,
                                       const std::vector<MatrixXcd>& control_matrices,
                                       const MatrixXcd& dfinal_dexpm)
{
    require_same_shape(exp_matrix, dfinal_dexpm, "control_sensitivities cotangent");

    VectorXcd dfinal_dcontrols = VectorXcd::Zero(static_cast<Index>(control_matrices.size()));
    for (size_t k = 0; k < control_matrices.size(); ++k)
    {
        const MatrixXcd& control_matrix = control_matrices[k];
        require_multipliable(control_matrix, exp_matrix, "control_sensitivities");
        MatrixXcd dexpm_dcontrol = control_matrix * exp_matrix;
        dfinal_dcontrols(static_cast<Index>(k)) =
            (dfinal_dexpm.array() * dexpm_dcontrol.array()).sum();
    }
    return dfinal_dcontrols;
}

/**
 * @brief Vector-Jacobian product of expm_fastgrad with respect to the matrix.
 *
 * Same first-order gradient as expm_vjp, evaluated as the single product
 * dfinal_dexpm * exp_matrix^T. Pulled back through dM/du_k = H_k it gives
 * exactly control_sensitivities().
 */
inline MatrixXcd expm_fastgrad_vjp(const MatrixXcd& exp_matrix, const MatrixXcd& matrix,
                                   const std::vector<MatrixXcd>& control_matrices,
                                   const MatrixXcd& dfinal_dexpm)
{
    require_same_shape(matrix, exp_matrix, "expm_fastgrad_vjp");
    require_same_shape(exp_matrix, dfinal_dexpm, "expm_fastgrad_vjp cotangent");
    for (const auto& control_matrix : control_matrices)
    {
        require_same_shape(matrix, control_matrix, "expm_fastgrad_vjp control matrix");
    }

    return dfinal_dexpm * exp_matrix.transpose();
}

/**
 * @brief Vector-Jacobian product of expm_fastgrad with respect to the control
 * matrices.
 *
 * Control matrices are constants: every cotangent is zero whatever
 * `dfinal_dexpm` holds.
 */
inline std::vector<MatrixXcd>
expm_fastgrad_vjp_controls(const MatrixXcd& /*exp_matrix*/, const MatrixXcd& /*matrix*/,
                           const std::vector<MatrixXcd>& control_matrices,
                           const MatrixXcd& /*dfinal_dexpm*/)
{
    std::vector<MatrixXcd> dfinal_dcontrol_matrices;
    dfinal_dcontrol_matrices.reserve(control_matrices.size());
    for (const auto& control_matrix : control_matrices)
    {
        dfinal_dcontrol_matrices.push_back(
            MatrixXcd::Zero(control_matrix.rows(), control_matrix.cols()));
    }
    return dfinal_dcontrol_matrices;
}

} // namespace linalg
} // namespace qoc
#endif // QOC_EXPM_HPP
