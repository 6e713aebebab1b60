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

#ifndef QOC_FUNCTIONS_HPP
#define QOC_FUNCTIONS_HPP

#include "qoc/autodiff/expm_ops.hpp"
#include "qoc/autodiff/graph.hpp"
#include "qoc/autodiff/standard_ops.hpp"

#include <Eigen/Dense>
#include <stdexcept>
#include <string>
#include <vector>

namespace qoc
{
namespace autodiff
{

using namespace Eigen;
using Complex = std::complex<double>;

inline Variable add(Graph& g, Variable a, Variable b)
{
    return g.apply(AddOp::NAME, {a, b});
}

inline Variable subtract(Graph& g, Variable a, Variable b)
{
    return g.apply(SubtractOp::NAME, {a, b});
}

inline Variable matmul(Graph& g, Variable a, Variable b)
{
    return g.apply(MatmulOp::NAME, {a, b});
}

inline Variable hadamard(Graph& g, Variable a, Variable b)
{
    return g.apply(HadamardOp::NAME, {a, b});
}

inline Variable scale(Graph& g, Variable scalar, Variable mat)
{
    return g.apply(ScaleOp::NAME, {scalar, mat});
}

inline Variable conjugate(Graph& g, Variable a)
{
    return g.apply(ConjugateOp::NAME, {a});
}

inline Variable transpose(Graph& g, Variable a)
{
    return g.apply(TransposeOp::NAME, {a});
}

inline Variable real(Graph& g, Variable a)
{
    return g.apply(RealOp::NAME, {a});
}

inline Variable sum(Graph& g, Variable a)
{
    return g.apply(SumOp::NAME, {a});
}

inline Variable sqrt(Graph& g, Variable a)
{
    return g.apply(SqrtOp::NAME, {a});
}

inline Variable kron(Graph& g, Variable a, Variable b)
{
    return g.apply(KronOp::NAME, {a, b});
}

inline Variable hstack(Graph& g, const std::vector<Variable>& columns)
{
    return g.apply(HstackOp::NAME, columns);
}

inline Variable expm(Graph& g, Variable mat)
{
    return g.apply(ExpmOp::NAME, {mat});
}

/**
 * @brief exp(mat) recorded with the fast-path rule.
 * @param control_matrices Usually graph constants; they never receive a
 * gradient.
 */
inline Variable expm_fastgrad(Graph& g, Variable mat, const std::vector<Variable>& control_matrices)
{
    std::vector<Variable> inputs;
    inputs.reserve(control_matrices.size() + 1);
    inputs.push_back(mat);
    inputs.insert(inputs.end(), control_matrices.begin(), control_matrices.end());
    return g.apply(ExpmFastgradOp::NAME, inputs);
}

/**
 * @brief Builds base + sum_k amplitudes[k] * controls[k].
 * @param amplitudes 1 x 1 variables, one per control matrix.
 * @throws std::invalid_argument if the two lists differ in length.
 */
inline Variable linear_combination(Graph& g, Variable base, const std::vector<Variable>& amplitudes,
                                   const std::vector<Variable>& controls)
{
    if (amplitudes.size() != controls.size())
    {
        throw std::invalid_argument("linear_combination: " + std::to_string(amplitudes.size()) +
                                    " amplitudes for " + std::to_string(controls.size()) +
                                    " control matrices");
    }
    Variable result = base;
    for (size_t k = 0; k < controls.size(); ++k)
    {
        result = add(g, result, scale(g, amplitudes[k], controls[k]));
    }
    return result;
}

inline Variable commutator(Graph& g, Variable a, Variable b)
{
    return subtract(g, matmul(g, a, b), matmul(g, b, a));
}

inline Variable conjugate_transpose(Graph& g, Variable a)
{
    return conjugate(g, transpose(g, a));
}

inline Variable krons(Graph& g, const std::vector<Variable>& matrices)
{
    if (matrices.empty())
    {
        throw std::invalid_argument("krons: at least one matrix is required");
    }
    Variable result = matrices.front();
    for (size_t i = 1; i < matrices.size(); ++i)
    {
        result = kron(g, result, matrices[i]);
    }
    return result;
}

inline Variable matmuls(Graph& g, const std::vector<Variable>& matrices)
{
    if (matrices.empty())
    {
        throw std::invalid_argument("matmuls: at least one matrix is required");
    }
    Variable result = matrices.front();
    for (size_t i = 1; i < matrices.size(); ++i)
    {
        result = matmul(g, result, matrices[i]);
    }
    return result;
}

/**
 * @brief Projects the n x 1 vector x onto the rows of the k x n `basis`.
 *
 * Rows are picked out with constant selector products, so the result is
 * differentiable in both x and basis. Orthonormality is assumed.
 */
inline Variable project(Graph& g, Variable x, Variable basis)
{
    const MatrixXcd& x_value = g.value(x);
    const MatrixXcd& basis_value = g.value(basis);
    if (x_value.cols() != 1 || basis_value.cols() != x_value.rows())
    {
        throw std::invalid_argument("project: cannot project " + linalg::shape_string(x_value) +
                                    " onto the rows of " + linalg::shape_string(basis_value));
    }

    // Copies: recording nodes below may reallocate the values referenced above.
    const Index n_basis = basis_value.rows();
    const Index n = x_value.rows();
    Variable result = g.constant(MatrixXcd::Zero(n, 1));
    for (Index i = 0; i < n_basis; ++i)
    {
        MatrixXcd selector = MatrixXcd::Zero(1, n_basis);
        selector(0, i) = 1.0;
        Variable row = matmul(g, g.constant(selector), basis);
        Variable overlap = matmul(g, row, x);
        result = add(g, result, scale(g, overlap, transpose(g, row)));
    }
    return result;
}

/**
 * @brief sqrt(sum(real(a .* conj(a))) / count(a)) as a 1 x 1 variable.
 */
inline Variable rms_norm(Graph& g, Variable a)
{
    MatrixXcd inv_size(1, 1);
    inv_size(0, 0) = 1.0 / static_cast<double>(g.value(a).size());

    Variable square_norm = sum(g, real(g, hadamard(g, a, conjugate(g, a))));
    return sqrt(g, scale(g, g.constant(inv_size), square_norm));
}

inline Variable column_vector_list_to_matrix(Graph& g, const std::vector<Variable>& column_vector_list)
{
    if (column_vector_list.empty())
    {
        throw std::invalid_argument("column_vector_list_to_matrix: empty column vector list");
    }
    return hstack(g, column_vector_list);
}

inline std::vector<Variable> matrix_to_column_vector_list(Graph& g, Variable mat)
{
    const Index cols = g.value(mat).cols();
    std::vector<Variable> column_vector_list;
    column_vector_list.reserve(static_cast<size_t>(cols));
    for (Index j = 0; j < cols; ++j)
    {
        MatrixXcd selector = MatrixXcd::Zero(cols, 1);
        selector(j, 0) = 1.0;
        column_vector_list.push_back(matmul(g, mat, g.constant(selector)));
    }
    return column_vector_list;
}

} // namespace autodiff
} // namespace qoc

#endif // QOC_FUNCTIONS_HPP
