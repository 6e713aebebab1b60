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

#ifndef QOC_CONVENIENCE_HPP
#define QOC_CONVENIENCE_HPP

#include "qoc/linalg/matrix_utils.hpp"

#include <Eigen/Dense>
#include <array>
#include <cmath>
#include <complex>
#include <stdexcept>
#include <string>
#include <unsupported/Eigen/CXX11/Tensor>
#include <unsupported/Eigen/KroneckerProduct>
#include <utility>
#include <vector>

namespace qoc
{
namespace linalg
{

using namespace Eigen;
using Complex = std::complex<double>;

/**
 * @brief Computes the commutator A B - B A.
 * @throws std::invalid_argument unless A and B are square and of equal shape.
 */
inline MatrixXcd commutator(const MatrixXcd& a, const MatrixXcd& b)
{
    require_square(a, "commutator");
    require_same_shape(a, b, "commutator");
    return a * b - b * a;
}

/**
 * @brief Computes the conjugate transpose of a matrix.
 */
inline MatrixXcd conjugate_transpose(const MatrixXcd& mat)
{
    return mat.adjoint();
}

/**
 * @brief Computes the conjugate transpose of every matrix in a stack.
 *
 * The tensor is indexed as (batch, row, col); the two trailing axes are
 * swapped and every entry is conjugated.
 *
 * @param stack A tensor of shape [batch, rows, cols].
 * @return A tensor of shape [batch, cols, rows].
 */
inline Tensor<Complex, 3> conjugate_transpose(const Tensor<Complex, 3>& stack)
{
    const std::array<Index, 3> swap_last_axes = {0, 2, 1};
    Tensor<Complex, 3> result = stack.shuffle(swap_last_axes).conjugate();
    return result;
}

/**
 * @brief Computes the Kronecker product of a list of matrices, reduced from
 * left to right.
 * @throws std::invalid_argument if the list is empty.
 */
inline MatrixXcd krons(const std::vector<MatrixXcd>& matrices)
{
    if (matrices.empty())
    {
        throw std::invalid_argument("krons: at least one matrix is required");
    }
    MatrixXcd result = matrices.front();
    for (size_t i = 1; i < matrices.size(); ++i)
    {
        MatrixXcd next = kroneckerProduct(result, matrices[i]);
        result = std::move(next);
    }
    return result;
}

template <typename... Rest>
MatrixXcd krons(const MatrixXcd& first, const Rest&... rest)
{
    return krons(std::vector<MatrixXcd>{first, rest...});
}

/**
 * @brief Computes the product of a list of matrices, reduced from left to
 * right.
 * @throws std::invalid_argument if the list is empty or a pair of neighbours
 * cannot be multiplied.
 */
inline MatrixXcd matmuls(const std::vector<MatrixXcd>& matrices)
{
    if (matrices.empty())
    {
        throw std::invalid_argument("matmuls: at least one matrix is required");
    }
    MatrixXcd result = matrices.front();
    for (size_t i = 1; i < matrices.size(); ++i)
    {
        require_multipliable(result, matrices[i], "matmuls");
        MatrixXcd next = result * matrices[i];
        result = std::move(next);
    }
    return result;
}

template <typename... Rest>
MatrixXcd matmuls(const MatrixXcd& first, const Rest&... rest)
{
    return matmuls(std::vector<MatrixXcd>{first, rest...});
}

/**
 * @brief Classical Gram-Schmidt orthogonalization.
 *
 * Vectors are processed in index order. Each one has its projection onto all
 * previously produced vectors removed, the projection coefficient being
 * (x . y_j) / ||y_j||^2 with the unconjugated dot product. The input is
 * assumed linearly independent; a dependent vector collapses to zero, and to
 * NaN once normalized.
 *
 * @param X The vectors, one per row (or per column if `row_vecs` is false).
 * @param row_vecs Whether the vectors are the rows of X.
 * @param norm Whether to scale each output vector to unit norm.
 * @return The orthogonalized vectors in the layout of X.
 */
inline MatrixXcd gram_schmidt(const MatrixXcd& X, bool row_vecs = true, bool norm = true)
{
    const MatrixXcd vectors = row_vecs ? MatrixXcd(X) : MatrixXcd(X.transpose());
    MatrixXcd Y(vectors.rows(), vectors.cols());
    if (vectors.rows() == 0)
    {
        return row_vecs ? Y : MatrixXcd(Y.transpose());
    }

    Y.row(0) = vectors.row(0);
    for (Index i = 1; i < vectors.rows(); ++i)
    {
        RowVectorXcd proj = RowVectorXcd::Zero(vectors.cols());
        for (Index j = 0; j < i; ++j)
        {
            Complex coeff = (vectors.row(i).array() * Y.row(j).array()).sum() /
                            Y.row(j).squaredNorm();
            proj += coeff * Y.row(j);
        }
        Y.row(i) = vectors.row(i) - proj;
    }

    if (norm)
    {
        for (Index i = 0; i < Y.rows(); ++i)
        {
            Y.row(i) *= 1.0 / Y.row(i).norm();
        }
    }

    if (row_vecs)
    {
        return Y;
    }
    return Y.transpose();
}

/**
 * @brief Projects x onto the span of the rows of `basis`.
 *
 * Assumes the rows of `basis` are orthonormal; this is not checked.
 *
 * @throws std::invalid_argument if the basis vectors and x differ in length.
 */
inline VectorXcd project(const VectorXcd& x, const MatrixXcd& basis)
{
    if (basis.cols() != x.size())
    {
        throw std::invalid_argument("project: basis vectors have length " +
                                    std::to_string(basis.cols()) + ", x has length " +
                                    std::to_string(x.size()));
    }
    VectorXcd y = VectorXcd::Zero(x.size());
    for (Index i = 0; i < basis.rows(); ++i)
    {
        VectorXcd b = basis.row(i).transpose();
        Complex overlap = (x.array() * b.array()).sum();
        y += overlap * b;
    }
    return y;
}

/**
 * @brief Computes the root-mean-square magnitude of all entries.
 */
inline double rms_norm(const MatrixXcd& array)
{
    double square_norm = array.cwiseAbs2().sum();
    return std::sqrt(square_norm / static_cast<double>(array.size()));
}

// A column vector is an n x 1 VectorXcd; a list of them stacks horizontally
// into a matrix in list order.
inline MatrixXcd column_vector_list_to_matrix(const std::vector<VectorXcd>& column_vector_list)
{
    if (column_vector_list.empty())
    {
        throw std::invalid_argument("column_vector_list_to_matrix: empty column vector list");
    }
    const Index rows = column_vector_list.front().size();
    MatrixXcd mat(rows, static_cast<Index>(column_vector_list.size()));
    for (size_t j = 0; j < column_vector_list.size(); ++j)
    {
        if (column_vector_list[j].size() != rows)
        {
            throw std::invalid_argument(
                "column_vector_list_to_matrix: column " + std::to_string(j) + " has length " +
                std::to_string(column_vector_list[j].size()) + ", expected " +
                std::to_string(rows));
        }
        mat.col(static_cast<Index>(j)) = column_vector_list[j];
    }
    return mat;
}

inline std::vector<VectorXcd> matrix_to_column_vector_list(const MatrixXcd& mat)
{
    std::vector<VectorXcd> column_vector_list;
    column_vector_list.reserve(static_cast<size_t>(mat.cols()));
    for (Index j = 0; j < mat.cols(); ++j)
    {
        column_vector_list.emplace_back(mat.col(j));
    }
    return column_vector_list;
}

} // namespace linalg
} // namespace qoc

#endif // QOC_CONVENIENCE_HPP
