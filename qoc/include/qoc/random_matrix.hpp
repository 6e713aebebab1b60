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

#ifndef QOC_RANDOM_MATRIX_HPP
#define QOC_RANDOM_MATRIX_HPP

#include <Eigen/Dense>
#include <complex>
#include <optional>
#include <random>

namespace qoc
{
using namespace Eigen;
using Complex = std::complex<double>;

/**
 * @brief Generates an N x N matrix with independent complex Gaussian entries.
 * @param N The size of the matrix.
 * @param seed Seed for the generator; std::random_device is used if empty.
 * @return A random complex matrix of size N x N.
 */
inline MatrixXcd random_matrix(int N, std::optional<unsigned int> seed = std::nullopt)
{
    std::mt19937 gen(seed.value_or(std::random_device{}()));
    std::normal_distribution<double> dist(0.0, 1.0);

    MatrixXcd A = MatrixXcd::Zero(N, N);
    for (int i = 0; i < N; ++i) {
        for (int j = 0; j < N; ++j) {
            A(i, j) = Complex(dist(gen), dist(gen));
        }
    }
    return A;
}

/**
 * @brief Generates a random Hermitian matrix (A + A^H) / 2 of size N x N.
 */
inline MatrixXcd random_hermitian(int N, std::optional<unsigned int> seed = std::nullopt)
{
    MatrixXcd A = random_matrix(N, seed);
    MatrixXcd H = 0.5 * (A + A.adjoint());
    return H;
}

/**
 * @brief Generates a random unitary matrix of size N x N.
 * @details This function uses the QR decomposition method to generate a random
 * unitary matrix. It creates a random matrix, performs QR decomposition, and
 * returns the unitary matrix Q.
 * @param N The size of the unitary matrix.
 * @param seed Seed for the generator; std::random_device is used if empty.
 * @return A random unitary matrix of size N x N.
 */
inline MatrixXcd random_unitary(int N, std::optional<unsigned int> seed = std::nullopt)
{
    MatrixXcd A = random_matrix(N, seed);
    HouseholderQR<MatrixXcd> qr(A);
    MatrixXcd Q = qr.householderQ();
    return Q;
}
} // namespace qoc
#endif // QOC_RANDOM_MATRIX_HPP
