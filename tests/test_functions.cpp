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

#include <gtest/gtest.h>

#include "gradient_check.hpp"
#include "qoc/autodiff/autodiff.hpp"
#include "qoc/linalg/linalg.hpp"
#include "qoc/random_matrix.hpp"

#include <complex>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace qoc::autodiff;
using qoc::linalg::array_all_close;
using qoc_test::numeric_cotangent;
using qoc_test::sample;

namespace
{

// Re(sum(weight .* out)), recorded on the graph.
Variable weighted_real_sum(Graph& g, const MatrixXcd& weight, Variable out)
{
    return real(g, sum(g, hadamard(g, g.constant(weight), out)));
}

double weighted_real_sum(const MatrixXcd& weight, const MatrixXcd& out)
{
    return (weight.array() * out.array()).sum().real();
}

MatrixXcd real_orthonormal_rows()
{
    MatrixXd seed_matrix(4, 4);
    seed_matrix << 1.0, 0.4, -0.2, 0.8,
                   -0.6, 1.3, 0.5, 0.1,
                   0.3, -0.9, 1.1, 0.7,
                   0.2, 0.5, -0.4, 1.6;
    HouseholderQR<MatrixXd> qr(seed_matrix);
    MatrixXd Q = qr.householderQ();
    return Q.transpose().cast<Complex>();
}

} // namespace

class FunctionsTest : public ::testing::Test
{
  protected:
    std::shared_ptr<const OpRegistry> registry_ = make_default_registry();
};

TEST_F(FunctionsTest, CommutatorValueAndGradient)
{
    MatrixXcd a_value = sample(3, 3, 501);
    MatrixXcd b_value = sample(3, 3, 502);
    MatrixXcd w = sample(3, 3, 503);

    Graph g(registry_);
    Variable a = g.variable(a_value);
    Variable b = g.variable(b_value);
    Variable c = commutator(g, a, b);
    EXPECT_TRUE(array_all_close(g.value(c), qoc::linalg::commutator(a_value, b_value), 1e-14,
                                1e-14));

    Gradients grads = g.backward(weighted_real_sum(g, w, c));
    MatrixXcd numeric_a = numeric_cotangent(
        [&](const MatrixXcd& X) {
            return weighted_real_sum(w, qoc::linalg::commutator(X, b_value));
        },
        a_value);
    MatrixXcd numeric_b = numeric_cotangent(
        [&](const MatrixXcd& X) {
            return weighted_real_sum(w, qoc::linalg::commutator(a_value, X));
        },
        b_value);
    EXPECT_TRUE(array_all_close(grads[a], numeric_a, 1e-6, 1e-7));
    EXPECT_TRUE(array_all_close(grads[b], numeric_b, 1e-6, 1e-7));

    Variable wide = g.variable(MatrixXcd::Ones(2, 3));
    Variable tall = g.variable(MatrixXcd::Ones(3, 2));
    EXPECT_THROW(commutator(g, wide, tall), std::invalid_argument);
}

TEST_F(FunctionsTest, ConjugateTransposeValueAndGradient)
{
    MatrixXcd a_value = sample(2, 3, 511);
    MatrixXcd w = sample(3, 2, 512);

    Graph g(registry_);
    Variable a = g.variable(a_value);
    Variable at = conjugate_transpose(g, a);
    EXPECT_TRUE(g.value(at) == qoc::linalg::conjugate_transpose(a_value));

    Gradients grads = g.backward(weighted_real_sum(g, w, at));
    MatrixXcd numeric = numeric_cotangent(
        [&](const MatrixXcd& X) {
            return weighted_real_sum(w, qoc::linalg::conjugate_transpose(X));
        },
        a_value);
    EXPECT_TRUE(array_all_close(grads[a], numeric, 1e-6, 1e-7));
}

TEST_F(FunctionsTest, KronsValueAndGradient)
{
    MatrixXcd a_value = sample(2, 2, 521);
    MatrixXcd b_value = sample(1, 2, 522);
    MatrixXcd c_value = sample(2, 1, 523);
    MatrixXcd w = sample(4, 4, 524);

    Graph g(registry_);
    Variable a = g.variable(a_value);
    Variable b = g.variable(b_value);
    Variable c = g.variable(c_value);
    Variable k = krons(g, {a, b, c});
    EXPECT_TRUE(array_all_close(g.value(k), qoc::linalg::krons(a_value, b_value, c_value),
                                1e-14, 1e-14));

    Gradients grads = g.backward(weighted_real_sum(g, w, k));
    MatrixXcd numeric = numeric_cotangent(
        [&](const MatrixXcd& X) {
            return weighted_real_sum(w, qoc::linalg::krons(a_value, X, c_value));
        },
        b_value);
    EXPECT_TRUE(array_all_close(grads[b], numeric, 1e-6, 1e-7));

    EXPECT_THROW(krons(g, {}), std::invalid_argument);
}

TEST_F(FunctionsTest, MatmulsValueAndGradient)
{
    MatrixXcd a_value = sample(2, 3, 531);
    MatrixXcd b_value = sample(3, 3, 532);
    MatrixXcd c_value = sample(3, 2, 533);
    MatrixXcd w = sample(2, 2, 534);

    Graph g(registry_);
    Variable a = g.constant(a_value);
    Variable b = g.variable(b_value);
    Variable c = g.constant(c_value);
    Variable p = matmuls(g, {a, b, c});
    EXPECT_TRUE(array_all_close(g.value(p), a_value * b_value * c_value, 1e-13, 1e-13));

    Gradients grads = g.backward(weighted_real_sum(g, w, p));
    MatrixXcd numeric = numeric_cotangent(
        [&](const MatrixXcd& X) {
            return weighted_real_sum(w, qoc::linalg::matmuls(a_value, X, c_value));
        },
        b_value);
    EXPECT_TRUE(array_all_close(grads[b], numeric, 1e-6, 1e-7));
    EXPECT_EQ(grads[a].cwiseAbs().maxCoeff(), 0.0);

    EXPECT_THROW(matmuls(g, {}), std::invalid_argument);
}

TEST_F(FunctionsTest, ProjectValueAndGradient)
{
    MatrixXcd basis_value = real_orthonormal_rows().topRows(2);
    MatrixXcd x_value = sample(4, 1, 541);
    MatrixXcd w = sample(4, 1, 542);

    Graph g(registry_);
    Variable x = g.variable(x_value);
    Variable basis = g.variable(basis_value);
    Variable y = project(g, x, basis);

    VectorXcd expected = qoc::linalg::project(x_value, basis_value);
    EXPECT_TRUE(array_all_close(g.value(y), expected, 1e-13, 1e-13));

    Gradients grads = g.backward(weighted_real_sum(g, w, y));
    MatrixXcd numeric_x = numeric_cotangent(
        [&](const MatrixXcd& X) {
            MatrixXcd projected = qoc::linalg::project(X, basis_value);
            return weighted_real_sum(w, projected);
        },
        x_value);
    MatrixXcd numeric_basis = numeric_cotangent(
        [&](const MatrixXcd& B) {
            MatrixXcd projected = qoc::linalg::project(x_value, B);
            return weighted_real_sum(w, projected);
        },
        basis_value);
    EXPECT_TRUE(array_all_close(grads[x], numeric_x, 1e-6, 1e-7));
    EXPECT_TRUE(array_all_close(grads[basis], numeric_basis, 1e-6, 1e-7));

    Variable short_x = g.variable(MatrixXcd::Ones(3, 1));
    EXPECT_THROW(project(g, short_x, basis), std::invalid_argument);
}

TEST_F(FunctionsTest, RmsNormValueAndGradient)
{
    MatrixXcd a_value = sample(3, 2, 551);

    Graph g(registry_);
    Variable a = g.variable(a_value);
    Variable rms = rms_norm(g, a);
    EXPECT_NEAR(g.value(rms)(0, 0).real(), qoc::linalg::rms_norm(a_value), 1e-14);
    EXPECT_NEAR(g.value(rms)(0, 0).imag(), 0.0, 1e-14);

    Gradients grads = g.backward(rms);
    MatrixXcd numeric = numeric_cotangent(
        [](const MatrixXcd& X) { return qoc::linalg::rms_norm(X); }, a_value);
    EXPECT_TRUE(array_all_close(grads[a], numeric, 1e-6, 1e-8));

    // d rms / d a = conj(a) / (count * rms) under the bilinear pairing.
    const double count = static_cast<double>(a_value.size());
    MatrixXcd expected = a_value.conjugate() / (count * qoc::linalg::rms_norm(a_value));
    EXPECT_TRUE(array_all_close(grads[a], expected, 1e-12, 1e-14));
}

TEST_F(FunctionsTest, ColumnVectorListsInGraph)
{
    MatrixXcd x_value = sample(3, 4, 561);
    MatrixXcd w = sample(3, 4, 562);

    Graph g(registry_);
    Variable x = g.variable(x_value);
    std::vector<Variable> columns = matrix_to_column_vector_list(g, x);
    ASSERT_EQ(columns.size(), 4u);
    for (size_t j = 0; j < columns.size(); ++j)
    {
        EXPECT_TRUE(g.value(columns[j]) == x_value.col(static_cast<Index>(j)));
    }

    Variable back = column_vector_list_to_matrix(g, columns);
    EXPECT_TRUE(g.value(back) == x_value);

    Gradients grads = g.backward(weighted_real_sum(g, w, back));
    EXPECT_TRUE(array_all_close(grads[x], w, 0.0, 1e-15));

    EXPECT_THROW(column_vector_list_to_matrix(g, {}), std::invalid_argument);
    Variable short_column = g.variable(MatrixXcd::Ones(2, 1));
    EXPECT_THROW(column_vector_list_to_matrix(g, {columns[0], short_column}),
                 std::invalid_argument);
}

TEST_F(FunctionsTest, ExpmNodeUsesGenericRule)
{
    MatrixXcd m_value = 0.3 * qoc::random_matrix(3, 571);
    MatrixXcd seed = sample(3, 3, 572);

    Graph g(registry_);
    Variable m = g.variable(m_value);
    Variable e = expm(g, m);
    EXPECT_TRUE(array_all_close(g.value(e), qoc::linalg::expm(m_value), 1e-14, 1e-14));

    Gradients grads = g.backward(e, seed);
    MatrixXcd expected = qoc::linalg::expm_vjp(g.value(e), m_value, seed);
    EXPECT_TRUE(array_all_close(grads[m], expected, 1e-14, 1e-14));
}

TEST_F(FunctionsTest, LinearCombination)
{
    MatrixXcd h0 = qoc::random_hermitian(3, 581);
    MatrixXcd h1 = qoc::random_hermitian(3, 582);
    MatrixXcd h2 = qoc::random_hermitian(3, 583);

    Graph g(registry_);
    Variable base = g.constant(h0);
    std::vector<Variable> controls = {g.constant(h1), g.constant(h2)};
    std::vector<Variable> amplitudes = {g.variable(MatrixXcd::Constant(1, 1, 0.25)),
                                        g.variable(MatrixXcd::Constant(1, 1, -1.5))};

    Variable m = linear_combination(g, base, amplitudes, controls);
    EXPECT_TRUE(array_all_close(g.value(m), h0 + 0.25 * h1 - 1.5 * h2, 1e-14, 1e-14));

    EXPECT_THROW(linear_combination(g, base, {amplitudes[0]}, controls), std::invalid_argument);
}

// M = H0 + u1 H1 + u2 H2, loss = sum(G .* exp(M)).
class FastPathTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        H0 = 0.3 * qoc::random_hermitian(4, 601);
        H1 = 0.3 * qoc::random_hermitian(4, 602);
        H2 = 0.3 * qoc::random_hermitian(4, 603);
        G = sample(4, 4, 604);
    }

    struct Recorded
    {
        Variable u1, u2, propagator, loss;
    };

    Recorded record(Graph& g, bool fast_path) const
    {
        Recorded r;
        r.u1 = g.variable(MatrixXcd::Constant(1, 1, u1));
        r.u2 = g.variable(MatrixXcd::Constant(1, 1, u2));
        std::vector<Variable> controls = {g.constant(H1), g.constant(H2)};
        Variable m = linear_combination(g, g.constant(H0), {r.u1, r.u2}, controls);
        r.propagator = fast_path ? expm_fastgrad(g, m, controls) : expm(g, m);
        r.loss = sum(g, hadamard(g, g.constant(G), r.propagator));
        return r;
    }

    std::shared_ptr<const OpRegistry> registry_ = make_default_registry();
    const double u1 = 0.6;
    const double u2 = -0.35;
    MatrixXcd H0, H1, H2, G;
};

TEST_F(FastPathTest, AgreesWithGenericRule)
{
    Graph generic_graph(registry_);
    Recorded generic = record(generic_graph, false);
    Gradients generic_grads = generic_graph.backward(generic.loss);

    Graph fast_graph(registry_);
    Recorded fast = record(fast_graph, true);
    Gradients fast_grads = fast_graph.backward(fast.loss);

    EXPECT_TRUE(array_all_close(fast_graph.value(fast.propagator),
                                generic_graph.value(generic.propagator), 0.0, 0.0));

    const Complex generic_u1 = generic_grads[generic.u1](0, 0);
    const Complex generic_u2 = generic_grads[generic.u2](0, 0);
    EXPECT_NEAR(std::abs(fast_grads[fast.u1](0, 0) - generic_u1), 0.0, 1e-12);
    EXPECT_NEAR(std::abs(fast_grads[fast.u2](0, 0) - generic_u2), 0.0, 1e-12);

    VectorXcd sensitivities = qoc::linalg::control_sensitivities(
        generic_graph.value(generic.propagator), {H1, H2}, G);
    EXPECT_NEAR(std::abs(sensitivities(0) - generic_u1), 0.0, 1e-12);
    EXPECT_NEAR(std::abs(sensitivities(1) - generic_u2), 0.0, 1e-12);
}

TEST_F(FastPathTest, ControlMatricesGetZeroGradient)
{
    Graph g(registry_);
    Variable u = g.variable(MatrixXcd::Constant(1, 1, u1));
    Variable m = linear_combination(g, g.constant(H0), {u}, {g.constant(H1)});

    // Differentiable leaves holding the control matrices, seen only by the
    // fast-path node.
    Variable c1 = g.variable(H1);
    Variable c2 = g.variable(H2);
    Variable e = expm_fastgrad(g, m, {c1, c2});

    for (double magnitude : {1.0, 1e8})
    {
        Gradients grads = g.backward(e, magnitude * G);
        EXPECT_EQ(grads[c1].cwiseAbs().maxCoeff(), 0.0);
        EXPECT_EQ(grads[c2].cwiseAbs().maxCoeff(), 0.0);
        EXPECT_GT(std::abs(grads[u](0, 0)), 0.0);
    }
}

// Commuting (diagonal) generators make the first-order rule exact, so the
// fast path reproduces finite differences in the amplitudes.
TEST_F(FastPathTest, ExactWhenGeneratorsCommute)
{
    MatrixXcd d0 = MatrixXcd::Zero(3, 3);
    MatrixXcd d1 = MatrixXcd::Zero(3, 3);
    MatrixXcd d2 = MatrixXcd::Zero(3, 3);
    d0.diagonal() << 0.2, -0.1, 0.4;
    d1.diagonal() << 1.0, 0.5, -0.3;
    d2.diagonal() << -0.7, 0.2, 0.9;
    MatrixXcd weight = sample(3, 3, 611);

    Graph g(registry_);
    Variable a1 = g.variable(MatrixXcd::Constant(1, 1, u1));
    Variable a2 = g.variable(MatrixXcd::Constant(1, 1, u2));
    std::vector<Variable> controls = {g.constant(d1), g.constant(d2)};
    Variable m = linear_combination(g, g.constant(d0), {a1, a2}, controls);
    Variable loss = sum(g, hadamard(g, g.constant(weight), expm_fastgrad(g, m, controls)));
    Gradients grads = g.backward(loss);

    auto objective = [&](double v1, double v2) {
        MatrixXcd e = qoc::linalg::expm(d0 + v1 * d1 + v2 * d2);
        return (weight.array() * e.array()).sum();
    };
    const double eps = 1e-6;
    const Complex numeric_1 = (objective(u1 + eps, u2) - objective(u1 - eps, u2)) / (2.0 * eps);
    const Complex numeric_2 = (objective(u1, u2 + eps) - objective(u1, u2 - eps)) / (2.0 * eps);
    EXPECT_NEAR(std::abs(grads[a1](0, 0) - numeric_1), 0.0, 1e-7);
    EXPECT_NEAR(std::abs(grads[a2](0, 0) - numeric_2), 0.0, 1e-7);
}
