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

#ifndef QOC_DIFFERENTIABLE_OP_HPP
#define QOC_DIFFERENTIABLE_OP_HPP

#include <Eigen/Dense>
#include <complex>
#include <cstddef>
#include <string>
#include <vector>

namespace qoc
{
namespace autodiff
{

using namespace Eigen;
using Complex = std::complex<double>;

/**
 * @brief Number of inputs accepted by an operation.
 *
 * A fixed arity accepts exactly `count` inputs; a variadic one accepts
 * `count` or more.
 */
struct Arity
{
    size_t count;
    bool variadic = false;

    bool accepts(size_t n) const
    {
        return variadic ? n >= count : n == count;
    }
};

/**
 * @brief An operation recorded as an opaque node of the differentiation graph.
 *
 * The graph never looks inside forward(); gradients flow only through the
 * hand-written backward() rule. Cotangents pair with perturbations through
 * Re(sum(ct .* dX)), so for holomorphic maps the cotangent is the plain
 * complex derivative, with no conjugation.
 */
class DifferentiableOp
{
  public:
    virtual ~DifferentiableOp() = default;

    virtual std::string name() const = 0;

    virtual Arity arity() const = 0;

    virtual MatrixXcd forward(const std::vector<MatrixXcd>& inputs) const = 0;

    /**
     * @brief Maps the cotangent of the output to one cotangent per input.
     * @param output The value forward() produced for `inputs`.
     * @param inputs The forward inputs, in order.
     * @param cotangent Gradient of the final scalar with respect to `output`.
     * @return Cotangents in input order, each with its input's shape.
     */
    virtual std::vector<MatrixXcd> backward(const MatrixXcd& output,
                                            const std::vector<MatrixXcd>& inputs,
                                            const MatrixXcd& cotangent) const = 0;
};

} // namespace autodiff
} // namespace qoc

#endif // QOC_DIFFERENTIABLE_OP_HPP
