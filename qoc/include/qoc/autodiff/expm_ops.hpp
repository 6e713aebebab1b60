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

#ifndef QOC_EXPM_OPS_HPP
#define QOC_EXPM_OPS_HPP

#include "qoc/autodiff/differentiable_op.hpp"
#include "qoc/autodiff/op_registry.hpp"
#include "qoc/linalg/expm.hpp"

#include <memory>
#include <utility>
#include <vector>

namespace qoc
{
namespace autodiff
{

/**
 * @brief exp(M) as an opaque primitive with the first-order Frechet rule.
 *
 * Inputs: [M].
 */
class ExpmOp : public DifferentiableOp
{
  public:
    static constexpr const char* NAME = "expm";
    std::string name() const override { return NAME; }
    Arity arity() const override { return {1}; }

    MatrixXcd forward(const std::vector<MatrixXcd>& inputs) const override
    {
        return linalg::expm(inputs[0]);
    }

    std::vector<MatrixXcd> backward(const MatrixXcd& output,
                                    const std::vector<MatrixXcd>& inputs,
                                    const MatrixXcd& cotangent) const override
    {
        return {linalg::expm_vjp(output, inputs[0], cotangent)};
    }
};

/**
 * @brief exp(M) for M = H0 + sum_k u_k H_k, carrying the control matrices.
 *
 * Inputs: [M, H_1, ..., H_k]. The control matrices are passed only so the
 * backward rule can see them; their cotangents are always zero.
 *
 * The cotangent of M is the matrix form G * E^T of the generic gradient; the
 * per-control accumulation sum(G .* (H_k * E)) is linalg::control_sensitivities.
 */
class ExpmFastgradOp : public DifferentiableOp
{
  public:
    static constexpr const char* NAME = "expm_fastgrad";
    std::string name() const override { return NAME; }
    Arity arity() const override { return {1, true}; }

    MatrixXcd forward(const std::vector<MatrixXcd>& inputs) const override
    {
        return linalg::expm_fastgrad(inputs[0], control_matrices(inputs));
    }

    std::vector<MatrixXcd> backward(const MatrixXcd& output,
                                    const std::vector<MatrixXcd>& inputs,
                                    const MatrixXcd& cotangent) const override
    {
        const std::vector<MatrixXcd> controls = control_matrices(inputs);
        std::vector<MatrixXcd> cotangents;
        cotangents.reserve(inputs.size());
        cotangents.push_back(linalg::expm_fastgrad_vjp(output, inputs[0], controls, cotangent));
        for (auto& ct : linalg::expm_fastgrad_vjp_controls(output, inputs[0], controls, cotangent))
        {
            cotangents.push_back(std::move(ct));
        }
        return cotangents;
    }

  private:
    static std::vector<MatrixXcd> control_matrices(const std::vector<MatrixXcd>& inputs)
    {
        return std::vector<MatrixXcd>(inputs.begin() + 1, inputs.end());
    }
};

inline void register_expm_ops(OpRegistry& registry)
{
    registry.register_op(std::make_shared<ExpmOp>());
    registry.register_op(std::make_shared<ExpmFastgradOp>());
}

} // namespace autodiff
} // namespace qoc

#endif // QOC_EXPM_OPS_HPP
