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

#ifndef QOC_STANDARD_OPS_HPP
#define QOC_STANDARD_OPS_HPP

#include "qoc/autodiff/differentiable_op.hpp"
#include "qoc/autodiff/op_registry.hpp"
#include "qoc/linalg/matrix_utils.hpp"

#include <Eigen/Dense>
#include <memory>
#include <stdexcept>
#include <unsupported/Eigen/KroneckerProduct>
#include <vector>

namespace qoc
{
namespace autodiff
{

using namespace Eigen;
using Complex = std::complex<double>;

// Element-wise and structural primitives. Every composite function in
// functions.hpp is built from these, so none of them needs a custom rule.

class AddOp : public DifferentiableOp
{
  public:
    static constexpr const char* NAME = "add";
    std::string name() const override { return NAME; }
    Arity arity() const override { return {2}; }

    MatrixXcd forward(const std::vector<MatrixXcd>& inputs) const override
    {
        linalg::require_same_shape(inputs[0], inputs[1], NAME);
        return inputs[0] + inputs[1];
    }

    std::vector<MatrixXcd> backward(const MatrixXcd& /*output*/,
                                    const std::vector<MatrixXcd>& /*inputs*/,
                                    const MatrixXcd& cotangent) const override
    {
        return {cotangent, cotangent};
    }
};

class SubtractOp : public DifferentiableOp
{
  public:
    static constexpr const char* NAME = "subtract";
    std::string name() const override { return NAME; }
    Arity arity() const override { return {2}; }

    MatrixXcd forward(const std::vector<MatrixXcd>& inputs) const override
    {
        linalg::require_same_shape(inputs[0], inputs[1], NAME);
        return inputs[0] - inputs[1];
    }

    std::vector<MatrixXcd> backward(const MatrixXcd& /*output*/,
                                    const std::vector<MatrixXcd>& /*inputs*/,
                                    const MatrixXcd& cotangent) const override
    {
        return {cotangent, -cotangent};
    }
};

class MatmulOp : public DifferentiableOp
{
  public:
    static constexpr const char* NAME = "matmul";
    std::string name() const override { return NAME; }
    Arity arity() const override { return {2}; }

    MatrixXcd forward(const std::vector<MatrixXcd>& inputs) const override
    {
        linalg::require_multipliable(inputs[0], inputs[1], NAME);
        return inputs[0] * inputs[1];
    }

    // Transposes, not adjoints: the pairing is bilinear.
    std::vector<MatrixXcd> backward(const MatrixXcd& /*output*/,
                                    const std::vector<MatrixXcd>& inputs,
                                    const MatrixXcd& cotangent) const override
    {
        MatrixXcd ct_a = cotangent * inputs[1].transpose();
        MatrixXcd ct_b = inputs[0].transpose() * cotangent;
        return {ct_a, ct_b};
    }
};

class HadamardOp : public DifferentiableOp
{
  public:
    static constexpr const char* NAME = "hadamard";
    std::string name() const override { return NAME; }
    Arity arity() const override { return {2}; }

    MatrixXcd forward(const std::vector<MatrixXcd>& inputs) const override
    {
        linalg::require_same_shape(inputs[0], inputs[1], NAME);
        return inputs[0].cwiseProduct(inputs[1]);
    }

    std::vector<MatrixXcd> backward(const MatrixXcd& /*output*/,
                                    const std::vector<MatrixXcd>& inputs,
                                    const MatrixXcd& cotangent) const override
    {
        MatrixXcd ct_a = cotangent.cwiseProduct(inputs[1]);
        MatrixXcd ct_b = cotangent.cwiseProduct(inputs[0]);
        return {ct_a, ct_b};
    }
};

/// Scalar (1 x 1) times matrix.
class ScaleOp : public DifferentiableOp
{
  public:
    static constexpr const char* NAME = "scale";
    std::string name() const override { return NAME; }
    Arity arity() const override { return {2}; }

    MatrixXcd forward(const std::vector<MatrixXcd>& inputs) const override
    {
        if (inputs[0].rows() != 1 || inputs[0].cols() != 1)
        {
            throw std::invalid_argument(std::string(NAME) + ": scalar must be 1 x 1, got " +
                                        linalg::shape_string(inputs[0]));
        }
        return inputs[0](0, 0) * inputs[1];
    }

    std::vector<MatrixXcd> backward(const MatrixXcd& /*output*/,
                                    const std::vector<MatrixXcd>& inputs,
                                    const MatrixXcd& cotangent) const override
    {
        MatrixXcd ct_scalar(1, 1);
        ct_scalar(0, 0) = (cotangent.array() * inputs[1].array()).sum();
        MatrixXcd ct_mat = inputs[0](0, 0) * cotangent;
        return {ct_scalar, ct_mat};
    }
};

class ConjugateOp : public DifferentiableOp
{
  public:
    static constexpr const char* NAME = "conjugate";
    std::string name() const override { return NAME; }
    Arity arity() const override { return {1}; }

    MatrixXcd forward(const std::vector<MatrixXcd>& inputs) const override
    {
        return inputs[0].conjugate();
    }

    std::vector<MatrixXcd> backward(const MatrixXcd& /*output*/,
                                    const std::vector<MatrixXcd>& /*inputs*/,
                                    const MatrixXcd& cotangent) const override
    {
        return {cotangent.conjugate()};
    }
};

class TransposeOp : public DifferentiableOp
{
  public:
    static constexpr const char* NAME = "transpose";
    std::string name() const override { return NAME; }
    Arity arity() const override { return {1}; }

    MatrixXcd forward(const std::vector<MatrixXcd>& inputs) const override
    {
        return inputs[0].transpose();
    }

    std::vector<MatrixXcd> backward(const MatrixXcd& /*output*/,
                                    const std::vector<MatrixXcd>& /*inputs*/,
                                    const MatrixXcd& cotangent) const override
    {
        return {cotangent.transpose()};
    }
};

/// Real part, kept as a complex matrix with zero imaginary part.
class RealOp : public DifferentiableOp
{
  public:
    static constexpr const char* NAME = "real";
    std::string name() const override { return NAME; }
    Arity arity() const override { return {1}; }

    MatrixXcd forward(const std::vector<MatrixXcd>& inputs) const override
    {
        return inputs[0].real().cast<Complex>();
    }

    std::vector<MatrixXcd> backward(const MatrixXcd& /*output*/,
                                    const std::vector<MatrixXcd>& /*inputs*/,
                                    const MatrixXcd& cotangent) const override
    {
        MatrixXcd ct = cotangent.real().cast<Complex>();
        return {ct};
    }
};

/// Sum of all entries, as a 1 x 1 matrix.
class SumOp : public DifferentiableOp
{
  public:
    static constexpr const char* NAME = "sum";
    std::string name() const override { return NAME; }
    Arity arity() const override { return {1}; }

    MatrixXcd forward(const std::vector<MatrixXcd>& inputs) const override
    {
        MatrixXcd total(1, 1);
        total(0, 0) = inputs[0].sum();
        return total;
    }

    std::vector<MatrixXcd> backward(const MatrixXcd& /*output*/,
                                    const std::vector<MatrixXcd>& inputs,
                                    const MatrixXcd& cotangent) const override
    {
        MatrixXcd ct = MatrixXcd::Constant(inputs[0].rows(), inputs[0].cols(), cotangent(0, 0));
        return {ct};
    }
};

/// Element-wise principal square root.
class SqrtOp : public DifferentiableOp
{
  public:
    static constexpr const char* NAME = "sqrt";
    std::string name() const override { return NAME; }
    Arity arity() const override { return {1}; }

    MatrixXcd forward(const std::vector<MatrixXcd>& inputs) const override
    {
        return inputs[0].array().sqrt().matrix();
    }

    std::vector<MatrixXcd> backward(const MatrixXcd& output,
                                    const std::vector<MatrixXcd>& /*inputs*/,
                                    const MatrixXcd& cotangent) const override
    {
        MatrixXcd ct = (cotangent.array() / (2.0 * output.array())).matrix();
        return {ct};
    }
};

class KronOp : public DifferentiableOp
{
  public:
    static constexpr const char* NAME = "kron";
    std::string name() const override { return NAME; }
    Arity arity() const override { return {2}; }

    MatrixXcd forward(const std::vector<MatrixXcd>& inputs) const override
    {
        MatrixXcd result = kroneckerProduct(inputs[0], inputs[1]);
        return result;
    }

    // Output block (i, j) is a(i, j) * b.
    std::vector<MatrixXcd> backward(const MatrixXcd& /*output*/,
                                    const std::vector<MatrixXcd>& inputs,
                                    const MatrixXcd& cotangent) const override
    {
        const MatrixXcd& a = inputs[0];
        const MatrixXcd& b = inputs[1];
        MatrixXcd ct_a = MatrixXcd::Zero(a.rows(), a.cols());
        MatrixXcd ct_b = MatrixXcd::Zero(b.rows(), b.cols());
        for (Index i = 0; i < a.rows(); ++i)
        {
            for (Index j = 0; j < a.cols(); ++j)
            {
                auto block = cotangent.block(i * b.rows(), j * b.cols(), b.rows(), b.cols());
                ct_a(i, j) = (block.array() * b.array()).sum();
                ct_b += a(i, j) * block;
            }
        }
        return {ct_a, ct_b};
    }
};

/// Horizontal concatenation of any number of matrices with equal row counts.
class HstackOp : public DifferentiableOp
{
  public:
    static constexpr const char* NAME = "hstack";
    std::string name() const override { return NAME; }
    Arity arity() const override { return {1, true}; }

    MatrixXcd forward(const std::vector<MatrixXcd>& inputs) const override
    {
        const Index rows = inputs.front().rows();
        Index cols = 0;
        for (const auto& input : inputs)
        {
            if (input.rows() != rows)
            {
                throw std::invalid_argument(std::string(NAME) + ": row count mismatch " +
                                            linalg::shape_string(inputs.front()) + " vs " +
                                            linalg::shape_string(input));
            }
            cols += input.cols();
        }
        MatrixXcd result(rows, cols);
        Index offset = 0;
        for (const auto& input : inputs)
        {
            result.middleCols(offset, input.cols()) = input;
            offset += input.cols();
        }
        return result;
    }

    std::vector<MatrixXcd> backward(const MatrixXcd& /*output*/,
                                    const std::vector<MatrixXcd>& inputs,
                                    const MatrixXcd& cotangent) const override
    {
        std::vector<MatrixXcd> cotangents;
        cotangents.reserve(inputs.size());
        Index offset = 0;
        for (const auto& input : inputs)
        {
            cotangents.emplace_back(cotangent.middleCols(offset, input.cols()));
            offset += input.cols();
        }
        return cotangents;
    }
};

/**
 * @brief Registers the element-wise and structural primitives.
 * @throws std::invalid_argument if any of them is already registered.
 */
inline void register_standard_ops(OpRegistry& registry)
{
    registry.register_op(std::make_shared<AddOp>());
    registry.register_op(std::make_shared<SubtractOp>());
    registry.register_op(std::make_shared<MatmulOp>());
    registry.register_op(std::make_shared<HadamardOp>());
    registry.register_op(std::make_shared<ScaleOp>());
    registry.register_op(std::make_shared<ConjugateOp>());
    registry.register_op(std::make_shared<TransposeOp>());
    registry.register_op(std::make_shared<RealOp>());
    registry.register_op(std::make_shared<SumOp>());
    registry.register_op(std::make_shared<SqrtOp>());
    registry.register_op(std::make_shared<KronOp>());
    registry.register_op(std::make_shared<HstackOp>());
}

} // namespace autodiff
} // namespace qoc

#endif // QOC_STANDARD_OPS_HPP
