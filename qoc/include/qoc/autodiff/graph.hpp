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

#ifndef QOC_GRAPH_HPP
#define QOC_GRAPH_HPP

#include "qoc/autodiff/op_registry.hpp"
#include "qoc/linalg/matrix_utils.hpp"

#include <Eigen/Dense>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace qoc
{
namespace autodiff
{

using namespace Eigen;

/**
 * @brief Handle to a node of a Graph.
 */
struct Variable
{
    size_t index;
};

/**
 * @brief Gradients of one backward pass, indexed by Variable.
 */
class Gradients
{
  public:
    explicit Gradients(std::vector<MatrixXcd> grads) : grads_(std::move(grads))
    {}

    const MatrixXcd& operator[](Variable v) const
    {
        if (v.index >= grads_.size())
        {
            throw std::out_of_range("Gradients: variable " + std::to_string(v.index) +
                                    " does not belong to this pass");
        }
        return grads_[v.index];
    }

  private:
    std::vector<MatrixXcd> grads_;
};

/**
 * @brief Append-only tape of matrix-valued operations.
 *
 * Nodes are stored in creation order, which is a topological order, so the
 * backward pass is a single reverse sweep. Values are immutable once recorded.
 */
class Graph
{
  public:
    explicit Graph(std::shared_ptr<const OpRegistry> registry) : registry_(std::move(registry))
    {
        if (!registry_)
        {
            throw std::invalid_argument("Graph: registry must not be null");
        }
    }

    /// Adds a leaf that receives a gradient.
    Variable variable(const MatrixXcd& value)
    {
        return push_leaf(value, true);
    }

    /// Adds a leaf that never receives a gradient.
    Variable constant(const MatrixXcd& value)
    {
        return push_leaf(value, false);
    }

    /**
     * @brief Evaluates a registered operation and records it.
     * @throws std::out_of_range if `op_name` is not registered.
     * @throws std::invalid_argument if the input count does not match the
     * operation's arity.
     */
    Variable apply(const std::string& op_name, const std::vector<Variable>& inputs)
    {
        const DifferentiableOp& op = registry_->get(op_name);
        if (!op.arity().accepts(inputs.size()))
        {
            throw std::invalid_argument("Graph: operation '" + op_name + "' does not accept " +
                                        std::to_string(inputs.size()) + " inputs");
        }

        Node node;
        node.op = &op;
        node.requires_grad = false;
        node.inputs.reserve(inputs.size());
        for (const auto& input : inputs)
        {
            node.inputs.push_back(checked(input).index);
            node.requires_grad = node.requires_grad || nodes_[input.index].requires_grad;
        }
        node.value = op.forward(input_values(node));
        nodes_.push_back(std::move(node));
        return Variable{nodes_.size() - 1};
    }

    const MatrixXcd& value(Variable v) const
    {
        return nodes_[checked(v).index].value;
    }

    bool requires_grad(Variable v) const
    {
        return nodes_[checked(v).index].requires_grad;
    }

    size_t size() const
    {
        return nodes_.size();
    }

    /**
     * @brief Backward pass from a 1 x 1 output seeded with 1.
     */
    Gradients backward(Variable output) const
    {
        const MatrixXcd& out = value(output);
        if (out.rows() != 1 || out.cols() != 1)
        {
            throw std::invalid_argument("Graph: backward without a seed needs a 1 x 1 output, got " +
                                        linalg::shape_string(out));
        }
        return backward(output, MatrixXcd::Ones(1, 1));
    }

    /**
     * @brief Backward pass from `output` with cotangent `seed`.
     *
     * Every reached node's backward rule is called with its output, its
     * inputs and its accumulated cotangent. Nodes that do not require a
     * gradient are skipped; their gradient stays zero.
     *
     * @throws std::runtime_error if a rule returns the wrong number or shape
     * of cotangents.
     */
    Gradients backward(Variable output, const MatrixXcd& seed) const
    {
        const size_t root = checked(output).index;
        linalg::require_same_shape(nodes_[root].value, seed, "Graph::backward seed");

        std::vector<MatrixXcd> grads;
        grads.reserve(nodes_.size());
        for (const auto& node : nodes_)
        {
            grads.push_back(MatrixXcd::Zero(node.value.rows(), node.value.cols()));
        }
        std::vector<bool> reached(nodes_.size(), false);
        grads[root] = seed;
        reached[root] = true;

        for (size_t i = root + 1; i-- > 0;)
        {
            const Node& node = nodes_[i];
            if (!reached[i] || !node.requires_grad || node.op == nullptr)
            {
                continue;
            }
            std::vector<MatrixXcd> cotangents =
                node.op->backward(node.value, input_values(node), grads[i]);
            if (cotangents.size() != node.inputs.size())
            {
                throw std::runtime_error("Graph: backward of '" + node.op->name() + "' returned " +
                                         std::to_string(cotangents.size()) +
                                         " cotangents for " +
                                         std::to_string(node.inputs.size()) + " inputs");
            }
            for (size_t k = 0; k < node.inputs.size(); ++k)
            {
                const size_t input = node.inputs[k];
                if (!nodes_[input].requires_grad)
                {
                    continue;
                }
                if (cotangents[k].rows() != grads[input].rows() ||
                    cotangents[k].cols() != grads[input].cols())
                {
                    throw std::runtime_error("Graph: backward of '" + node.op->name() +
                                             "' returned cotangent of shape " +
                                             linalg::shape_string(cotangents[k]) +
                                             " for input of shape " +
                                             linalg::shape_string(grads[input]));
                }
                grads[input] += cotangents[k];
                reached[input] = true;
            }
        }
        return Gradients(std::move(grads));
    }

  private:
    struct Node
    {
        const DifferentiableOp* op = nullptr; // null for leaves
        std::vector<size_t> inputs;
        MatrixXcd value;
        bool requires_grad = false;
    };

    Variable push_leaf(const MatrixXcd& value, bool requires_grad)
    {
        Node node;
        node.value = value;
        node.requires_grad = requires_grad;
        nodes_.push_back(std::move(node));
        return Variable{nodes_.size() - 1};
    }

    Variable checked(Variable v) const
    {
        if (v.index >= nodes_.size())
        {
            throw std::out_of_range("Graph: variable " + std::to_string(v.index) +
                                    " does not belong to this graph");
        }
        return v;
    }

    std::vector<MatrixXcd> input_values(const Node& node) const
    {
        std::vector<MatrixXcd> values;
        values.reserve(node.inputs.size());
        for (size_t input : node.inputs)
        {
            values.push_back(nodes_[input].value);
        }
        return values;
    }

    std::shared_ptr<const OpRegistry> registry_;
    std::vector<Node> nodes_;
};

} // namespace autodiff
} // namespace qoc

#endif // QOC_GRAPH_HPP
