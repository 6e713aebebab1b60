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

#ifndef QOC_OP_REGISTRY_HPP
#define QOC_OP_REGISTRY_HPP

#include "qoc/autodiff/differentiable_op.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace qoc
{
namespace autodiff
{

/**
 * @brief Name -> operation table consulted by a Graph.
 *
 * Registries are plain values filled by explicit setup calls
 * (register_standard_ops, register_expm_ops); there is no process-wide
 * instance.
 */
class OpRegistry
{
  public:
    void register_op(std::shared_ptr<const DifferentiableOp> op)
    {
        if (!op)
        {
            throw std::invalid_argument("OpRegistry: cannot register a null operation");
        }
        std::string name = op->name();
        if (ops_.count(name) != 0)
        {
            throw std::invalid_argument("OpRegistry: operation '" + name +
                                        "' is already registered");
        }
        ops_.emplace(std::move(name), std::move(op));
    }

    bool contains(const std::string& name) const
    {
        return ops_.count(name) != 0;
    }

    const DifferentiableOp& get(const std::string& name) const
    {
        auto it = ops_.find(name);
        if (it == ops_.end())
        {
            throw std::out_of_range("OpRegistry: unknown operation '" + name + "'");
        }
        return *it->second;
    }

    size_t size() const
    {
        return ops_.size();
    }

  private:
    std::unordered_map<std::string, std::shared_ptr<const DifferentiableOp>> ops_;
};

} // namespace autodiff
} // namespace qoc

#endif // QOC_OP_REGISTRY_HPP
