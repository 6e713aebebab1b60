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

#ifndef QOC_AUTODIFF_HPP
#define QOC_AUTODIFF_HPP

#include "qoc/autodiff/differentiable_op.hpp"
#include "qoc/autodiff/expm_ops.hpp"
#include "qoc/autodiff/functions.hpp"
#include "qoc/autodiff/graph.hpp"
#include "qoc/autodiff/op_registry.hpp"
#include "qoc/autodiff/standard_ops.hpp"

#include <memory>

namespace qoc
{
namespace autodiff
{

/**
 * @brief A registry holding the standard primitives and both exponential
 * operators.
 */
inline std::shared_ptr<const OpRegistry> make_default_registry()
{
    auto registry = std::make_shared<OpRegistry>();
    register_standard_ops(*registry);
    register_expm_ops(*registry);
    return registry;
}

} // namespace autodiff
} // namespace qoc

#endif // QOC_AUTODIFF_HPP
