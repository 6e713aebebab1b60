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

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "gradcheck_helper.hpp"
#include "load_parameters.hpp"
#include "qoc/autodiff/autodiff.hpp"
#include "qoc/linalg/linalg.hpp"

using namespace Eigen;
using namespace qoc;

// Gate infidelity 1 - |tr(V^H U)|^2 / n^2 with U = exp(-i dt H(u)), recorded in
// a graph so both exponential rules can be compared on the same cost.
struct CostGraph {
    autodiff::Variable cost;
    autodiff::Variable propagator;
    std::vector<autodiff::Variable> amplitudes;
    std::vector<MatrixXcd> generators; // -i dt H_k, i.e. dM/du_k
};

static CostGraph
build_cost(autodiff::Graph &graph, const ControlProblem &problem, bool fast_path)
{
    const Complex minus_i_dt(0.0, -problem.time_step);
    const auto n = static_cast<double>(problem.dimension());

    CostGraph result;
    std::vector<autodiff::Variable> controls;
    for (size_t k = 0; k < problem.control_hamiltonians.size(); ++k) {
        result.generators.push_back(minus_i_dt * problem.control_hamiltonians[k]);
        controls.push_back(graph.constant(result.generators.back()));
        result.amplitudes.push_back(
            graph.variable(MatrixXcd::Constant(1, 1, problem.control_amplitudes[k]))
        );
    }

    // M = -i dt H0 + sum_k u_k (-i dt H_k)
    auto base = graph.constant(minus_i_dt * problem.drift_hamiltonian);
    auto exponent = autodiff::linear_combination(graph, base, result.amplitudes, controls);

    result.propagator = fast_path ? autodiff::expm_fastgrad(graph, exponent, controls)
                                  : autodiff::expm(graph, exponent);

    auto target_conj = graph.constant(problem.target_unitary.conjugate());
    auto overlap =
        autodiff::sum(graph, autodiff::hadamard(graph, target_conj, result.propagator));
    auto overlap_sq = autodiff::real(
        graph, autodiff::hadamard(graph, overlap, autodiff::conjugate(graph, overlap))
    );
    auto fidelity = autodiff::scale(
        graph, graph.constant(MatrixXcd::Constant(1, 1, 1.0 / (n * n))), overlap_sq
    );
    result.cost = autodiff::subtract(
        graph, graph.constant(MatrixXcd::Ones(1, 1)), fidelity
    );
    return result;
}

// Same cost, evaluated without a graph for finite differences.
static double infidelity(const ControlProblem &problem, const std::vector<double> &amplitudes)
{
    MatrixXcd hamiltonian = problem.drift_hamiltonian;
    for (size_t k = 0; k < amplitudes.size(); ++k) {
        hamiltonian += amplitudes[k] * problem.control_hamiltonians[k];
    }
    MatrixXcd propagator =
        linalg::expm(Complex(0.0, -problem.time_step) * hamiltonian);
    Complex overlap = (problem.target_unitary.adjoint() * propagator).trace();
    const auto n = static_cast<double>(problem.dimension());
    return 1.0 - std::norm(overlap) / (n * n);
}

static std::string format_double(double value)
{
    std::stringstream ss;
    ss << std::scientific << std::setprecision(6) << value;
    return ss.str();
}

// Relative for gradients above 1 in magnitude, absolute below.
static double relative_gap(double a, double b)
{
    return std::abs(a - b) / std::max({std::abs(a), std::abs(b), 1.0});
}

int main(int argc, char *argv[])
{
    try {
        GradCheckConfig config = generate_grad_check_config(argc, argv);
        if (config.verbose) {
            std::cout << config.summary();
        }

        ControlProblem problem;
        if (config.input_file.empty()) {
            problem = random_control_problem(config);
            log(config, {"random control problem generated. dimension=",
                         std::to_string(problem.dimension()), ", controls=",
                         std::to_string(problem.control_hamiltonians.size())});
        } else {
            problem = load_control_problem(config.input_file);
            log(config, {"control problem is loaded. file=", config.input_file});
        }

        if (!linalg::is_hermitian(problem.drift_hamiltonian)) {
            error(config, {"drift_hamiltonian is not Hermitian; propagator is not unitary"});
        }
        for (size_t k = 0; k < problem.control_hamiltonians.size(); ++k) {
            if (!linalg::is_hermitian(problem.control_hamiltonians[k])) {
                error(config, {"control_hamiltonians[", std::to_string(k),
                               "] is not Hermitian"});
            }
        }

        // Operators are registered once, before any graph is built.
        auto registry = autodiff::make_default_registry();
        log(config, {"registered operations: ", std::to_string(registry->size())});

        autodiff::Graph generic_graph(registry);
        CostGraph generic = build_cost(generic_graph, problem, false);
        auto generic_grads = generic_graph.backward(generic.cost);

        autodiff::Graph fast_graph(registry);
        CostGraph fast = build_cost(fast_graph, problem, true);
        auto fast_grads = fast_graph.backward(fast.cost);

        const MatrixXcd &propagator = generic_graph.value(generic.propagator);
        if (!linalg::is_unitary(propagator, 1e-8, 1e-10)) {
            error(config, {"propagator deviates from unitarity"});
        }

        // dcost/du_k straight from the control generators and the propagator
        // cotangent.
        VectorXcd sensitivities = linalg::control_sensitivities(
            propagator, generic.generators, generic_grads[generic.propagator]
        );

        const double cost = generic_graph.value(generic.cost)(0, 0).real();
        std::cout << "cost: " << format_double(cost) << std::endl;
        std::cout << std::setw(8) << "control" << std::setw(16) << "generic"
                  << std::setw(16) << "fast_path" << std::setw(16) << "sensitivity"
                  << std::setw(16) << "finite_diff" << std::endl;

        double worst_gap = 0.0;
        for (size_t k = 0; k < problem.control_amplitudes.size(); ++k) {
            const double generic_grad = generic_grads[generic.amplitudes[k]](0, 0).real();
            const double fast_grad = fast_grads[fast.amplitudes[k]](0, 0).real();
            const double sensitivity = sensitivities(static_cast<Index>(k)).real();

            std::vector<double> plus = problem.control_amplitudes;
            std::vector<double> minus = problem.control_amplitudes;
            plus[k] += config.epsilon;
            minus[k] -= config.epsilon;
            const double finite_diff =
                (infidelity(problem, plus) - infidelity(problem, minus)) /
                (2.0 * config.epsilon);

            std::cout << std::setw(8) << k << std::setw(16) << format_double(generic_grad)
                      << std::setw(16) << format_double(fast_grad) << std::setw(16)
                      << format_double(sensitivity) << std::setw(16)
                      << format_double(finite_diff) << std::endl;

            worst_gap = std::max(worst_gap, relative_gap(generic_grad, fast_grad));
            worst_gap = std::max(worst_gap, relative_gap(generic_grad, sensitivity));
            log(config, {"control ", std::to_string(k),
                         ": first-order vs finite-difference relative gap=",
                         format_double(relative_gap(generic_grad, finite_diff))});
        }

        log(config, {"largest generic/fast gap: ", format_double(worst_gap)});
        if (worst_gap > config.tolerance) {
            std::cerr << "generic and fast-path gradients disagree: gap "
                      << format_double(worst_gap) << " exceeds tolerance "
                      << format_double(config.tolerance) << std::endl;
            return 1;
        }
        return 0;
    } catch (const std::exception &e) {
        std::cerr << "Unhandled exception in main: " << e.what() << std::endl;
        return 1;
    }
}
