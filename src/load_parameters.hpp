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

#ifndef LOAD_PARAMETERS_HPP_
#define LOAD_PARAMETERS_HPP_

#include <complex>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include <Eigen/Dense>
#include <nlohmann/json.hpp>

#include "gradcheck_helper.hpp"
#include "qoc/random_matrix.hpp"

// H(u) = drift_hamiltonian + sum_k control_amplitudes[k] * control_hamiltonians[k],
// propagated for time_step and compared against target_unitary.
struct ControlProblem {
    Eigen::MatrixXcd drift_hamiltonian;
    std::vector<Eigen::MatrixXcd> control_hamiltonians;
    std::vector<double> control_amplitudes;
    double time_step = 0.0;
    Eigen::MatrixXcd target_unitary;

    Eigen::Index dimension() const
    {
        return drift_hamiltonian.rows();
    }
};

// Matrix entries are either plain numbers or [re, im] pairs.
inline std::complex<double> parse_entry(const nlohmann::json &entry, const std::string &where)
{
    if (entry.is_number()) {
        return {entry.get<double>(), 0.0};
    }
    if (entry.is_array() && entry.size() == 2 && entry[0].is_number() &&
        entry[1].is_number()) {
        return {entry[0].get<double>(), entry[1].get<double>()};
    }
    throw std::runtime_error(where + ": matrix entries must be numbers or [re, im] pairs");
}

inline Eigen::MatrixXcd parse_matrix(const nlohmann::json &node, const std::string &where)
{
    if (!node.is_array() || node.empty() || !node[0].is_array()) {
        throw std::runtime_error(where + ": expected a non-empty list of rows");
    }
    const auto rows = static_cast<Eigen::Index>(node.size());
    const auto cols = static_cast<Eigen::Index>(node[0].size());
    Eigen::MatrixXcd mat(rows, cols);
    for (Eigen::Index i = 0; i < rows; ++i) {
        const auto &row = node[static_cast<size_t>(i)];
        if (!row.is_array() || static_cast<Eigen::Index>(row.size()) != cols) {
            throw std::runtime_error(
                where + ": row " + std::to_string(i) + " must have " +
                std::to_string(cols) + " entries"
            );
        }
        for (Eigen::Index j = 0; j < cols; ++j) {
            mat(i, j) = parse_entry(row[static_cast<size_t>(j)], where);
        }
    }
    return mat;
}

inline void validate_control_problem(const ControlProblem &problem, const std::string &where)
{
    const auto n = problem.drift_hamiltonian.rows();
    if (problem.drift_hamiltonian.cols() != n) {
        throw std::runtime_error(where + ": drift_hamiltonian must be square");
    }
    for (const auto &control : problem.control_hamiltonians) {
        if (control.rows() != n || control.cols() != n) {
            throw std::runtime_error(
                where + ": every control_hamiltonian must match the drift_hamiltonian shape"
            );
        }
    }
    if (problem.control_amplitudes.size() != problem.control_hamiltonians.size()) {
        throw std::runtime_error(
            where + ": control_amplitudes has " +
            std::to_string(problem.control_amplitudes.size()) + " entries for " +
            std::to_string(problem.control_hamiltonians.size()) + " control_hamiltonians"
        );
    }
    if (problem.target_unitary.rows() != n || problem.target_unitary.cols() != n) {
        throw std::runtime_error(
            where + ": target_unitary must match the drift_hamiltonian shape"
        );
    }
}

inline ControlProblem load_control_problem(const std::string &filepath)
{
    std::ifstream i(filepath);
    if (!i.is_open()) {
        throw std::runtime_error("Could not open file: " + filepath);
    }

    nlohmann::json input;
    i >> input;

    for (const char *key : {"drift_hamiltonian", "control_hamiltonians",
                            "control_amplitudes", "time_step"}) {
        if (!input.contains(key)) {
            throw std::runtime_error(
                std::string("no ") + key + " in control problem json: file=" + filepath
            );
        }
    }

    ControlProblem problem;
    problem.drift_hamiltonian =
        parse_matrix(input["drift_hamiltonian"], filepath + ": drift_hamiltonian");

    const auto &controls = input["control_hamiltonians"];
    if (!controls.is_array()) {
        throw std::runtime_error(filepath + ": control_hamiltonians must be a list");
    }
    for (size_t k = 0; k < controls.size(); ++k) {
        problem.control_hamiltonians.push_back(parse_matrix(
            controls[k], filepath + ": control_hamiltonians[" + std::to_string(k) + "]"
        ));
    }

    const auto &amplitudes = input["control_amplitudes"];
    if (!amplitudes.is_array()) {
        throw std::runtime_error(filepath + ": control_amplitudes must be a list");
    }
    for (size_t k = 0; k < amplitudes.size(); ++k) {
        if (!amplitudes[k].is_number()) {
            throw std::runtime_error(
                filepath + ": control_amplitudes[" + std::to_string(k) + "] must be a number"
            );
        }
        problem.control_amplitudes.push_back(amplitudes[k].get<double>());
    }
    problem.time_step = input["time_step"].get<double>();

    // Without a target, the identity gate is requested.
    if (input.contains("target_unitary")) {
        problem.target_unitary =
            parse_matrix(input["target_unitary"], filepath + ": target_unitary");
    } else {
        const auto n = problem.drift_hamiltonian.rows();
        problem.target_unitary = Eigen::MatrixXcd::Identity(n, n);
    }

    validate_control_problem(problem, filepath);
    return problem;
}

// Problem used when no --input is given: Hermitian drift and controls, uniform
// amplitudes in [-1, 1] and a Haar-like target, all derived from config.seed.
inline ControlProblem random_control_problem(const GradCheckConfig &config)
{
    const int n = static_cast<int>(config.dimension);
    ControlProblem problem;
    problem.drift_hamiltonian = qoc::random_hermitian(n, config.seed);

    std::mt19937 rng(config.seed);
    std::uniform_real_distribution<double> dist(-1.0, 1.0);
    for (uint64_t k = 0; k < config.n_controls; ++k) {
        problem.control_hamiltonians.push_back(
            qoc::random_hermitian(n, config.seed + static_cast<unsigned int>(k) + 1)
        );
        problem.control_amplitudes.push_back(dist(rng));
    }
    problem.time_step = config.time_step;
    problem.target_unitary = qoc::random_unitary(n, config.seed + 1000);

    validate_control_problem(problem, "random control problem");
    return problem;
}

#endif
