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

#ifndef GRADCHECK_HELPER_HPP_
#define GRADCHECK_HELPER_HPP_

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

inline std::string get_time(bool compact = false)
{
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    if (compact)
        ss << std::put_time(
            std::localtime(&in_time_t),
            "%Y%m%d%H%M%S"
        ); // Format: YYYYMMDDHHMMSS
    else
        ss << std::put_time(
            std::localtime(&in_time_t),
            "%Y-%m-%d %H:%M:%S"
        ); // Format: YYYY-MM-DD HH:MM:SS
    return ss.str();
}

struct GradCheckConfig {
    std::string date_str = get_time(true);
    std::string run_id = date_str;
    std::string input_file = ""; // JSON control problem; random problem if empty
    uint64_t dimension = 4;      // Hilbert-space dimension of a random problem
    uint64_t n_controls = 2;     // number of control channels of a random problem
    double time_step = 0.1;      // propagator time step of a random problem
    double epsilon = 1e-6;       // central finite-difference step
    double tolerance = 1e-8;     // allowed relative gap between generic and fast paths
    unsigned int seed = 1234;
    bool verbose = false; // print messages to stdout

    std::string summary() const
    {
        std::stringstream ss;
        ss << "# date: " << date_str << std::endl;
        ss << "# run_id:" << run_id << std::endl;
        ss << "# input_file: " << (input_file.empty() ? "<random>" : input_file) << std::endl;
        ss << "# dimension: " << dimension << std::endl;
        ss << "# n_controls: " << n_controls << std::endl;
        ss << "# time_step: " << time_step << std::endl;
        ss << "# epsilon: " << epsilon << std::endl;
        ss << "# tolerance: " << tolerance << std::endl;
        ss << "# seed: " << seed << std::endl;
        return ss.str();
    }
};

inline void log(const GradCheckConfig &config, const std::vector<std::string> &messages)
{
    if (config.verbose) {
        std::cout << get_time();
        std::cout << ": ";
        for (auto &msg : messages)
            std::cout << msg;
        std::cout << std::endl;
    }
}

inline void error(const GradCheckConfig &config, const std::vector<std::string> &messages)
{
    if (config.verbose) {
        std::cerr << get_time();
        std::cerr << ": ";
        for (auto &msg : messages)
            std::cerr << msg;
        std::cerr << std::endl;
    }
}

// Value following a flag; fails fast when the command line ends early.
inline std::string flag_value(int argc, char *argv[], int i)
{
    if (i + 1 >= argc) {
        throw std::invalid_argument(
            std::string("missing value for command line flag ") + argv[i]
        );
    }
    return std::string(argv[i + 1]);
}

inline GradCheckConfig generate_grad_check_config(int argc, char *argv[])
{
    GradCheckConfig config;
    for (int i = 1; i < argc; i++) {
        const std::string arg(argv[i]);
        if (arg == "--input") {
            config.input_file = flag_value(argc, argv, i);
            i++;
        } else if (arg == "--dimension") {
            config.dimension = std::stoul(flag_value(argc, argv, i));
            i++;
        } else if (arg == "--controls") {
            config.n_controls = std::stoul(flag_value(argc, argv, i));
            i++;
        } else if (arg == "--time_step") {
            config.time_step = std::stod(flag_value(argc, argv, i));
            i++;
        } else if (arg == "--epsilon") {
            config.epsilon = std::stod(flag_value(argc, argv, i));
            i++;
        } else if (arg == "--tolerance") {
            config.tolerance = std::stod(flag_value(argc, argv, i));
            i++;
        } else if (arg == "--seed") {
            config.seed = static_cast<unsigned int>(std::stoul(flag_value(argc, argv, i)));
            i++;
        } else if (arg == "--run_id") {
            config.run_id = flag_value(argc, argv, i);
            i++;
        } else if (arg == "-v") {
            config.verbose = true;
        } else {
            throw std::invalid_argument("unknown command line flag: " + arg);
        }
    }
    if (config.dimension == 0) {
        throw std::invalid_argument("--dimension must be positive");
    }
    return config;
}

#endif
