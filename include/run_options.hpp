#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "demo_instances.hpp"
#include "optimizer.hpp"
#include <string>


///////////////////////////
///       OPTIONS       ///
///////////////////////////
/**
 * @brief Command-line options shared by the demo drivers.
 */
struct RunOptions {
    DemoSize size = DemoSize::S;
    OptimizerConfig config;
    int candidateCount = 3;
    bool verbose = false;
    bool help = false;
};

/**
 * @brief Parse --size, --threads, --seed, --generations, --population,
 * --candidates, --verbose and --help.
 *
 * @param defaultThreads Thread count used when --threads is not given.
 * Throws std::invalid_argument on unknown flags or bad values.
 */
RunOptions parseRunOptions(int argc, char** argv, int defaultThreads);

/// Usage text for a driver.
std::string usage(const std::string& program);
