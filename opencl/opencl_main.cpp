///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "optimizer.hpp"
#include "opencl_evaluator.hpp"
#include "formatting.hpp"
#include "demo_instances.hpp"
#include "run_options.hpp"
#include "time_slots.hpp"
#include <chrono>
#include <iostream>
#include <memory>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <vector>

///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Demo entry point for the GPU-scored optimizer.
 *
 * Runs the same genetic optimizer as the threaded driver, but every
 * generation is scored in one OpenCL kernel launch. Falls back to CPU
 * scoring when no OpenCL device is available.
 */
int main(int argc, char** argv) {
    RunOptions opts;
    try {
        opts = parseRunOptions(argc, argv, /*defaultThreads=*/0);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n" << usage(argv[0]);
        return 2;
    }
    if (opts.help) {
        std::cout << usage(argv[0]);
        return 0;
    }
    spdlog::set_level(opts.verbose ? spdlog::level::debug : spdlog::level::info);

    ProblemInstance inst = makeDemoInstance(opts.size);
    TimetableSettings settings;
    settings.breaks.push_back({"Lunch", "12:00", "13:00"});
    std::vector<std::string> slotLabels;
    for (const TimeSlot& slot : generateTimeSlots(settings)) slotLabels.push_back(slot.label);
    inst.geometry.slotsPerDay = (int)slotLabels.size();

    std::cout << "========================================\n";
    std::cout << "OPENCL-SCORED TIMETABLE OPTIMIZER\n";
    std::cout << "Population: " << opts.config.populationSize << "\n";
    std::cout << "========================================\n";

    Optimizer optimizer(opts.config, std::make_shared<RuleBasedAdvisor>());
    const int numThreads = opts.config.numThreads;
    optimizer.setEvaluatorFactory([numThreads](const FitnessEvaluator& fitness) {
        return std::make_unique<OpenCLPopulationEvaluator>(fitness, numThreads);
    });

    SolveRequest request;
    request.candidateCount = opts.candidateCount;

    auto start = std::chrono::high_resolution_clock::now();
    std::vector<Candidate> candidates;
    try {
        candidates = optimizer.solve(inst, request);
    } catch (const std::exception& e) {
        std::cerr << "Cannot optimize: " << e.what() << "\n";
        return 1;
    }
    auto end = std::chrono::high_resolution_clock::now();
    double elapsedMs = std::chrono::duration<double, std::milli>(end - start).count();

    std::cout << "OpenCL optimizer time: " << elapsedMs << " ms\n";
    for (size_t i = 0; i < candidates.size(); ++i) {
        std::cout << "\nCandidate " << i + 1 << ": ";
        printMetrics(std::cout, candidates[i].metrics);
    }
    if (!candidates.empty()) {
        std::cout << "\nBest timetable:\n";
        printBatchSchedules(std::cout, inst, candidates.front().timetable, slotLabels);
    }
    std::cout << "========================================\n";
    return 0;
}
