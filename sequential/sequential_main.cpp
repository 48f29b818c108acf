///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "optimizer.hpp"
#include "analytics.hpp"
#include "diagnostics.hpp"
#include "formatting.hpp"
#include "demo_instances.hpp"
#include "run_options.hpp"
#include "time_slots.hpp"
#include <iostream>
#include <chrono>
#include <memory>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <vector>


///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Demo entry point for the single-threaded optimizer.
 *
 * Builds a demo problem instance, runs pre-flight diagnostics, optimizes it
 * on the calling thread with the rule-based advisor, and prints the metrics
 * and per-batch schedule of every returned candidate.
 */
int main(int argc, char** argv) {
    RunOptions opts;
    try {
        opts = parseRunOptions(argc, argv, /*defaultThreads=*/1);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n" << usage(argv[0]);
        return 2;
    }
    if (opts.help) {
        std::cout << usage(argv[0]);
        return 0;
    }
    spdlog::set_level(opts.verbose ? spdlog::level::debug : spdlog::level::info);

    // Synthetic problem instance for testing/benchmarking.
    ProblemInstance inst = makeDemoInstance(opts.size);

    // College day 09:00-17:00 with a lunch break gives the slot geometry.
    TimetableSettings settings;
    settings.breaks.push_back({"Lunch", "12:00", "13:00"});
    std::vector<std::string> slotLabels;
    for (const TimeSlot& slot : generateTimeSlots(settings)) slotLabels.push_back(slot.label);
    inst.geometry.slotsPerDay = (int)slotLabels.size();

    // Refuse to run on data that cannot produce a usable timetable.
    std::vector<DiagnosticIssue> issues = runPreflightDiagnostics(inst);
    for (const DiagnosticIssue& issue : issues) {
        std::cout << "[" << toString(issue.severity) << "] " << issue.title << ": " << issue.description << "\n";
    }
    if (hasCriticalIssues(issues)) {
        std::cout << "Critical data issues found, not optimizing.\n";
        return 1;
    }

    auto advisor = std::make_shared<RuleBasedAdvisor>();
    Optimizer optimizer(opts.config, advisor);
    SolveRequest request;
    request.candidateCount = opts.candidateCount;

    // Measure wall-clock time of the whole run.
    auto start = std::chrono::high_resolution_clock::now();
    std::vector<Candidate> candidates;
    try {
        candidates = optimizer.solve(inst, request);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Cannot optimize: " << e.what() << "\n";
        return 1;
    }
    auto end = std::chrono::high_resolution_clock::now();
    double ms = std::chrono::duration<double, std::milli>(end - start).count();

    std::cout << "========================================\n";
    std::cout << "SEQUENTIAL TIMETABLE OPTIMIZER\n";
    std::cout << "Batches: " << inst.batches.size() << "\n";
    std::cout << "Generations run: " << optimizer.lastReport().history.size() << "\n";
    std::cout << "Time: " << ms << " ms\n";

    for (size_t i = 0; i < candidates.size(); ++i) {
        std::cout << "\nCandidate " << i + 1 << ": ";
        printMetrics(std::cout, candidates[i].metrics);
    }
    if (!candidates.empty()) {
        std::cout << "\nBest timetable:\n";
        printBatchSchedules(std::cout, inst, candidates.front().timetable, slotLabels);

        ProblemContext ctx(inst);
        const TimetableGrid& best = candidates.front().timetable;
        printAnalytics(std::cout, generateAnalyticsReport(ctx, best));
    }
    std::cout << "========================================\n";
    return 0;
}
