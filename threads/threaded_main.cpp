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
#include "worker_pool.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <vector>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/// Set by Ctrl+C; the optimizer stops at the next generation boundary.
static std::atomic<bool> g_cancel{false};

static void onInterrupt(int) {
    g_cancel = true;
}


///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Demo entry point for the multithreaded optimizer.
 *
 * Same run as the sequential driver, but initialization, offspring
 * generation and scoring are spread over a worker pool (all hardware
 * threads unless --threads is given). Ctrl+C ends the run early and still
 * prints the best timetables found so far.
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
    std::signal(SIGINT, onInterrupt);

    ProblemInstance inst = makeDemoInstance(opts.size);

    // College day 09:00-17:00 with a lunch break gives the slot geometry.
    TimetableSettings settings;
    settings.breaks.push_back({"Lunch", "12:00", "13:00"});
    std::vector<std::string> slotLabels;
    for (const TimeSlot& slot : generateTimeSlots(settings)) slotLabels.push_back(slot.label);
    inst.geometry.slotsPerDay = (int)slotLabels.size();

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
    request.cancel = &g_cancel;

    // Measure wall-clock time for the threaded run.
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

    const RunReport& report = optimizer.lastReport();
    std::cout << "========================================\n";
    std::cout << "THREADED TIMETABLE OPTIMIZER\n";
    std::cout << "Threads: " << resolveThreadCount(opts.config.numThreads) << "\n";
    std::cout << "Batches: " << inst.batches.size() << "\n";
    std::cout << "Generations run: " << report.history.size()
              << (report.cancelled ? " (cancelled)" : "") << "\n";
    std::cout << "Interventions applied: " << report.interventionsApplied << "\n";
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

        // Cover list for the first session that is not pinned.
        GuardedAdvisor guard(advisor, opts.config.advisoryTimeout);
        for (const ClassAssignment& a : best.assignments()) {
            if (a.pinned) continue;
            std::cout << "\nSubstitutes for session " << a.id << ":\n";
            printSubstitutes(std::cout, findRankedSubstitutes(ctx, best, a.id, guard));
            break;
        }
    }
    std::cout << "========================================\n";
    return 0;
}
