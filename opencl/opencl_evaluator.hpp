#pragma once
#define CL_TARGET_OPENCL_VERSION 120

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <CL/cl.h>
#include <memory>
#include <vector>
#include "fitness.hpp"
#include "problem_context.hpp"
#include "timetable.hpp"


///////////////////////////
///        TYPES        ///
///////////////////////////
/**
 * @brief Raw soft-constraint counts produced by the scoring kernel.
 */
struct DeviceMetrics {
    int studentGaps = 0;
    int facultyGaps = 0;
    int preferenceViolations = 0;
    std::vector<int> facultyLoads;   ///< Weekly sessions per faculty index.
};


///////////////////////////
///      EVALUATOR      ///
///////////////////////////
/**
 * @brief OpenCL helper context for batched timetable evaluation.
 *
 * Owns the OpenCL platform/device/context/queue and a compiled program
 * used to score a whole population of timetables in one kernel launch,
 * one work item per candidate.
 */
class TimetableOpenCLContext {
public:
    /// Largest instance the kernel's private arrays can hold.
    static constexpr int kMaxFaculty = 64;
    static constexpr int kMaxDays = 7;
    static constexpr int kMaxSlots = 16;

    /**
     * @brief Initialize OpenCL platform, device, context and command queue.
     *
     * Also builds the program containing the scoring kernel. Throws
     * std::runtime_error if any OpenCL call fails.
     */
    TimetableOpenCLContext();

    /**
     * @brief Release all OpenCL resources owned by this context.
     */
    ~TimetableOpenCLContext();

    TimetableOpenCLContext(const TimetableOpenCLContext&) = delete;
    TimetableOpenCLContext& operator=(const TimetableOpenCLContext&) = delete;

    /// True if the kernel's static limits cover this instance.
    static bool fits(const ProblemContext& ctx);

    /**
     * @brief Compute gap, preference and workload counts for many timetables.
     *
     * @param ctx   Problem whose faculty preferences and working days apply.
     * @param grids Timetables to score, all shaped like ctx.emptyGrid().
     * @return One DeviceMetrics per grid, in order.
     */
    std::vector<DeviceMetrics> evaluateBatch(const ProblemContext& ctx,
                                             const std::vector<const TimetableGrid*>& grids);

private:
    cl_platform_id platform = nullptr;
    cl_device_id device = nullptr;
    cl_context context = nullptr;
    cl_program program = nullptr;
    cl_command_queue queue = nullptr;

    cl_program buildProgram(const char* src);
};

/**
 * @brief PopulationEvaluator that scores soft constraints on the GPU.
 *
 * Hard conflicts and unplaced sessions are still counted on the CPU
 * worker pool. Instances beyond the kernel limits are scored entirely by
 * a CpuPopulationEvaluator.
 */
class OpenCLPopulationEvaluator : public PopulationEvaluator {
public:
    /**
     * @param fitness    Evaluator supplying weights and CPU-side counts.
     * @param numThreads Worker threads for the CPU part.
     */
    OpenCLPopulationEvaluator(const FitnessEvaluator& fitness, int numThreads);

    void evaluate(std::vector<Candidate>& population) override;

private:
    const FitnessEvaluator& fitness_;
    int numThreads_;
    CpuPopulationEvaluator cpuFallback_;
    std::unique_ptr<TimetableOpenCLContext> device_;   ///< Null when the instance does not fit.
};
