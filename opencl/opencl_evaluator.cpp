///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "opencl_evaluator.hpp"
#include "worker_pool.hpp"
#include <algorithm>
#include <cstring>
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>
#include <type_traits>

///////////////////////////
///   ERROR  CHECKING   ///
///////////////////////////
static inline void checkError(cl_int err, const char* operation) {
    if (err != CL_SUCCESS) {
        std::stringstream ss;
        ss << "OpenCL error during " << operation << ": " << err;
        throw std::runtime_error(ss.str());
    }
}

///////////////////////////
///   OPENCL KERNELS    ///
///////////////////////////
static const char* SOFT_CONSTRAINT_KERNEL_SRC = R"(
#define MAX_FACULTY 64
#define MAX_DAYS    7
#define MAX_SLOTS   16

__kernel void eval_soft_constraints(
    __global const int* occupancy,      // numCandidates * numBatches * numDays * slotsPerDay
    __global const int* incOffsets,     // numCandidates + 1
    __global const int* incFaculty,     // faculty index per (session, faculty) incidence
    __global const int* incDay,
    __global const int* incSlot,
    __global const int* prefAllowed,    // numFaculty * numDays * slotsPerDay
    __global const int* workingDay,     // numDays
    const int numCandidates,
    const int numBatches,
    const int numDays,
    const int slotsPerDay,
    const int numFaculty,
    __global int* studentGapsOut,
    __global int* facultyGapsOut,
    __global int* preferenceOut,
    __global int* loadOut               // numCandidates * numFaculty
) {
    int cid = get_global_id(0);
    if (cid >= numCandidates) return;

    int base = cid * numBatches * numDays * slotsPerDay;

    // STUDENT GAPS
    int studentGaps = 0;
    for (int b = 0; b < numBatches; ++b) {
        for (int d = 0; d < numDays; ++d) {
            int first = -1, last = -1, used = 0;
            for (int s = 0; s < slotsPerDay; ++s) {
                if (occupancy[base + (b * numDays + d) * slotsPerDay + s]) {
                    if (first == -1) first = s;
                    last = s;
                    used++;
                }
            }
            if (first != -1) studentGaps += (last - first + 1) - used;
        }
    }

    // FACULTY OCCUPANCY, LOAD, PREFERENCES
    int busy[MAX_FACULTY][MAX_DAYS][MAX_SLOTS];
    int load[MAX_FACULTY];
    for (int f = 0; f < numFaculty; ++f) {
        load[f] = 0;
        for (int d = 0; d < numDays; ++d)
            for (int s = 0; s < slotsPerDay; ++s)
                busy[f][d][s] = 0;
    }

    int violations = 0;
    for (int i = incOffsets[cid]; i < incOffsets[cid + 1]; ++i) {
        int f = incFaculty[i];
        int d = incDay[i];
        int s = incSlot[i];
        busy[f][d][s] = 1;
        load[f]++;
        if (workingDay[d] && !prefAllowed[(f * numDays + d) * slotsPerDay + s]) violations++;
    }

    // FACULTY GAPS
    int facultyGaps = 0;
    for (int f = 0; f < numFaculty; ++f) {
        for (int d = 0; d < numDays; ++d) {
            int first = -1, last = -1, used = 0;
            for (int s = 0; s < slotsPerDay; ++s) {
                if (busy[f][d][s]) {
                    if (first == -1) first = s;
                    last = s;
                    used++;
                }
            }
            if (first != -1) facultyGaps += (last - first + 1) - used;
        }
        loadOut[cid * numFaculty + f] = load[f];
    }

    studentGapsOut[cid] = studentGaps;
    facultyGapsOut[cid] = facultyGaps;
    preferenceOut[cid] = violations;
}
)";


///////////////////////////
///       HELPERS       ///
///////////////////////////
namespace {

/**
 * @brief Device buffers of one launch, released when the launch ends.
 */
class BufferSet {
public:
    explicit BufferSet(cl_context context) : context_(context) {}
    ~BufferSet() {
        for (cl_mem m : buffers_) clReleaseMemObject(m);
    }

    /// Create a buffer and upload data into it; empty inputs get a one-int buffer.
    cl_mem upload(cl_command_queue queue, const std::vector<int>& data, const char* name) {
        cl_mem m = create(CL_MEM_READ_ONLY, data.size(), name);
        if (!data.empty()) {
            cl_int err = clEnqueueWriteBuffer(queue, m, CL_TRUE, 0, data.size() * sizeof(int),
                                              data.data(), 0, nullptr, nullptr);
            checkError(err, name);
        }
        return m;
    }

    cl_mem create(cl_mem_flags flags, size_t count, const char* name) {
        cl_int err = CL_SUCCESS;
        cl_mem m = clCreateBuffer(context_, flags, std::max<size_t>(count, 1) * sizeof(int), nullptr, &err);
        checkError(err, name);
        buffers_.push_back(m);
        return m;
    }

private:
    cl_context context_;
    std::vector<cl_mem> buffers_;
};

void readInts(cl_command_queue queue, cl_mem buffer, std::vector<int>& out, const char* name) {
    if (out.empty()) return;
    cl_int err = clEnqueueReadBuffer(queue, buffer, CL_TRUE, 0, out.size() * sizeof(int),
                                     out.data(), 0, nullptr, nullptr);
    checkError(err, name);
}

} // namespace


///////////////////////////
///  CONTEXT CTOR/DTOR  ///
///////////////////////////
TimetableOpenCLContext::TimetableOpenCLContext() {
    cl_int err = CL_SUCCESS;

    cl_uint numPlatforms = 0;
    err = clGetPlatformIDs(0, nullptr, &numPlatforms);
    checkError(err, "getting platform count");
    if (numPlatforms == 0)
        throw std::runtime_error("No OpenCL platforms found.");

    std::vector<cl_platform_id> platforms(numPlatforms);
    err = clGetPlatformIDs(numPlatforms, platforms.data(), nullptr);
    checkError(err, "getting platform IDs");
    platform = platforms[0];

    err = clGetDeviceIDs(platform, CL_DEVICE_TYPE_GPU, 1, &device, nullptr);
    if (err != CL_SUCCESS) {
        spdlog::info("No GPU found, trying CPU...");
        err = clGetDeviceIDs(platform, CL_DEVICE_TYPE_CPU, 1, &device, nullptr);
        checkError(err, "getting device ID");
    }

    char name[256] = {0};
    err = clGetDeviceInfo(device, CL_DEVICE_NAME, sizeof(name), name, nullptr);
    checkError(err, "querying device name");
    spdlog::info("Using OpenCL device: {}", name);

    context = clCreateContext(nullptr, 1, &device, nullptr, nullptr, &err);
    checkError(err, "creating context");

    queue = clCreateCommandQueue(context, device, 0, &err);
    checkError(err, "creating command queue");

    program = buildProgram(SOFT_CONSTRAINT_KERNEL_SRC);
}

TimetableOpenCLContext::~TimetableOpenCLContext() {
    if (queue)   clReleaseCommandQueue(queue);
    if (program) clReleaseProgram(program);
    if (context) clReleaseContext(context);
}

bool TimetableOpenCLContext::fits(const ProblemContext& ctx) {
    const ProblemInstance& inst = ctx.instance();
    return (int)inst.faculty.size() <= kMaxFaculty &&
           inst.geometry.dayCount() <= kMaxDays &&
           inst.geometry.slotsPerDay <= kMaxSlots;
}

///////////////////////////
///   BUILD PROGRAM     ///
///////////////////////////
cl_program TimetableOpenCLContext::buildProgram(const char* src) {
    cl_int err = CL_SUCCESS;
    size_t len = std::strlen(src);
    const char* srcs[1] = { src };
    size_t lens[1] = { len };

    cl_program prog = clCreateProgramWithSource(context, 1, srcs, lens, &err);
    checkError(err, "creating program from source");

    err = clBuildProgram(prog, 1, &device, nullptr, nullptr, nullptr);
    if (err != CL_SUCCESS) {
        size_t logSize = 0;
        clGetProgramBuildInfo(prog, device, CL_PROGRAM_BUILD_LOG, 0, nullptr, &logSize);
        std::vector<char> buildLog(logSize + 1, '\0');
        clGetProgramBuildInfo(prog, device, CL_PROGRAM_BUILD_LOG, logSize, buildLog.data(), nullptr);
        spdlog::error("OpenCL build log:\n{}", buildLog.data());
        clReleaseProgram(prog);
        throw std::runtime_error("Failed to build OpenCL program");
    }

    return prog;
}

///////////////////////////
///   EVALUATE BATCH    ///
///////////////////////////
std::vector<DeviceMetrics> TimetableOpenCLContext::evaluateBatch(
        const ProblemContext& ctx,
        const std::vector<const TimetableGrid*>& grids
) {
    int numCandidates = (int)grids.size();
    if (numCandidates == 0) return {};
    if (!fits(ctx)) throw std::invalid_argument("instance exceeds OpenCL kernel limits");

    const ProblemInstance& inst = ctx.instance();
    int numBatches = (int)inst.batches.size();
    int numDays = inst.geometry.dayCount();
    int slotsPerDay = inst.geometry.slotsPerDay;
    int numFaculty = (int)inst.faculty.size();
    int cells = numBatches * numDays * slotsPerDay;

    // Flatten candidates: cell occupancy plus a CSR list of faculty incidences.
    std::vector<int> occupancy((size_t)numCandidates * cells, 0);
    std::vector<int> incOffsets(numCandidates + 1, 0);
    std::vector<int> incFaculty, incDay, incSlot;

    for (int c = 0; c < numCandidates; ++c) {
        const TimetableGrid& grid = *grids[c];
        incOffsets[c] = (int)incFaculty.size();
        for (int b = 0; b < numBatches; ++b) {
            for (int d = 0; d < numDays; ++d) {
                for (int s = 0; s < slotsPerDay; ++s) {
                    const ClassAssignment* a = grid.at(b, d, s);
                    if (!a) continue;
                    occupancy[(size_t)c * cells + (b * numDays + d) * slotsPerDay + s] = 1;
                    for (int fid : a->facultyIds) {
                        int fIdx = ctx.facultyIndex(fid);
                        if (fIdx < 0) continue;
                        incFaculty.push_back(fIdx);
                        incDay.push_back(d);
                        incSlot.push_back(s);
                    }
                }
            }
        }
    }
    incOffsets[numCandidates] = (int)incFaculty.size();

    // Instance tables shared by every work item.
    FitnessEvaluator prefs(ctx, ConstraintWeights());
    std::vector<int> prefAllowed((size_t)numFaculty * numDays * slotsPerDay, 1);
    for (int f = 0; f < numFaculty; ++f)
        for (int d = 0; d < numDays; ++d)
            for (int s = 0; s < slotsPerDay; ++s)
                if (prefs.violatesPreference(inst.faculty[f].id, d, s))
                    prefAllowed[(f * numDays + d) * slotsPerDay + s] = 0;

    std::vector<int> workingDay(numDays, 0);
    for (int d = 0; d < numDays; ++d) workingDay[d] = ctx.isWorkingDay(d) ? 1 : 0;

    BufferSet buffers(context);
    cl_mem d_occupancy   = buffers.upload(queue, occupancy, "writing d_occupancy");
    cl_mem d_incOffsets  = buffers.upload(queue, incOffsets, "writing d_incOffsets");
    cl_mem d_incFaculty  = buffers.upload(queue, incFaculty, "writing d_incFaculty");
    cl_mem d_incDay      = buffers.upload(queue, incDay, "writing d_incDay");
    cl_mem d_incSlot     = buffers.upload(queue, incSlot, "writing d_incSlot");
    cl_mem d_prefAllowed = buffers.upload(queue, prefAllowed, "writing d_prefAllowed");
    cl_mem d_workingDay  = buffers.upload(queue, workingDay, "writing d_workingDay");
    cl_mem d_studentGaps = buffers.create(CL_MEM_WRITE_ONLY, numCandidates, "creating d_studentGaps");
    cl_mem d_facultyGaps = buffers.create(CL_MEM_WRITE_ONLY, numCandidates, "creating d_facultyGaps");
    cl_mem d_preference  = buffers.create(CL_MEM_WRITE_ONLY, numCandidates, "creating d_preference");
    cl_mem d_load        = buffers.create(CL_MEM_WRITE_ONLY, (size_t)numCandidates * numFaculty, "creating d_load");

    // Kernel + args
    cl_int err = CL_SUCCESS;
    cl_kernel kernel = clCreateKernel(program, "eval_soft_constraints", &err);
    checkError(err, "creating kernel");
    std::unique_ptr<std::remove_pointer<cl_kernel>::type, decltype(&clReleaseKernel)> kernelGuard(kernel, &clReleaseKernel);

    int arg = 0;
    err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_occupancy); checkError(err, "arg occupancy");
    err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_incOffsets); checkError(err, "arg incOffsets");
    err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_incFaculty); checkError(err, "arg incFaculty");
    err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_incDay); checkError(err, "arg incDay");
    err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_incSlot); checkError(err, "arg incSlot");
    err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_prefAllowed); checkError(err, "arg prefAllowed");
    err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_workingDay); checkError(err, "arg workingDay");
    err = clSetKernelArg(kernel, arg++, sizeof(int), &numCandidates); checkError(err, "arg numCandidates");
    err = clSetKernelArg(kernel, arg++, sizeof(int), &numBatches); checkError(err, "arg numBatches");
    err = clSetKernelArg(kernel, arg++, sizeof(int), &numDays); checkError(err, "arg numDays");
    err = clSetKernelArg(kernel, arg++, sizeof(int), &slotsPerDay); checkError(err, "arg slotsPerDay");
    err = clSetKernelArg(kernel, arg++, sizeof(int), &numFaculty); checkError(err, "arg numFaculty");
    err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_studentGaps); checkError(err, "arg studentGapsOut");
    err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_facultyGaps); checkError(err, "arg facultyGapsOut");
    err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_preference); checkError(err, "arg preferenceOut");
    err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_load); checkError(err, "arg loadOut");

    size_t global = (size_t)numCandidates;
    err = clEnqueueNDRangeKernel(queue, kernel, 1, nullptr, &global, nullptr, 0, nullptr, nullptr);
    checkError(err, "enqueuing eval_soft_constraints");
    err = clFinish(queue);
    checkError(err, "finishing queue");

    std::vector<int> studentGaps(numCandidates), facultyGaps(numCandidates), preference(numCandidates);
    std::vector<int> loads((size_t)numCandidates * numFaculty);
    readInts(queue, d_studentGaps, studentGaps, "reading studentGaps");
    readInts(queue, d_facultyGaps, facultyGaps, "reading facultyGaps");
    readInts(queue, d_preference, preference, "reading preference violations");
    readInts(queue, d_load, loads, "reading loads");

    std::vector<DeviceMetrics> out(numCandidates);
    for (int c = 0; c < numCandidates; ++c) {
        out[c].studentGaps = studentGaps[c];
        out[c].facultyGaps = facultyGaps[c];
        out[c].preferenceViolations = preference[c];
        out[c].facultyLoads.assign(loads.begin() + (size_t)c * numFaculty,
                                   loads.begin() + (size_t)(c + 1) * numFaculty);
    }
    return out;
}


///////////////////////////
///     POPULATION      ///
///////////////////////////
OpenCLPopulationEvaluator::OpenCLPopulationEvaluator(const FitnessEvaluator& fitness, int numThreads)
        : fitness_(fitness),
          numThreads_(numThreads),
          cpuFallback_(fitness, numThreads) {
    if (!TimetableOpenCLContext::fits(fitness.context())) {
        spdlog::warn("instance exceeds OpenCL kernel limits, scoring on the CPU");
        return;
    }
    try {
        device_ = std::make_unique<TimetableOpenCLContext>();
    } catch (const std::runtime_error& e) {
        spdlog::warn("OpenCL unavailable ({}), scoring on the CPU", e.what());
    }
}

/**
 * @brief Soft counts from the device, hard counts from the worker pool.
 *
 * The final score is combined on the host with the same combineScore()
 * the CPU evaluator uses, so both paths rank candidates identically.
 */
void OpenCLPopulationEvaluator::evaluate(std::vector<Candidate>& population) {
    if (!device_) {
        cpuFallback_.evaluate(population);
        return;
    }

    std::vector<const TimetableGrid*> grids;
    grids.reserve(population.size());
    for (const Candidate& c : population) grids.push_back(&c.timetable);
    std::vector<DeviceMetrics> device = device_->evaluateBatch(fitness_.context(), grids);

    parallelFor((int)population.size(), numThreads_, [&](int i) {
        TimetableMetrics m;
        m.studentGaps = device[i].studentGaps;
        m.facultyGaps = device[i].facultyGaps;
        m.preferenceViolations = device[i].preferenceViolations;
        m.facultyWorkloadStdDev = workloadStdDev(device[i].facultyLoads);
        m.score = combineScore(fitness_.weights(), m.studentGaps, m.facultyGaps,
                               m.facultyWorkloadStdDev, m.preferenceViolations);
        m.hardConflicts = fitness_.countHardConflicts(population[i].timetable);
        m.unplacedSessions = fitness_.countUnplaced(population[i].timetable);
        population[i].metrics = m;
    });
}
