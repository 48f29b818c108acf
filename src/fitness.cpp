///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "fitness.hpp"
#include "constraints.hpp"
#include "worker_pool.hpp"
#include <algorithm>
#include <cmath>
#include <unordered_map>


///////////////////////////
///       HELPERS       ///
///////////////////////////
int countGaps(const std::vector<bool>& occupied) {
    int first = -1, last = -1, used = 0;
    for (int s = 0; s < (int)occupied.size(); ++s) {
        if (!occupied[s]) continue;
        if (first == -1) first = s;
        last = s;
        ++used;
    }
    if (first == -1) return 0;
    return (last - first + 1) - used;
}

double workloadStdDev(const std::vector<int>& loads) {
    if (loads.size() < 2) return 0.0;
    double mean = 0.0;
    for (int l : loads) mean += l;
    mean /= (double)loads.size();
    double var = 0.0;
    for (int l : loads) var += (l - mean) * (l - mean);
    var /= (double)loads.size();
    return std::sqrt(var);
}

double combineScore(const ConstraintWeights& weights, int studentGaps, int facultyGaps,
                    double facultyWorkloadStdDev, int preferenceViolations) {
    double score = kMaxScore
                   - studentGaps * weights.studentGap
                   - facultyGaps * weights.facultyGap
                   - facultyWorkloadStdDev * weights.facultyWorkload
                   - preferenceViolations * weights.facultyPreference;
    return std::min(kMaxScore, std::max(0.0, score));
}


///////////////////////////
///       FITNESS       ///
///////////////////////////
FitnessEvaluator::FitnessEvaluator(const ProblemContext& ctx, const ConstraintWeights& weights)
        : ctx_(ctx), weights_(weights) {}

bool FitnessEvaluator::violatesPreference(int facultyId, int day, int slot) const {
    const Faculty* f = ctx_.faculty(facultyId);
    if (!f || !f->preferredSlots) return false;
    auto it = f->preferredSlots->find(day);
    if (it == f->preferredSlots->end()) return true;
    return std::find(it->second.begin(), it->second.end(), slot) == it->second.end();
}

/**
 * @brief Score a timetable.
 *
 * Gaps are measured from per-day occupancy (a faculty member teaching two
 * sessions at once still occupies one slot). Workload counts every
 * (session, faculty) incidence, zero-load faculty included.
 */
TimetableMetrics FitnessEvaluator::softMetrics(const TimetableGrid& grid) const {
    TimetableMetrics m;
    const int numDays = grid.numDays();
    const int slots = grid.slotsPerDay();
    const int numFaculty = (int)ctx_.instance().faculty.size();

    // facultyBusy[f][d][s] = faculty f teaches at (d, s).
    std::vector<std::vector<std::vector<bool>>> facultyBusy(
            numFaculty, std::vector<std::vector<bool>>(numDays, std::vector<bool>(slots, false)));
    std::vector<int> load(numFaculty, 0);

    for (int b = 0; b < grid.numBatches(); ++b) {
        for (int d = 0; d < numDays; ++d) {
            std::vector<bool> batchDay(slots, false);
            for (int s = 0; s < slots; ++s) {
                const ClassAssignment* a = grid.at(b, d, s);
                if (!a) continue;
                batchDay[s] = true;
                for (int fid : a->facultyIds) {
                    int fIdx = ctx_.facultyIndex(fid);
                    if (fIdx < 0) continue;
                    facultyBusy[fIdx][d][s] = true;
                    ++load[fIdx];
                    if (ctx_.isWorkingDay(d) && violatesPreference(fid, d, s))
                        ++m.preferenceViolations;
                }
            }
            m.studentGaps += countGaps(batchDay);
        }
    }

    for (int f = 0; f < numFaculty; ++f) {
        for (int d = 0; d < numDays; ++d)
            m.facultyGaps += countGaps(facultyBusy[f][d]);
    }

    m.facultyWorkloadStdDev = workloadStdDev(load);
    m.score = combineScore(weights_, m.studentGaps, m.facultyGaps,
                           m.facultyWorkloadStdDev, m.preferenceViolations);
    return m;
}

TimetableMetrics FitnessEvaluator::evaluate(const TimetableGrid& grid) const {
    TimetableMetrics m = softMetrics(grid);
    m.hardConflicts = countHardConflicts(grid);
    m.unplacedSessions = countUnplaced(grid);
    return m;
}

double FitnessEvaluator::score(const TimetableGrid& grid) const {
    return softMetrics(grid).score;
}

int FitnessEvaluator::countUnplaced(const TimetableGrid& grid) const {
    // placed[batchIndex][subjectId]
    std::vector<std::unordered_map<int, int>> placed(grid.numBatches());
    for (int b = 0; b < grid.numBatches(); ++b) {
        for (int d = 0; d < grid.numDays(); ++d) {
            for (int s = 0; s < grid.slotsPerDay(); ++s) {
                const ClassAssignment* a = grid.at(b, d, s);
                if (a) ++placed[b][a->subjectId];
            }
        }
    }
    int missing = 0;
    for (const SessionRequirement& req : ctx_.requirements()) {
        int have = req.batchIndex < (int)placed.size() ? placed[req.batchIndex][req.subjectId] : 0;
        missing += std::max(0, req.sessions - have);
    }
    return missing;
}

int FitnessEvaluator::countHardConflicts(const TimetableGrid& grid) const {
    return (int)detectConflicts(ctx_, grid).size();
}


///////////////////////////
///     POPULATION      ///
///////////////////////////
CpuPopulationEvaluator::CpuPopulationEvaluator(const FitnessEvaluator& fitness, int numThreads)
        : fitness_(fitness), numThreads_(numThreads) {}

void CpuPopulationEvaluator::evaluate(std::vector<Candidate>& population) {
    parallelFor((int)population.size(), numThreads_, [&](int i) {
        population[i].metrics = fitness_.evaluate(population[i].timetable);
    });
}
