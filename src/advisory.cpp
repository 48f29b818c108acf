///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "advisory.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <exception>
#include <future>
#include <regex>
#include <spdlog/spdlog.h>
#include <sstream>
#include <thread>
#include <utility>


///////////////////////////
///       HELPERS       ///
///////////////////////////
namespace {

/**
 * @brief Run one advisory call on a detached thread and wait for it.
 *
 * Returns std::nullopt (after logging a warning) if the call throws or does
 * not finish within the timeout.
 */
template <typename T, typename Fn>
std::optional<T> guardedCall(const std::shared_ptr<AdvisoryService>& service,
                             std::chrono::milliseconds timeout, const char* what, Fn fn) {
    if (!service) return std::nullopt;

    auto promise = std::make_shared<std::promise<T>>();
    std::future<T> result = promise->get_future();
    std::thread([promise, service, fn]() {
        try {
            promise->set_value(fn(*service));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    if (result.wait_for(timeout) != std::future_status::ready) {
        spdlog::warn("advisory {} timed out after {} ms; using defaults", what, timeout.count());
        return std::nullopt;
    }
    try {
        return result.get();
    } catch (const std::exception& e) {
        spdlog::warn("advisory {} failed: {}; using defaults", what, e.what());
    } catch (...) {
        spdlog::warn("advisory {} failed with an unknown error; using defaults", what);
    }
    return std::nullopt;
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

Phase makePhase(const std::string& name, int generations, HeuristicWeights weights) {
    Phase p;
    p.name = name;
    p.generations = std::max(1, generations);
    p.weights = weights;
    return p;
}

} // namespace

std::string dayName(int day) {
    static const char* names[] = {"Mon", "Tue", "Wed", "Thu", "Fri", "Sat", "Sun"};
    if (day < 0 || day >= 7) return "Day" + std::to_string(day);
    return names[day];
}

bool validWeights(const ConstraintWeights& w) {
    auto ok = [](double x) { return std::isfinite(x) && x >= 0.0; };
    return ok(w.studentGap) && ok(w.facultyGap) && ok(w.facultyWorkload) && ok(w.facultyPreference);
}

ProblemSummary summarize(const ProblemContext& ctx, int targetGenerations) {
    const ProblemInstance& inst = ctx.instance();
    ProblemSummary s;
    s.numBatches = (int)inst.batches.size();
    s.numClasses = ctx.totalSessions();
    s.numFaculty = (int)inst.faculty.size();
    s.numRooms = (int)inst.rooms.size();
    s.numConstraints = (int)inst.pinnedAssignments.size();
    s.targetGenerations = targetGenerations;
    return s;
}

std::string describeTimetable(const ProblemContext& ctx, const TimetableGrid& grid) {
    std::ostringstream out;
    for (const ClassAssignment& a : grid.assignments()) {
        const Subject* subject = ctx.subject(a.subjectId);
        const Batch* batch = ctx.batch(a.batchId);
        out << "ID: " << a.id
            << ", Class: " << (subject ? subject->code : std::string("?"))
            << " for " << (batch ? batch->name : std::string("?"))
            << " on " << dayName(a.day)
            << " at slot " << a.slot << "\n";
    }
    return out.str();
}


///////////////////////////
///      ADVISORS       ///
///////////////////////////
std::vector<RankedSubstitute> AdvisoryService::rankSubstitutes(const SubstituteRequest&) {
    return {};
}

std::vector<Phase> NullAdvisor::proposePhaseStrategy(const ProblemSummary&) {
    return {};
}

std::optional<InterventionSuggestion> NullAdvisor::proposeIntervention(const std::string&) {
    return std::nullopt;
}

ConstraintWeights NullAdvisor::tuneWeights(const ConstraintWeights& base, const std::vector<TimetableFeedback>&) {
    return base;
}

/**
 * @brief Budget split by density.
 *
 * Dense problems (many sessions per batch or many pins) get a longer
 * exploration phase; sparse ones spend more time refining.
 */
std::vector<Phase> RuleBasedAdvisor::proposePhaseStrategy(const ProblemSummary& summary) {
    int total = std::max(summary.targetGenerations, 3);
    double perBatch = (double)summary.numClasses / std::max(1, summary.numBatches);
    bool dense = perBatch > 20.0 || summary.numConstraints > summary.numBatches;

    double explore = dense ? 0.5 : 0.3;
    double balance = dense ? 0.3 : 0.4;
    int first = (int)std::lround(total * explore);
    int second = (int)std::lround(total * balance);
    int third = total - first - second;

    return {
            makePhase("exploration", first, {0.5, 0.4, 0.1, 0.0}),
            makePhase("balanced", second, {0.2, 0.2, 0.5, 0.1}),
            makePhase("refinement", third, {0.0, 0.1, 0.4, 0.5}),
    };
}

/**
 * @brief Swap the latest session of the timetable with the earliest session
 * of the same batch on another day.
 */
std::optional<InterventionSuggestion> RuleBasedAdvisor::proposeIntervention(const std::string& timetableSummary) {
    struct Line { int id; std::string batch; std::string day; int slot; };
    static const std::regex pattern(R"(ID: (\d+), Class: (.+) for (.+) on (\S+) at slot (\d+))");

    std::vector<Line> lines;
    std::istringstream in(timetableSummary);
    std::string text;
    while (std::getline(in, text)) {
        std::smatch m;
        if (!std::regex_match(text, m, pattern)) continue;
        lines.push_back({std::stoi(m[1]), m[3], m[4], std::stoi(m[5])});
    }
    if (lines.size() < 2) return std::nullopt;

    const Line* latest = &lines[0];
    for (const Line& l : lines) {
        if (l.slot > latest->slot) latest = &l;
    }
    const Line* earliest = nullptr;
    for (const Line& l : lines) {
        if (l.batch != latest->batch || l.day == latest->day) continue;
        if (!earliest || l.slot < earliest->slot) earliest = &l;
    }
    if (!earliest || earliest->slot >= latest->slot) return std::nullopt;
    return InterventionSuggestion{latest->id, earliest->id};
}

/**
 * @brief Nudge the weights named in feedback comments.
 *
 * A concern raised by at least a third of the samples raises the matching
 * weights by 10% (20% when the average rating is below 3). Fewer than three
 * samples leave the weights untouched.
 */
ConstraintWeights RuleBasedAdvisor::tuneWeights(const ConstraintWeights& base,
                                                const std::vector<TimetableFeedback>& feedback) {
    if (feedback.size() < 3) return base;

    int gaps = 0, load = 0, prefs = 0;
    double ratingSum = 0.0;
    for (const TimetableFeedback& f : feedback) {
        std::string c = lowercase(f.comment);
        if (c.find("gap") != std::string::npos || c.find("idle") != std::string::npos) ++gaps;
        if (c.find("workload") != std::string::npos || c.find("too many") != std::string::npos) ++load;
        if (c.find("prefer") != std::string::npos || c.find("morning") != std::string::npos ||
            c.find("evening") != std::string::npos) ++prefs;
        ratingSum += f.rating;
    }
    double factor = ratingSum / feedback.size() < 3.0 ? 1.2 : 1.1;
    int quorum = ((int)feedback.size() + 2) / 3;

    ConstraintWeights tuned = base;
    if (gaps >= quorum) {
        tuned.studentGap *= factor;
        tuned.facultyGap *= factor;
    }
    if (load >= quorum) tuned.facultyWorkload *= factor;
    if (prefs >= quorum) tuned.facultyPreference *= factor;
    return tuned;
}


std::vector<RankedSubstitute> RuleBasedAdvisor::rankSubstitutes(const SubstituteRequest& request) {
    return rankByPriorities(request);
}


///////////////////////////
///        GUARD        ///
///////////////////////////
GuardedAdvisor::GuardedAdvisor(std::shared_ptr<AdvisoryService> service, std::chrono::milliseconds timeout)
        : service_(std::move(service)), timeout_(timeout) {}

std::vector<Phase> GuardedAdvisor::phaseStrategy(const ProblemSummary& summary) {
    auto proposed = guardedCall<std::vector<Phase>>(
            service_, timeout_, "phase strategy",
            [summary](AdvisoryService& s) { return s.proposePhaseStrategy(summary); });
    if (proposed) {
        std::vector<Phase> clean = sanitizePhases(*proposed);
        if (!clean.empty()) return clean;
        if (!proposed->empty()) spdlog::warn("advisory phase strategy had no usable phase; using defaults");
    }
    return defaultPhases(summary.targetGenerations);
}

std::optional<InterventionSuggestion> GuardedAdvisor::intervention(const std::string& timetableSummary) {
    auto answer = guardedCall<std::optional<InterventionSuggestion>>(
            service_, timeout_, "intervention",
            [timetableSummary](AdvisoryService& s) { return s.proposeIntervention(timetableSummary); });
    if (!answer) return std::nullopt;
    return *answer;
}

ConstraintWeights GuardedAdvisor::tunedWeights(const ConstraintWeights& base,
                                               const std::vector<TimetableFeedback>& feedback) {
    if (feedback.size() < 3) return base;
    auto tuned = guardedCall<ConstraintWeights>(
            service_, timeout_, "weight tuning",
            [base, feedback](AdvisoryService& s) { return s.tuneWeights(base, feedback); });
    if (!tuned) return base;
    if (!validWeights(*tuned)) {
        spdlog::warn("advisory weight tuning returned invalid weights; keeping the configured ones");
        return base;
    }
    return *tuned;
}

std::vector<RankedSubstitute> GuardedAdvisor::substitutes(const SubstituteRequest& request) {
    if (request.candidates.empty()) return {};
    auto answer = guardedCall<std::vector<RankedSubstitute>>(
            service_, timeout_, "substitute ranking",
            [request](AdvisoryService& s) { return s.rankSubstitutes(request); });
    if (!answer) return unrankedSubstitutes(request.candidates);

    // Keep the first entry per known candidate, with the candidate's own data.
    std::vector<RankedSubstitute> ranked;
    for (const RankedSubstitute& r : *answer) {
        auto known = std::find_if(request.candidates.begin(), request.candidates.end(),
                                  [&](const SubstituteCandidate& c) { return c.facultyId == r.candidate.facultyId; });
        if (known == request.candidates.end()) continue;
        bool seen = std::any_of(ranked.begin(), ranked.end(), [&](const RankedSubstitute& k) {
            return k.candidate.facultyId == r.candidate.facultyId;
        });
        if (seen) continue;
        ranked.push_back({*known, std::min(100, std::max(0, r.score)), r.reasons});
    }
    if (ranked.empty()) {
        if (!answer->empty()) spdlog::warn("advisory substitute ranking named no available faculty; using defaults");
        return unrankedSubstitutes(request.candidates);
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const RankedSubstitute& a, const RankedSubstitute& b) { return a.score > b.score; });
    return ranked;
}

std::vector<RankedSubstitute> findRankedSubstitutes(const ProblemContext& ctx, const TimetableGrid& grid,
                                                    int assignmentId, GuardedAdvisor& advisor) {
    return advisor.substitutes(buildSubstituteRequest(ctx, grid, assignmentId));
}
