#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "problem_context.hpp"
#include "strategy.hpp"
#include "substitutes.hpp"
#include "timetable.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>


///////////////////////////
///        TYPES        ///
///////////////////////////
/**
 * @brief Size figures of a problem, handed to the advisory service.
 */
struct ProblemSummary {
    int numBatches = 0;
    int numClasses = 0; ///< Total required sessions.
    int numFaculty = 0;
    int numRooms = 0;
    int numConstraints = 0; ///< Pinned assignments.
    int targetGenerations = 0; ///< Generation budget the plan should fit.
};

/**
 * @brief A proposed exchange of two sessions of the current best timetable.
 */
struct InterventionSuggestion {
    int assignmentIdA;
    int assignmentIdB;
};


///////////////////////////
///      INTERFACE      ///
///////////////////////////
/**
 * @brief Optional outside advice for the optimizer.
 *
 * Implementations may be slow, may throw and may return nonsense; the
 * optimizer only ever talks to them through GuardedAdvisor.
 */
class AdvisoryService {
public:
    virtual ~AdvisoryService() = default;

    /// Ordered phase plan for the run. An empty list means "no opinion".
    virtual std::vector<Phase> proposePhaseStrategy(const ProblemSummary& summary) = 0;

    /**
     * @brief Suggest two sessions to swap in a stagnating timetable.
     *
     * @param timetableSummary One line per session, as produced by describeTimetable().
     */
    virtual std::optional<InterventionSuggestion> proposeIntervention(const std::string& timetableSummary) = 0;

    /// Adjust the soft-constraint weights from faculty feedback.
    virtual ConstraintWeights tuneWeights(const ConstraintWeights& base,
                                          const std::vector<TimetableFeedback>& feedback) = 0;

    /**
     * @brief Rank the substitutes for one session, best first.
     *
     * Entries naming faculty outside request.candidates are ignored. The
     * default has no opinion and returns an empty list.
     */
    virtual std::vector<RankedSubstitute> rankSubstitutes(const SubstituteRequest& request);
};

/**
 * @brief Advisor with no opinions: the optimizer always uses its defaults.
 */
class NullAdvisor : public AdvisoryService {
public:
    std::vector<Phase> proposePhaseStrategy(const ProblemSummary& summary) override;
    std::optional<InterventionSuggestion> proposeIntervention(const std::string& timetableSummary) override;
    ConstraintWeights tuneWeights(const ConstraintWeights& base,
                                  const std::vector<TimetableFeedback>& feedback) override;
};

/**
 * @brief Deterministic rule-of-thumb advisor.
 *
 * Phase plans depend on how dense the problem is; interventions move the
 * latest-running session of a batch to the slot of its earliest session on
 * another day; weight tuning nudges the weights named in feedback comments;
 * substitutes are ranked by rankByPriorities().
 */
class RuleBasedAdvisor : public AdvisoryService {
public:
    std::vector<Phase> proposePhaseStrategy(const ProblemSummary& summary) override;
    std::optional<InterventionSuggestion> proposeIntervention(const std::string& timetableSummary) override;
    ConstraintWeights tuneWeights(const ConstraintWeights& base,
                                  const std::vector<TimetableFeedback>& feedback) override;
    std::vector<RankedSubstitute> rankSubstitutes(const SubstituteRequest& request) override;
};


///////////////////////////
///        GUARD        ///
///////////////////////////
/**
 * @brief Timeout- and exception-safe front end to an AdvisoryService.
 *
 * Every call runs on a detached helper thread and is awaited for at most
 * the configured timeout. Exceptions, timeouts and invalid answers are
 * logged as warnings and replaced by the engine's defaults. The helper
 * thread holds its own reference to the service, so an abandoned call can
 * finish safely after the optimizer has moved on.
 */
class GuardedAdvisor {
public:
    /**
     * @param service Advisory service, or nullptr for none.
     * @param timeout Maximum time to wait for any single call.
     */
    GuardedAdvisor(std::shared_ptr<AdvisoryService> service, std::chrono::milliseconds timeout);

    /**
     * @brief Sanitized advisory phase plan, or defaultPhases() if none is usable.
     */
    std::vector<Phase> phaseStrategy(const ProblemSummary& summary);

    /// Advisory swap suggestion, or std::nullopt on any failure.
    std::optional<InterventionSuggestion> intervention(const std::string& timetableSummary);

    /**
     * @brief Tuned weights, or base when fewer than 3 samples exist or the answer is invalid.
     */
    ConstraintWeights tunedWeights(const ConstraintWeights& base, const std::vector<TimetableFeedback>& feedback);

    /**
     * @brief Advisory substitute ranking restricted to the request's candidates,
     * or unrankedSubstitutes() when the service fails or names none of them.
     */
    std::vector<RankedSubstitute> substitutes(const SubstituteRequest& request);

private:
    std::shared_ptr<AdvisoryService> service_;
    std::chrono::milliseconds timeout_;
};


///////////////////////////
///       HELPERS       ///
///////////////////////////
/// Size figures of an instance for a given generation budget.
ProblemSummary summarize(const ProblemContext& ctx, int targetGenerations);

/**
 * @brief Plain-text listing of a timetable, one session per line.
 *
 * Format: "ID: <id>, Class: <code> for <batch> on <day> at slot <slot>".
 */
std::string describeTimetable(const ProblemContext& ctx, const TimetableGrid& grid);

/// Short English day name for a day index in [0, 7).
std::string dayName(int day);

/// True if every weight is finite and non-negative.
bool validWeights(const ConstraintWeights& weights);

/**
 * @brief Ranked substitutes for a placed session.
 *
 * Throws std::invalid_argument if the assignment is not in the timetable.
 */
std::vector<RankedSubstitute> findRankedSubstitutes(const ProblemContext& ctx, const TimetableGrid& grid,
                                                    int assignmentId, GuardedAdvisor& advisor);
