#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <string>
#include <vector>


///////////////////////////
///     DIAGNOSTICS     ///
///////////////////////////
enum class Severity { WARNING, CRITICAL };

/**
 * @brief One data problem found before a run.
 */
struct DiagnosticIssue {
    Severity severity;
    std::string title;
    std::string description;
    std::string suggestion;
};

/**
 * @brief Check an instance for data problems that doom or weaken a run.
 *
 * Reports subjects nobody teaches and faculty without subjects (warnings),
 * plus batch subjects with no candidate faculty, practicals with fewer than
 * two candidate faculty and batch subjects with no usable room (critical).
 * Works on unvalidated instances: unknown ids are skipped, not reported.
 */
std::vector<DiagnosticIssue> runPreflightDiagnostics(const ProblemInstance& inst);

/// True if any issue is critical.
bool hasCriticalIssues(const std::vector<DiagnosticIssue>& issues);

std::string toString(Severity severity);
