///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "strategy.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>


///////////////////////////
///      STRATEGY       ///
///////////////////////////
std::vector<Phase> defaultPhases(int totalGenerations) {
    int total = std::max(totalGenerations, 3);
    int first = std::max(1, (int)std::lround(total * 0.4));
    int second = std::max(1, (int)std::lround(total * 0.4));
    int third = std::max(1, total - first - second);

    std::vector<Phase> phases(3);
    phases[0].name = "exploration";
    phases[0].generations = first;
    phases[0].weights = {0.5, 0.4, 0.1, 0.0};

    phases[1].name = "balanced";
    phases[1].generations = second;
    phases[1].weights = {0.2, 0.2, 0.5, 0.1};

    phases[2].name = "exploitation";
    phases[2].generations = third;
    phases[2].weights = {0.0, 0.1, 0.4, 0.5};
    return phases;
}

std::vector<Phase> sanitizePhases(const std::vector<Phase>& phases) {
    auto valid = [](double w) { return std::isfinite(w) && w >= 0.0; };

    std::vector<Phase> out;
    for (const Phase& p : phases) {
        const HeuristicWeights& w = p.weights;
        if (p.generations <= 0) {
            spdlog::warn("dropping phase '{}' with {} generations", p.name, p.generations);
            continue;
        }
        if (!valid(w.crossover) || !valid(w.move) || !valid(w.swap) || !valid(w.annealing)) {
            spdlog::warn("dropping phase '{}' with an invalid heuristic weight", p.name);
            continue;
        }
        double total = w.crossover + w.move + w.swap + w.annealing;
        if (!(total > 0.0)) {
            spdlog::warn("dropping phase '{}' with an all-zero heuristic mix", p.name);
            continue;
        }
        Phase clean = p;
        clean.weights = {w.crossover / total, w.move / total, w.swap / total, w.annealing / total};
        out.push_back(clean);
    }
    return out;
}

StagnationTracker::StagnationTracker(int exitLimit, int interventionLimit)
        : exitLimit_(exitLimit), interventionLimit_(interventionLimit) {}

void StagnationTracker::reset() {
    streak_ = 0;
    lastBest_ = -1.0;
    intervened_ = false;
}

void StagnationTracker::startPhase() {
    intervened_ = false;
}

void StagnationTracker::record(double bestScore) {
    if (streak_ > 0 && bestScore == lastBest_) {
        ++streak_;
    } else {
        streak_ = 1;
        lastBest_ = bestScore;
    }
}

bool StagnationTracker::shouldExit() const {
    return streak_ >= exitLimit_;
}

bool StagnationTracker::shouldIntervene(int generationInPhase) const {
    return !intervened_ && streak_ >= interventionLimit_ && generationInPhase > interventionLimit_;
}

void StagnationTracker::markAttempted() {
    intervened_ = true;
}

void StagnationTracker::resetStreak() {
    streak_ = 0;
    lastBest_ = -1.0;
}
