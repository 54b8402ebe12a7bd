#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <atomic>
#include <chrono>
#include <string>


///////////////////////////
///       BUDGET        ///
///////////////////////////
/**
 * @brief Why a search stopped before exploring its whole tree.
 */
enum class TruncationReason { NONE, DEADLINE, STEP_BUDGET };

/// Lower-case label of a truncation reason ("step_budget").
std::string truncationReasonName(TruncationReason reason);

/**
 * @brief Wall-clock deadline and loop-iteration budget shared by one search.
 *
 * Each search loop calls consume() once per iteration; after the first
 * failure every later call fails too, so all branches unwind. Safe to share
 * between worker threads.
 */
class SearchBudget {
public:
    /**
     * @param timeLimitSeconds Wall-clock limit; 0 disables it.
     * @param stepBudget       Maximum number of iterations; 0 disables it.
     */
    SearchBudget(double timeLimitSeconds, long long stepBudget);

    /**
     * @brief Account for one loop iteration.
     *
     * @return false once the deadline has passed or the step budget is spent.
     */
    bool consume();

    /// True once consume() has failed.
    bool exhausted() const { return reason_.load() != static_cast<int>(TruncationReason::NONE); }

    TruncationReason reason() const { return static_cast<TruncationReason>(reason_.load()); }

    long long stepsTaken() const { return steps_.load(); }

private:
    double timeLimitSeconds_;
    long long stepBudget_;
    std::chrono::high_resolution_clock::time_point startTime_;

    std::atomic<long long> steps_{0};
    std::atomic<int> reason_{static_cast<int>(TruncationReason::NONE)};

    void stop(TruncationReason reason);
};
