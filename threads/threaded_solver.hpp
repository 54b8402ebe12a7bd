#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "constraints.hpp"
#include "solver_base.hpp"
#include "search_budget.hpp"
#include <vector>
#include <mutex>
#include <atomic>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Multithreaded slot solver splitting the search by date.
 *
 * Dates (round-0 dates in the multi-day flow) are dealt to worker tasks by
 * index modulo the thread count. Every date writes to its own buffer, and the
 * buffers are joined in date order before capping and ranking, so the result
 * equals the sequential solver's. Workers share one SearchBudget and stop
 * taking new dates once the finished date prefix already holds maxResults
 * results.
 */
class ThreadedSlotSolver : public ISolver {
public:
    /**
     * @param numThreads   Number of worker tasks (values below 1 count as 1).
     * @param overlapTable Optional precomputed busy overlaps.
     */
    explicit ThreadedSlotSolver(int numThreads, const BusyOverlapTable* overlapTable = nullptr);

    using ISolver::findSlots;

    SlotSearchResult findSlots(const SchedulingRequest& request, const BusySnapshot& busy) override;

    /**
     * @brief Ranked single-day outcomes for each of `dates`, aligned with it.
     *
     * The request must already be validated. Dates skipped after the early
     * stop have an empty outcome.
     */
    std::vector<SearchOutcome<Combination>> searchDates(const SchedulingRequest& request,
                                                        const BusySnapshot& busy,
                                                        const std::vector<int>& dates,
                                                        SearchBudget& budget);

    /**
     * @brief Multi-day outcomes (exploration order) per round-0 date, aligned with `dates`.
     */
    std::vector<SearchOutcome<MultiDayPlan>> searchFirstRoundDates(const SchedulingRequest& request,
                                                                   const BusySnapshot& busy,
                                                                   const std::vector<int>& dates,
                                                                   SearchBudget& budget);

    int numThreads() const { return numThreads_; }

private:
    int numThreads_; ///< Number of worker tasks.
    const BusyOverlapTable* overlapTable_;

    // Shared state across workers, reset per search.
    std::mutex progressMutex_; ///< Guards finished_ and resultsPerDate_.
    std::vector<char> finished_; ///< Per-date completion flags.
    std::vector<size_t> resultsPerDate_; ///< Per-date result counts.
    std::atomic<bool> found_{false}; ///< Enough results in the finished prefix.

    /**
     * @brief Run `searchOne(dateIndex)` for every date on numThreads_ async workers.
     */
    template <class T, class SearchOne>
    std::vector<SearchOutcome<T>> runPerDate(size_t dateCount, size_t cap, SearchOne searchOne);

    /**
     * @brief Record a finished date and raise found_ when the finished prefix reaches `cap`.
     */
    void markFinished(size_t dateIndex, size_t resultCount, size_t cap);
};
