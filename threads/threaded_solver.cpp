///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "threaded_solver.hpp"
#include "../sequential/sequential_solver.hpp"
#include "rounds.hpp"
#include <algorithm>
#include <future>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
ThreadedSlotSolver::ThreadedSlotSolver(int numThreads, const BusyOverlapTable* overlapTable)
        : numThreads_(numThreads < 1 ? 1 : numThreads),
          overlapTable_(overlapTable) {}

/**
 * @brief Validate, pick the flow, search all dates in parallel, then merge in date order.
 */
SlotSearchResult ThreadedSlotSolver::findSlots(const SchedulingRequest& request, const BusySnapshot& busy) {
    validateRequest(request);
    const SearchOptions& options = request.options;
    SearchBudget budget(options.timeLimitSeconds, options.stepBudget);
    std::vector<int> dates = requestDates(request);

    SlotSearchResult result;
    if (needsMultiDayScheduling(request.sessions, options.dayLengthThreshold)) {
        result = mergePlanOutcomes(searchFirstRoundDates(request, busy, dates, budget), options);
    } else {
        result = mergeCombinationOutcomes(searchDates(request, busy, dates, budget), options);
    }
    result.steps = budget.stepsTaken();
    return result;
}

/**
 * @brief Deal date indices to async workers (index modulo numThreads_).
 *
 * Each date fills only its own slot of the returned vector, so workers never
 * share an output buffer.
 */
template <class T, class SearchOne>
std::vector<SearchOutcome<T>> ThreadedSlotSolver::runPerDate(size_t dateCount, size_t cap, SearchOne searchOne) {
    std::vector<SearchOutcome<T>> outcomes(dateCount);

    // Reset shared state before starting a new search.
    {
        std::lock_guard<std::mutex> lock(progressMutex_);
        finished_.assign(dateCount, 0);
        resultsPerDate_.assign(dateCount, 0);
    }
    found_ = false;

    int workers = static_cast<int>(std::min<size_t>(static_cast<size_t>(numThreads_), dateCount));
    std::vector<std::future<void>> tasks;
    for (int w = 0; w < workers; ++w) {
        tasks.push_back(std::async(std::launch::async, [this, w, dateCount, cap, &outcomes, &searchOne]() {
            for (size_t i = static_cast<size_t>(w); i < dateCount; i += static_cast<size_t>(numThreads_)) {
                if (found_) break;
                outcomes[i] = searchOne(i);
                markFinished(i, outcomes[i].results.size(), cap);
            }
        }));
    }
    // get() rethrows a worker's exception after every task has been joined.
    for (auto& t : tasks) t.wait();
    for (auto& t : tasks) t.get();

    return outcomes;
}

std::vector<SearchOutcome<Combination>> ThreadedSlotSolver::searchDates(const SchedulingRequest& request,
                                                                       const BusySnapshot& busy,
                                                                       const std::vector<int>& dates,
                                                                       SearchBudget& budget) {
    // One read-only search object serves every worker.
    SingleDaySearch search(request.sessions, request.participants, busy, request.options, overlapTable_);
    size_t cap = static_cast<size_t>(request.options.maxResults);

    return runPerDate<Combination>(dates.size(), cap, [&](size_t i) {
        return search.run(dates[i], budget);
    });
}

std::vector<SearchOutcome<MultiDayPlan>> ThreadedSlotSolver::searchFirstRoundDates(
        const SchedulingRequest& request, const BusySnapshot& busy,
        const std::vector<int>& dates, SearchBudget& budget) {
    MultiDaySearch search(request, busy, overlapTable_);
    size_t cap = static_cast<size_t>(request.options.maxResults);

    return runPerDate<MultiDayPlan>(dates.size(), cap, [&](size_t i) {
        return search.collect(std::vector<int>{dates[i]}, cap, budget);
    });
}

void ThreadedSlotSolver::markFinished(size_t dateIndex, size_t resultCount, size_t cap) {
    std::lock_guard<std::mutex> lock(progressMutex_);
    finished_[dateIndex] = 1;
    resultsPerDate_[dateIndex] = resultCount;
    if (cap == 0) return;

    // Later dates cannot reach the capped output once the finished prefix fills it.
    size_t prefix = 0;
    for (size_t i = 0; i < finished_.size() && finished_[i]; ++i) {
        prefix += resultsPerDate_[i];
        if (prefix >= cap) {
            found_ = true;
            return;
        }
    }
}
