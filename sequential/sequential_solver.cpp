///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "sequential_solver.hpp"
#include "ranking.hpp"
#include "rounds.hpp"


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief Append `outcome` to `merged`, honoring the result cap.
 */
template <class T>
static void appendOutcome(const SearchOutcome<T>& outcome, size_t cap,
                          std::vector<T>& merged, SlotSearchResult& result) {
    if (outcome.truncated && !result.truncated) {
        result.truncated = true;
        result.truncationReason = outcome.reason;
    }
    if (outcome.limitReached) result.limitReached = true;

    for (const T& item : outcome.results) {
        if (cap > 0 && merged.size() >= cap) {
            result.limitReached = true;
            break;
        }
        merged.push_back(item);
    }
}

SlotSearchResult mergeCombinationOutcomes(const std::vector<SearchOutcome<Combination>>& perDate,
                                          const SearchOptions& options) {
    SlotSearchResult result;
    result.multiDay = false;
    size_t cap = static_cast<size_t>(options.maxResults);
    for (const auto& outcome : perDate) {
        appendOutcome(outcome, cap, result.combinations, result);
    }
    if (cap > 0 && result.combinations.size() >= cap) result.limitReached = true;
    rankCombinations(result.combinations, options.balanceLoad);
    return result;
}

SlotSearchResult mergePlanOutcomes(const std::vector<SearchOutcome<MultiDayPlan>>& perDate,
                                   const SearchOptions& options) {
    SlotSearchResult result;
    result.multiDay = true;
    size_t cap = static_cast<size_t>(options.maxResults);
    for (const auto& outcome : perDate) {
        appendOutcome(outcome, cap, result.plans, result);
    }
    if (cap > 0 && result.plans.size() >= cap) result.limitReached = true;
    rankPlans(result.plans, options.balanceLoad);
    return result;
}


///////////////////////////
///       SOLVERS       ///
///////////////////////////
SequentialSlotSolver::SequentialSlotSolver(const BusyOverlapTable* overlapTable)
        : overlapTable_(overlapTable) {}

/**
 * @brief Validate, pick the flow, and search the dates in ascending order.
 *
 * The single-day flow stops visiting dates once maxResults combinations are
 * collected or the budget is exhausted.
 */
SlotSearchResult SequentialSlotSolver::findSlots(const SchedulingRequest& request, const BusySnapshot& busy) {
    validateRequest(request);
    const SearchOptions& options = request.options;
    SearchBudget budget(options.timeLimitSeconds, options.stepBudget);

    if (needsMultiDayScheduling(request.sessions, options.dayLengthThreshold)) {
        MultiDaySearch search(request, busy, overlapTable_);
        std::vector<SearchOutcome<MultiDayPlan>> outcomes{search.run(budget)};
        SlotSearchResult result = mergePlanOutcomes(outcomes, options);
        result.steps = budget.stepsTaken();
        return result;
    }

    SingleDaySearch search(request.sessions, request.participants, busy, options, overlapTable_);
    std::vector<SearchOutcome<Combination>> outcomes;
    size_t collected = 0;
    size_t cap = static_cast<size_t>(options.maxResults);

    for (int date : requestDates(request)) {
        outcomes.push_back(search.run(date, budget));
        collected += outcomes.back().results.size();
        if (budget.exhausted()) break;
        if (cap > 0 && collected >= cap) break;
    }

    SlotSearchResult result = mergeCombinationOutcomes(outcomes, options);
    result.steps = budget.stepsTaken();
    return result;
}

SearchOutcome<Combination> SequentialSlotSolver::findSlotsForDate(const SchedulingRequest& request, int date,
                                                                  const BusySnapshot& busy) {
    validateRequest(request);
    SearchBudget budget(request.options.timeLimitSeconds, request.options.stepBudget);
    SingleDaySearch search(request.sessions, request.participants, busy, request.options, overlapTable_);
    return search.run(date, budget);
}
