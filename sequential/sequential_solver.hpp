#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "constraints.hpp"
#include "solver_base.hpp"
#include "single_day_search.hpp"
#include "multi_day_search.hpp"


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Single-threaded depth-first slot solver.
 *
 * Single-day flow: every date of the range in order, each placed with a
 * ranked SingleDaySearch, results concatenated and capped at maxResults.
 * Multi-day flow: one MultiDaySearch over the whole range.
 */
class SequentialSlotSolver : public ISolver {
public:
    /**
     * @param overlapTable Optional precomputed busy overlaps (see the OpenCL
     *                     pre-filter); must outlive every findSlots() call.
     */
    explicit SequentialSlotSolver(const BusyOverlapTable* overlapTable = nullptr);

    using ISolver::findSlots;

    SlotSearchResult findSlots(const SchedulingRequest& request, const BusySnapshot& busy) override;

    /**
     * @brief Ranked combinations of all sessions on a single date.
     *
     * Validates the request; the date need not lie in its range.
     */
    SearchOutcome<Combination> findSlotsForDate(const SchedulingRequest& request, int date,
                                                const BusySnapshot& busy);

private:
    const BusyOverlapTable* overlapTable_;
};

/**
 * @brief Concatenate per-date outcomes in the given order and cap the result.
 *
 * Truncation and limit flags are merged; the concatenation is cut to
 * maxResults (0 = no cap) and ranked. Shared by the parallel solvers so they
 * produce the same ordering as the sequential one.
 */
SlotSearchResult mergeCombinationOutcomes(const std::vector<SearchOutcome<Combination>>& perDate,
                                          const SearchOptions& options);

/// Multi-day counterpart of mergeCombinationOutcomes().
SlotSearchResult mergePlanOutcomes(const std::vector<SearchOutcome<MultiDayPlan>>& perDate,
                                   const SearchOptions& options);
