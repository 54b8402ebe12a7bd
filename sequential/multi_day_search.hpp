#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "constraints.hpp"
#include "search_budget.hpp"
#include "solver_base.hpp"
#include "single_day_search.hpp"
#include <set>
#include <string>
#include <vector>


///////////////////////////
///       SEARCH        ///
///////////////////////////
/**
 * @brief Recursive placement of interview rounds on increasing dates.
 *
 * Round 0 may use any date of the request range. Round i > 0 starts no
 * earlier than the previous round's date plus gapDays() of the previous round
 * and no later than the range end. For each date the round's sessions are
 * placed with a SingleDaySearch; a combination sharing a participant with any
 * earlier round is skipped.
 */
class MultiDaySearch {
public:
    /**
     * @brief Group the request's sessions into rounds and prepare one day search per round.
     *
     * `request`, `busy` and `overlapTable` must outlive the search. Throws
     * AlgorithmError when a round boundary would not move past its
     * predecessor's date.
     */
    MultiDaySearch(const SchedulingRequest& request,
                   const BusySnapshot& busy,
                   const BusyOverlapTable* overlapTable = nullptr);

    /**
     * @brief Plans whose first round lies on one of `firstRoundDates`, in exploration order.
     *
     * @param cap    Stop once this many plans exist (0 = no cap).
     * @param budget Consumed once per date and once per round combination.
     */
    SearchOutcome<MultiDayPlan> collect(const std::vector<int>& firstRoundDates, size_t cap,
                                        SearchBudget& budget) const;

    /**
     * @brief collect() over every date of the range, capped at maxResults, then ranked.
     */
    SearchOutcome<MultiDayPlan> run(SearchBudget& budget) const;

    const std::vector<Round>& rounds() const { return rounds_; }

private:
    const SchedulingRequest& request_;
    std::vector<Round> rounds_;

    /// One day search per round, aligned with rounds_.
    std::vector<SingleDaySearch> daySearches_;

    void backtrack(size_t roundIndex, const std::vector<int>& dates,
                   std::vector<RoundPlan>& placed, SearchOutcome<MultiDayPlan>& out,
                   size_t cap, SearchBudget& budget) const;

    MultiDayPlan makePlan(const std::vector<RoundPlan>& placed) const;
};

/// True if the combination shares a participant id with any placed round.
bool sharesParticipant(const Combination& combination, const std::vector<RoundPlan>& placed);

/// Deterministic plan id from its round combinations.
std::string makePlanId(const std::vector<RoundPlan>& rounds);
