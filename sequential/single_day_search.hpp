#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "combinations.hpp"
#include "constraints.hpp"
#include "search_budget.hpp"
#include "solver_base.hpp"
#include <map>
#include <string>
#include <vector>


///////////////////////////
///       SEARCH        ///
///////////////////////////
/**
 * @brief Backtracking placement of a session list on one calendar date.
 *
 * The first session starts at dayStartMinutes (UTC) of the date; every later
 * session starts at the previous slot's end plus the previous session's
 * breakAfter. At each depth the session's participant groups are tried in
 * generation order, and a group is accepted only if every member passes:
 *  - the availability checks,
 *  - the busy-interval overlap check (from the overlap table when given),
 *  - the daily / weekly load limits that are enforced.
 *
 * The search only reads its inputs, so one instance can serve several dates
 * and several threads at once.
 */
class SingleDaySearch {
public:
    /**
     * @brief Prepare a search over `sessions` (re-sorted by order).
     *
     * `participants`, `busy` and `overlapTable` are not copied and must
     * outlive the search. Throws AlgorithmError for a negative duration.
     */
    SingleDaySearch(const std::vector<Session>& sessions,
                    const std::vector<Participant>& participants,
                    const BusySnapshot& busy,
                    const SearchOptions& options,
                    const BusyOverlapTable* overlapTable = nullptr);

    /**
     * @brief Accepted combinations for `date` in exploration order.
     *
     * @param cap    Stop once this many results exist (0 = no cap).
     * @param budget Consumed once per candidate group.
     */
    SearchOutcome<Combination> collect(int date, size_t cap, SearchBudget& budget) const;

    /**
     * @brief collect() capped at maxResults, then ranked.
     */
    SearchOutcome<Combination> run(int date, SearchBudget& budget) const;

    /// Sessions in placement order.
    const std::vector<Session>& sessions() const { return sessions_; }

    /**
     * @brief Slot windows implied by the day-start rule for one date.
     *
     * Independent of the chosen participants, so the windows can be
     * precomputed (see BusyOverlapTable).
     */
    static std::vector<TimeChunk> sessionWindows(const std::vector<Session>& sessions, int date,
                                                 const SearchOptions& options);

private:
    std::vector<Session> sessions_;
    const std::vector<Participant>& participants_;
    const BusySnapshot& busy_;
    SearchOptions options_;
    const BusyOverlapTable* overlapTable_;

    /// Candidate groups per session, aligned with sessions_.
    std::vector<std::vector<ParticipantGroup>> groups_;

    /// Participant id -> index in the roster (overlap table rows).
    std::map<std::string, size_t> rosterIndex_;

    void backtrack(size_t depth, int date, std::vector<PlacedSlot>& slots,
                   SearchOutcome<Combination>& out, size_t cap, SearchBudget& budget) const;

    /// All three gates for every member of the group; `placed` counts towards load.
    bool acceptsGroup(const ParticipantGroup& group, long long start, long long end,
                      const std::vector<PlacedSlot>& placed) const;

    Combination makeCombination(int date, const std::vector<PlacedSlot>& slots) const;
};

/// Assignment record for a participant, status pending.
ParticipantAssignment makeAssignment(const Participant& participant);

/// Deterministic combination id from its date, sessions and participants.
std::string makeCombinationId(int date, const std::vector<PlacedSlot>& slots);

/**
 * @brief Coarse per-participant density: assigned slot count / TYPICAL_MAX_SLOTS.
 */
std::map<std::string, double> slotCountDensity(const std::vector<PlacedSlot>& slots);

/**
 * @brief Every slot window a search over `request` can test.
 *
 * Single-day flow: the session windows of each date of the range. Multi-day
 * flow: the windows of each round on each date of the range.
 */
std::vector<TimeChunk> requestSessionWindows(const SchedulingRequest& request);
