#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "constraints.hpp"
#include "load.hpp"
#include <map>
#include <string>
#include <vector>


///////////////////////////
///    VERIFICATION     ///
///////////////////////////
/**
 * @brief Re-check result for a combination or plan before it is booked.
 */
struct VerificationResult {
    bool isAvailable; ///< True iff conflicts is empty.
    std::vector<SlotConflict> conflicts;
    std::map<std::string, LoadInfo> loadInfo; ///< Peak daily and weekly load per participant over their slots.
};

/**
 * @brief Every conflict of one participant for one slot window.
 *
 * Collects availability conflicts, busy overlaps (CALENDAR_EVENT or
 * RECRUITING_BLOCK) and, for enforced limits, DAILY_LIMIT / WEEKLY_LIMIT.
 * A non-positive limit maximum is reported as a DAILY_LIMIT or WEEKLY_LIMIT
 * conflict instead of being thrown. The computed load is written to `load`,
 * and `hasLoad` says whether it could be computed.
 */
std::vector<SlotConflict> checkSlotConflicts(const Participant& participant,
                                             long long start, long long end,
                                             const std::vector<BusyInterval>& busy,
                                             const SearchOptions& options,
                                             LoadInfo* load = nullptr,
                                             bool* hasLoad = nullptr);

/**
 * @brief Re-check every slot of a combination against a (fresh) snapshot.
 *
 * Assigned participants missing from `participants` are skipped. A
 * participant's earlier slots in the combination count towards their load.
 * Never throws for an unavailable slot.
 */
VerificationResult verifyCombination(const Combination& combination,
                                     const std::vector<Participant>& participants,
                                     const BusySnapshot& busy,
                                     const SearchOptions& options);

/// verifyCombination() over the slots of every round of a plan, in round order.
VerificationResult verifyPlan(const MultiDayPlan& plan,
                              const std::vector<Participant>& participants,
                              const BusySnapshot& busy,
                              const SearchOptions& options);
