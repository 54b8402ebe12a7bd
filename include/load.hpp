#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <map>
#include <string>
#include <vector>


///////////////////////////
///        TYPES        ///
///////////////////////////
/**
 * @brief Load of one period (day or week), proposed slot included.
 */
struct PeriodLoad {
    double current; ///< Hours or count, depending on the limit type.
    double max; ///< Configured maximum.
    double density; ///< current / max.
};

struct LoadInfo {
    PeriodLoad daily;
    PeriodLoad weekly;
};

enum class LoadCategory { LOW, MEDIUM, HIGH, OVER_LIMIT };


///////////////////////////
///        LOAD         ///
///////////////////////////
/**
 * @brief Exact load of a participant if the window [start, end) were added.
 *
 * Busy intervals are matched on the participant's local date (daily) and
 * Sunday-aligned local week (weekly) of their start. HOURS limits use the
 * merged busy minutes plus the window, in hours; COUNT limits the number of
 * matching intervals plus one.
 *
 * Throws ValidationError if a limit maximum is not positive.
 */
LoadInfo calculateParticipantLoad(const Participant& participant,
                                  long long start, long long end,
                                  const std::vector<BusyInterval>& busy);

/**
 * @brief `busy` extended with the slots of `slots` that `participantId` holds.
 *
 * A partially placed combination counts its own earlier slots towards the
 * participant's daily and weekly load.
 */
std::vector<BusyInterval> withHeldSlots(const std::vector<BusyInterval>& busy,
                                        const std::vector<PlacedSlot>& slots,
                                        const std::string& participantId);

/**
 * @brief Bucket a density: LOW < 0.7 <= MEDIUM < 0.9 <= HIGH < 1.0 <= OVER_LIMIT.
 */
LoadCategory getLoadDensityCategory(double density);

/// Lower-case label of a load category ("over_limit").
std::string loadCategoryName(LoadCategory category);

/**
 * @brief True if an enforced period (respectDailyLimits / respectWeeklyLimits) exceeds density 1.0.
 */
bool wouldExceedLoadLimits(const LoadInfo& info, const SearchOptions& options);

/**
 * @brief Order participants by ascending load, for load balancing.
 *
 * Weekly density decides when two participants differ by more than 0.1,
 * daily density otherwise. Participants without an entry in `loads` keep
 * their relative order after the others.
 */
std::vector<const Participant*> sortByLoadDensity(const std::vector<const Participant*>& participants,
                                                  const std::map<std::string, LoadInfo>& loads);
