#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "interval_math.hpp"
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>


///////////////////////////
///      CONFLICTS      ///
///////////////////////////
/**
 * @brief Reason a participant cannot take a proposed slot.
 */
enum class ConflictType {
    CALENDAR_EVENT,    ///< Overlaps a busy interval from the participant's calendar.
    WORK_HOURS,        ///< Outside (or no) work hours on that weekday.
    HOLIDAY,           ///< Falls on one of the participant's holidays.
    DAY_OFF,           ///< Falls on a personal day off.
    RECRUITING_BLOCK,  ///< Overlaps a blocked range or a recruiting-block event.
    DAILY_LIMIT,       ///< Daily load limit would be exceeded.
    WEEKLY_LIMIT       ///< Weekly load limit would be exceeded.
};

/**
 * @brief Structured conflict record, produced only when conflicts are requested.
 */
struct SlotConflict {
    ConflictType type;
    std::string participantId;
    std::string eventId; ///< Busy interval id (calendar conflicts only).
    std::string eventTitle; ///< Busy interval title (calendar conflicts only).
    std::string message; ///< Human-readable reason.
};

/**
 * @brief Outcome of the availability checks for one participant and window.
 */
struct AvailabilityResult {
    bool available; ///< True iff conflicts is empty.
    std::vector<SlotConflict> conflicts; ///< Every failed check, not only the first.
};

/// Lower-case label of a conflict type ("work_hours").
std::string conflictTypeName(ConflictType type);


///////////////////////////
///    AVAILABILITY     ///
///////////////////////////
/**
 * @brief Run the toggleable availability checks for a window [start, end).
 *
 * Evaluated in the participant's local time:
 *  - work hours (respectWorkHours): the local weekday must have a range that
 *    fully contains the window,
 *  - holidays (respectHolidays) and day-offs (respectDayOffs): exact match on
 *    the local date of the start,
 *  - blocked ranges (excludeBlockedTimes): any overlap.
 *
 * Never throws for an unavailable participant.
 */
AvailabilityResult isParticipantAvailable(const Participant& participant,
                                          long long start, long long end,
                                          const SearchOptions& options);

/**
 * @brief True if a busy interval counts as a recruiting block for this participant.
 *
 * Either explicitly flagged, or its title contains one of the participant's
 * recruiting-block keywords (case-insensitive).
 */
bool isRecruitingBlock(const Participant& participant, const BusyInterval& interval);

/**
 * @brief Busy intervals that can reject a slot under the given options.
 *
 * Recruiting blocks are kept when excludeBlockedTimes is set, all other
 * intervals when checkBusyIntervals is set.
 */
std::vector<TimeChunk> gatedBusyChunks(const Participant& participant,
                                       const std::vector<BusyInterval>& busy,
                                       const SearchOptions& options);

/**
 * @brief True if [start, end) overlaps any interval kept by gatedBusyChunks().
 */
bool overlapsBusyTime(const Participant& participant,
                      long long start, long long end,
                      const std::vector<BusyInterval>& busy,
                      const SearchOptions& options);

/**
 * @brief One conflict per overlapping busy interval.
 *
 * Recruiting blocks report RECRUITING_BLOCK (when excludeBlockedTimes),
 * other intervals CALENDAR_EVENT (when checkBusyIntervals).
 */
std::vector<SlotConflict> findBusyConflicts(const Participant& participant,
                                            long long start, long long end,
                                            const std::vector<BusyInterval>& busy,
                                            const SearchOptions& options);


///////////////////////////
///   OVERLAP TABLE     ///
///////////////////////////
/**
 * @brief Precomputed busy-overlap answers for (participant, window) pairs.
 *
 * Participants are addressed by their index in the request roster, windows by
 * their exact [start, end). Filled once before a search (on the CPU or by the
 * OpenCL pre-filter) and read-only afterwards.
 */
class BusyOverlapTable {
public:
    BusyOverlapTable() = default;

    /**
     * @brief Create a table with every flag cleared.
     *
     * Duplicate windows are collapsed; the first occurrence keeps its index.
     */
    BusyOverlapTable(size_t participantCount, const std::vector<TimeChunk>& windows);

    size_t participantCount() const { return participantCount_; }
    const std::vector<TimeChunk>& windows() const { return windows_; }

    /// Set the overlap flag of a (participant index, window index) pair.
    void set(size_t participantIndex, size_t windowIndex, bool overlaps);

    /**
     * @brief Look up a window.
     *
     * @return The stored flag, or std::nullopt if the window was not precomputed.
     */
    std::optional<bool> find(size_t participantIndex, long long start, long long end) const;

private:
    size_t participantCount_ = 0;
    std::vector<TimeChunk> windows_;
    std::map<std::pair<long long, long long>, size_t> windowIndex_;

    /// flags_[participantIndex * windows_.size() + windowIndex], 1 = overlaps.
    std::vector<unsigned char> flags_;
};

/**
 * @brief Fill a BusyOverlapTable on the CPU with overlapsBusyTime().
 */
BusyOverlapTable buildBusyOverlapTable(const std::vector<Participant>& participants,
                                       const BusySnapshot& busy,
                                       const std::vector<TimeChunk>& windows,
                                       const SearchOptions& options);

/// Busy list of a participant, or an empty list when the snapshot has none.
const std::vector<BusyInterval>& busyFor(const BusySnapshot& busy, const std::string& participantId);
