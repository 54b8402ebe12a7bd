#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>


///////////////////////////
///      CONSTANTS      ///
///////////////////////////
// Time grid: instants are minutes since 1970-01-01T00:00Z, dates are day numbers.
static constexpr int MINUTES_IN_DAY = 1440;
static constexpr int DAYS_IN_WEEK = 7;

/// Default start of the first session of a day (09:00 UTC).
static constexpr int DEFAULT_DAY_START_MINUTES = 9 * 60;

/// Slot count used by the coarse per-combination load density.
static constexpr int TYPICAL_MAX_SLOTS = 4;


///////////////////////////
///       MODELS        ///
///////////////////////////
/**
 * @brief Days of the week, Sunday first (matches weekdayOf()).
 */
enum class Weekday { SUNDAY, MONDAY, TUESDAY, WEDNESDAY, THURSDAY, FRIDAY, SATURDAY };

/**
 * @brief Clock-of-day range, both ends in minutes from midnight.
 */
struct TimeRange {
    int startMinute; ///< Inclusive start (e.g. 540 for 09:00).
    int endMinute; ///< Exclusive end.
};

/**
 * @brief Absolute time range, both ends as instants.
 */
struct DateTimeRange {
    long long start;
    long long end;
};

/**
 * @brief Inclusive range of calendar dates (day numbers).
 */
struct DateRange {
    int start;
    int end;
};

/**
 * @brief Load limits are expressed either in hours or in number of sessions.
 */
enum class LimitType { HOURS, COUNT };

struct LoadLimit {
    LimitType type; ///< Unit of the limit.
    double max; ///< Maximum load per period (must be positive).
};

struct ParticipantLimits {
    LoadLimit daily;
    LoadLimit weekly;
};

struct Holiday {
    int date; ///< Day number of the holiday.
    std::string name; ///< Holiday name, used in conflict messages.
};

/**
 * @brief Participant (interviewer) with availability rules and load ceilings.
 *
 * Work hours, holidays and day-offs are interpreted in the participant's local
 * time, derived from tzOffsetMinutes.
 */
struct Participant {
    std::string id; ///< Unique participant identifier.
    std::string name; ///< Display name.
    std::string email; ///< Contact address (display only).

    std::string tzCode = "UTC"; ///< IANA name, informational.
    int tzOffsetMinutes = 0; ///< Offset from UTC in minutes (east positive).

    /// Work hours indexed by Weekday; an empty entry means no work that day.
    std::array<std::optional<TimeRange>, DAYS_IN_WEEK> workHours;

    ParticipantLimits limits; ///< Daily and weekly load ceilings.

    std::vector<Holiday> holidays; ///< Exclusion dates.
    std::vector<int> dayOffs; ///< Personal day-off dates.
    std::vector<DateTimeRange> blockedTimes; ///< Blocked absolute ranges.

    /// Busy interval titles containing one of these are recruiting blocks.
    std::vector<std::string> recruitingBlockKeywords;

    bool isTraining = false; ///< Trainee participants join only on request.
};

/**
 * @brief One interview session (stage) to be placed.
 */
struct Session {
    std::string id; ///< Unique session identifier.
    std::string name; ///< Human-readable session name.
    int duration; ///< Length in minutes.
    int breakAfter; ///< Minutes between this session's end and the next start.
    int requiredCount; ///< Number of participants to assign.
    int order; ///< Strict ordering key within the interview flow.

    /// Eligible participant ids; empty optional means every participant.
    std::optional<std::vector<std::string>> pool;

    bool allowTraining = false; ///< Enables trainee combinations for this session.
};

/**
 * @brief External commitment of a participant (calendar event).
 */
struct BusyInterval {
    std::string id; ///< Provider event id.
    std::string title; ///< Label used in conflict messages.
    long long start; ///< Start instant.
    long long end; ///< End instant.
    bool isRecruitingBlock = false; ///< Explicit recruiting-block marker.
};

/// Frozen busy-interval snapshot: participant id -> busy intervals.
using BusySnapshot = std::map<std::string, std::vector<BusyInterval>>;

enum class AssignmentStatus { PENDING, ACCEPTED, DECLINED };

/**
 * @brief Participant attached to a placed session.
 */
struct ParticipantAssignment {
    std::string participantId;
    std::string name;
    std::string email;
    bool isTraining = false;
    AssignmentStatus status = AssignmentStatus::PENDING;
};

/**
 * @brief One session placed at a concrete time with its participants.
 */
struct PlacedSlot {
    std::string sessionId;
    std::string sessionName;
    long long start; ///< Start instant.
    long long end; ///< End instant.
    std::vector<ParticipantAssignment> participants;
};

/**
 * @brief All sessions of a day (or round) placed without conflicts.
 *
 * Slots appear in ascending session order.
 */
struct Combination {
    std::string id; ///< Deterministic identifier built from session ids and date.
    int date; ///< Day number.
    std::vector<PlacedSlot> slots;
    long long startTime; ///< Start of the first slot.
    long long endTime; ///< End of the last slot.
    int totalDuration; ///< Span in minutes, breaks included.

    /// Coarse density per participant (assigned slots / TYPICAL_MAX_SLOTS).
    std::map<std::string, double> loadDensity;
};

/**
 * @brief Sessions meant for the same calendar date.
 */
struct Round {
    int number; ///< 0-based round index.
    std::vector<Session> sessions; ///< Sessions in ascending order.
};

struct RoundPlan {
    int roundNumber;
    int date; ///< Day number the round is placed on.
    Combination combination;
    std::vector<Session> sessions;
};

/**
 * @brief Placement of every round on its own date.
 */
struct MultiDayPlan {
    std::string id; ///< Deterministic identifier built from round dates.
    std::vector<RoundPlan> rounds;
    int totalRounds;
    std::vector<std::string> allParticipants; ///< Deduplicated, first-seen order.
};

/**
 * @brief Search toggles; every constraint is enforced unless switched off.
 */
struct SearchOptions {
    bool respectWorkHours = true;
    bool respectHolidays = true;
    bool respectDayOffs = true;
    bool respectDailyLimits = true;
    bool respectWeeklyLimits = true;
    bool checkBusyIntervals = true;
    bool excludeBlockedTimes = true;
    bool balanceLoad = true; ///< Use mean density as secondary ranking key.
    int maxResults = 100; ///< Result cap; 0 disables the cap.
    bool includeTrainingParticipants = false;

    int dayStartMinutes = DEFAULT_DAY_START_MINUTES; ///< First session start, UTC.
    int dayLengthThreshold = MINUTES_IN_DAY; ///< Break that splits rounds.

    double timeLimitSeconds = 0.0; ///< Wall-clock budget; 0 disables it.
    long long stepBudget = 0; ///< Loop-iteration budget; 0 disables it.
};

/**
 * @brief Complete input of a slot search.
 */
struct SchedulingRequest {
    std::vector<Session> sessions;
    std::vector<Participant> participants;
    DateRange dateRange;
    SearchOptions options;
};
