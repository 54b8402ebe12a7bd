///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "constraints.hpp"
#include "calendar.hpp"
#include <algorithm>
#include <cctype>


///////////////////////////
///       HELPERS       ///
///////////////////////////
static std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

/**
 * @brief Work-hours check in the participant's local time.
 *
 * A window crossing local midnight is measured from the start's local day,
 * so it can only fit a range that reaches past 24:00.
 */
static std::optional<SlotConflict> checkWorkHours(const Participant& p, long long start, long long end) {
    int localDay = localDayOf(start, p.tzOffsetMinutes);
    Weekday weekday = weekdayOf(localDay);
    const std::optional<TimeRange>& hours = p.workHours[static_cast<int>(weekday)];

    if (!hours) {
        return SlotConflict{ConflictType::WORK_HOURS, p.id, "", "",
                            p.name + " does not work on " + weekdayName(weekday)};
    }

    long long startMinute = localMinuteOfDay(start, p.tzOffsetMinutes);
    long long endMinute = startMinute + (end - start);
    if (startMinute < hours->startMinute || endMinute > hours->endMinute) {
        return SlotConflict{ConflictType::WORK_HOURS, p.id, "", "",
                            "Outside work hours (" + formatClockTime(hours->startMinute) + " - " +
                            formatClockTime(hours->endMinute) + ")"};
    }
    return std::nullopt;
}

static std::optional<SlotConflict> checkHolidays(const Participant& p, int localDay) {
    for (const Holiday& h : p.holidays) {
        if (h.date == localDay) {
            return SlotConflict{ConflictType::HOLIDAY, p.id, "", "", "Holiday: " + h.name};
        }
    }
    return std::nullopt;
}

static std::optional<SlotConflict> checkDayOffs(const Participant& p, int localDay) {
    if (std::find(p.dayOffs.begin(), p.dayOffs.end(), localDay) != p.dayOffs.end()) {
        return SlotConflict{ConflictType::DAY_OFF, p.id, "", "", "Day off for " + p.name};
    }
    return std::nullopt;
}

/**
 * @brief First blocked range overlapping the window, reported as a recruiting block.
 */
static std::optional<SlotConflict> checkBlockedTimes(const Participant& p, long long start, long long end) {
    TimeChunk slot{start, end};
    for (const DateTimeRange& blocked : p.blockedTimes) {
        if (isTimeOverlap(slot, TimeChunk{blocked.start, blocked.end})) {
            return SlotConflict{ConflictType::RECRUITING_BLOCK, p.id, "", "",
                                "Overlaps with blocked time (" + formatTimestamp(blocked.start) + " - " +
                                formatTimestamp(blocked.end) + ")"};
        }
    }
    return std::nullopt;
}


///////////////////////////
///      CONFLICTS      ///
///////////////////////////
std::string conflictTypeName(ConflictType type) {
    switch (type) {
        case ConflictType::CALENDAR_EVENT:   return "calendar_event";
        case ConflictType::WORK_HOURS:       return "work_hours";
        case ConflictType::HOLIDAY:          return "holiday";
        case ConflictType::DAY_OFF:          return "day_off";
        case ConflictType::RECRUITING_BLOCK: return "recruiting_block";
        case ConflictType::DAILY_LIMIT:      return "daily_limit";
        case ConflictType::WEEKLY_LIMIT:     return "weekly_limit";
    }
    return "unknown";
}


///////////////////////////
///    AVAILABILITY     ///
///////////////////////////
AvailabilityResult isParticipantAvailable(const Participant& participant,
                                          long long start, long long end,
                                          const SearchOptions& options) {
    AvailabilityResult result{true, {}};
    int localDay = localDayOf(start, participant.tzOffsetMinutes);

    if (options.respectWorkHours) {
        if (auto c = checkWorkHours(participant, start, end)) result.conflicts.push_back(*c);
    }
    if (options.respectHolidays) {
        if (auto c = checkHolidays(participant, localDay)) result.conflicts.push_back(*c);
    }
    if (options.respectDayOffs) {
        if (auto c = checkDayOffs(participant, localDay)) result.conflicts.push_back(*c);
    }
    if (options.excludeBlockedTimes) {
        if (auto c = checkBlockedTimes(participant, start, end)) result.conflicts.push_back(*c);
    }

    result.available = result.conflicts.empty();
    return result;
}

bool isRecruitingBlock(const Participant& participant, const BusyInterval& interval) {
    if (interval.isRecruitingBlock) return true;
    if (participant.recruitingBlockKeywords.empty()) return false;

    std::string title = toLower(interval.title);
    for (const std::string& keyword : participant.recruitingBlockKeywords) {
        if (keyword.empty()) continue;
        if (title.find(toLower(keyword)) != std::string::npos) return true;
    }
    return false;
}

std::vector<TimeChunk> gatedBusyChunks(const Participant& participant,
                                       const std::vector<BusyInterval>& busy,
                                       const SearchOptions& options) {
    std::vector<TimeChunk> chunks;
    for (const BusyInterval& b : busy) {
        bool gated = isRecruitingBlock(participant, b) ? options.excludeBlockedTimes
                                                        : options.checkBusyIntervals;
        if (gated) chunks.push_back({b.start, b.end});
    }
    return chunks;
}

bool overlapsBusyTime(const Participant& participant,
                      long long start, long long end,
                      const std::vector<BusyInterval>& busy,
                      const SearchOptions& options) {
    if (!options.checkBusyIntervals && !options.excludeBlockedTimes) return false;

    TimeChunk slot{start, end};
    for (const BusyInterval& b : busy) {
        if (!isTimeOverlap(slot, TimeChunk{b.start, b.end})) continue;
        bool gated = isRecruitingBlock(participant, b) ? options.excludeBlockedTimes
                                                        : options.checkBusyIntervals;
        if (gated) return true;
    }
    return false;
}

std::vector<SlotConflict> findBusyConflicts(const Participant& participant,
                                            long long start, long long end,
                                            const std::vector<BusyInterval>& busy,
                                            const SearchOptions& options) {
    std::vector<SlotConflict> conflicts;
    TimeChunk slot{start, end};

    for (const BusyInterval& b : busy) {
        if (!isTimeOverlap(slot, TimeChunk{b.start, b.end})) continue;

        if (isRecruitingBlock(participant, b)) {
            if (!options.excludeBlockedTimes) continue;
            conflicts.push_back({ConflictType::RECRUITING_BLOCK, participant.id, b.id, b.title,
                                 "Recruiting block \"" + b.title + "\""});
        } else {
            if (!options.checkBusyIntervals) continue;
            conflicts.push_back({ConflictType::CALENDAR_EVENT, participant.id, b.id, b.title,
                                 "Calendar conflict with \"" + b.title + "\""});
        }
    }
    return conflicts;
}

const std::vector<BusyInterval>& busyFor(const BusySnapshot& busy, const std::string& participantId) {
    static const std::vector<BusyInterval> kNoBusy;
    auto it = busy.find(participantId);
    return it == busy.end() ? kNoBusy : it->second;
}


///////////////////////////
///   OVERLAP TABLE     ///
///////////////////////////
BusyOverlapTable::BusyOverlapTable(size_t participantCount, const std::vector<TimeChunk>& windows)
        : participantCount_(participantCount) {
    for (const TimeChunk& w : windows) {
        auto key = std::make_pair(w.start, w.end);
        if (windowIndex_.count(key)) continue;
        windowIndex_[key] = windows_.size();
        windows_.push_back(w);
    }
    flags_.assign(participantCount_ * windows_.size(), 0);
}

void BusyOverlapTable::set(size_t participantIndex, size_t windowIndex, bool overlaps) {
    flags_[participantIndex * windows_.size() + windowIndex] = overlaps ? 1 : 0;
}

std::optional<bool> BusyOverlapTable::find(size_t participantIndex, long long start, long long end) const {
    if (participantIndex >= participantCount_) return std::nullopt;
    auto it = windowIndex_.find(std::make_pair(start, end));
    if (it == windowIndex_.end()) return std::nullopt;
    return flags_[participantIndex * windows_.size() + it->second] != 0;
}

BusyOverlapTable buildBusyOverlapTable(const std::vector<Participant>& participants,
                                       const BusySnapshot& busy,
                                       const std::vector<TimeChunk>& windows,
                                       const SearchOptions& options) {
    BusyOverlapTable table(participants.size(), windows);
    const std::vector<TimeChunk>& unique = table.windows();

    for (size_t p = 0; p < participants.size(); ++p) {
        const std::vector<BusyInterval>& list = busyFor(busy, participants[p].id);
        for (size_t w = 0; w < unique.size(); ++w) {
            table.set(p, w, overlapsBusyTime(participants[p], unique[w].start, unique[w].end, list, options));
        }
    }
    return table;
}
