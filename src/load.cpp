///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "load.hpp"
#include "calendar.hpp"
#include "errors.hpp"
#include "interval_math.hpp"
#include <algorithm>
#include <cmath>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief Load of the intervals selected by `inPeriod` against one limit.
 */
template <class Predicate>
static PeriodLoad periodLoad(const LoadLimit& limit, long long proposedMinutes,
                             const std::vector<BusyInterval>& busy, Predicate inPeriod) {
    std::vector<TimeChunk> chunks;
    for (const BusyInterval& b : busy) {
        if (inPeriod(b)) chunks.push_back({b.start, b.end});
    }

    double current = 0.0;
    if (limit.type == LimitType::HOURS) {
        current = static_cast<double>(getTotalDuration(chunks) + proposedMinutes) / 60.0;
    } else {
        current = static_cast<double>(chunks.size() + 1);
    }
    return PeriodLoad{current, limit.max, current / limit.max};
}


///////////////////////////
///        LOAD         ///
///////////////////////////
LoadInfo calculateParticipantLoad(const Participant& participant,
                                  long long start, long long end,
                                  const std::vector<BusyInterval>& busy) {
    const ParticipantLimits& limits = participant.limits;
    if (limits.daily.max <= 0.0 || limits.weekly.max <= 0.0) {
        throw ValidationError("Participant " + participant.id + " has a non-positive load limit");
    }

    int tz = participant.tzOffsetMinutes;
    int day = localDayOf(start, tz);
    int week = weekStartOf(day);
    long long proposed = end - start;

    LoadInfo info;
    info.daily = periodLoad(limits.daily, proposed, busy, [&](const BusyInterval& b) {
        return localDayOf(b.start, tz) == day;
    });
    info.weekly = periodLoad(limits.weekly, proposed, busy, [&](const BusyInterval& b) {
        return weekStartOf(localDayOf(b.start, tz)) == week;
    });
    return info;
}

std::vector<BusyInterval> withHeldSlots(const std::vector<BusyInterval>& busy,
                                        const std::vector<PlacedSlot>& slots,
                                        const std::string& participantId) {
    std::vector<BusyInterval> extended = busy;
    for (const PlacedSlot& slot : slots) {
        for (const ParticipantAssignment& a : slot.participants) {
            if (a.participantId != participantId) continue;
            BusyInterval held;
            held.id = slot.sessionId;
            held.title = slot.sessionName;
            held.start = slot.start;
            held.end = slot.end;
            extended.push_back(held);
            break;
        }
    }
    return extended;
}

LoadCategory getLoadDensityCategory(double density) {
    if (density < 0.7) return LoadCategory::LOW;
    if (density < 0.9) return LoadCategory::MEDIUM;
    if (density < 1.0) return LoadCategory::HIGH;
    return LoadCategory::OVER_LIMIT;
}

std::string loadCategoryName(LoadCategory category) {
    switch (category) {
        case LoadCategory::LOW:        return "low";
        case LoadCategory::MEDIUM:     return "medium";
        case LoadCategory::HIGH:       return "high";
        case LoadCategory::OVER_LIMIT: return "over_limit";
    }
    return "unknown";
}

bool wouldExceedLoadLimits(const LoadInfo& info, const SearchOptions& options) {
    if (options.respectDailyLimits && info.daily.density > 1.0) return true;
    if (options.respectWeeklyLimits && info.weekly.density > 1.0) return true;
    return false;
}

std::vector<const Participant*> sortByLoadDensity(const std::vector<const Participant*>& participants,
                                                  const std::map<std::string, LoadInfo>& loads) {
    std::vector<const Participant*> sorted = participants;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [&](const Participant* a, const Participant* b) {
                         auto la = loads.find(a->id);
                         auto lb = loads.find(b->id);
                         // Unknown load sorts last.
                         if (la == loads.end() || lb == loads.end()) {
                             return la != loads.end() && lb == loads.end();
                         }
                         double weeklyDiff = la->second.weekly.density - lb->second.weekly.density;
                         if (std::fabs(weeklyDiff) > 0.1) return weeklyDiff < 0;
                         return la->second.daily.density < lb->second.daily.density;
                     });
    return sorted;
}
