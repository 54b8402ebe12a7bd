///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "verification.hpp"
#include "errors.hpp"
#include <sstream>


///////////////////////////
///       HELPERS       ///
///////////////////////////
static std::string formatLimit(const PeriodLoad& load) {
    std::ostringstream out;
    out << load.current << "/" << load.max;
    return out.str();
}

static const Participant* findParticipant(const std::vector<Participant>& participants, const std::string& id) {
    for (const Participant& p : participants) {
        if (p.id == id) return &p;
    }
    return nullptr;
}

/// Keep the busier of two loads, period by period.
static void keepPeak(LoadInfo& peak, const LoadInfo& load) {
    if (load.daily.density > peak.daily.density) peak.daily = load.daily;
    if (load.weekly.density > peak.weekly.density) peak.weekly = load.weekly;
}

/**
 * @brief Check every slot in order against the snapshot plus the participant's earlier slots.
 *
 * Earlier slots count towards load, and one that overlaps the current slot
 * shows up as a CALENDAR_EVENT conflict.
 */
static void verifySlots(const std::vector<PlacedSlot>& slots,
                        const std::vector<Participant>& participants,
                        const BusySnapshot& busy,
                        const SearchOptions& options,
                        VerificationResult& result) {
    for (size_t i = 0; i < slots.size(); ++i) {
        const PlacedSlot& slot = slots[i];
        std::vector<PlacedSlot> earlier(slots.begin(), slots.begin() + i);

        for (const ParticipantAssignment& assignment : slot.participants) {
            const Participant* p = findParticipant(participants, assignment.participantId);
            if (!p) continue;

            LoadInfo load{};
            bool hasLoad = false;
            auto conflicts = checkSlotConflicts(*p, slot.start, slot.end,
                                                withHeldSlots(busyFor(busy, p->id), earlier, p->id),
                                                options, &load, &hasLoad);
            result.conflicts.insert(result.conflicts.end(), conflicts.begin(), conflicts.end());
            if (!hasLoad) continue;

            auto it = result.loadInfo.find(p->id);
            if (it == result.loadInfo.end()) {
                result.loadInfo[p->id] = load;
            } else {
                keepPeak(it->second, load);
            }
        }
    }
}


///////////////////////////
///    VERIFICATION     ///
///////////////////////////
std::vector<SlotConflict> checkSlotConflicts(const Participant& participant,
                                             long long start, long long end,
                                             const std::vector<BusyInterval>& busy,
                                             const SearchOptions& options,
                                             LoadInfo* load,
                                             bool* hasLoad) {
    std::vector<SlotConflict> conflicts = isParticipantAvailable(participant, start, end, options).conflicts;

    auto busyConflicts = findBusyConflicts(participant, start, end, busy, options);
    conflicts.insert(conflicts.end(), busyConflicts.begin(), busyConflicts.end());

    if (hasLoad) *hasLoad = false;
    LoadInfo info{};
    try {
        info = calculateParticipantLoad(participant, start, end, busy);
    } catch (const ValidationError& e) {
        ConflictType type = participant.limits.daily.max <= 0.0 ? ConflictType::DAILY_LIMIT
                                                                 : ConflictType::WEEKLY_LIMIT;
        conflicts.push_back({type, participant.id, "", "", e.what()});
        return conflicts;
    }

    if (options.respectDailyLimits && info.daily.density > 1.0) {
        conflicts.push_back({ConflictType::DAILY_LIMIT, participant.id, "", "",
                             "Daily limit exceeded (" + formatLimit(info.daily) + ")"});
    }
    if (options.respectWeeklyLimits && info.weekly.density > 1.0) {
        conflicts.push_back({ConflictType::WEEKLY_LIMIT, participant.id, "", "",
                             "Weekly limit exceeded (" + formatLimit(info.weekly) + ")"});
    }
    if (load) *load = info;
    if (hasLoad) *hasLoad = true;
    return conflicts;
}

VerificationResult verifyCombination(const Combination& combination,
                                     const std::vector<Participant>& participants,
                                     const BusySnapshot& busy,
                                     const SearchOptions& options) {
    VerificationResult result{true, {}, {}};
    verifySlots(combination.slots, participants, busy, options, result);
    result.isAvailable = result.conflicts.empty();
    return result;
}

VerificationResult verifyPlan(const MultiDayPlan& plan,
                              const std::vector<Participant>& participants,
                              const BusySnapshot& busy,
                              const SearchOptions& options) {
    std::vector<PlacedSlot> slots;
    for (const RoundPlan& round : plan.rounds) {
        slots.insert(slots.end(), round.combination.slots.begin(), round.combination.slots.end());
    }

    VerificationResult result{true, {}, {}};
    verifySlots(slots, participants, busy, options, result);
    result.isAvailable = result.conflicts.empty();
    return result;
}
