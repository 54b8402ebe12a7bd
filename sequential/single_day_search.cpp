///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "single_day_search.hpp"
#include "calendar.hpp"
#include "errors.hpp"
#include "load.hpp"
#include "ranking.hpp"
#include "rounds.hpp"


///////////////////////////
///       HELPERS       ///
///////////////////////////
ParticipantAssignment makeAssignment(const Participant& participant) {
    ParticipantAssignment a;
    a.participantId = participant.id;
    a.name = participant.name;
    a.email = participant.email;
    a.isTraining = participant.isTraining;
    a.status = AssignmentStatus::PENDING;
    return a;
}

std::string makeCombinationId(int date, const std::vector<PlacedSlot>& slots) {
    std::string id = "combo-" + formatIsoDate(date);
    for (const PlacedSlot& slot : slots) {
        id += "-" + slot.sessionId + ":";
        for (size_t i = 0; i < slot.participants.size(); ++i) {
            if (i > 0) id += "+";
            id += slot.participants[i].participantId;
        }
    }
    return id;
}

std::map<std::string, double> slotCountDensity(const std::vector<PlacedSlot>& slots) {
    std::map<std::string, int> counts;
    for (const PlacedSlot& slot : slots) {
        for (const ParticipantAssignment& a : slot.participants) {
            ++counts[a.participantId];
        }
    }

    std::map<std::string, double> density;
    for (const auto& entry : counts) {
        density[entry.first] = static_cast<double>(entry.second) / TYPICAL_MAX_SLOTS;
    }
    return density;
}


///////////////////////////
///       SEARCH        ///
///////////////////////////
/**
 * @brief Sort the sessions, cache their candidate groups and index the roster.
 */
SingleDaySearch::SingleDaySearch(const std::vector<Session>& sessions,
                                 const std::vector<Participant>& participants,
                                 const BusySnapshot& busy,
                                 const SearchOptions& options,
                                 const BusyOverlapTable* overlapTable)
        : sessions_(sortedByOrder(sessions)),
          participants_(participants),
          busy_(busy),
          options_(options),
          overlapTable_(overlapTable) {
    for (const Session& s : sessions_) {
        if (s.duration < 0) {
            throw AlgorithmError("Session " + s.id + " has a negative duration");
        }
    }

    groups_ = generateParticipantCombinations(sessions_, participants_, options_);

    for (size_t i = 0; i < participants_.size(); ++i) {
        rosterIndex_.emplace(participants_[i].id, i);
    }
}

std::vector<TimeChunk> SingleDaySearch::sessionWindows(const std::vector<Session>& sessions, int date,
                                                       const SearchOptions& options) {
    std::vector<TimeChunk> windows;
    long long start = instantAt(date, options.dayStartMinutes);
    for (const Session& s : sortedByOrder(sessions)) {
        long long end = start + s.duration;
        windows.push_back({start, end});
        start = end + s.breakAfter;
    }
    return windows;
}

SearchOutcome<Combination> SingleDaySearch::collect(int date, size_t cap, SearchBudget& budget) const {
    SearchOutcome<Combination> out;
    std::vector<PlacedSlot> slots;
    slots.reserve(sessions_.size());

    backtrack(0, date, slots, out, cap, budget);

    if (budget.exhausted()) {
        out.truncated = true;
        out.reason = budget.reason();
    }
    return out;
}

SearchOutcome<Combination> SingleDaySearch::run(int date, SearchBudget& budget) const {
    SearchOutcome<Combination> out = collect(date, static_cast<size_t>(options_.maxResults), budget);
    rankCombinations(out.results, options_.balanceLoad);
    return out;
}

/**
 * @brief Depth-first placement of sessions_[depth..].
 *
 * Every candidate group costs one budget step; the branch unwinds as soon as
 * the budget fails or `cap` results exist.
 */
void SingleDaySearch::backtrack(size_t depth, int date, std::vector<PlacedSlot>& slots,
                                SearchOutcome<Combination>& out, size_t cap, SearchBudget& budget) const {
    if (cap > 0 && out.results.size() >= cap) {
        out.limitReached = true;
        return;
    }

    // Every session placed: emit the combination.
    if (depth == sessions_.size()) {
        out.results.push_back(makeCombination(date, slots));
        if (cap > 0 && out.results.size() >= cap) out.limitReached = true;
        return;
    }

    const Session& session = sessions_[depth];
    long long start = depth == 0
                      ? instantAt(date, options_.dayStartMinutes)
                      : slots.back().end + sessions_[depth - 1].breakAfter;
    long long end = start + session.duration;

    for (const ParticipantGroup& group : groups_[depth]) {
        if (!budget.consume()) return;
        if (!acceptsGroup(group, start, end, slots)) continue;

        PlacedSlot slot;
        slot.sessionId = session.id;
        slot.sessionName = session.name;
        slot.start = start;
        slot.end = end;
        for (const Participant* p : group) {
            slot.participants.push_back(makeAssignment(*p));
        }

        slots.push_back(std::move(slot));
        backtrack(depth + 1, date, slots, out, cap, budget);
        slots.pop_back();

        if (out.limitReached || budget.exhausted()) return;
    }
}

bool SingleDaySearch::acceptsGroup(const ParticipantGroup& group, long long start, long long end,
                                   const std::vector<PlacedSlot>& placed) const {
    bool checkLimits = options_.respectDailyLimits || options_.respectWeeklyLimits;

    for (const Participant* p : group) {
        // (a) Availability rules.
        if (!isParticipantAvailable(*p, start, end, options_).available) return false;

        // (b) Busy intervals, precomputed when a table covers this window.
        const std::vector<BusyInterval>& busy = busyFor(busy_, p->id);
        std::optional<bool> cached;
        if (overlapTable_) {
            auto it = rosterIndex_.find(p->id);
            if (it != rosterIndex_.end()) cached = overlapTable_->find(it->second, start, end);
        }
        bool overlaps = cached ? *cached : overlapsBusyTime(*p, start, end, busy, options_);
        if (overlaps) return false;

        // (c) Load limits, earlier slots of this combination included.
        if (checkLimits) {
            LoadInfo load = calculateParticipantLoad(*p, start, end, withHeldSlots(busy, placed, p->id));
            if (wouldExceedLoadLimits(load, options_)) return false;
        }
    }
    return true;
}

Combination SingleDaySearch::makeCombination(int date, const std::vector<PlacedSlot>& slots) const {
    Combination c;
    c.id = makeCombinationId(date, slots);
    c.date = date;
    c.slots = slots;
    c.startTime = slots.empty() ? instantAt(date, options_.dayStartMinutes) : slots.front().start;
    c.endTime = slots.empty() ? c.startTime : slots.back().end;
    c.totalDuration = static_cast<int>(c.endTime - c.startTime);
    c.loadDensity = slotCountDensity(slots);
    return c;
}

std::vector<TimeChunk> requestSessionWindows(const SchedulingRequest& request) {
    const SearchOptions& options = request.options;
    std::vector<std::vector<Session>> sessionLists;
    if (needsMultiDayScheduling(request.sessions, options.dayLengthThreshold)) {
        for (const Round& round : groupSessionsIntoRounds(request.sessions, options.dayLengthThreshold)) {
            sessionLists.push_back(round.sessions);
        }
    } else {
        sessionLists.push_back(request.sessions);
    }

    std::vector<TimeChunk> windows;
    for (int date = request.dateRange.start; date <= request.dateRange.end; ++date) {
        for (const std::vector<Session>& sessions : sessionLists) {
            std::vector<TimeChunk> day = SingleDaySearch::sessionWindows(sessions, date, options);
            windows.insert(windows.end(), day.begin(), day.end());
        }
    }
    return windows;
}
