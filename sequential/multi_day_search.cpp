///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "multi_day_search.hpp"
#include "calendar.hpp"
#include "errors.hpp"
#include "ranking.hpp"
#include "rounds.hpp"


///////////////////////////
///       HELPERS       ///
///////////////////////////
bool sharesParticipant(const Combination& combination, const std::vector<RoundPlan>& placed) {
    std::set<std::string> used;
    for (const RoundPlan& round : placed) {
        for (const PlacedSlot& slot : round.combination.slots) {
            for (const ParticipantAssignment& a : slot.participants) used.insert(a.participantId);
        }
    }
    for (const PlacedSlot& slot : combination.slots) {
        for (const ParticipantAssignment& a : slot.participants) {
            if (used.count(a.participantId)) return true;
        }
    }
    return false;
}

std::string makePlanId(const std::vector<RoundPlan>& rounds) {
    std::string id = "plan";
    for (const RoundPlan& round : rounds) {
        id += "|" + round.combination.id;
    }
    return id;
}


///////////////////////////
///       SEARCH        ///
///////////////////////////
MultiDaySearch::MultiDaySearch(const SchedulingRequest& request,
                               const BusySnapshot& busy,
                               const BusyOverlapTable* overlapTable)
        : request_(request),
          rounds_(groupSessionsIntoRounds(request.sessions, request.options.dayLengthThreshold)) {
    // Each boundary must push the next round to a later date.
    for (size_t i = 0; i + 1 < rounds_.size(); ++i) {
        if (gapDays(rounds_[i], request.options.dayLengthThreshold) < 1) {
            throw AlgorithmError("Round " + std::to_string(i + 1) +
                                 " would not start after round " + std::to_string(i));
        }
    }

    daySearches_.reserve(rounds_.size());
    for (const Round& round : rounds_) {
        daySearches_.emplace_back(round.sessions, request.participants, busy, request.options, overlapTable);
    }
}

SearchOutcome<MultiDayPlan> MultiDaySearch::collect(const std::vector<int>& firstRoundDates, size_t cap,
                                                    SearchBudget& budget) const {
    SearchOutcome<MultiDayPlan> out;
    std::vector<RoundPlan> placed;
    placed.reserve(rounds_.size());

    backtrack(0, firstRoundDates, placed, out, cap, budget);

    if (budget.exhausted()) {
        out.truncated = true;
        out.reason = budget.reason();
    }
    return out;
}

SearchOutcome<MultiDayPlan> MultiDaySearch::run(SearchBudget& budget) const {
    SearchOutcome<MultiDayPlan> out = collect(requestDates(request_),
                                              static_cast<size_t>(request_.options.maxResults), budget);
    rankPlans(out.results, request_.options.balanceLoad);
    return out;
}

/**
 * @brief Place rounds_[roundIndex..] on dates after the last placed round.
 *
 * `dates` is only used for round 0; later rounds derive their range from
 * the previous round's date.
 */
void MultiDaySearch::backtrack(size_t roundIndex, const std::vector<int>& dates,
                               std::vector<RoundPlan>& placed, SearchOutcome<MultiDayPlan>& out,
                               size_t cap, SearchBudget& budget) const {
    if (cap > 0 && out.results.size() >= cap) {
        out.limitReached = true;
        return;
    }

    // Every round placed: emit the plan.
    if (roundIndex == rounds_.size()) {
        out.results.push_back(makePlan(placed));
        if (cap > 0 && out.results.size() >= cap) out.limitReached = true;
        return;
    }

    std::vector<int> candidates;
    if (roundIndex == 0) {
        candidates = dates;
    } else {
        int lower = placed.back().date + gapDays(rounds_[roundIndex - 1], request_.options.dayLengthThreshold);
        for (int d = lower; d <= request_.dateRange.end; ++d) candidates.push_back(d);
    }

    const Round& round = rounds_[roundIndex];
    for (int date : candidates) {
        if (!budget.consume()) return;

        SearchOutcome<Combination> day = daySearches_[roundIndex].run(date, budget);
        for (const Combination& combination : day.results) {
            if (!budget.consume()) return;

            // Participants never return in a later round.
            if (sharesParticipant(combination, placed)) continue;

            placed.push_back(RoundPlan{round.number, date, combination, round.sessions});
            backtrack(roundIndex + 1, dates, placed, out, cap, budget);
            placed.pop_back();

            if (out.limitReached || budget.exhausted()) return;
        }
        if (budget.exhausted()) return;
    }
}

MultiDayPlan MultiDaySearch::makePlan(const std::vector<RoundPlan>& placed) const {
    MultiDayPlan plan;
    plan.id = makePlanId(placed);
    plan.rounds = placed;
    plan.totalRounds = static_cast<int>(placed.size());

    std::set<std::string> seen;
    for (const RoundPlan& round : placed) {
        for (const PlacedSlot& slot : round.combination.slots) {
            for (const ParticipantAssignment& a : slot.participants) {
                if (seen.insert(a.participantId).second) plan.allParticipants.push_back(a.participantId);
            }
        }
    }
    return plan;
}
