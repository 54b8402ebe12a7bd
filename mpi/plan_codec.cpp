///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "plan_codec.hpp"
#include "errors.hpp"
#include "rounds.hpp"
#include "../sequential/single_day_search.hpp"
#include "../sequential/multi_day_search.hpp"
#include <set>


///////////////////////////
///        CODEC        ///
///////////////////////////
PlanCodec::PlanCodec(const SchedulingRequest& request)
        : request_(request),
          rounds_(groupSessionsIntoRounds(request.sessions, request.options.dayLengthThreshold)) {
    for (size_t i = 0; i < request.sessions.size(); ++i) {
        sessionIndex_[request.sessions[i].id] = static_cast<long long>(i);
    }
    for (size_t i = 0; i < request.participants.size(); ++i) {
        participantIndex_[request.participants[i].id] = static_cast<long long>(i);
    }
}

long long PlanCodec::Reader::next() {
    if (pos >= buffer.size()) {
        throw AlgorithmError("Truncated outcome buffer (" + std::to_string(buffer.size()) + " values)");
    }
    return buffer[pos++];
}

template <class T>
void PlanCodec::encodeHeader(const SearchOutcome<T>& outcome, std::vector<long long>& buffer) {
    buffer.push_back(outcome.truncated ? 1 : 0);
    buffer.push_back(static_cast<long long>(outcome.reason));
    buffer.push_back(outcome.limitReached ? 1 : 0);
    buffer.push_back(static_cast<long long>(outcome.results.size()));
}

template <class T>
size_t PlanCodec::decodeHeader(Reader& reader, SearchOutcome<T>& outcome) {
    outcome.truncated = reader.next() != 0;
    long long reason = reader.next();
    if (reason < static_cast<long long>(TruncationReason::NONE) ||
        reason > static_cast<long long>(TruncationReason::STEP_BUDGET)) {
        throw AlgorithmError("Unknown truncation reason " + std::to_string(reason));
    }
    outcome.reason = static_cast<TruncationReason>(reason);
    outcome.limitReached = reader.next() != 0;

    long long count = reader.next();
    if (count < 0) throw AlgorithmError("Negative result count in outcome buffer");
    return static_cast<size_t>(count);
}

void PlanCodec::encodeCombination(const Combination& combination, std::vector<long long>& buffer) const {
    buffer.push_back(combination.date);
    buffer.push_back(combination.startTime);
    buffer.push_back(combination.endTime);
    buffer.push_back(static_cast<long long>(combination.slots.size()));

    for (const PlacedSlot& slot : combination.slots) {
        auto session = sessionIndex_.find(slot.sessionId);
        if (session == sessionIndex_.end()) {
            throw AlgorithmError("Cannot encode unknown session " + slot.sessionId);
        }
        buffer.push_back(session->second);
        buffer.push_back(slot.start);
        buffer.push_back(slot.end);
        buffer.push_back(static_cast<long long>(slot.participants.size()));

        for (const ParticipantAssignment& a : slot.participants) {
            auto participant = participantIndex_.find(a.participantId);
            if (participant == participantIndex_.end()) {
                throw AlgorithmError("Cannot encode unknown participant " + a.participantId);
            }
            buffer.push_back(participant->second);
        }
    }
}

Combination PlanCodec::decodeCombination(Reader& reader) const {
    Combination c;
    c.date = static_cast<int>(reader.next());
    c.startTime = reader.next();
    c.endTime = reader.next();
    c.totalDuration = static_cast<int>(c.endTime - c.startTime);

    long long slotCount = reader.next();
    if (slotCount < 0) throw AlgorithmError("Negative slot count in outcome buffer");

    for (long long s = 0; s < slotCount; ++s) {
        long long sessionIdx = reader.next();
        if (sessionIdx < 0 || sessionIdx >= static_cast<long long>(request_.sessions.size())) {
            throw AlgorithmError("Session index " + std::to_string(sessionIdx) + " out of range");
        }
        const Session& session = request_.sessions[static_cast<size_t>(sessionIdx)];

        PlacedSlot slot;
        slot.sessionId = session.id;
        slot.sessionName = session.name;
        slot.start = reader.next();
        slot.end = reader.next();

        long long members = reader.next();
        if (members < 0) throw AlgorithmError("Negative member count in outcome buffer");
        for (long long m = 0; m < members; ++m) {
            long long idx = reader.next();
            if (idx < 0 || idx >= static_cast<long long>(request_.participants.size())) {
                throw AlgorithmError("Participant index " + std::to_string(idx) + " out of range");
            }
            slot.participants.push_back(makeAssignment(request_.participants[static_cast<size_t>(idx)]));
        }
        c.slots.push_back(std::move(slot));
    }

    c.id = makeCombinationId(c.date, c.slots);
    c.loadDensity = slotCountDensity(c.slots);
    return c;
}

void PlanCodec::encode(const SearchOutcome<Combination>& outcome, std::vector<long long>& buffer) const {
    buffer.clear();
    encodeHeader(outcome, buffer);
    for (const Combination& c : outcome.results) encodeCombination(c, buffer);
}

void PlanCodec::encode(const SearchOutcome<MultiDayPlan>& outcome, std::vector<long long>& buffer) const {
    buffer.clear();
    encodeHeader(outcome, buffer);
    for (const MultiDayPlan& plan : outcome.results) {
        buffer.push_back(static_cast<long long>(plan.rounds.size()));
        for (const RoundPlan& round : plan.rounds) {
            buffer.push_back(round.roundNumber);
            buffer.push_back(round.date);
            encodeCombination(round.combination, buffer);
        }
    }
}

SearchOutcome<Combination> PlanCodec::decodeCombinations(const std::vector<long long>& buffer) const {
    Reader reader{buffer, 0};
    SearchOutcome<Combination> outcome;
    size_t count = decodeHeader(reader, outcome);
    for (size_t i = 0; i < count; ++i) {
        outcome.results.push_back(decodeCombination(reader));
    }
    if (reader.pos != buffer.size()) {
        throw AlgorithmError("Trailing values in combination buffer");
    }
    return outcome;
}

SearchOutcome<MultiDayPlan> PlanCodec::decodePlans(const std::vector<long long>& buffer) const {
    Reader reader{buffer, 0};
    SearchOutcome<MultiDayPlan> outcome;
    size_t count = decodeHeader(reader, outcome);

    for (size_t i = 0; i < count; ++i) {
        long long roundCount = reader.next();
        if (roundCount != static_cast<long long>(rounds_.size())) {
            throw AlgorithmError("Plan with " + std::to_string(roundCount) + " rounds, expected " +
                                 std::to_string(rounds_.size()));
        }

        MultiDayPlan plan;
        for (long long r = 0; r < roundCount; ++r) {
            RoundPlan round;
            long long number = reader.next();
            if (number < 0 || number >= roundCount) {
                throw AlgorithmError("Round number " + std::to_string(number) + " out of range");
            }
            round.roundNumber = static_cast<int>(number);
            round.date = static_cast<int>(reader.next());
            round.combination = decodeCombination(reader);
            round.sessions = rounds_[static_cast<size_t>(number)].sessions;
            plan.rounds.push_back(std::move(round));
        }

        plan.id = makePlanId(plan.rounds);
        plan.totalRounds = static_cast<int>(plan.rounds.size());
        std::set<std::string> seen;
        for (const RoundPlan& round : plan.rounds) {
            for (const PlacedSlot& slot : round.combination.slots) {
                for (const ParticipantAssignment& a : slot.participants) {
                    if (seen.insert(a.participantId).second) plan.allParticipants.push_back(a.participantId);
                }
            }
        }
        outcome.results.push_back(std::move(plan));
    }
    if (reader.pos != buffer.size()) {
        throw AlgorithmError("Trailing values in plan buffer");
    }
    return outcome;
}
