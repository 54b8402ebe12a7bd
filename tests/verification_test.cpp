///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "verification.hpp"
#include "../sequential/single_day_search.hpp"
#include "test_helpers.hpp"
#include "doctest.h"


///////////////////////////
///       HELPERS       ///
///////////////////////////
static Combination slotsCombination(const Participant& p, const std::vector<TimeChunk>& windows) {
    Combination c;
    for (size_t i = 0; i < windows.size(); ++i) {
        PlacedSlot slot;
        slot.sessionId = "s" + std::to_string(i + 1);
        slot.sessionName = "Session " + std::to_string(i + 1);
        slot.start = windows[i].start;
        slot.end = windows[i].end;
        slot.participants.push_back(makeAssignment(p));
        c.slots.push_back(slot);
    }

    c.date = dayOfInstant(windows.front().start);
    c.id = makeCombinationId(c.date, c.slots);
    c.startTime = windows.front().start;
    c.endTime = windows.back().end;
    c.totalDuration = static_cast<int>(c.endTime - c.startTime);
    c.loadDensity = slotCountDensity(c.slots);
    return c;
}

static Combination oneSlotCombination(const Participant& p, long long start, long long end) {
    return slotsCombination(p, {TimeChunk{start, end}});
}


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST_CASE("Verification: Clean slot verifies") {
    std::vector<Participant> roster = {makeTestParticipant("alice")};
    Combination c = oneSlotCombination(roster[0], at(monday(), 9), at(monday(), 10));

    VerificationResult r = verifyCombination(c, roster, BusySnapshot{}, SearchOptions{});
    CHECK(r.isAvailable);
    REQUIRE(r.loadInfo.count("alice") == 1u);
    CHECK(r.loadInfo["alice"].daily.current == doctest::Approx(1.0));
}

TEST_CASE("Verification: Reports calendar conflict added after search") {
    std::vector<Participant> roster = {makeTestParticipant("alice")};
    Combination c = oneSlotCombination(roster[0], at(monday(), 9), at(monday(), 10));

    BusySnapshot busy;
    busy["alice"] = {makeBusy("ev-7", at(monday(), 9, 30), at(monday(), 10, 30), "Offsite")};

    VerificationResult r = verifyCombination(c, roster, busy, SearchOptions{});
    CHECK_FALSE(r.isAvailable);
    REQUIRE(r.conflicts.size() == 1u);
    CHECK(r.conflicts[0].type == ConflictType::CALENDAR_EVENT);
    CHECK(r.conflicts[0].eventId == "ev-7");
    CHECK(r.conflicts[0].eventTitle == "Offsite");
}

TEST_CASE("Verification: Reports limit breaches") {
    Participant p = makeTestParticipant("alice");
    p.limits.daily = LoadLimit{LimitType::COUNT, 1.0};
    p.limits.weekly = LoadLimit{LimitType::COUNT, 1.0};
    std::vector<Participant> roster = {p};
    Combination c = oneSlotCombination(p, at(monday(), 14), at(monday(), 15));

    BusySnapshot busy;
    busy["alice"] = {makeBusy("ev-1", at(monday(), 9), at(monday(), 10))};

    VerificationResult r = verifyCombination(c, roster, busy, SearchOptions{});
    REQUIRE(r.conflicts.size() == 2u);
    CHECK(r.conflicts[0].type == ConflictType::DAILY_LIMIT);
    CHECK(r.conflicts[0].message == "Daily limit exceeded (2/1)");
    CHECK(r.conflicts[1].type == ConflictType::WEEKLY_LIMIT);
}

TEST_CASE("Verification: Unknown participants are skipped") {
    Participant ghost = makeTestParticipant("ghost");
    Combination c = oneSlotCombination(ghost, at(monday() + 5, 9), at(monday() + 5, 10));

    VerificationResult r = verifyCombination(c, {}, BusySnapshot{}, SearchOptions{});
    CHECK(r.isAvailable);
    CHECK(r.loadInfo.empty());
}

TEST_CASE("Verification: Plan checks every round") {
    std::vector<Participant> roster = {makeTestParticipant("alice")};
    MultiDayPlan plan;
    plan.rounds.push_back(RoundPlan{0, monday(), oneSlotCombination(roster[0], at(monday(), 9), at(monday(), 10)), {}});
    int saturday = monday() + 5;
    plan.rounds.push_back(RoundPlan{1, saturday, oneSlotCombination(roster[0], at(saturday, 9), at(saturday, 10)), {}});
    plan.totalRounds = 2;

    VerificationResult r = verifyPlan(plan, roster, BusySnapshot{}, SearchOptions{});
    CHECK_FALSE(r.isAvailable);
    REQUIRE(r.conflicts.size() == 1u);
    CHECK(r.conflicts[0].type == ConflictType::WORK_HOURS);
}

TEST_CASE("Verification: Slot check fills load") {
    Participant p = makeTestParticipant("alice");
    LoadInfo load{};
    auto conflicts = checkSlotConflicts(p, at(monday(), 9), at(monday(), 11), {}, SearchOptions{}, &load);
    CHECK(conflicts.empty());
    CHECK(load.daily.current == doctest::Approx(2.0));
    CHECK(load.daily.density == doctest::Approx(0.25));
}

TEST_CASE("Verification: Earlier slots count towards load") {
    Participant p = makeTestParticipant("alice");
    p.limits.daily = LoadLimit{LimitType::COUNT, 1.0};
    std::vector<Participant> roster = {p};
    Combination c = slotsCombination(p, {TimeChunk{at(monday(), 9), at(monday(), 10)},
                                         TimeChunk{at(monday(), 10), at(monday(), 11)}});

    VerificationResult r = verifyCombination(c, roster, BusySnapshot{}, SearchOptions{});
    CHECK_FALSE(r.isAvailable);
    REQUIRE(r.conflicts.size() == 1u);
    CHECK(r.conflicts[0].type == ConflictType::DAILY_LIMIT);
    CHECK(r.conflicts[0].message == "Daily limit exceeded (2/1)");

    // The peak load is kept, not the last slot's.
    REQUIRE(r.loadInfo.count("alice") == 1u);
    CHECK(r.loadInfo["alice"].daily.current == doctest::Approx(2.0));
    CHECK(r.loadInfo["alice"].weekly.current == doctest::Approx(2.0));
}

TEST_CASE("Verification: Overlapping slots of one participant conflict") {
    std::vector<Participant> roster = {makeTestParticipant("alice")};
    Combination c = slotsCombination(roster[0], {TimeChunk{at(monday(), 9), at(monday(), 10)},
                                                 TimeChunk{at(monday(), 9, 30), at(monday(), 10, 30)}});

    VerificationResult r = verifyCombination(c, roster, BusySnapshot{}, SearchOptions{});
    CHECK_FALSE(r.isAvailable);
    REQUIRE(r.conflicts.size() == 1u);
    CHECK(r.conflicts[0].type == ConflictType::CALENDAR_EVENT);
    CHECK(r.conflicts[0].eventId == "s1");
}

TEST_CASE("Verification: Peak load spans plan rounds") {
    std::vector<Participant> roster = {makeTestParticipant("alice")};
    MultiDayPlan plan;
    plan.rounds.push_back(RoundPlan{0, monday(), slotsCombination(roster[0], {TimeChunk{at(monday(), 9), at(monday(), 12)}}), {}});
    plan.rounds.push_back(RoundPlan{1, monday() + 1, oneSlotCombination(roster[0], at(monday() + 1, 9), at(monday() + 1, 10)), {}});
    plan.totalRounds = 2;

    VerificationResult r = verifyPlan(plan, roster, BusySnapshot{}, SearchOptions{});
    CHECK(r.isAvailable);
    // Busiest day is Monday (3h); the week holds both rounds (4h).
    CHECK(r.loadInfo["alice"].daily.current == doctest::Approx(3.0));
    CHECK(r.loadInfo["alice"].weekly.current == doctest::Approx(4.0));
}

TEST_CASE("Verification: Invalid limit is reported, not thrown") {
    Participant p = makeTestParticipant("alice");
    p.limits.weekly.max = 0.0;
    std::vector<Participant> roster = {p};
    Combination c = oneSlotCombination(p, at(monday(), 9), at(monday(), 10));

    VerificationResult r;
    CHECK_NOTHROW(r = verifyCombination(c, roster, BusySnapshot{}, SearchOptions{}));
    CHECK_FALSE(r.isAvailable);
    REQUIRE(r.conflicts.size() == 1u);
    CHECK(r.conflicts[0].type == ConflictType::WEEKLY_LIMIT);
    CHECK(r.loadInfo.empty());
}
