///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "../sequential/sequential_solver.hpp"
#include "errors.hpp"
#include "rounds.hpp"
#include "demo_instances.hpp"
#include "test_helpers.hpp"
#include "doctest.h"
#include <set>


///////////////////////////
///       HELPERS       ///
///////////////////////////
static std::vector<std::string> combinationIds(const SlotSearchResult& result) {
    std::vector<std::string> ids;
    for (const Combination& c : result.combinations) ids.push_back(c.id);
    for (const MultiDayPlan& p : result.plans) ids.push_back(p.id);
    return ids;
}

/// Nobody holds two seats of one slot, and nobody holds two overlapping slots.
static void checkNoDoubleBooking(const Combination& c) {
    INFO(c.id);
    for (size_t i = 0; i < c.slots.size(); ++i) {
        std::set<std::string> seated;
        for (const auto& a : c.slots[i].participants) {
            CHECK(seated.insert(a.participantId).second);
        }
        for (size_t j = i + 1; j < c.slots.size(); ++j) {
            TimeChunk x{c.slots[i].start, c.slots[i].end};
            TimeChunk y{c.slots[j].start, c.slots[j].end};
            for (const auto& a : c.slots[j].participants) {
                if (seated.count(a.participantId)) CHECK_FALSE(isTimeOverlap(x, y));
            }
        }
    }
}

/// Two single-participant sessions on separate days, each with its own interviewer.
static SchedulingRequest twoRoundRequest() {
    Session screen = makeTestSession("screen", 1, 60, MINUTES_IN_DAY);
    screen.pool = std::vector<std::string>{"a"};
    Session onsite = makeTestSession("onsite", 2, 60);
    onsite.pool = std::vector<std::string>{"b"};
    return makeTestRequest({screen, onsite}, {makeTestParticipant("a"), makeTestParticipant("b")},
                           monday(), monday() + 2);
}


///////////////////////////
///      SCENARIOS      ///
///////////////////////////
TEST_CASE("Sequential solver: Single session starts at day start") {
    SchedulingRequest request = makeTestRequest({makeTestSession("tech", 1, 60)},
                                                {makeTestParticipant("alice")}, monday(), monday());
    SequentialSlotSolver solver;
    SlotSearchResult result = solver.findSlots(request, BusySnapshot{});

    CHECK_FALSE(result.multiDay);
    REQUIRE(result.combinations.size() == 1u);
    const Combination& c = result.combinations[0];
    CHECK(c.startTime == at(monday(), 9));
    CHECK(c.endTime == at(monday(), 10));
    CHECK(c.totalDuration == 60);
    CHECK(c.id == "combo-2024-02-05-tech:alice");
    CHECK(c.loadDensity.at("alice") == doctest::Approx(0.25));
    CHECK_FALSE(result.truncated);
}

TEST_CASE("Sequential solver: Unavailable member empties pair session") {
    Participant away = makeTestParticipant("bob");
    away.dayOffs.push_back(monday());
    SchedulingRequest request = makeTestRequest({makeTestSession("panel", 1, 60, 0, 2)},
                                                {makeTestParticipant("alice"), away}, monday(), monday());
    SequentialSlotSolver solver;
    CHECK(solver.findSlots(request, BusySnapshot{}).resultCount() == 0u);
}

TEST_CASE("Sequential solver: Break separates consecutive slots") {
    SchedulingRequest request = makeTestRequest({makeTestSession("s1", 1, 45, 15), makeTestSession("s2", 2, 30)},
                                                {makeTestParticipant("alice")}, monday(), monday());
    SequentialSlotSolver solver;
    SlotSearchResult result = solver.findSlots(request, BusySnapshot{});

    REQUIRE(result.combinations.size() == 1u);
    const auto& slots = result.combinations[0].slots;
    REQUIRE(slots.size() == 2u);
    CHECK(slots[1].start == slots[0].end + 15);
    CHECK(result.combinations[0].totalDuration == 90);
}

TEST_CASE("Sequential solver: Long break places rounds on later dates") {
    SchedulingRequest request = twoRoundRequest();
    CHECK(groupSessionsIntoRounds(request.sessions, request.options.dayLengthThreshold).size() == 2u);

    SequentialSlotSolver solver;
    SlotSearchResult result = solver.findSlots(request, BusySnapshot{});
    CHECK(result.multiDay);
    REQUIRE(result.plans.size() == 3u);

    for (const MultiDayPlan& plan : result.plans) {
        REQUIRE(plan.totalRounds == 2);
        CHECK(plan.rounds[1].date > plan.rounds[0].date);
        CHECK(plan.rounds[1].sessions[0].id == "onsite");
        CHECK(plan.allParticipants == (std::vector<std::string>{"a", "b"}));
    }
    CHECK(result.plans[0].rounds[0].date == monday());
}

TEST_CASE("Sequential solver: Daily count limit prunes second slot") {
    Participant p = makeTestParticipant("alice");
    p.limits.daily = LoadLimit{LimitType::COUNT, 1.0};
    SchedulingRequest request = makeTestRequest({makeTestSession("tech", 1, 60)}, {p}, monday(), monday());

    BusySnapshot busy;
    busy["alice"] = {makeBusy("ev-1", at(monday(), 14), at(monday(), 15))};

    SequentialSlotSolver solver;
    CHECK(solver.findSlots(request, busy).resultCount() == 0u);

    request.options.respectDailyLimits = false;
    CHECK(solver.findSlots(request, busy).resultCount() == 1u);
}

TEST_CASE("Sequential solver: Earlier slots of a combination count towards the daily limit") {
    Participant p = makeTestParticipant("alice");
    p.limits.daily = LoadLimit{LimitType::COUNT, 1.0};
    SchedulingRequest request = makeTestRequest({makeTestSession("tech", 1, 60), makeTestSession("culture", 2, 60)},
                                                {p}, monday(), monday());

    SequentialSlotSolver solver;
    CHECK(solver.findSlots(request, BusySnapshot{}).resultCount() == 0u);

    request.participants[0].limits.daily = LoadLimit{LimitType::HOURS, 1.5};
    CHECK(solver.findSlots(request, BusySnapshot{}).resultCount() == 0u);

    request.participants[0].limits.daily = LoadLimit{LimitType::HOURS, 2.0};
    CHECK(solver.findSlots(request, BusySnapshot{}).resultCount() == 1u);

    request.participants[0].limits.daily = LoadLimit{LimitType::COUNT, 1.0};
    request.options.respectDailyLimits = false;
    CHECK(solver.findSlots(request, BusySnapshot{}).resultCount() == 1u);
}


///////////////////////////
///     PROPERTIES      ///
///////////////////////////
TEST_CASE("Sequential solver: Shared participants never double booked") {
    DemoScenario demo = makeDemoScenario(DemoSize::M);
    SequentialSlotSolver solver;
    SlotSearchResult result = solver.findSlots(demo.request, demo.calendar);
    REQUIRE_FALSE(result.combinations.empty());
    for (const Combination& c : result.combinations) checkNoDoubleBooking(c);
}

TEST_CASE("Sequential solver: Shared pool member gets back to back slots") {
    Session s1 = makeTestSession("s1", 1, 60);
    s1.pool = std::vector<std::string>{"alice"};
    Session s2 = makeTestSession("s2", 2, 60, 0, 2);
    s2.pool = std::vector<std::string>{"alice", "bob", "carol"};
    SchedulingRequest request = makeTestRequest(
            {s1, s2}, {makeTestParticipant("alice"), makeTestParticipant("bob"), makeTestParticipant("carol")},
            monday(), monday());

    SequentialSlotSolver solver;
    SlotSearchResult result = solver.findSlots(request, BusySnapshot{});

    // {alice,bob}, {alice,carol}, {bob,carol} for the pair session.
    REQUIRE(result.combinations.size() == 3u);
    for (const Combination& c : result.combinations) {
        REQUIRE(c.slots.size() == 2u);
        CHECK(c.slots[1].start == c.slots[0].end);
        CHECK_FALSE(isTimeOverlap({c.slots[0].start, c.slots[0].end}, {c.slots[1].start, c.slots[1].end}));
        checkNoDoubleBooking(c);
    }
}

TEST_CASE("Sequential solver: Duplicate participant ids are rejected") {
    SchedulingRequest request = makeTestRequest({makeTestSession("panel", 1, 60, 0, 2)},
                                                {makeTestParticipant("alice"), makeTestParticipant("alice")},
                                                monday(), monday());
    SequentialSlotSolver solver;
    CHECK_THROWS_AS(solver.findSlots(request, BusySnapshot{}), ValidationError);
}

TEST_CASE("Sequential solver: Plan rounds respect gaps") {
    DemoScenario demo = makeDemoScenario(DemoSize::L);
    SequentialSlotSolver solver;
    SlotSearchResult result = solver.findSlots(demo.request, demo.calendar);
    REQUIRE(result.multiDay);

    auto rounds = groupSessionsIntoRounds(demo.request.sessions, demo.request.options.dayLengthThreshold);
    for (const MultiDayPlan& plan : result.plans) {
        REQUIRE(plan.rounds.size() == rounds.size());
        for (size_t r = 1; r < plan.rounds.size(); ++r) {
            int gap = gapDays(rounds[r - 1], demo.request.options.dayLengthThreshold);
            INFO(plan.id);
            CHECK(plan.rounds[r].date - plan.rounds[r - 1].date >= gap);
        }
    }
}

TEST_CASE("Sequential solver: Repeated search is identical") {
    DemoScenario demo = makeDemoScenario(DemoSize::M);
    DateRange range = busyFetchRange(demo.request);
    BusySnapshot busy = demo.calendar.fetch(demo.request.participants, range);

    SequentialSlotSolver solver;
    SlotSearchResult first = solver.findSlots(demo.request, busy);
    SlotSearchResult second = solver.findSlots(demo.request, busy);
    CHECK(combinationIds(first) == combinationIds(second));
    CHECK(first.steps == second.steps);
}

TEST_CASE("Sequential solver: Results sorted by start time") {
    SchedulingRequest request = makeTestRequest({makeTestSession("tech", 1, 60)},
                                                {makeTestParticipant("a"), makeTestParticipant("b")},
                                                monday(), monday() + 4);
    SequentialSlotSolver solver;
    SlotSearchResult result = solver.findSlots(request, BusySnapshot{});
    REQUIRE(result.combinations.size() == 10u);
    for (size_t i = 1; i < result.combinations.size(); ++i) {
        CHECK(result.combinations[i - 1].startTime <= result.combinations[i].startTime);
    }
}


///////////////////////////
///   LIMITS & BUDGET   ///
///////////////////////////
TEST_CASE("Sequential solver: Max results caps output") {
    SchedulingRequest request = makeTestRequest({makeTestSession("tech", 1, 60)},
                                                {makeTestParticipant("a"), makeTestParticipant("b"),
                                                 makeTestParticipant("c")},
                                                monday(), monday() + 4);
    request.options.maxResults = 4;
    SequentialSlotSolver solver;
    SlotSearchResult capped = solver.findSlots(request, BusySnapshot{});
    CHECK(capped.combinations.size() == 4u);
    CHECK(capped.limitReached);
    CHECK_FALSE(capped.truncated);

    request.options.maxResults = 0;
    SlotSearchResult all = solver.findSlots(request, BusySnapshot{});
    CHECK(all.combinations.size() == 15u);
    CHECK_FALSE(all.limitReached);
}

TEST_CASE("Sequential solver: Step budget truncates") {
    SchedulingRequest request = makeTestRequest({makeTestSession("tech", 1, 60)},
                                                {makeTestParticipant("a"), makeTestParticipant("b"),
                                                 makeTestParticipant("c")},
                                                monday(), monday() + 4);
    request.options.stepBudget = 2;
    SequentialSlotSolver solver;
    SlotSearchResult result = solver.findSlots(request, BusySnapshot{});
    CHECK(result.truncated);
    CHECK(result.truncationReason == TruncationReason::STEP_BUDGET);
    CHECK(result.combinations.size() == 2u);
}

TEST_CASE("Sequential solver: Busy intervals block slots") {
    SchedulingRequest request = makeTestRequest({makeTestSession("tech", 1, 60)},
                                                {makeTestParticipant("a"), makeTestParticipant("b")},
                                                monday(), monday());
    BusySnapshot busy;
    busy["a"] = {makeBusy("ev-1", at(monday(), 9, 30), at(monday(), 10))};

    SequentialSlotSolver solver;
    SlotSearchResult result = solver.findSlots(request, busy);
    REQUIRE(result.combinations.size() == 1u);
    CHECK(result.combinations[0].slots[0].participants[0].participantId == "b");

    request.options.checkBusyIntervals = false;
    CHECK(solver.findSlots(request, busy).combinations.size() == 2u);
}

TEST_CASE("Sequential solver: Single date search") {
    SchedulingRequest request = makeTestRequest({makeTestSession("tech", 1, 60)},
                                                {makeTestParticipant("a")}, monday(), monday());
    SequentialSlotSolver solver;
    CHECK(solver.findSlotsForDate(request, monday() + 2, BusySnapshot{}).results.size() == 1u);
    CHECK(solver.findSlotsForDate(request, monday() + 5, BusySnapshot{}).results.empty());
}

TEST_CASE("Sequential solver: Provider overload fetches once") {
    SchedulingRequest request = makeTestRequest({makeTestSession("tech", 1, 60)},
                                                {makeTestParticipant("a")}, monday(), monday());
    InMemoryBusyIntervalProvider provider;
    provider.add("a", makeBusy("ev-1", at(monday(), 9), at(monday(), 10)));

    SequentialSlotSolver solver;
    CHECK(solver.findSlots(request, provider).resultCount() == 0u);
    CHECK(provider.fetchCount() == 1);
}


///////////////////////////
///     VALIDATION      ///
///////////////////////////
TEST_CASE("Sequential solver: Rejects malformed requests") {
    SequentialSlotSolver solver;
    SchedulingRequest valid = makeTestRequest({makeTestSession("tech", 1, 60)},
                                              {makeTestParticipant("a")}, monday(), monday());

    SchedulingRequest r = valid;
    r.sessions.clear();
    CHECK_THROWS_AS(solver.findSlots(r, BusySnapshot{}), ValidationError);

    r = valid;
    r.participants.clear();
    CHECK_THROWS_AS(solver.findSlots(r, BusySnapshot{}), ValidationError);

    r = valid;
    r.dateRange = DateRange{monday() + 1, monday()};
    CHECK_THROWS_AS(solver.findSlots(r, BusySnapshot{}), ValidationError);

    r = valid;
    r.options.maxResults = -1;
    CHECK_THROWS_AS(solver.findSlots(r, BusySnapshot{}), ValidationError);

    r = valid;
    r.options.dayLengthThreshold = 0;
    CHECK_THROWS_AS(solver.findSlots(r, BusySnapshot{}), ValidationError);

    r = valid;
    r.sessions.push_back(makeTestSession("dup", 1, 30));
    CHECK_THROWS_AS(solver.findSlots(r, BusySnapshot{}), ValidationError);

    r = valid;
    r.sessions[0].breakAfter = -5;
    CHECK_THROWS_AS(solver.findSlots(r, BusySnapshot{}), ValidationError);

    r = valid;
    r.participants[0].limits.daily.max = 0.0;
    CHECK_THROWS_AS(solver.findSlots(r, BusySnapshot{}), ValidationError);

    r = valid;
    r.participants.push_back(makeTestParticipant("a"));
    CHECK_THROWS_AS(solver.findSlots(r, BusySnapshot{}), ValidationError);

    r = valid;
    r.options.dayStartMinutes = -1;
    CHECK_THROWS_AS(solver.findSlots(r, BusySnapshot{}), ValidationError);

    r = valid;
    r.options.dayStartMinutes = MINUTES_IN_DAY;
    CHECK_THROWS_AS(solver.findSlots(r, BusySnapshot{}), ValidationError);

    r = valid;
    r.options.timeLimitSeconds = -1.0;
    CHECK_THROWS_AS(solver.findSlots(r, BusySnapshot{}), ValidationError);

    r = valid;
    r.options.stepBudget = -1;
    CHECK_THROWS_AS(solver.findSlots(r, BusySnapshot{}), ValidationError);

    r = valid;
    r.sessions[0].duration = -10;
    CHECK_THROWS_AS(solver.findSlots(r, BusySnapshot{}), AlgorithmError);

    CHECK_NOTHROW(solver.findSlots(valid, BusySnapshot{}));
}
