///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "demo_instances.hpp"
#include "calendar.hpp"
#include "errors.hpp"
#include "interval_math.hpp"
#include <vector>
#include <string>


///////////////////////////
///       HELPERS       ///
///////////////////////////
static int isoDate(const std::string& text) {
    auto day = parseIsoDate(text);
    if (!day) throw ValidationError("Malformed date: \"" + text + "\"");
    return *day;
}

static long long timestamp(const std::string& text) {
    auto instant = parseTimestamp(text);
    if (!instant) throw ValidationError("Malformed timestamp: \"" + text + "\"");
    return *instant;
}

static TimeRange hours(const std::string& from, const std::string& to) {
    return TimeRange{static_cast<int>(normalizeTime(from)), static_cast<int>(normalizeTime(to))};
}

/**
 * @brief Participant working Monday to Friday with default limits.
 *
 * Daily limit: 4 interviews. Weekly limit: 20 hours.
 */
static Participant makeParticipant(const std::string& id, const std::string& name,
                                   const TimeRange& workHours = TimeRange{9 * 60, 17 * 60}) {
    Participant p;
    p.id = id;
    p.name = name;
    p.email = id + "@example.com";
    for (int d = static_cast<int>(Weekday::MONDAY); d <= static_cast<int>(Weekday::FRIDAY); ++d) {
        p.workHours[d] = workHours;
    }
    p.limits.daily = LoadLimit{LimitType::COUNT, 4};
    p.limits.weekly = LoadLimit{LimitType::HOURS, 20};
    return p;
}

static Session makeSession(const std::string& id, const std::string& name, int duration,
                           int breakAfter, int requiredCount, int order) {
    Session s;
    s.id = id;
    s.name = name;
    s.duration = duration;
    s.breakAfter = breakAfter;
    s.requiredCount = requiredCount;
    s.order = order;
    return s;
}

/**
 * @brief Add the same busy interval on every `step`-th day of the range, starting at `offset`.
 */
static void addRecurringBusy(DemoScenario& demo, const std::string& participantId, const std::string& title,
                             const std::string& from, const std::string& to, int step, int offset) {
    const DateRange& range = demo.request.dateRange;
    int begin = static_cast<int>(normalizeTime(from));
    int end = static_cast<int>(normalizeTime(to));
    for (int d = range.start + offset; d <= range.end; d += step) {
        BusyInterval b;
        b.id = participantId + "-" + formatIsoDate(d) + "-" + from;
        b.title = title;
        b.start = instantAt(d, begin);
        b.end = instantAt(d, end);
        demo.calendar.add(participantId, b);
    }
}

static void addBusy(DemoScenario& demo, const std::string& participantId, const std::string& title,
                    const std::string& from, const std::string& to) {
    BusyInterval b;
    b.id = participantId + "-" + from;
    b.title = title;
    b.start = timestamp(from);
    b.end = timestamp(to);
    demo.calendar.add(participantId, b);
}


///////////////////////////
///     DEMO: SMALL     ///
///////////////////////////
static DemoScenario makeDemoSmall() {
    DemoScenario demo;
    demo.name = "Two-stage loop over three days";
    demo.request.dateRange = DateRange{isoDate("2024-02-05"), isoDate("2024-02-07")};

    Session tech = makeSession("tech", "Technical interview", 60, 15, 1, 1);
    Session culture = makeSession("culture", "Culture fit", 45, 0, 1, 2);
    culture.pool = std::vector<std::string>{"bob", "carol"};
    demo.request.sessions = {tech, culture};

    Participant alice = makeParticipant("alice", "Alice Martin");
    Participant bob = makeParticipant("bob", "Bob Chen");
    Participant carol = makeParticipant("carol", "Carol Diaz");
    carol.recruitingBlockKeywords = {"hold"};
    demo.request.participants = {alice, bob, carol};

    addBusy(demo, "alice", "Team standup", "2024-02-05T09:00:00Z", "2024-02-05T09:30:00Z");
    addRecurringBusy(demo, "bob", "Lunch", "12:00", "13:00", 1, 0);
    addBusy(demo, "carol", "Recruiting HOLD", "2024-02-06T10:00:00Z", "2024-02-06T11:00:00Z");

    return demo;
}


///////////////////////////
///    DEMO: MEDIUM     ///
///////////////////////////
static DemoScenario makeDemoMedium() {
    DemoScenario demo;
    demo.name = "Panel loop with trainees over two weeks";
    demo.request.dateRange = DateRange{isoDate("2024-02-05"), isoDate("2024-02-16")};

    Session tech = makeSession("tech", "Technical panel", 60, 15, 2, 1);
    tech.pool = std::vector<std::string>{"alice", "bob", "carol", "dave", "erin"};
    tech.allowTraining = true;
    Session design = makeSession("design", "System design", 60, 30, 1, 2);
    design.pool = std::vector<std::string>{"bob", "carol", "dave"};
    Session manager = makeSession("manager", "Hiring manager", 30, 0, 1, 3);
    manager.pool = std::vector<std::string>{"frank"};
    demo.request.sessions = {tech, design, manager};

    Participant alice = makeParticipant("alice", "Alice Martin");
    Participant bob = makeParticipant("bob", "Bob Chen");
    bob.dayOffs = {isoDate("2024-02-06")};
    Participant carol = makeParticipant("carol", "Carol Diaz");
    carol.limits.daily = LoadLimit{LimitType::HOURS, 2};
    Participant dave = makeParticipant("dave", "Dave Okafor");
    dave.holidays = {Holiday{isoDate("2024-02-12"), "Company offsite"}};
    Participant erin = makeParticipant("erin", "Erin Walsh");
    erin.isTraining = true;
    Participant frank = makeParticipant("frank", "Frank Weber", hours("10:00", "19:00"));
    frank.tzCode = "Europe/Berlin";
    frank.tzOffsetMinutes = 60;
    frank.blockedTimes = {DateTimeRange{timestamp("2024-02-08T00:00:00Z"), timestamp("2024-02-09T00:00:00Z")}};
    demo.request.participants = {alice, bob, carol, dave, erin, frank};

    addRecurringBusy(demo, "alice", "Sprint planning", "09:00", "10:00", 7, 0);
    addRecurringBusy(demo, "bob", "Lunch", "12:00", "13:00", 1, 0);
    addRecurringBusy(demo, "carol", "Design review", "10:00", "11:00", 2, 1);
    addRecurringBusy(demo, "dave", "Customer call", "11:00", "12:00", 3, 0);
    addRecurringBusy(demo, "frank", "Leadership sync", "11:30", "12:00", 2, 0);

    return demo;
}


///////////////////////////
///     DEMO: LARGE     ///
///////////////////////////
static DemoScenario makeDemoLarge() {
    DemoScenario demo;
    demo.name = "Phone screen, then on-site the next day";
    demo.request.dateRange = DateRange{isoDate("2024-02-05"), isoDate("2024-02-14")};

    Session screen = makeSession("screen", "Phone screen", 30, MINUTES_IN_DAY, 1, 1);
    screen.pool = std::vector<std::string>{"alice", "bob"};
    Session tech = makeSession("onsite-tech", "On-site technical", 60, 15, 1, 2);
    tech.pool = std::vector<std::string>{"carol", "dave", "erin"};
    Session culture = makeSession("onsite-culture", "On-site culture", 45, 0, 1, 3);
    culture.pool = std::vector<std::string>{"frank", "gina", "hank"};
    demo.request.sessions = {screen, tech, culture};

    const char* ids[] = {"alice", "bob", "carol", "dave", "erin", "frank", "gina", "hank"};
    const char* names[] = {"Alice Martin", "Bob Chen", "Carol Diaz", "Dave Okafor",
                           "Erin Walsh", "Frank Weber", "Gina Rossi", "Hank Muller"};
    for (int i = 0; i < 8; ++i) {
        demo.request.participants.push_back(makeParticipant(ids[i], names[i]));
    }
    demo.request.participants[6].holidays = {Holiday{isoDate("2024-02-07"), "Local holiday"}};

    for (int i = 0; i < 8; ++i) {
        addRecurringBusy(demo, ids[i], "Focus time", "09:00", "09:45", 3 + (i % 3), i % 4);
    }

    return demo;
}


///////////////////////////
///       DEMO: XL      ///
///////////////////////////
static DemoScenario makeDemoXL() {
    DemoScenario demo;
    demo.name = "Three rounds over three weeks";
    demo.request.dateRange = DateRange{isoDate("2024-02-05"), isoDate("2024-02-23")};
    demo.request.options.timeLimitSeconds = 30.0;

    Session screen = makeSession("screen", "Recruiter screen", 30, MINUTES_IN_DAY, 1, 1);
    screen.pool = std::vector<std::string>{"p00", "p01", "p02"};
    Session coding = makeSession("coding", "Coding exercise", 90, 15, 2, 2);
    coding.pool = std::vector<std::string>{"p03", "p04", "p05", "p06"};
    Session review = makeSession("review", "Code review", 45, 2 * MINUTES_IN_DAY, 1, 3);
    review.pool = std::vector<std::string>{"p07", "p08"};
    Session finalRound = makeSession("final", "Final round", 60, 0, 2, 4);
    finalRound.pool = std::vector<std::string>{"p09", "p10", "p11"};
    demo.request.sessions = {screen, coding, review, finalRound};

    for (int i = 0; i < 12; ++i) {
        std::string id = (i < 10 ? "p0" : "p") + std::to_string(i);
        Participant p = makeParticipant(id, "Interviewer " + std::to_string(i + 1));
        if (i % 4 == 3) p.limits.daily = LoadLimit{LimitType::COUNT, 1};
        demo.request.participants.push_back(p);

        addRecurringBusy(demo, id, "Team sync", "09:00", "09:30", 2 + (i % 5), i % 3);
        addRecurringBusy(demo, id, "Interview debrief", "14:00", "15:00", 4, i % 4);
    }

    return demo;
}


///////////////////////////
///    DEMO FACTORY     ///
///////////////////////////
DemoScenario makeDemoScenario(DemoSize size) {
    switch (size) {
        case DemoSize::S: return makeDemoSmall();
        case DemoSize::M: return makeDemoMedium();
        case DemoSize::L: return makeDemoLarge();
        case DemoSize::XL: return makeDemoXL();
    }
    return makeDemoSmall();
}
