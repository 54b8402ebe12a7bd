///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "busy_provider.hpp"
#include "test_helpers.hpp"
#include "doctest.h"


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST_CASE("Busy provider: In memory fetch clips to range and sorts") {
    InMemoryBusyIntervalProvider provider;
    provider.add("a", makeBusy("late", at(monday(), 15), at(monday(), 16)));
    provider.add("a", makeBusy("early", at(monday(), 9), at(monday(), 10)));
    provider.add("a", makeBusy("next-week", at(monday() + 7, 9), at(monday() + 7, 10)));
    provider.add("b", makeBusy("b1", at(monday() + 1, 9), at(monday() + 1, 10)));

    std::vector<Participant> roster = {makeTestParticipant("a"), makeTestParticipant("c")};
    BusySnapshot snapshot = provider.fetch(roster, DateRange{monday(), monday() + 4});

    REQUIRE(snapshot.count("a") == 1u);
    CHECK(snapshot.count("b") == 0u);
    CHECK(snapshot.count("c") == 0u);
    REQUIRE(snapshot["a"].size() == 2u);
    CHECK(snapshot["a"][0].id == "early");
    CHECK(snapshot["a"][1].id == "late");
    CHECK(provider.fetchCount() == 1);
}

TEST_CASE("Busy provider: Cache serves covered ranges without refetching") {
    InMemoryBusyIntervalProvider source;
    source.add("a", makeBusy("e1", at(monday(), 9), at(monday(), 10)));
    source.add("a", makeBusy("e2", at(monday() + 3, 9), at(monday() + 3, 10)));
    CachingBusyIntervalProvider cache(source);
    std::vector<Participant> roster = {makeTestParticipant("a"), makeTestParticipant("b")};

    cache.fetch(roster, DateRange{monday(), monday() + 6});
    CHECK(source.fetchCount() == 1);
    CHECK(cache.size() == 2u);

    // A narrower range is answered from the cache and still clipped.
    BusySnapshot narrow = cache.fetch(roster, DateRange{monday(), monday()});
    CHECK(source.fetchCount() == 1);
    REQUIRE(narrow["a"].size() == 1u);
    CHECK(narrow["a"][0].id == "e1");

    // A wider range misses.
    cache.fetch(roster, DateRange{monday() - 7, monday() + 6});
    CHECK(source.fetchCount() == 2);
}

TEST_CASE("Busy provider: Invalidated entries are refetched") {
    InMemoryBusyIntervalProvider source;
    CachingBusyIntervalProvider cache(source);
    std::vector<Participant> roster = {makeTestParticipant("a")};
    DateRange week{monday(), monday() + 6};

    CHECK(cache.fetch(roster, week).empty());
    source.add("a", makeBusy("new", at(monday(), 9), at(monday(), 10)));

    // Stale until invalidated.
    CHECK(cache.fetch(roster, week).empty());
    cache.invalidate("a");
    CHECK(cache.fetch(roster, week)["a"].size() == 1u);
    CHECK(source.fetchCount() == 2);

    cache.clear();
    CHECK(cache.size() == 0u);
}
