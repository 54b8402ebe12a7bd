///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "ranking.hpp"
#include "test_helpers.hpp"
#include "doctest.h"


///////////////////////////
///       HELPERS       ///
///////////////////////////
static Combination combo(const std::string& id, long long start, std::map<std::string, double> density) {
    Combination c;
    c.id = id;
    c.date = dayOfInstant(start);
    c.startTime = start;
    c.endTime = start + 60;
    c.totalDuration = 60;
    c.loadDensity = std::move(density);
    return c;
}


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST_CASE("Ranking: Earlier start wins") {
    std::vector<Combination> list = {combo("late", at(monday(), 10), {{"a", 0.0}}),
                                     combo("early", at(monday(), 9), {{"a", 1.0}})};
    rankCombinations(list, true);
    CHECK(list[0].id == "early");
}

TEST_CASE("Ranking: Lower mean density breaks ties") {
    std::vector<Combination> list = {combo("busy", at(monday(), 9), {{"a", 0.5}, {"b", 0.5}}),
                                     combo("light", at(monday(), 9), {{"a", 0.25}})};
    rankCombinations(list, true);
    CHECK(list[0].id == "light");
    CHECK(averageLoadDensity(list[1].loadDensity) == doctest::Approx(0.5));
}

TEST_CASE("Ranking: Without balancing ties keep discovery order") {
    std::vector<Combination> list = {combo("busy", at(monday(), 9), {{"a", 0.5}}),
                                     combo("light", at(monday(), 9), {{"a", 0.25}})};
    rankCombinations(list, false);
    CHECK(list[0].id == "busy");
    CHECK(list[1].id == "light");
}

TEST_CASE("Ranking: Plans rank by first round then mean density") {
    MultiDayPlan p1;
    p1.id = "p1";
    p1.rounds.push_back(RoundPlan{0, monday(), combo("c1", at(monday(), 9), {{"a", 0.5}}), {}});
    MultiDayPlan p2;
    p2.id = "p2";
    p2.rounds.push_back(RoundPlan{0, monday(), combo("c2", at(monday(), 9), {{"a", 0.25}}), {}});
    MultiDayPlan p3;
    p3.id = "p3";
    p3.rounds.push_back(RoundPlan{0, monday() - 1, combo("c3", at(monday() - 1, 9), {{"a", 1.0}}), {}});

    std::vector<MultiDayPlan> plans = {p1, p2, p3};
    rankPlans(plans, true);
    CHECK(plans[0].id == "p3");
    CHECK(plans[1].id == "p2");
    CHECK(plans[2].id == "p1");
    CHECK(averagePlanDensity(p1) == doctest::Approx(0.5));
}
