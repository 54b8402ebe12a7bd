///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "ranking.hpp"
#include <algorithm>


///////////////////////////
///       RANKING       ///
///////////////////////////
double averageLoadDensity(const std::map<std::string, double>& loadDensity) {
    if (loadDensity.empty()) return 0.0;
    double sum = 0.0;
    for (const auto& entry : loadDensity) sum += entry.second;
    return sum / static_cast<double>(loadDensity.size());
}

double averagePlanDensity(const MultiDayPlan& plan) {
    double sum = 0.0;
    size_t count = 0;
    for (const RoundPlan& round : plan.rounds) {
        for (const auto& entry : round.combination.loadDensity) {
            sum += entry.second;
            ++count;
        }
    }
    return count == 0 ? 0.0 : sum / static_cast<double>(count);
}

bool compareCombinations(const Combination& a, const Combination& b, bool balanceLoad) {
    if (a.startTime != b.startTime) return a.startTime < b.startTime;
    if (!balanceLoad) return false;
    return averageLoadDensity(a.loadDensity) < averageLoadDensity(b.loadDensity);
}

bool comparePlans(const MultiDayPlan& a, const MultiDayPlan& b, bool balanceLoad) {
    // Plans always hold at least one round.
    long long startA = a.rounds.empty() ? 0 : a.rounds.front().combination.startTime;
    long long startB = b.rounds.empty() ? 0 : b.rounds.front().combination.startTime;
    if (startA != startB) return startA < startB;
    if (!balanceLoad) return false;
    return averagePlanDensity(a) < averagePlanDensity(b);
}

void rankCombinations(std::vector<Combination>& combinations, bool balanceLoad) {
    std::stable_sort(combinations.begin(), combinations.end(),
                     [balanceLoad](const Combination& a, const Combination& b) {
                         return compareCombinations(a, b, balanceLoad);
                     });
}

void rankPlans(std::vector<MultiDayPlan>& plans, bool balanceLoad) {
    std::stable_sort(plans.begin(), plans.end(),
                     [balanceLoad](const MultiDayPlan& a, const MultiDayPlan& b) {
                         return comparePlans(a, b, balanceLoad);
                     });
}
