///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "rounds.hpp"
#include <algorithm>


///////////////////////////
///       ROUNDS        ///
///////////////////////////
std::vector<Session> sortedByOrder(const std::vector<Session>& sessions) {
    std::vector<Session> sorted = sessions;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const Session& a, const Session& b) { return a.order < b.order; });
    return sorted;
}

std::vector<Round> groupSessionsIntoRounds(const std::vector<Session>& sessions, int thresholdMinutes) {
    std::vector<Round> rounds;
    Round current{0, {}};

    for (const Session& s : sortedByOrder(sessions)) {
        current.sessions.push_back(s);
        // A long break closes the round; the next session starts another day.
        if (s.breakAfter >= thresholdMinutes) {
            rounds.push_back(current);
            current = Round{static_cast<int>(rounds.size()), {}};
        }
    }
    if (!current.sessions.empty()) {
        rounds.push_back(current);
    }
    return rounds;
}

bool needsMultiDayScheduling(const std::vector<Session>& sessions, int thresholdMinutes) {
    return std::any_of(sessions.begin(), sessions.end(),
                       [&](const Session& s) { return s.breakAfter >= thresholdMinutes; });
}

int gapDays(const Round& previous, int thresholdMinutes) {
    if (previous.sessions.empty()) return 1;
    long long breakAfter = previous.sessions.back().breakAfter;
    // Integer ceiling for non-negative operands.
    return static_cast<int>((breakAfter + thresholdMinutes - 1) / thresholdMinutes);
}
