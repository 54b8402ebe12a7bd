#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <vector>


///////////////////////////
///       ROUNDS        ///
///////////////////////////
/**
 * @brief Split sessions into same-day rounds.
 *
 * Sessions are taken in ascending `order`; a round is closed after every
 * session whose breakAfter reaches `thresholdMinutes`, and the trailing
 * sessions form the final round. Rounds are numbered from 0.
 */
std::vector<Round> groupSessionsIntoRounds(const std::vector<Session>& sessions, int thresholdMinutes);

/// True if any session's breakAfter reaches the threshold.
bool needsMultiDayScheduling(const std::vector<Session>& sessions, int thresholdMinutes);

/**
 * @brief Minimum number of days between a round and the next one.
 *
 * ceil(boundary.breakAfter / thresholdMinutes), where the boundary is the
 * last session of the earlier round.
 */
int gapDays(const Round& previous, int thresholdMinutes);

/// Copy of the sessions sorted by ascending `order`.
std::vector<Session> sortedByOrder(const std::vector<Session>& sessions);
