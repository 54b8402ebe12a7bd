#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <vector>


///////////////////////////
///        TYPES        ///
///////////////////////////
/// Participants assigned together to one session (non-owning, request-scoped).
using ParticipantGroup = std::vector<const Participant*>;


///////////////////////////
///    COMBINATIONS     ///
///////////////////////////
/**
 * @brief Choose/skip recursion behind generateCombinations().
 */
template <class T>
void chooseCombinationsFrom(const std::vector<T>& pool, size_t first, int k,
                            std::vector<T>& current, std::vector<std::vector<T>>& out) {
    if (k == 0) {
        out.push_back(current);
        return;
    }
    if (pool.size() - first < static_cast<size_t>(k)) return;

    // Subsets containing pool[first] come before those skipping it.
    current.push_back(pool[first]);
    chooseCombinationsFrom(pool, first + 1, k - 1, current, out);
    current.pop_back();
    chooseCombinationsFrom(pool, first + 1, k, current, out);
}

/**
 * @brief All k-element subsets of `pool`, lexicographic in pool order.
 *
 * k == 0 yields one empty subset; k < 0 or k > pool.size() yields none.
 */
template <class T>
std::vector<std::vector<T>> generateCombinations(const std::vector<T>& pool, int k) {
    std::vector<std::vector<T>> out;
    if (k < 0 || static_cast<size_t>(k) > pool.size()) return out;
    std::vector<T> current;
    current.reserve(static_cast<size_t>(k));
    chooseCombinationsFrom(pool, 0, k, current, out);
    return out;
}

/**
 * @brief Participants eligible for a session, in roster order.
 *
 * Applies the session pool filter only; trainee handling is left to callers.
 */
ParticipantGroup eligibleParticipants(const Session& session, const std::vector<Participant>& participants);

/**
 * @brief Groups of `required` members mixing at least one trainee.
 *
 * For t = 1..min(required, trainees), pairs every (required - t)-subset of
 * the non-trainees with every t-subset of the trainees; non-trainees come
 * first inside each group.
 */
std::vector<ParticipantGroup> generateCombinationsWithTraining(const ParticipantGroup& pool, int required);

/**
 * @brief Candidate participant groups for every session.
 *
 * The returned vector is aligned with `sessions`. Each entry lists the
 * non-trainee groups first, followed by the trainee groups when training is
 * enabled (globally or for that session); trainees are excluded otherwise.
 */
std::vector<std::vector<ParticipantGroup>> generateParticipantCombinations(
        const std::vector<Session>& sessions,
        const std::vector<Participant>& participants,
        const SearchOptions& options);
