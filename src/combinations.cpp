///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "combinations.hpp"
#include <algorithm>


///////////////////////////
///    COMBINATIONS     ///
///////////////////////////
ParticipantGroup eligibleParticipants(const Session& session, const std::vector<Participant>& participants) {
    ParticipantGroup pool;
    for (const Participant& p : participants) {
        if (session.pool) {
            const auto& ids = *session.pool;
            if (std::find(ids.begin(), ids.end(), p.id) == ids.end()) continue;
        }
        pool.push_back(&p);
    }
    return pool;
}

std::vector<ParticipantGroup> generateCombinationsWithTraining(const ParticipantGroup& pool, int required) {
    ParticipantGroup regular;
    ParticipantGroup training;
    for (const Participant* p : pool) {
        (p->isTraining ? training : regular).push_back(p);
    }

    std::vector<ParticipantGroup> groups;
    if (training.empty() || required <= 0) return groups;

    int maxTraining = std::min(required, static_cast<int>(training.size()));
    for (int numTraining = 1; numTraining <= maxTraining; ++numTraining) {
        int numRegular = required - numTraining;
        if (numRegular > static_cast<int>(regular.size())) continue;

        auto regularGroups = generateCombinations(regular, numRegular);
        auto trainingGroups = generateCombinations(training, numTraining);

        for (const auto& reg : regularGroups) {
            for (const auto& train : trainingGroups) {
                ParticipantGroup group = reg;
                group.insert(group.end(), train.begin(), train.end());
                groups.push_back(std::move(group));
            }
        }
    }
    return groups;
}

std::vector<std::vector<ParticipantGroup>> generateParticipantCombinations(
        const std::vector<Session>& sessions,
        const std::vector<Participant>& participants,
        const SearchOptions& options) {

    std::vector<std::vector<ParticipantGroup>> perSession;
    perSession.reserve(sessions.size());

    for (const Session& session : sessions) {
        ParticipantGroup pool = eligibleParticipants(session, participants);

        ParticipantGroup regular;
        for (const Participant* p : pool) {
            if (!p->isTraining) regular.push_back(p);
        }

        // Regular pass first, trainee pass appended after it.
        std::vector<ParticipantGroup> groups = generateCombinations(regular, session.requiredCount);
        if (options.includeTrainingParticipants || session.allowTraining) {
            auto withTraining = generateCombinationsWithTraining(pool, session.requiredCount);
            groups.insert(groups.end(),
                          std::make_move_iterator(withTraining.begin()),
                          std::make_move_iterator(withTraining.end()));
        }

        perSession.push_back(std::move(groups));
    }
    return perSession;
}
