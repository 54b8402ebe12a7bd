#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "solver_base.hpp"
#include <map>
#include <string>
#include <vector>


///////////////////////////
///        CODEC        ///
///////////////////////////
/**
 * @brief Flat integer encoding of search outcomes, for MPI transfer.
 *
 * Sessions and participants are sent as indices into the request, which every
 * rank holds, so a buffer is a plain array of long long:
 *
 *   outcome     = truncated, reason, limitReached, count, item...
 *   combination = date, startTime, endTime, slotCount, slot...
 *   slot        = sessionIndex, start, end, memberCount, participantIndex...
 *   plan        = roundCount, (roundNumber, date, combination)...
 *
 * Ids, names and densities are rebuilt on decode the same way the search
 * builds them.
 */
class PlanCodec {
public:
    /// `request` must outlive the codec.
    explicit PlanCodec(const SchedulingRequest& request);

    void encode(const SearchOutcome<Combination>& outcome, std::vector<long long>& buffer) const;
    void encode(const SearchOutcome<MultiDayPlan>& outcome, std::vector<long long>& buffer) const;

    /**
     * @brief Rebuild combinations from a buffer made by encode().
     *
     * Throws AlgorithmError when the buffer is truncated or names an unknown
     * session or participant.
     */
    SearchOutcome<Combination> decodeCombinations(const std::vector<long long>& buffer) const;

    /// Multi-day counterpart of decodeCombinations().
    SearchOutcome<MultiDayPlan> decodePlans(const std::vector<long long>& buffer) const;

private:
    const SchedulingRequest& request_;
    std::vector<Round> rounds_; ///< Rounds of the request, for RoundPlan::sessions.
    std::map<std::string, long long> sessionIndex_;
    std::map<std::string, long long> participantIndex_;

    /// Read cursor over a received buffer.
    struct Reader {
        const std::vector<long long>& buffer;
        size_t pos;

        long long next();
    };

    void encodeCombination(const Combination& combination, std::vector<long long>& buffer) const;
    Combination decodeCombination(Reader& reader) const;

    template <class T>
    static void encodeHeader(const SearchOutcome<T>& outcome, std::vector<long long>& buffer);

    template <class T>
    static size_t decodeHeader(Reader& reader, SearchOutcome<T>& outcome);
};
