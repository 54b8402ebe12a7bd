#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "busy_provider.hpp"
#include "search_budget.hpp"
#include <vector>

///////////////////////////
///        TYPES        ///
///////////////////////////
/**
 * @brief Results of one search pass together with how the pass ended.
 */
template <class T>
struct SearchOutcome {
    /// Accepted results, in exploration order or ranked (see the producing call).
    std::vector<T> results;

    bool truncated = false; ///< Stopped by the deadline or step budget.
    TruncationReason reason = TruncationReason::NONE; ///< Set when truncated.
    bool limitReached = false; ///< Stopped because maxResults results exist.
};

/**
 * @brief Ranked outcome of a full slot search.
 *
 * Single-day flows fill `combinations`, multi-day flows fill `plans`.
 */
struct SlotSearchResult {
    bool multiDay = false;
    std::vector<Combination> combinations;
    std::vector<MultiDayPlan> plans;

    bool truncated = false; ///< Partial results: deadline or step budget hit.
    TruncationReason truncationReason = TruncationReason::NONE;
    bool limitReached = false; ///< The maxResults cap was hit.
    long long steps = 0; ///< Loop iterations consumed.

    size_t resultCount() const { return multiDay ? plans.size() : combinations.size(); }
};


///////////////////////////
///      INTERFACE      ///
///////////////////////////
/**
 * @brief Common interface for slot solvers.
 *
 * Implementations may be sequential, multithreaded, GPU-assisted or
 * distributed via MPI, but all return the same ranked results for the same
 * request and snapshot.
 */
class ISolver {
public:
    virtual ~ISolver() = default;

    /**
     * @brief Find every valid placement of the request's sessions.
     *
     * Validates the request first (ValidationError, AlgorithmError), then runs
     * the single-day flow over each date of the range, or the multi-day flow
     * when a session's break reaches the day-length threshold.
     */
    virtual SlotSearchResult findSlots(const SchedulingRequest& request, const BusySnapshot& busy) = 0;

    /**
     * @brief Take a snapshot from `provider`, then search against it.
     *
     * The fetched range is widened to whole weeks so weekly load sees every
     * relevant interval.
     */
    SlotSearchResult findSlots(const SchedulingRequest& request, BusyIntervalProvider& provider);
};


///////////////////////////
///     VALIDATION      ///
///////////////////////////
/**
 * @brief Reject malformed input before any search starts.
 *
 * Throws ValidationError for an empty session or participant list, an
 * inverted date range, negative breakAfter or requiredCount, duplicate session
 * order, a non-positive limit maximum, negative maxResults or a non-positive
 * dayLengthThreshold. Throws AlgorithmError for a negative session duration.
 */
void validateRequest(const SchedulingRequest& request);

/// Date range fetched for a request: its range widened to whole weeks plus one day each side.
DateRange busyFetchRange(const SchedulingRequest& request);

/// Every date of the request's range, ascending.
std::vector<int> requestDates(const SchedulingRequest& request);
