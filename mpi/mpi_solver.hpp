#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "constraints.hpp"
#include "solver_base.hpp"
#include "plan_codec.hpp"
#include "../threads/threaded_solver.hpp"
#include <vector>


///////////////////////////
///       SOLVER        ///
///////////////////////////
/**
 * @brief MPI date-split wrapper around the threaded slot solver.
 *
 * Every rank holds the same request and busy snapshot. Dates (round-0 dates
 * in the multi-day flow) are dealt to ranks round-robin by index; each rank
 * searches its dates with an internal ThreadedSlotSolver for intra-node
 * parallelism. Rank 0 then collects the per-date outcomes, merges them in
 * global date order and returns the ranked result, which is the same as the
 * sequential solver's. Other ranks return an empty result carrying only the
 * flow, truncation flags and step count.
 */
class MPIDateSplitSolver : public ISolver {
public:
    /**
     * @brief Construct a hybrid MPI + threaded solver.
     *
     * @param numThreads   Number of worker threads used inside each rank.
     * @param overlapTable Optional precomputed busy overlaps, present on every rank.
     */
    explicit MPIDateSplitSolver(int numThreads, const BusyOverlapTable* overlapTable = nullptr);

    using ISolver::findSlots;

    /**
     * @brief Search cooperatively across all MPI ranks.
     *
     * Must be called on every rank with the same arguments. A deadline or
     * step budget applies to each rank separately; if any rank is truncated
     * the merged result is marked truncated.
     */
    SlotSearchResult findSlots(const SchedulingRequest& request, const BusySnapshot& busy) override;

private:
    /// Number of worker threads used within each MPI process.
    int numThreads_;

    const BusyOverlapTable* overlapTable_;

    /**
     * @brief Send this rank's outcomes to rank 0, or receive everyone's on rank 0.
     *
     * @param local Outcomes of this rank's dates, in its dealing order.
     * @return All outcomes in global date order on rank 0, empty elsewhere.
     */
    template <class T>
    std::vector<SearchOutcome<T>> gatherOutcomes(const PlanCodec& codec,
                                                 std::vector<SearchOutcome<T>> local,
                                                 size_t dateCount, int rank, int size) const;
};
