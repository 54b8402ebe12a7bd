#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "constraints.hpp"
#include "solver_base.hpp"
#include "opencl_evaluator.hpp"


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief OpenCL-assisted slot solver.
 *
 * Every slot window the search can test is fixed by the day-start rule, so
 * the busy-interval overlap check of each (participant, window) pair is
 * computed up front on the device. The depth-first search then runs on the
 * CPU exactly as in SequentialSlotSolver, reading overlaps from the table.
 */
class OpenCLPrefilterSolver : public ISolver {
public:
    /**
     * @brief Construct an OpenCL-assisted solver.
     *
     * @param batchSize Number of slot windows sent to the device per kernel launch.
     */
    explicit OpenCLPrefilterSolver(int batchSize);

    using ISolver::findSlots;

    SlotSearchResult findSlots(const SchedulingRequest& request, const BusySnapshot& busy) override;

private:
    /// Target number of windows per kernel launch.
    int batchSize_;

    /// OpenCL context and kernel used for the overlap table.
    BusyOverlapOpenCLContext clctx_;
};
