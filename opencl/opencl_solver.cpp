///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "opencl_solver.hpp"
#include "../sequential/sequential_solver.hpp"
#include "../sequential/single_day_search.hpp"


///////////////////////////
///       SOLVERS       ///
///////////////////////////
OpenCLPrefilterSolver::OpenCLPrefilterSolver(int batchSize)
        : batchSize_(batchSize) {}

/**
 * @brief Validate, fill the overlap table on the device, then search on the CPU.
 */
SlotSearchResult OpenCLPrefilterSolver::findSlots(const SchedulingRequest& request, const BusySnapshot& busy) {
    validateRequest(request);

    BusyOverlapTable table(request.participants.size(), requestSessionWindows(request));
    clctx_.fillOverlapTable(table, request.participants, busy, request.options, batchSize_);

    SequentialSlotSolver cpuSolver(&table);
    return cpuSolver.findSlots(request, busy);
}
