#pragma once
#define CL_TARGET_OPENCL_VERSION 120

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <CL/cl.h>
#include <vector>
#include "model.hpp"
#include "constraints.hpp"


///////////////////////////
///      EVALUATOR      ///
///////////////////////////
/**
 * @brief OpenCL helper context for batched busy-overlap checks.
 *
 * Owns the OpenCL platform/device/context/queue and a compiled program that
 * tests many (participant, slot window) pairs against the participants'
 * busy intervals in parallel.
 */
class BusyOverlapOpenCLContext {
public:
    /**
     * @brief Initialize OpenCL platform, device, context and command queue.
     *
     * Also builds the program containing the overlap kernel. Throws
     * std::runtime_error if no platform exists or setup fails.
     */
    BusyOverlapOpenCLContext();

    /**
     * @brief Release all OpenCL resources owned by this context.
     */
    ~BusyOverlapOpenCLContext();

    BusyOverlapOpenCLContext(const BusyOverlapOpenCLContext&) = delete;
    BusyOverlapOpenCLContext& operator=(const BusyOverlapOpenCLContext&) = delete;

    /**
     * @brief Fill every flag of `table` on the device.
     *
     * Each participant's busy intervals are first reduced to the ones the
     * options enforce (see gatedBusyChunks()), so a flag equals
     * overlapsBusyTime() for the same pair.
     *
     * @param table        Table whose rows are aligned with `participants`.
     * @param participants Request roster.
     * @param busy         Busy snapshot.
     * @param options      Gating options.
     * @param batchSize    Windows per kernel launch (values below 1 count as 1).
     */
    void fillOverlapTable(BusyOverlapTable& table,
                          const std::vector<Participant>& participants,
                          const BusySnapshot& busy,
                          const SearchOptions& options,
                          int batchSize);

private:
    cl_platform_id platform = nullptr;
    cl_device_id device = nullptr;
    cl_context context = nullptr;
    cl_program program = nullptr;
    cl_command_queue queue = nullptr;

    cl_program buildProgram(const char* src);
};
