///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "formatting.hpp"
#include "demo_instances.hpp"
#include "opencl_solver.hpp"
#include <iostream>
#include <chrono>

///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Demo entry point for the OpenCL-assisted slot solver.
 *
 * Builds a demo scenario, computes the busy-overlap table on the device,
 * runs the CPU search and prints the best results.
 */
int main(int argc, char** argv) {
    // No CLI arguments are used yet; silence unused parameter warnings.
    (void)argc;
    (void)argv;

    // Choose which demo scenario to run.
    DemoSize size = DemoSize::XL;
    DemoScenario demo = makeDemoScenario(size);

    // How many slot windows to test per kernel launch.
    int batchSize = 512;

    std::cout << "========================================\n";
    std::cout << "OPENCL PRE-FILTER SLOT SOLVER\n";
    std::cout << "Participants: " << demo.request.participants.size() << "\n";
    std::cout << "Windows per batch: " << batchSize << "\n";

    OpenCLPrefilterSolver solver(batchSize);

    // Measure wall-clock time for the OpenCL solver.
    auto start = std::chrono::high_resolution_clock::now();
    SlotSearchResult result = solver.findSlots(demo.request, demo.calendar);
    auto end   = std::chrono::high_resolution_clock::now();
    double elapsedMs = std::chrono::duration<double, std::milli>(end - start).count();

    printSearchSummary("OPENCL SLOT SOLVER: " + demo.name, demo.request, result, elapsedMs);
    std::cout << "\n";

    if (result.multiDay) {
        printMultiDayPlans(result.plans, 3);
    } else {
        printCombinations(result.combinations, 3);
    }

    std::cout << "========================================\n";
    return 0;
}
