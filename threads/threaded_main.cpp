///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "../threads/threaded_solver.hpp"
#include "model.hpp"
#include "formatting.hpp"
#include "demo_instances.hpp"
#include <iostream>
#include <chrono>
#include <thread>


///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Demo entry point for the threaded slot solver.
 *
 * Builds a demo scenario, snapshots its calendar, runs the date-parallel
 * search and prints the best results.
 */
int main(int argc, char** argv) {
    // Suppress unused parameter warnings for now (no CLI parsing yet).
    (void)argc;
    (void)argv;

    // Choose which demo scenario to run (L exercises the multi-day flow).
    DemoSize size = DemoSize::L;
    DemoScenario demo = makeDemoScenario(size);

    // One worker per hardware thread, at least four.
    int numThreads = static_cast<int>(std::thread::hardware_concurrency());
    if (numThreads < 4) numThreads = 4;
    ThreadedSlotSolver thrSolver(numThreads);

    // Measure wall-clock time for the threaded solver.
    auto startThr = std::chrono::high_resolution_clock::now();
    SlotSearchResult result = thrSolver.findSlots(demo.request, demo.calendar);
    auto endThr = std::chrono::high_resolution_clock::now();
    double msThr = std::chrono::duration<double, std::milli>(endThr - startThr).count();

    printSearchSummary("THREADED SLOT SOLVER: " + demo.name, demo.request, result, msThr);
    std::cout << "Threads: " << thrSolver.numThreads() << "\n\n";

    if (result.multiDay) {
        printMultiDayPlans(result.plans, 3);
    } else {
        printCombinations(result.combinations, 3);
    }

    std::cout << "========================================\n";
    return 0;
}
