///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "sequential_solver.hpp"
#include "model.hpp"
#include "formatting.hpp"
#include "demo_instances.hpp"
#include "verification.hpp"
#include <iostream>
#include <chrono>


///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Demo entry point for the sequential slot solver.
 *
 * Builds a demo scenario, snapshots its calendar through a caching provider,
 * runs the single-threaded search, then re-verifies the best result against a
 * fresh snapshot.
 */
int main(int argc, char** argv) {
    // Currently no command-line handling; silence unused parameter warnings.
    (void)argc;
    (void)argv;

    // Select demo scenario size (controls sessions, participants and date range).
    DemoSize size = DemoSize::M;
    DemoScenario demo = makeDemoScenario(size);
    CachingBusyIntervalProvider calendar(demo.calendar);

    SequentialSlotSolver solver;

    // Measure wall-clock time of the sequential search, snapshot included.
    auto startSeq = std::chrono::high_resolution_clock::now();
    SlotSearchResult result = solver.findSlots(demo.request, calendar);
    auto endSeq = std::chrono::high_resolution_clock::now();
    double msSeq = std::chrono::duration<double, std::milli>(endSeq - startSeq).count();

    printSearchSummary("SEQUENTIAL SLOT SOLVER: " + demo.name, demo.request, result, msSeq);
    std::cout << "\n";

    if (result.multiDay) {
        printMultiDayPlans(result.plans, 3);
    } else {
        printCombinations(result.combinations, 3);
    }

    // Re-check the best result before it would be booked.
    if (result.resultCount() > 0) {
        calendar.clear();
        BusySnapshot fresh = calendar.fetch(demo.request.participants, busyFetchRange(demo.request));
        VerificationResult verification = result.multiDay
                ? verifyPlan(result.plans.front(), demo.request.participants, fresh, demo.request.options)
                : verifyCombination(result.combinations.front(), demo.request.participants, fresh,
                                    demo.request.options);
        std::cout << "\n";
        printVerification(verification);
    }

    std::cout << "========================================\n";
    return 0;
}
