///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "mpi_solver.hpp"
#include "formatting.hpp"
#include "demo_instances.hpp"
#include <mpi.h>
#include <iostream>
#include <chrono>

///////////////////////////
///     ENTRY POINT     ///
///////////////////////////

/**
 * @brief MPI entry point for the hybrid MPI + threads slot search demo.
 *
 * Initializes MPI, builds the same demo scenario and busy snapshot on each
 * rank, runs the MPIDateSplitSolver, and finalizes MPI. Rank 0 prints the
 * merged result.
 */
int main(int argc, char** argv) {
    MPI_Init(&argc, &argv);

    int rank, size;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    // Only rank 0 prints a brief header about the MPI configuration.
    if (rank == 0) {
        std::cout << "========================================\n";
        std::cout << "MPI+THREADS SLOT SOLVER\n";
        std::cout << "Processes: " << size << "\n";
        std::cout << "========================================\n";
    }

    // Use a medium-size scenario for distributed tests.
    DemoSize demoSize = DemoSize::M;
    DemoScenario demo = makeDemoScenario(demoSize);

    // Hybrid solver: numThreads workers inside each MPI process.
    int numThreads = 8;
    MPIDateSplitSolver solver(/*numThreads=*/numThreads);

    // All ranks participate; rank 0 receives the merged result.
    auto start = std::chrono::high_resolution_clock::now();
    SlotSearchResult result = solver.findSlots(demo.request, demo.calendar);
    auto end = std::chrono::high_resolution_clock::now();
    double ms = std::chrono::duration<double, std::milli>(end - start).count();

    if (rank == 0) {
        printSearchSummary("MPI SLOT SOLVER: " + demo.name, demo.request, result, ms);
        std::cout << "\n";
        if (result.multiDay) {
            printMultiDayPlans(result.plans, 3);
        } else {
            printCombinations(result.combinations, 3);
        }
        std::cout << "========================================\n";
    }

    MPI_Finalize();
    return 0;
}
