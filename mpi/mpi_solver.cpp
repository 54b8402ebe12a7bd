///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "mpi_solver.hpp"
#include "rounds.hpp"
#include "../sequential/sequential_solver.hpp"
#include <mpi.h>
#include <utility>


///////////////////////////
///       HELPERS       ///
///////////////////////////
static const int TAG_META = 300;
static const int TAG_DATA = 301;

static SearchOutcome<Combination> decodeOutcome(const PlanCodec& codec, const std::vector<long long>& buffer,
                                                const SearchOutcome<Combination>*) {
    return codec.decodeCombinations(buffer);
}

static SearchOutcome<MultiDayPlan> decodeOutcome(const PlanCodec& codec, const std::vector<long long>& buffer,
                                                 const SearchOutcome<MultiDayPlan>*) {
    return codec.decodePlans(buffer);
}


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Construct the hybrid MPI + threaded date-split solver.
 *
 * @param numThreads   Number of worker threads used on each MPI rank.
 * @param overlapTable Optional precomputed busy overlaps.
 */
MPIDateSplitSolver::MPIDateSplitSolver(int numThreads, const BusyOverlapTable* overlapTable)
        : numThreads_(numThreads),
          overlapTable_(overlapTable) {}

/**
 * @brief Exchange per-date outcomes with rank 0.
 *
 * Date index i belongs to rank i % size. A sender emits, for each of its
 * dates in ascending order, the buffer length (TAG_META) and then the buffer
 * itself (TAG_DATA). Rank 0 receives in global date order, which matches each
 * sender's order.
 */
template <class T>
std::vector<SearchOutcome<T>> MPIDateSplitSolver::gatherOutcomes(const PlanCodec& codec,
                                                                 std::vector<SearchOutcome<T>> local,
                                                                 size_t dateCount, int rank, int size) const {
    std::vector<SearchOutcome<T>> all;

    if (rank != 0) {
        std::vector<long long> buf;
        for (const SearchOutcome<T>& outcome : local) {
            codec.encode(outcome, buf);
            int len = (int)buf.size();
            MPI_Send(&len, 1, MPI_INT, 0, TAG_META, MPI_COMM_WORLD);
            if (len > 0) {
                MPI_Send(buf.data(), len, MPI_LONG_LONG, 0, TAG_DATA, MPI_COMM_WORLD);
            }
        }
        return all;
    }

    all.resize(dateCount);
    for (size_t i = 0; i < dateCount; ++i) {
        int owner = (int)(i % (size_t)size);
        if (owner == 0) {
            all[i] = std::move(local[i / (size_t)size]);
            continue;
        }

        int len = 0;
        MPI_Recv(&len, 1, MPI_INT, owner, TAG_META, MPI_COMM_WORLD, MPI_STATUS_IGNORE);
        std::vector<long long> buf(len);
        if (len > 0) {
            MPI_Recv(buf.data(), len, MPI_LONG_LONG, owner, TAG_DATA, MPI_COMM_WORLD, MPI_STATUS_IGNORE);
        }
        all[i] = decodeOutcome(codec, buf, static_cast<const SearchOutcome<T>*>(nullptr));
    }
    return all;
}

/**
 * @brief Split the dates across ranks, search locally with threads, merge on rank 0.
 *
 * Truncation flags and step counts are combined with MPI_Allreduce so every
 * rank reports whether the overall search was cut short.
 */
SlotSearchResult MPIDateSplitSolver::findSlots(const SchedulingRequest& request, const BusySnapshot& busy) {
    validateRequest(request);

    int rank, size;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    const SearchOptions& options = request.options;
    bool multiDay = needsMultiDayScheduling(request.sessions, options.dayLengthThreshold);

    // Round-robin dealing of dates to ranks.
    std::vector<int> dates = requestDates(request);
    std::vector<int> myDates;
    for (size_t i = (size_t)rank; i < dates.size(); i += (size_t)size) {
        myDates.push_back(dates[i]);
    }

    // Threaded solver inside each rank (hybrid parallelism).
    ThreadedSlotSolver threadedSolver(numThreads_, overlapTable_);
    SearchBudget budget(options.timeLimitSeconds, options.stepBudget);
    PlanCodec codec(request);

    SlotSearchResult result;
    if (multiDay) {
        auto local = threadedSolver.searchFirstRoundDates(request, busy, myDates, budget);
        auto all = gatherOutcomes(codec, std::move(local), dates.size(), rank, size);
        if (rank == 0) result = mergePlanOutcomes(all, options);
    } else {
        auto local = threadedSolver.searchDates(request, busy, myDates, budget);
        auto all = gatherOutcomes(codec, std::move(local), dates.size(), rank, size);
        if (rank == 0) result = mergeCombinationOutcomes(all, options);
    }
    result.multiDay = multiDay;

    // Share truncation and work done across ranks.
    int localReason = static_cast<int>(budget.reason());
    int globalReason = 0;
    MPI_Allreduce(&localReason, &globalReason, 1, MPI_INT, MPI_MAX, MPI_COMM_WORLD);

    long long localSteps = budget.stepsTaken();
    long long globalSteps = 0;
    MPI_Allreduce(&localSteps, &globalSteps, 1, MPI_LONG_LONG, MPI_SUM, MPI_COMM_WORLD);

    if (globalReason != static_cast<int>(TruncationReason::NONE) && !result.truncated) {
        result.truncated = true;
        result.truncationReason = static_cast<TruncationReason>(globalReason);
    }
    result.steps = globalSteps;
    return result;
}
