///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "formatting.hpp"
#include "calendar.hpp"
#include "load.hpp"
#include "ranking.hpp"
#include <iostream>
#include <iomanip>
#include <algorithm>

///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief "HH:MM-HH:MM" label of a slot, in UTC.
 */
static std::string formatWindow(long long start, long long end) {
    return formatClockTime(minuteOfDay(start)) + "-" + formatClockTime(minuteOfDay(end));
}

static std::string joinParticipants(const std::vector<ParticipantAssignment>& participants) {
    std::string out;
    for (size_t i = 0; i < participants.size(); ++i) {
        if (i > 0) out += ", ";
        out += participants[i].name;
        if (participants[i].isTraining) out += " (trainee)";
    }
    return out.empty() ? "-" : out;
}

/**
 * @brief Print the header row of a slot table.
 *
 * Uses fixed-width columns to align time, session and participants.
 */
static void printSlotTableHeader() {
    std::cout << "    "
              << std::left << std::setw(11) << "Time (UTC)"
              << " | " << std::left << std::setw(20) << "Session"
              << " | " << "Participants"
              << "\n";

    std::cout << "    "
              << std::string(11, '-')
              << "-+-" << std::string(20, '-')
              << "-+-" << std::string(24, '-')
              << "\n";
}

static void printSlots(const std::vector<PlacedSlot>& slots) {
    printSlotTableHeader();
    for (const PlacedSlot& slot : slots) {
        std::cout << "    "
                  << std::left << std::setw(11) << formatWindow(slot.start, slot.end)
                  << " | " << std::left << std::setw(20) << slot.sessionName
                  << " | " << joinParticipants(slot.participants)
                  << "\n";
    }
}


///////////////////////////
///       REPORTS       ///
///////////////////////////
void printSearchSummary(const std::string& title, const SchedulingRequest& request,
                        const SlotSearchResult& result, double elapsedMs) {
    std::cout << "========================================\n";
    std::cout << title << "\n";
    std::cout << "Sessions: " << request.sessions.size()
              << " | Participants: " << request.participants.size()
              << " | Dates: " << formatIsoDate(request.dateRange.start)
              << " .. " << formatIsoDate(request.dateRange.end) << "\n";
    std::cout << "Flow: " << (result.multiDay ? "multi-day" : "single-day") << "\n";
    std::cout << "Results: " << result.resultCount();
    if (result.limitReached) std::cout << " (maxResults reached)";
    std::cout << "\n";
    if (result.truncated) {
        std::cout << "Search truncated: " << truncationReasonName(result.truncationReason) << "\n";
    }
    std::cout << "Steps: " << result.steps << "\n";
    std::cout << "Time: " << elapsedMs << " ms\n";
}

void printCombinations(const std::vector<Combination>& combinations, size_t maxShown) {
    if (combinations.empty()) {
        std::cout << "  (no combinations)\n";
        return;
    }

    size_t shown = std::min(maxShown, combinations.size());
    for (size_t i = 0; i < shown; ++i) {
        const Combination& c = combinations[i];
        std::cout << "----------------------------------------\n";
        std::cout << "#" << (i + 1) << " " << formatIsoDate(c.date) << " ("
                  << weekdayName(weekdayOf(c.date)) << "), span " << c.totalDuration
                  << " min, mean density " << std::fixed << std::setprecision(2)
                  << averageLoadDensity(c.loadDensity) << std::defaultfloat << "\n";
        printSlots(c.slots);
    }
    if (shown < combinations.size()) {
        std::cout << "  ... " << (combinations.size() - shown) << " more\n";
    }
}

void printMultiDayPlans(const std::vector<MultiDayPlan>& plans, size_t maxShown) {
    if (plans.empty()) {
        std::cout << "  (no plans)\n";
        return;
    }

    size_t shown = std::min(maxShown, plans.size());
    for (size_t i = 0; i < shown; ++i) {
        const MultiDayPlan& plan = plans[i];
        std::cout << "----------------------------------------\n";
        std::cout << "Plan #" << (i + 1) << ": " << plan.totalRounds << " rounds, "
                  << plan.allParticipants.size() << " participants, mean density "
                  << std::fixed << std::setprecision(2) << averagePlanDensity(plan)
                  << std::defaultfloat << "\n";

        for (const RoundPlan& round : plan.rounds) {
            std::cout << "\n  Round " << (round.roundNumber + 1) << " - "
                      << formatIsoDate(round.date) << " (" << weekdayName(weekdayOf(round.date)) << "):\n";
            printSlots(round.combination.slots);
        }
    }
    if (shown < plans.size()) {
        std::cout << "  ... " << (plans.size() - shown) << " more\n";
    }
}

void printVerification(const VerificationResult& verification) {
    std::cout << "Verification: " << (verification.isAvailable ? "available" : "NOT available") << "\n";

    for (const SlotConflict& c : verification.conflicts) {
        std::cout << "  [" << conflictTypeName(c.type) << "] " << c.participantId << ": " << c.message << "\n";
    }

    for (const auto& entry : verification.loadInfo) {
        const LoadInfo& load = entry.second;
        std::cout << "  " << std::left << std::setw(12) << entry.first
                  << " daily " << std::fixed << std::setprecision(2) << load.daily.density
                  << " (" << loadCategoryName(getLoadDensityCategory(load.daily.density)) << ")"
                  << ", weekly " << load.weekly.density
                  << " (" << loadCategoryName(getLoadDensityCategory(load.weekly.density)) << ")"
                  << std::defaultfloat << "\n";
    }
}
