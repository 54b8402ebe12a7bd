///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "solver_base.hpp"
#include "calendar.hpp"
#include "errors.hpp"
#include <set>
#include <string>


///////////////////////////
///      INTERFACE      ///
///////////////////////////
SlotSearchResult ISolver::findSlots(const SchedulingRequest& request, BusyIntervalProvider& provider) {
    validateRequest(request);
    BusySnapshot busy = provider.fetch(request.participants, busyFetchRange(request));
    return findSlots(request, busy);
}


///////////////////////////
///     VALIDATION      ///
///////////////////////////
void validateRequest(const SchedulingRequest& request) {
    if (request.sessions.empty()) {
        throw ValidationError("At least one session is required");
    }
    if (request.participants.empty()) {
        throw ValidationError("At least one participant is required");
    }
    if (request.dateRange.start > request.dateRange.end) {
        throw ValidationError("Date range starts after it ends (" + formatIsoDate(request.dateRange.start) +
                              " > " + formatIsoDate(request.dateRange.end) + ")");
    }

    const SearchOptions& options = request.options;
    if (options.maxResults < 0) {
        throw ValidationError("maxResults must not be negative");
    }
    if (options.dayLengthThreshold <= 0) {
        throw ValidationError("dayLengthThreshold must be positive");
    }
    if (options.dayStartMinutes < 0 || options.dayStartMinutes >= MINUTES_IN_DAY) {
        throw ValidationError("dayStartMinutes must lie in [0, " + std::to_string(MINUTES_IN_DAY) + ")");
    }
    if (options.timeLimitSeconds < 0.0) {
        throw ValidationError("timeLimitSeconds must not be negative");
    }
    if (options.stepBudget < 0) {
        throw ValidationError("stepBudget must not be negative");
    }

    std::set<int> orders;
    for (const Session& s : request.sessions) {
        if (s.breakAfter < 0) {
            throw ValidationError("Session " + s.id + " has a negative breakAfter");
        }
        if (s.requiredCount < 0) {
            throw ValidationError("Session " + s.id + " has a negative requiredCount");
        }
        if (!orders.insert(s.order).second) {
            throw ValidationError("Duplicate session order " + std::to_string(s.order));
        }
        if (s.duration < 0) {
            throw AlgorithmError("Session " + s.id + " has a negative duration");
        }
    }

    std::set<std::string> ids;
    for (const Participant& p : request.participants) {
        if (!ids.insert(p.id).second) {
            throw ValidationError("Duplicate participant id " + p.id);
        }
        if (p.limits.daily.max <= 0.0 || p.limits.weekly.max <= 0.0) {
            throw ValidationError("Participant " + p.id + " has a non-positive load limit");
        }
    }
}

DateRange busyFetchRange(const SchedulingRequest& request) {
    // One extra day on both sides covers participants east or west of UTC.
    int from = weekStartOf(request.dateRange.start) - 1;
    int to = weekStartOf(request.dateRange.end) + DAYS_IN_WEEK;
    return DateRange{from, to};
}

std::vector<int> requestDates(const SchedulingRequest& request) {
    std::vector<int> dates;
    for (int d = request.dateRange.start; d <= request.dateRange.end; ++d) {
        dates.push_back(d);
    }
    return dates;
}
