#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "calendar.hpp"
#include <string>
#include <vector>


///////////////////////////
///      FIXTURES       ///
///////////////////////////
/// Monday 2024-02-05.
inline int monday() { return daysFromCivil(2024, 2, 5); }

/// Instant at hh:mm UTC on `date`.
inline long long at(int date, int hh, int mm = 0) { return instantAt(date, hh * 60 + mm); }

/**
 * @brief Participant working 09:00-17:00 Monday to Friday with generous limits.
 */
inline Participant makeTestParticipant(const std::string& id, bool isTraining = false) {
    Participant p;
    p.id = id;
    p.name = id;
    p.email = id + "@example.com";
    for (int d = static_cast<int>(Weekday::MONDAY); d <= static_cast<int>(Weekday::FRIDAY); ++d) {
        p.workHours[d] = TimeRange{9 * 60, 17 * 60};
    }
    p.limits = ParticipantLimits{LoadLimit{LimitType::HOURS, 8.0}, LoadLimit{LimitType::HOURS, 40.0}};
    p.isTraining = isTraining;
    return p;
}

inline Session makeTestSession(const std::string& id, int order, int duration, int breakAfter = 0,
                               int requiredCount = 1) {
    Session s;
    s.id = id;
    s.name = id;
    s.duration = duration;
    s.breakAfter = breakAfter;
    s.requiredCount = requiredCount;
    s.order = order;
    return s;
}

inline BusyInterval makeBusy(const std::string& id, long long start, long long end,
                             const std::string& title = "Meeting") {
    BusyInterval b;
    b.id = id;
    b.title = title;
    b.start = start;
    b.end = end;
    return b;
}

/**
 * @brief Request over [first, last] with default options.
 */
inline SchedulingRequest makeTestRequest(std::vector<Session> sessions, std::vector<Participant> participants,
                                         int first, int last) {
    SchedulingRequest r;
    r.sessions = std::move(sessions);
    r.participants = std::move(participants);
    r.dateRange = DateRange{first, last};
    return r;
}
