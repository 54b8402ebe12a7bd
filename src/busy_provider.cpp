///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "busy_provider.hpp"
#include "calendar.hpp"
#include <algorithm>


///////////////////////////
///      PROVIDERS      ///
///////////////////////////
void InMemoryBusyIntervalProvider::add(const std::string& participantId, const BusyInterval& interval) {
    intervals_[participantId].push_back(interval);
}

void InMemoryBusyIntervalProvider::set(const std::string& participantId, std::vector<BusyInterval> intervals) {
    intervals_[participantId] = std::move(intervals);
}

BusySnapshot InMemoryBusyIntervalProvider::fetch(const std::vector<Participant>& participants,
                                                 const DateRange& range) {
    ++fetchCount_;
    long long from = instantAt(range.start, 0);
    long long to = instantAt(range.end + 1, 0);

    BusySnapshot snapshot;
    for (const Participant& p : participants) {
        auto it = intervals_.find(p.id);
        if (it == intervals_.end()) continue;

        std::vector<BusyInterval> clipped;
        for (const BusyInterval& b : it->second) {
            if (b.end > from && b.start < to) clipped.push_back(b);
        }
        std::stable_sort(clipped.begin(), clipped.end(),
                         [](const BusyInterval& a, const BusyInterval& b) { return a.start < b.start; });
        if (!clipped.empty()) snapshot[p.id] = std::move(clipped);
    }
    return snapshot;
}

CachingBusyIntervalProvider::CachingBusyIntervalProvider(BusyIntervalProvider& source) : source_(source) {}

/**
 * @brief Serve covered participants from the cache, fetch the rest in one call.
 */
BusySnapshot CachingBusyIntervalProvider::fetch(const std::vector<Participant>& participants,
                                                const DateRange& range) {
    std::vector<Participant> missing;
    for (const Participant& p : participants) {
        auto it = entries_.find(p.id);
        bool covered = it != entries_.end() &&
                       it->second.range.start <= range.start && it->second.range.end >= range.end;
        if (!covered) missing.push_back(p);
    }

    if (!missing.empty()) {
        BusySnapshot fetched = source_.fetch(missing, range);
        for (const Participant& p : missing) {
            auto it = fetched.find(p.id);
            Entry entry{range, {}};
            if (it != fetched.end()) entry.intervals = std::move(it->second);
            entries_[p.id] = std::move(entry);
        }
    }

    long long from = instantAt(range.start, 0);
    long long to = instantAt(range.end + 1, 0);

    BusySnapshot snapshot;
    for (const Participant& p : participants) {
        const Entry& entry = entries_.at(p.id);
        std::vector<BusyInterval> clipped;
        for (const BusyInterval& b : entry.intervals) {
            if (b.end > from && b.start < to) clipped.push_back(b);
        }
        if (!clipped.empty()) snapshot[p.id] = std::move(clipped);
    }
    return snapshot;
}

void CachingBusyIntervalProvider::invalidate(const std::string& participantId) {
    entries_.erase(participantId);
}

void CachingBusyIntervalProvider::clear() {
    entries_.clear();
}
