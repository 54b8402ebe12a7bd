#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <map>
#include <string>
#include <vector>


///////////////////////////
///      INTERFACE      ///
///////////////////////////
/**
 * @brief Source of participants' busy intervals.
 *
 * Implementations return a snapshot covering the requested participants and
 * date range. A participant missing from the snapshot has no known busy time.
 * The snapshot is taken before a search and never changes during it.
 */
class BusyIntervalProvider {
public:
    virtual ~BusyIntervalProvider() = default;

    virtual BusySnapshot fetch(const std::vector<Participant>& participants, const DateRange& range) = 0;
};


///////////////////////////
///      PROVIDERS      ///
///////////////////////////
/**
 * @brief Provider backed by lists filled by the caller.
 *
 * fetch() keeps only intervals overlapping the requested days (UTC) and
 * returns each list sorted by start.
 */
class InMemoryBusyIntervalProvider : public BusyIntervalProvider {
public:
    void add(const std::string& participantId, const BusyInterval& interval);

    /// Replace every interval of a participant.
    void set(const std::string& participantId, std::vector<BusyInterval> intervals);

    BusySnapshot fetch(const std::vector<Participant>& participants, const DateRange& range) override;

    /// Number of fetch() calls served so far.
    int fetchCount() const { return fetchCount_; }

private:
    std::map<std::string, std::vector<BusyInterval>> intervals_;
    int fetchCount_ = 0;
};

/**
 * @brief Read-through cache in front of another provider.
 *
 * Entries are keyed by participant id and remember the date range they were
 * fetched for; a request outside that range is fetched again. The cache is
 * owned by the caller and only invalidated explicitly.
 */
class CachingBusyIntervalProvider : public BusyIntervalProvider {
public:
    /// `source` must outlive the cache.
    explicit CachingBusyIntervalProvider(BusyIntervalProvider& source);

    BusySnapshot fetch(const std::vector<Participant>& participants, const DateRange& range) override;

    /// Drop the cached entry of one participant.
    void invalidate(const std::string& participantId);

    /// Drop every cached entry.
    void clear();

    size_t size() const { return entries_.size(); }

private:
    struct Entry {
        DateRange range; ///< Range the intervals were fetched for.
        std::vector<BusyInterval> intervals;
    };

    BusyIntervalProvider& source_;
    std::map<std::string, Entry> entries_;
};
