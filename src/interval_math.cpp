///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "interval_math.hpp"
#include "calendar.hpp"
#include "errors.hpp"
#include <algorithm>


///////////////////////////
///    NORMALIZATION    ///
///////////////////////////
long long normalizeTime(const std::string& value) {
    if (auto instant = parseTimestamp(value)) {
        return minuteOfDay(*instant);
    }
    if (auto clock = parseClockTime(value)) {
        return *clock;
    }
    throw ValidationError("Unrecognized time value: \"" + value + "\"");
}

long long normalizeTime(long long minutes) {
    return minutes;
}

std::string denormalizeTime(long long minutes, const std::string& originalFormat) {
    if (auto instant = parseTimestamp(originalFormat)) {
        // Keep the original date, replace the clock part.
        return formatTimestamp(instantAt(dayOfInstant(*instant), 0) + minutes);
    }
    return formatClockTime(static_cast<int>(minutes));
}

TimeChunk makeTimeChunk(const std::string& start, const std::string& end) {
    return TimeChunk{normalizeTime(start), normalizeTime(end)};
}


///////////////////////////
///     OPERATIONS      ///
///////////////////////////
bool isTimeOverlap(const TimeChunk& a, const TimeChunk& b) {
    return !(a.end <= b.start || a.start >= b.end);
}

/**
 * @brief Classify `a` against `b`.
 *
 * Checks run from the most to the least specific case, so the six outcomes
 * are mutually exclusive.
 */
OverlapType getOverlapType(const TimeChunk& a, const TimeChunk& b) {
    if (a.end <= b.start || a.start >= b.end) {
        return OverlapType::NONE;
    }
    if (a.start == b.start && a.end == b.end) {
        return OverlapType::EXACT;
    }
    if (a.start <= b.start && a.end >= b.end) {
        return OverlapType::ENCLOSES;
    }
    if (a.start >= b.start && a.end <= b.end) {
        return OverlapType::ENCLOSED;
    }
    if (a.start < b.start && a.end < b.end) {
        return OverlapType::LEFT;
    }
    return OverlapType::RIGHT;
}

long long getOverlapDuration(const TimeChunk& a, const TimeChunk& b) {
    if (!isTimeOverlap(a, b)) return 0;
    return std::min(a.end, b.end) - std::max(a.start, b.start);
}

long long getTimeDifference(long long from, long long to) {
    return to - from;
}

bool isTimeInRange(long long t, const TimeChunk& range) {
    return t >= range.start && t < range.end;
}

std::vector<OverlapPair> findAllOverlaps(const std::vector<TimeChunk>& chunks) {
    std::vector<OverlapPair> overlaps;
    for (size_t i = 0; i < chunks.size(); ++i) {
        for (size_t j = i + 1; j < chunks.size(); ++j) {
            OverlapType type = getOverlapType(chunks[i], chunks[j]);
            if (type != OverlapType::NONE) {
                overlaps.push_back({i, j, type});
            }
        }
    }
    return overlaps;
}

std::vector<TimeChunk> mergeTimeChunks(std::vector<TimeChunk> chunks) {
    std::vector<TimeChunk> merged;
    if (chunks.empty()) return merged;

    std::sort(chunks.begin(), chunks.end(),
              [](const TimeChunk& a, const TimeChunk& b) {
                  if (a.start != b.start) return a.start < b.start;
                  return a.end < b.end;
              });

    TimeChunk current = chunks.front();
    for (size_t i = 1; i < chunks.size(); ++i) {
        const TimeChunk& next = chunks[i];
        // Overlapping or adjacent: extend the current run.
        if (next.start <= current.end) {
            current.end = std::max(current.end, next.end);
        } else {
            merged.push_back(current);
            current = next;
        }
    }
    merged.push_back(current);
    return merged;
}

long long getTotalDuration(const std::vector<TimeChunk>& chunks) {
    long long total = 0;
    for (const TimeChunk& c : mergeTimeChunks(chunks)) {
        total += c.end - c.start;
    }
    return total;
}

std::vector<TimeChunk> subtractTimeChunks(const TimeChunk& base, const std::vector<TimeChunk>& busy) {
    std::vector<TimeChunk> available;
    long long cursor = base.start;

    for (const TimeChunk& chunk : mergeTimeChunks(busy)) {
        // Skip busy time entirely outside the base range.
        if (chunk.end <= base.start || chunk.start >= base.end) continue;

        if (cursor < chunk.start) {
            available.push_back({cursor, chunk.start});
        }
        cursor = std::max(cursor, chunk.end);
    }

    if (cursor < base.end) {
        available.push_back({cursor, base.end});
    }
    return available;
}

std::string overlapTypeName(OverlapType type) {
    switch (type) {
        case OverlapType::NONE:     return "none";
        case OverlapType::EXACT:    return "exact";
        case OverlapType::LEFT:     return "left";
        case OverlapType::RIGHT:    return "right";
        case OverlapType::ENCLOSED: return "enclosed";
        case OverlapType::ENCLOSES: return "encloses";
    }
    return "unknown";
}
