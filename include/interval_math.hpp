#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <string>
#include <vector>


///////////////////////////
///        TYPES        ///
///////////////////////////
/**
 * @brief Half-open time range [start, end) in a common minute unit.
 *
 * The unit is either minutes from midnight (normalized clock values) or
 * absolute instants; all operations are pure arithmetic and only require both
 * operands to share the same unit.
 */
struct TimeChunk {
    long long start;
    long long end;
};

/**
 * @brief Relative position of a first chunk with respect to a second one.
 */
enum class OverlapType {
    NONE,      ///< Disjoint (touching ends do not overlap).
    EXACT,     ///< Same start and end.
    LEFT,      ///< First starts before the second and ends inside it.
    RIGHT,     ///< First starts inside the second and ends after it.
    ENCLOSED,  ///< First lies within the second.
    ENCLOSES   ///< First contains the second.
};

/**
 * @brief One overlapping pair found by findAllOverlaps().
 */
struct OverlapPair {
    size_t first;
    size_t second;
    OverlapType type;
};


///////////////////////////
///    NORMALIZATION    ///
///////////////////////////
/**
 * @brief Normalize a clock string ("HH:MM") or ISO timestamp to minutes from midnight.
 *
 * Timestamps are read in UTC. Throws ValidationError for unparseable input.
 */
long long normalizeTime(const std::string& value);

/// Already-normalized minute offsets are returned unchanged.
long long normalizeTime(long long minutes);

/**
 * @brief Convert minutes from midnight back to the format of `originalFormat`.
 *
 * A timestamp keeps its date component; a clock string becomes "HH:MM".
 */
std::string denormalizeTime(long long minutes, const std::string& originalFormat);

/**
 * @brief Build a chunk from two clock or timestamp strings, normalized to minutes from midnight.
 */
TimeChunk makeTimeChunk(const std::string& start, const std::string& end);


///////////////////////////
///     OPERATIONS      ///
///////////////////////////
bool isTimeOverlap(const TimeChunk& a, const TimeChunk& b);

OverlapType getOverlapType(const TimeChunk& a, const TimeChunk& b);

/// Minutes shared by both chunks, 0 if disjoint.
long long getOverlapDuration(const TimeChunk& a, const TimeChunk& b);

/// Signed distance from `from` to `to`, in minutes.
long long getTimeDifference(long long from, long long to);

/// True when `t` lies in [range.start, range.end).
bool isTimeInRange(long long t, const TimeChunk& range);

/**
 * @brief Every overlapping index pair (i < j) of a list, with its overlap type. O(n^2).
 */
std::vector<OverlapPair> findAllOverlaps(const std::vector<TimeChunk>& chunks);

/**
 * @brief Merge overlapping or adjacent chunks into a sorted disjoint list. O(n log n).
 */
std::vector<TimeChunk> mergeTimeChunks(std::vector<TimeChunk> chunks);

/// Total minutes covered by the chunks, overlaps counted once.
long long getTotalDuration(const std::vector<TimeChunk>& chunks);

/**
 * @brief Free windows left in `base` after removing every busy chunk. O(n log n).
 */
std::vector<TimeChunk> subtractTimeChunks(const TimeChunk& base, const std::vector<TimeChunk>& busy);

/// Lower-case label of an overlap type ("encloses").
std::string overlapTypeName(OverlapType type);
