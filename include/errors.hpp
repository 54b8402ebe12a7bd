#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <stdexcept>
#include <string>


///////////////////////////
///       ERRORS        ///
///////////////////////////
/**
 * @brief Base class of every fault raised by the scheduling core.
 *
 * Expected negative outcomes (conflicts, limit breaches, no slots found) are
 * never reported through exceptions.
 */
class SchedulingError : public std::runtime_error {
public:
    explicit SchedulingError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Invalid caller input, detected before a search starts.
 */
class ValidationError : public SchedulingError {
public:
    explicit ValidationError(const std::string& message) : SchedulingError(message) {}
};

/**
 * @brief Broken internal invariant; aborts the call.
 */
class AlgorithmError : public SchedulingError {
public:
    explicit AlgorithmError(const std::string& message) : SchedulingError(message) {}
};
