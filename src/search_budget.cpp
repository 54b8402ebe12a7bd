///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "search_budget.hpp"


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief True once more than `timeout` seconds have passed since `startTime`.
 *
 * A timeout of 0 never expires.
 */
template <class TimePoint>
static bool didExceedTimeout(double timeout, TimePoint startTime) {
    const auto currentTime = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double, std::ratio<1, 1>> spentTime = currentTime - startTime;
    return timeout != 0.0 && spentTime.count() > timeout;
}


///////////////////////////
///       BUDGET        ///
///////////////////////////
std::string truncationReasonName(TruncationReason reason) {
    switch (reason) {
        case TruncationReason::NONE:        return "none";
        case TruncationReason::DEADLINE:    return "deadline";
        case TruncationReason::STEP_BUDGET: return "step_budget";
    }
    return "unknown";
}

SearchBudget::SearchBudget(double timeLimitSeconds, long long stepBudget)
        : timeLimitSeconds_(timeLimitSeconds),
          stepBudget_(stepBudget),
          startTime_(std::chrono::high_resolution_clock::now()) {}

bool SearchBudget::consume() {
    if (exhausted()) return false;

    long long step = ++steps_;
    if (stepBudget_ > 0 && step > stepBudget_) {
        stop(TruncationReason::STEP_BUDGET);
        return false;
    }
    if (didExceedTimeout(timeLimitSeconds_, startTime_)) {
        stop(TruncationReason::DEADLINE);
        return false;
    }
    return true;
}

void SearchBudget::stop(TruncationReason reason) {
    // The first reason wins when several threads run out together.
    int expected = static_cast<int>(TruncationReason::NONE);
    reason_.compare_exchange_strong(expected, static_cast<int>(reason));
}
