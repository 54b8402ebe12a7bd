#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "busy_provider.hpp"
#include <string>


///////////////////////////
///        DEMOS        ///
///////////////////////////
/**
 * @brief Size presets of the synthetic demo scenarios.
 *
 * S and M exercise the single-day flow, L and XL the multi-day flow.
 */
enum class DemoSize { S, M, L, XL };

/**
 * @brief Request plus the calendar it is searched against.
 */
struct DemoScenario {
    std::string name;
    SchedulingRequest request;
    InMemoryBusyIntervalProvider calendar; ///< Busy intervals of every participant.
};

/**
 * @brief Build a deterministic demo scenario of the given size.
 */
DemoScenario makeDemoScenario(DemoSize size);
