#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <map>
#include <string>
#include <vector>


///////////////////////////
///       RANKING       ///
///////////////////////////
/**
 * @brief Mean of a per-participant density map, 0 when empty.
 */
double averageLoadDensity(const std::map<std::string, double>& loadDensity);

/**
 * @brief Mean of every density value over all rounds of a plan.
 */
double averagePlanDensity(const MultiDayPlan& plan);

/**
 * @brief Strict "ranks before" relation between two combinations.
 *
 * Earlier start first; with balanceLoad, equal starts are ordered by lower
 * mean density. Instants compare like their fixed-width ISO strings.
 */
bool compareCombinations(const Combination& a, const Combination& b, bool balanceLoad);

/**
 * @brief Strict "ranks before" relation between two plans.
 *
 * Start of the first round first, then (with balanceLoad) the mean density
 * across all rounds.
 */
bool comparePlans(const MultiDayPlan& a, const MultiDayPlan& b, bool balanceLoad);

/// Stable sort with compareCombinations().
void rankCombinations(std::vector<Combination>& combinations, bool balanceLoad);

/// Stable sort with comparePlans().
void rankPlans(std::vector<MultiDayPlan>& plans, bool balanceLoad);
