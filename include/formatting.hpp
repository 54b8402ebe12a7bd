#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "solver_base.hpp"
#include "verification.hpp"
#include <string>
#include <vector>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/// Summary block: request size, flow, result count and how the search ended.
void printSearchSummary(const std::string& title, const SchedulingRequest& request,
                        const SlotSearchResult& result, double elapsedMs);

/// Per-combination slot tables, at most `maxShown` combinations.
void printCombinations(const std::vector<Combination>& combinations, size_t maxShown);

/// Per-plan round tables, at most `maxShown` plans.
void printMultiDayPlans(const std::vector<MultiDayPlan>& plans, size_t maxShown);

/// Availability flag, conflicts and per-participant load of a verification.
void printVerification(const VerificationResult& verification);
