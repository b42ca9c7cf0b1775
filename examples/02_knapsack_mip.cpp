/*
================================================================================
EXAMPLE 02: BINARY KNAPSACK - Item Selection with Conflicts
================================================================================
DIFFICULTY: Beginner
PROBLEM TYPE: Mixed-Integer Programming (MIP)

PROBLEM DESCRIPTION
-------------------
A hiker needs to select items for a backpack. Each item has a value and weight.
The goal is to maximize total value while respecting the weight capacity.
Additionally, some items are incompatible and cannot be both selected.

MATHEMATICAL MODEL
------------------
Sets:
    I = {0, 1, ..., n-1}         Items
    C = {(i,j) : incompatible}   Conflict pairs

Parameters:
    value[i]        Value of item i
    weight[i]       Weight of item i
    capacity        Maximum weight capacity

Variables:
    x[i] in {0,1}   1 if item i is selected, 0 otherwise

Objective:
    max  sum_{i in I} value[i] * x[i]

Constraints:
    Capacity:   sum_{i in I} weight[i] * x[i] <= capacity
    Conflict:   x[i] + x[j] <= 1    for all (i,j) in C

FEATURES DEMONSTRATED
---------------------
- applyPreset(Preset::Fast)       Parameter presets
- mipGapLimit()                   MIP gap setting
- model += expr <= rhs            Row registration
- store()                         Metadata storage
- conflictGraph()                 Conflicts implied by the rows
- setLB(), setUB()                What-if analysis by fixing bounds
- numSolutions(), xi()            Solution pool
- computeSolutionQuality()        Solution diagnostics

================================================================================
*/

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <utility>
#include <vector>

#include <mip/gurobi_solver.h>
#include <mip/mip.h>

// ============================================================================
// HELPERS
// ============================================================================

/// Indices of the items at one in the incumbent
std::vector<int> selectedItems(const std::vector<mip::Var>& X) {
    std::vector<int> selected;
    for (const mip::Var& x : X) {
        if (x.x().value_or(0.0) > 0.5) {
            selected.push_back(x.idx());
        }
    }
    return selected;
}

/// Objective with item fixed to a value, or nullopt if no solution exists
std::optional<double> solveWithItemFixed(mip::Model& model, mip::Var x, bool include) {
    const double value = include ? 1.0 : 0.0;
    x.setLB(value);
    x.setUB(value);

    model.optimize();
    std::optional<double> obj = model.objectiveValue();

    x.setLB(0.0);
    x.setUB(1.0);
    return obj;
}

// ============================================================================
// MAIN PROGRAM
// ============================================================================
int main() {
    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 02: Binary Knapsack with Conflicts\n";
    std::cout << "================================================================\n\n";

    try {
        // ====================================================================
        // PROBLEM DATA
        // ====================================================================
        const std::vector<std::string> itemNames = {
            "Tent", "Sleeping Bag", "Cooking Set", "Water Filter",
            "First Aid Kit", "Flashlight", "Camera", "Book"
        };

        const std::vector<double> values  = { 60, 100, 120, 80, 90, 75, 110, 95 };
        const std::vector<double> weights = { 10,  20,  30, 15, 25, 12, 28, 18 };
        const double capacity = 80;

        // Item conflicts (cannot select both)
        const std::vector<std::pair<int, int>> conflicts = {
            { 0, 1 },  // Tent and Sleeping Bag (redundant shelter)
            { 2, 3 },  // Cooking Set and Water Filter (weight limit)
            { 4, 6 }   // First Aid Kit and Camera (space constraint)
        };

        const int nItems = static_cast<int>(values.size());
        const auto I = std::views::iota(0, nItems);

        // ====================================================================
        // BUILD MODEL
        // ====================================================================
        mip::Model model(std::make_unique<mip::GurobiSolver>(), "knapsack");
        model.applyPreset(mip::Model::Preset::Fast);  // TimeLimit=60s, MIPGap=5%
        model.quiet();
        model.mipGapLimit(0.001);                     // Override: 0.1% gap

        model.store()["n_items"] = nItems;
        model.store()["n_conflicts"] = static_cast<int>(conflicts.size());
        model.store()["capacity"] = capacity;

        auto X = model.addVars(nItems, "x", 0.0, 1.0, 0.0, mip::VarType::Binary);
        for (int i = 0; i < nItems; ++i) {
            X[i].setName(itemNames[i]);
        }

        model.addConstr(mip::sum(I, [&](int i) { return weights[i] * X[i]; }) <= capacity,
            "capacity");

        for (const auto& [i, j] : conflicts) {
            model += X[i] + X[j] <= 1;
        }

        model.maximize(mip::sum(I, [&](int i) { return values[i] * X[i]; }));

        std::cout << "MODEL\n";
        std::cout << "-----\n";
        std::cout << mip::modelSummary(model) << "\n\n";

        // ====================================================================
        // CONFLICT GRAPH
        // ====================================================================
        std::cout << "CONFLICT GRAPH\n";
        std::cout << "--------------\n";
        mip::ConflictGraph cg = model.conflictGraph();
        for (const mip::Var& x : X) {
            auto [atOne, atZero] = cg.conflictingAssignments(x);
            if (atOne.empty()) continue;

            std::cout << "  " << std::setw(14) << std::left << x.name() << std::right
                      << " excludes:";
            for (const mip::Var& y : atOne) {
                std::cout << " " << y;
            }
            std::cout << "\n";
        }
        std::cout << "\n";

        // ====================================================================
        // SOLVE
        // ====================================================================
        std::cout << "SOLVING...\n";
        std::cout << "----------\n";

        model.optimize();
        std::cout << "Status: " << mip::statusString(model.status()) << "\n";

        // ====================================================================
        // DISPLAY RESULTS
        // ====================================================================
        if (model.hasSolution()) {
            const double best = model.objectiveValue().value();
            const auto selected = selectedItems(X);

            double totalWeight = 0.0;
            for (int i : selected) totalWeight += weights[i];
            model.store()["objective"] = best;
            model.store()["total_weight"] = totalWeight;

            std::cout << std::fixed << std::setprecision(2);
            std::cout << "\nBEST SOLUTION\n";
            std::cout << "-------------\n";
            std::cout << "Total Value:  $" << best << "\n";
            std::cout << "Total Weight: " << totalWeight << " / " << capacity << " kg\n";
            std::cout << "Items Selected: " << selected.size() << " / " << nItems << "\n";
            std::cout << "Solutions Found: " << model.numSolutions() << "\n\n";

            for (const mip::Var& x : X) {
                const bool in = std::ranges::find(selected, x.idx()) != selected.end();
                std::cout << "  " << (in ? "[x] " : "[ ] ")
                          << std::setw(16) << std::left << x.name() << std::right
                          << " Value: $" << std::setw(6) << values[x.idx()]
                          << "  Weight: " << std::setw(5) << weights[x.idx()] << " kg\n";
            }

            if (model.numSolutions() > 1) {
                std::cout << "\nSecond pool solution:";
                for (const mip::Var& x : X) {
                    std::cout << " " << x.xi(1).value_or(0.0);
                }
                std::cout << "\n";
            }

            if (auto q = mip::computeSolutionQuality(model)) {
                std::cout << "\nMax integrality violation: " << std::scientific
                          << q->maxIntViolation << std::fixed << "\n";
            }

            // ================================================================
            // WHAT-IF ANALYSIS
            // ================================================================
            std::cout << "\nWHAT-IF ANALYSIS\n";
            std::cout << "----------------\n";
            std::cout << "Original optimal value: $" << best << "\n\n";

            std::cout << "Impact of forcing unselected items:\n";
            for (const mip::Var& x : X) {
                if (std::ranges::find(selected, x.idx()) != selected.end()) continue;

                std::optional<double> forced = solveWithItemFixed(model, x, true);
                std::cout << "  Force " << std::setw(16) << std::left << x.name()
                          << std::right << ": ";
                if (forced) {
                    const double change = *forced - best;
                    std::cout << "$" << *forced
                              << " (change: " << (change >= 0 ? "+" : "") << change << ")\n";
                }
                else {
                    std::cout << mip::statusString(model.status()) << "\n";
                }
            }
        }

    } catch (GRBException& e) {
        std::cerr << "Gurobi Error " << e.getErrorCode() << ": " << e.getMessage() << "\n";
        return 1;
    } catch (std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n================================================================\n";
    return 0;
}
