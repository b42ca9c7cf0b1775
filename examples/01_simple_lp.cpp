/*
================================================================================
EXAMPLE 01: SIMPLE LINEAR PROGRAMMING - Production Planning
================================================================================
DIFFICULTY: Beginner
PROBLEM TYPE: Linear Programming (LP)

PROBLEM DESCRIPTION
-------------------
A factory produces 3 products (A, B, C) using 2 machines. Each product requires
different processing hours on each machine. The factory wants to maximize total
profit subject to machine capacity constraints.

MATHEMATICAL MODEL
------------------
Sets:
    P = {0, 1, 2}       Products (A, B, C)
    M = {0, 1}          Machines

Parameters:
    profit[p]           Profit per unit of product p
    hours[m,p]          Hours required on machine m to produce one unit of p
    capacity[m]         Available hours on machine m

Variables:
    x[p] >= 0           Units of product p to produce (continuous)

Objective:
    max  sum_{p in P} profit[p] * x[p]

Constraints:
    Capacity[m]:  sum_{p in P} hours[m,p] * x[p] <= capacity[m]   for all m in M

FEATURES DEMONSTRATED
---------------------
- Model::addVars()                Create a block of variables
- mip::sum(range, lambda)         Summation notation
- Model::addConstr()              Named rows, printed with operator<<
- Model::maximize()               Objective with sense
- Var::x(), Var::rc()             Primal values and reduced costs
- Constr::slack(), Constr::pi()   LP sensitivity analysis
- statusString(), modelSummary()  Diagnostics

================================================================================
*/

#include <iomanip>
#include <iostream>
#include <memory>
#include <ranges>
#include <string>
#include <vector>

#include <mip/gurobi_solver.h>
#include <mip/mip.h>

// ============================================================================
// MAIN PROGRAM
// ============================================================================
int main() {
    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 01: Production Planning LP\n";
    std::cout << "================================================================\n\n";

    try {
        // ====================================================================
        // PROBLEM DATA
        // ====================================================================
        const std::vector<std::string> productNames = { "Product A", "Product B", "Product C" };
        const std::vector<double> profit = { 30.0, 50.0, 40.0 };  // $/unit

        // Hours required on each machine per unit of product
        //                    Prod A  Prod B  Prod C
        const std::vector<std::vector<double>> hours = {
            { 1.0, 2.0, 3.0 },  // Machine 0 (Cutting)
            { 2.0, 1.0, 3.0 }   // Machine 1 (Assembly)
        };

        const std::vector<double> capacity = { 100.0, 80.0 };  // hours available
        const std::vector<std::string> machineNames = { "Cutting", "Assembly" };

        const int nProducts = static_cast<int>(profit.size());
        const int nMachines = static_cast<int>(capacity.size());
        const auto P = std::views::iota(0, nProducts);

        // ====================================================================
        // BUILD MODEL
        // ====================================================================
        mip::Model model(std::make_unique<mip::GurobiSolver>(), "production");
        model.quiet();
        model.store()["n_products"] = nProducts;
        model.store()["n_machines"] = nMachines;

        // x[p] >= 0
        auto X = model.addVars(nProducts, "x");
        for (int p = 0; p < nProducts; ++p) {
            X[p].setName(productNames[p]);
        }

        // Capacity[m]: sum_{p in P} hours[m,p] * x[p] <= capacity[m]
        std::vector<mip::Constr> capConstrs;
        for (int m = 0; m < nMachines; ++m) {
            capConstrs.push_back(model.addConstr(
                mip::sum(P, [&](int p) { return hours[m][p] * X[p]; }) <= capacity[m],
                force_name::math("capacity", m)));
        }

        // max sum_{p in P} profit[p] * x[p]
        model.maximize(mip::sum(P, [&](int p) { return profit[p] * X[p]; }));

        std::cout << "MODEL\n";
        std::cout << "-----\n";
        for (const mip::Constr& c : capConstrs) {
            std::cout << c << "\n";
        }
        std::cout << "\n";

        // ====================================================================
        // SOLVE
        // ====================================================================
        std::cout << "SOLVING...\n";
        std::cout << "----------\n";

        model.optimize();

        std::cout << "Status: " << mip::statusString(model.status()) << "\n";
        std::cout << mip::modelSummary(model) << "\n";

        // ====================================================================
        // DISPLAY RESULTS
        // ====================================================================
        if (model.hasSolution()) {
            std::cout << std::fixed << std::setprecision(2);

            std::cout << "\nOPTIMAL SOLUTION\n";
            std::cout << "----------------\n";
            std::cout << "Maximum Profit: $" << model.objectiveValue().value() << "\n\n";

            std::cout << "Production Plan:\n";
            for (const mip::Var& x : X) {
                const double val = x.x().value();
                std::cout << "  " << std::setw(12) << x.name()
                          << ": " << std::setw(8) << val << " units"
                          << " (contributes $" << x.obj() * val << ")"
                          << ", reduced cost " << x.rc().value_or(0.0) << "\n";
            }

            // Sensitivity analysis - machine utilization
            std::cout << "\nMachine Utilization & Sensitivity:\n";
            for (int m = 0; m < nMachines; ++m) {
                const double slk = capConstrs[m].slack().value();
                const double pi = capConstrs[m].pi().value_or(0.0);  // Shadow price
                const double used = capacity[m] - slk;
                const double utilization = (used / capacity[m]) * 100.0;

                std::cout << "  " << std::setw(12) << machineNames[m] << ": "
                          << std::setw(6) << used << "/" << capacity[m] << " hrs"
                          << " (" << std::setw(5) << utilization << "% utilized)"
                          << ", Shadow Price: $" << pi << "/hr\n";
            }

            if (auto q = mip::computeSolutionQuality(model)) {
                std::cout << "\nMax constraint violation: " << std::scientific
                          << q->maxConstrViolation << "\n";
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
