#ifndef EVALUATE_H
#define EVALUATE_H

#include <vector>
#include <ilcplex/ilocplex.h>
#include "definitions.h"
#include "build.h"

// KPIs and residuals of a solved plan, recomputed from the turn-on decisions
// and flows rather than read from the derived model variables.
struct PlanKPI {
    double rawObj = 0.0;
    double marketProfit = 0.0;       // EUR, sales
    double marketCost = 0.0;         // EUR, purchases incl. energy grid charge
    double gridChargePower = 0.0;    // EUR
    double meanDeviation = 0.0;      // MW, avg |exchange - reference|
    double totalLoadJumps = 0.0;     // MW, sum |exchange[t-1] - exchange[t]|
    double finalSteel = 0.0;         // tons

    // residuals (0 / within tolerance on a valid plan)
    double maxEnergyResidual = 0.0;  // MW
    int    maxRunningModes = 0;      // max over e, t of running virtual equipment
    int    lateStarts = 0;           // turn-ons after T - duration - rolling
    int    downtimeViolations = 0;   // starts less than T_down steps after the previous batch ended
    int    electrolyserOffRange = 0; // steps with load strictly between 0 and min, or above max
    double minH2 = 0.0, maxH2 = 0.0; // MWh
    double minDri = 0.0;             // tons

    std::vector<std::vector<int>> starts;  // [v] batch start steps
};

// Compute KPIs of the incumbent in cplex for the model in A
PlanKPI evaluatePlan(
    const PlantData& P,
    const TimeSeries& S,
    const BuildArtifacts& A,
    const IloCplex& cplex
);

// Residual check against the model invariants; problems are printed to std::cerr
bool planIsConsistent(const PlanKPI& kpi, const PlantData& P, double tol = 1e-5);

#endif // EVALUATE_H
