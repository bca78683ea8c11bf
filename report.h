#pragma once
#ifndef REPORT_H
#define REPORT_H

#include <string>
#include <vector>
#include <ilcplex/ilocplex.h>
#include "definitions.h"
#include "build.h"
#include "evaluate.h"

// One exported value: family name, index tuple (possibly empty), value.
struct ResultEntry {
    std::string name;
    std::vector<std::string> index;
    double value = 0.0;
};

// All sets, parameters and solved variables of the model in A. Gated groups
// that were not built contribute no entries.
std::vector<ResultEntry> collectResults(
    const PlantData& P,
    const TimeSeries& S,
    const BuildArtifacts& A,
    const IloCplex& cplex
);

// Console summary: outcome, KPIs, batch schedule.
void reportSolution(const SolveResult& r, const PlanKPI& kpi, const BuildArtifacts& A);

// Write sol_meta.json, sol_results.csv (name,idx...,value) and sol_schedule.csv
// into outDir (created if missing). Returns the results CSV path.
std::string exportSolution(
    const std::string& outDir,
    const std::vector<ResultEntry>& entries,
    const SolveResult& r,
    const PlanKPI& kpi,
    const BuildArtifacts& A,
    const PlantData& P
);

#endif // REPORT_H
