#pragma once
#include <ilcplex/ilocplex.h>
#include "definitions.h"

// Apply time limit / gap / verbosity to cplex, solve, and map the terminal
// status to a SolveOutcome. Solver failures are returned, never thrown.
SolveResult solveModel(IloCplex& cplex, const SolverControl& ctl);

// true for outcomes that carry a usable incumbent
inline bool hasPlan(const SolveResult& r) {
    return r.hasSolution && (r.outcome == SolveOutcome::OPTIMAL
        || r.outcome == SolveOutcome::OPTIMAL_WITHIN_GAP
        || r.outcome == SolveOutcome::FEASIBLE);
}
