// solve.cpp
#include "solve.h"

#include <iomanip>
#include <iostream>
#include <sstream>

const char* outcomeName(SolveOutcome outcome) {
    switch (outcome) {
    case SolveOutcome::OPTIMAL:                 return "OPTIMAL";
    case SolveOutcome::OPTIMAL_WITHIN_GAP:      return "OPTIMAL_WITHIN_GAP";
    case SolveOutcome::FEASIBLE:                return "FEASIBLE";
    case SolveOutcome::TIME_LIMIT_NO_SOLUTION:  return "TIME_LIMIT_NO_SOLUTION";
    case SolveOutcome::INFEASIBLE:              return "INFEASIBLE";
    case SolveOutcome::UNBOUNDED:               return "UNBOUNDED";
    case SolveOutcome::INFEASIBLE_OR_UNBOUNDED: return "INFEASIBLE_OR_UNBOUNDED";
    case SolveOutcome::ERROR:                   return "ERROR";
    }
    return "?";
}

static SolveOutcome classify(IloCplex::CplexStatus cs, IloAlgorithm::Status st, bool incumbent) {
    switch (cs) {
    case IloCplex::Optimal:      return SolveOutcome::OPTIMAL;
    case IloCplex::OptimalTol:   return SolveOutcome::OPTIMAL_WITHIN_GAP;
    case IloCplex::AbortTimeLim: return incumbent ? SolveOutcome::FEASIBLE : SolveOutcome::TIME_LIMIT_NO_SOLUTION;
    case IloCplex::Infeasible:   return SolveOutcome::INFEASIBLE;
    case IloCplex::Unbounded:    return SolveOutcome::UNBOUNDED;
    case IloCplex::InfOrUnbd:    return SolveOutcome::INFEASIBLE_OR_UNBOUNDED;
    default: break;
    }
    // other limits (node, memory, solution count): fall back to the algorithm status
    switch (st) {
    case IloAlgorithm::Optimal:               return SolveOutcome::OPTIMAL;
    case IloAlgorithm::Feasible:              return SolveOutcome::FEASIBLE;
    case IloAlgorithm::Infeasible:            return SolveOutcome::INFEASIBLE;
    case IloAlgorithm::Unbounded:             return SolveOutcome::UNBOUNDED;
    case IloAlgorithm::InfeasibleOrUnbounded: return SolveOutcome::INFEASIBLE_OR_UNBOUNDED;
    default:                                  return SolveOutcome::ERROR;
    }
}

SolveResult solveModel(IloCplex& cplex, const SolverControl& ctl) {
    IloEnv env = cplex.getEnv();
    SolveResult r;

    try {
        if (ctl.timeLimit > 0) cplex.setParam(IloCplex::Param::TimeLimit, ctl.timeLimit);
        if (ctl.mipGap > 0)    cplex.setParam(IloCplex::Param::MIP::Tolerances::MIPGap, ctl.mipGap);
        if (ctl.verbose) {
            cplex.setOut(std::cout);
            cplex.setParam(IloCplex::Param::MIP::Display, 2);
        }
        else {
            cplex.setOut(env.getNullStream());
            cplex.setWarning(env.getNullStream());
        }

        const bool solved = cplex.solve();
        const IloAlgorithm::Status st = cplex.getStatus();
        r.hasSolution = solved && (st == IloAlgorithm::Optimal || st == IloAlgorithm::Feasible);
        r.outcome = classify(cplex.getCplexStatus(), st, r.hasSolution);

        std::ostringstream os;
        os << st;
        r.cplexStatus = os.str();

        if (r.hasSolution) {
            r.objective = cplex.getObjValue();
            r.mipGap = cplex.isMIP() ? cplex.getMIPRelativeGap() : 0.0;
        }
    }
    catch (IloException& ex) {
        std::cerr << "[solve] CPLEX error: " << ex << "\n";
        ex.end();
        r = SolveResult{};
        r.outcome = SolveOutcome::ERROR;
        return r;
    }

    std::cout << "[solve] " << outcomeName(r.outcome) << " (" << r.cplexStatus << ")";
    if (r.hasSolution)
        std::cout << "  objective=" << std::fixed << std::setprecision(3) << r.objective
            << "  gap=" << std::setprecision(4) << r.mipGap;
    std::cout << std::defaultfloat << "\n";
    return r;
}
