// main.cpp
// Flexible batch production planning for a green steel plant.
//
// usage: flexbatch [-v] <plant.yaml> <series.csv> <objective>
//                  [time_limit_s] [mip_gap] [output_dir]
//   objective: max_profit | stability | min_load_jumps

#include <ilcplex/ilocplex.h>
#include "definitions.h"
#include "config.h"
#include "build.h"
#include "solve.h"
#include "evaluate.h"
#include "report.h"

#include <iostream>
#include <string>
#include <vector>

ILOSTLBEGIN

static void usage(const char* prog) {
	std::cerr << "usage: " << prog << " [-v] <plant.yaml> <series.csv> <objective>"
		<< " [time_limit_s] [mip_gap] [output_dir]\n"
		<< "  objective: max_profit | stability | min_load_jumps\n";
}

int main(int argc, char** argv) {
	std::vector<std::string> args;
	SolverControl ctl;
	for (int i = 1; i < argc; ++i) {
		const std::string a = argv[i];
		if (a == "-v" || a == "--verbose") ctl.verbose = true;
		else args.push_back(a);
	}
	if (args.size() < 3 || args.size() > 6) {
		usage(argv[0]);
		return 2;
	}

	const std::string plantPath = args[0];
	const std::string seriesPath = args[1];
	const std::string objective = args[2];
	std::string outDir = "results";
	try {
		if (args.size() > 3) ctl.timeLimit = std::stod(args[3]);
		if (args.size() > 4) ctl.mipGap = std::stod(args[4]);
	}
	catch (const std::logic_error&) {
		std::cerr << "time limit and gap must be numbers\n";
		usage(argv[0]);
		return 2;
	}
	if (args.size() > 5) outDir = args[5];

	IloEnv env;
	int rc = 0;
	try {
		// -----------------------
		// 1) Load inputs
		// -----------------------
		const PlantData P = loadPlantData(plantPath);
		const TimeSeries S = loadTimeSeries(seriesPath);

		// -----------------------
		// 2) Build model
		// -----------------------
		auto art = buildModel(P, S, objective, env);

		// -----------------------
		// 3) Solve
		// -----------------------
		IloCplex cplex(art.model);
		const SolveResult res = solveModel(cplex, ctl);

		if (!hasPlan(res)) {
			std::cerr << "CPLEX found no plan: " << outcomeName(res.outcome)
				<< " (" << res.cplexStatus << ")\n";
			rc = 1;
		}
		else {
			// -----------------------
			// 4) Evaluate, report & export
			// -----------------------
			const PlanKPI kpi = evaluatePlan(P, S, art, cplex);
			if (!planIsConsistent(kpi, P, 1e-4))
				std::cerr << "[evaluate] plan violates model invariants beyond tolerance\n";
			reportSolution(res, kpi, art);
			const auto entries = collectResults(P, S, art, cplex);
			exportSolution(outDir, entries, res, kpi, art, P);
		}
	}
	catch (const ConfigurationError& ex) {
		std::cerr << "[config] " << ex.what() << "\n";
		rc = 1;
	}
	catch (const ModelError& ex) {
		std::cerr << "[build] " << ex.what() << "\n";
		rc = 1;
	}
	catch (const YAML::Exception& ex) {
		std::cerr << "[config] " << ex.what() << "\n";
		rc = 1;
	}
	catch (IloException& ex) {
		std::cerr << "[solve] CPLEX error: " << ex << "\n";
		ex.end();
		rc = 1;
	}
	catch (const std::exception& ex) {
		std::cerr << "error: " << ex.what() << "\n";
		rc = 1;
	}

	env.end();
	return rc;
}
