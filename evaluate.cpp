// evaluate.cpp
#include "evaluate.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>
#include <vector>

// ---------- helpers ----------
static inline bool on(const IloCplex& cplex, const IloBoolVar& x) {
    return cplex.getValue(x) > 0.5;
}

static std::vector<double> values(const IloCplex& cplex, const IloNumVarArray& x, int T) {
    std::vector<double> out(T, 0.0);
    if (x.getSize() == 0) return out;   // gated off
    for (int t = 0; t < T; ++t) out[t] = cplex.getValue(x[t]);
    return out;
}

// ---------- main KPI evaluator ----------
PlanKPI evaluatePlan(
    const PlantData& P, const TimeSeries& S,
    const BuildArtifacts& A, const IloCplex& cplex
) {
    const IndexDomains& D = A.D;
    const int T = D.T, nV = (int)D.V.size(), nE = (int)D.E.size();
    const double dt = A.dt;
    PlanKPI kpi;
    kpi.rawObj = cplex.getObjValue();

    // batch starts
    kpi.starts.assign(nV, {});
    for (int v = 0; v < nV; ++v) {
        const VirtualEquipment& ve = D.V[v];
        const int latest = T - D.Z[v] - P.rollingDuration.at(ve.equipment);
        for (int t = 0; t < T; ++t) {
            if (!on(cplex, A.turnOn[v][t])) continue;
            kpi.starts[v].push_back(t);
            if (t > latest) ++kpi.lateStarts;
        }
    }

    // running modes per equipment, from the start windows
    for (int e = 0; e < nE; ++e) {
        for (int t = 0; t < T; ++t) {
            int running = 0;
            for (int v : D.VofE[e])
                for (int s : kpi.starts[v])
                    if (s <= t && t < s + D.Z[v]) ++running;
            kpi.maxRunningModes = std::max(kpi.maxRunningModes, running);
        }
    }

    // minimum downtime between consecutive batches of one equipment
    for (int e = 0; e < nE; ++e) {
        const int pause = P.pauseDuration.at(D.E[e]);
        std::vector<std::pair<int, int>> batches;   // (start, end)
        for (int v : D.VofE[e])
            for (int s : kpi.starts[v]) batches.emplace_back(s, s + D.Z[v]);
        std::sort(batches.begin(), batches.end());
        for (std::size_t i = 1; i < batches.size(); ++i)
            if (batches[i].first < batches[i - 1].second + pause) ++kpi.downtimeViolations;
    }

    const std::vector<double> el = values(cplex, A.electrolyserLoad, T);
    for (int t = 0; t < T; ++t) {
        const bool off = el[t] <= 1e-6;
        const bool inRange = el[t] >= P.minConsumptionElectrolyser - 1e-6
            && el[t] <= P.maxCapacityElectrolyser + 1e-6;
        if (!off && !inRange) ++kpi.electrolyserOffRange;
    }

    const std::vector<double> fc = values(cplex, A.fcGeneration, T);
    const std::vector<double> pfg = values(cplex, A.powerFromGrid, T);
    const std::vector<double> p2g = values(cplex, A.powerToGrid, T);
    const std::vector<double> h2 = values(cplex, A.h2StorageContent, T);
    const std::vector<double> dri = values(cplex, A.driStorageContent, T);

    // energy balance with equipment and rolling load rebuilt from the starts
    for (int t = 0; t < T; ++t) {
        double demand = el[t] + p2g[t];
        for (int e = 0; e < nE; ++e) {
            const std::string& id = D.E[e];
            const int roll = P.rollingDuration.at(id);
            for (int v : D.VofE[e]) {
                const auto& profile = P.batchLoadProfile.at(D.V[v].equipment).at(D.V[v].mode);
                for (int s : kpi.starts[v]) {
                    if (s <= t && t < s + D.Z[v]) demand += profile[t - s];
                    // rolling runs roll steps, starting one step after the batch ends
                    if (s + D.Z[v] + 1 <= t && t < s + D.Z[v] + 1 + roll)
                        demand += P.rollingCapacity.at(id);
                }
            }
        }
        const double supply = S.generation[t] + fc[t] + pfg[t];
        kpi.maxEnergyResidual = std::max(kpi.maxEnergyResidual, std::fabs(supply - demand));
    }

    kpi.minH2 = *std::min_element(h2.begin(), h2.end());
    kpi.maxH2 = *std::max_element(h2.begin(), h2.end());
    kpi.minDri = *std::min_element(dri.begin(), dri.end());

    for (int e = 0; e < nE; ++e) kpi.finalSteel += cplex.getValue(A.steelProduced[e][T - 1]);

    // economics
    double peak = 0.0;
    for (int t = 0; t < T; ++t) {
        kpi.marketProfit += p2g[t] * dt * S.price[t];
        if (P.drawPowerFromGrid) {
            kpi.marketCost += pfg[t] * dt * (S.price[t] + P.gridCharges->energyPrice);
            peak = std::max(peak, pfg[t]);
        }
    }
    if (P.drawPowerFromGrid) kpi.gridChargePower = peak * P.gridCharges->powerPrice;

    // exchange profile
    std::vector<double> exch(T);
    double mean = 0.0;
    for (int t = 0; t < T; ++t) { exch[t] = p2g[t] - pfg[t]; mean += exch[t]; }
    mean /= T;
    const double ref = P.givenGoalLoad ? *P.goalLoad : mean;
    for (int t = 0; t < T; ++t) {
        kpi.meanDeviation += std::fabs(exch[t] - ref);
        if (t > 0) kpi.totalLoadJumps += std::fabs(exch[t - 1] - exch[t]);
    }
    kpi.meanDeviation /= T;

    return kpi;
}

bool planIsConsistent(const PlanKPI& kpi, const PlantData& P, double tol) {
    bool ok = true;
    auto bad = [&](const char* what, double value) {
        std::cerr << "[evaluate] " << what << ": " << value << "\n";
        ok = false;
    };

    if (kpi.maxEnergyResidual > tol) bad("energy balance residual", kpi.maxEnergyResidual);
    if (kpi.maxRunningModes > 1)     bad("virtual equipment running at once", kpi.maxRunningModes);
    if (kpi.lateStarts > 0)          bad("late batch starts", kpi.lateStarts);
    if (kpi.downtimeViolations > 0)  bad("batches started inside the downtime", kpi.downtimeViolations);
    if (kpi.electrolyserOffRange > 0) bad("electrolyser load outside {0} + [min, max]", kpi.electrolyserOffRange);
    if (kpi.minH2 < -tol)            bad("hydrogen content below 0", kpi.minH2);
    if (kpi.maxH2 > P.capacityH2Tank + tol) bad("hydrogen content above capacity", kpi.maxH2);
    if (kpi.minDri < -tol)           bad("DRI content below 0", kpi.minDri);
    if (kpi.finalSteel < P.steelDemand - tol) bad("final steel below demand", kpi.finalSteel);
    return ok;
}
