#include "report.h"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

std::string str(int t) { return std::to_string(t); }

struct Collector {
    const IloCplex& cplex;
    std::vector<ResultEntry>& out;

    void add(const std::string& name, std::vector<std::string> index, double value) {
        out.push_back({ name, std::move(index), value });
    }

    // [t] family; skipped when gated off
    template <typename Arr>
    void series(const char* name, const Arr& x) {
        for (IloInt t = 0; t < x.getSize(); ++t)
            add(name, { str((int)t) }, cplex.getValue(x[t]));
    }

    // [key][t] family
    template <typename Arr2>
    void table(const char* name, const Arr2& x, const std::vector<std::vector<std::string>>& keys) {
        for (IloInt k = 0; k < x.getSize(); ++k)
            for (IloInt t = 0; t < x[k].getSize(); ++t) {
                std::vector<std::string> idx = keys[k];
                idx.push_back(str((int)t));
                add(name, std::move(idx), cplex.getValue(x[k][t]));
            }
    }
};

} // namespace

std::vector<ResultEntry> collectResults(
    const PlantData& P, const TimeSeries& S,
    const BuildArtifacts& A, const IloCplex& cplex
) {
    const IndexDomains& D = A.D;
    std::vector<ResultEntry> out;
    Collector c{ cplex, out };

    std::vector<std::vector<std::string>> eKeys, vKeys;
    for (const auto& e : D.E) eKeys.push_back({ e });
    for (const auto& v : D.V) vKeys.push_back({ v.equipment, v.mode });

    // ---------- sets (value = position) ----------
    for (int t = 0; t < D.T; ++t) c.add("T", { str(t) }, t);
    for (int e = 0; e < (int)D.E.size(); ++e) c.add("E", { D.E[e] }, e);
    for (int v = 0; v < (int)D.V.size(); ++v) {
        c.add("V", vKeys[v], v);
        for (int z = 0; z < D.Z[v]; ++z) c.add("Z", { D.V[v].equipment, D.V[v].mode, str(z) }, z);
    }
    for (int b = 0; b < (int)D.B.size(); ++b) c.add("B", { D.B[b] }, b);

    // ---------- parameters ----------
    c.add("minutes_per_step", {}, P.minutesPerStep);
    c.add("steel_demand", {}, P.steelDemand);
    c.add("max_capacity_electrolyser", {}, P.maxCapacityElectrolyser);
    c.add("min_consumption_electrolyser", {}, P.minConsumptionElectrolyser);
    c.add("efficiency_electrolyser", {}, P.electrolyserEfficiency);
    c.add("capacity_h2_tank", {}, P.capacityH2Tank);
    c.add("initial_h2_tank_filling", {}, P.initialH2TankFilling);
    c.add("DRI_init_content", {}, P.initialDriContent);
    c.add("h2_MWh_per_DRI", {}, P.h2MWhPerDri);
    c.add("fuel_cell_capacity", {}, P.fuelCellCapacity);
    c.add("fuel_cell_efficiency", {}, P.fuelCellEfficiency);
    c.add("use_storage_goals", {}, P.useStorageGoals ? 1.0 : 0.0);
    c.add("draw_power_from_grid", {}, P.drawPowerFromGrid ? 1.0 : 0.0);
    c.add("given_goal_load", {}, P.givenGoalLoad ? 1.0 : 0.0);
    if (P.storageGoals) {
        c.add("goal_h2_content", {}, P.storageGoals->h2Content);
        c.add("goal_DRI_content", {}, P.storageGoals->driContent);
    }
    if (P.gridCharges) {
        c.add("grid_charge_power_price", {}, P.gridCharges->powerPrice);
        c.add("grid_charge_energy_price", {}, P.gridCharges->energyPrice);
    }
    if (P.goalLoad) c.add("goal_load", {}, *P.goalLoad);

    for (int t = 0; t < D.T; ++t) {
        c.add("renewable_generation", { str(t) }, S.generation[t]);
        c.add("electricity_price", { str(t) }, S.price[t]);
    }
    for (const auto& e : D.E) {
        c.add("T_down", { e }, P.pauseDuration.at(e));
        c.add("rolling_duration", { e }, P.rollingDuration.at(e));
        c.add("rolling_cap", { e }, P.rollingCapacity.at(e));
        c.add("rolling_mass_efficiency", { e }, P.rollingMassEfficiency.at(e));
    }
    for (const auto& v : D.V) {
        const auto& e = v.equipment;
        const auto& m = v.mode;
        c.add("virtual_equipment_duration", { e, m }, P.virtualEquipmentDuration.at(e).at(m));
        c.add("DRI_demand", { e, m }, P.driDemand.at(e).at(m));
        c.add("output_steel_products", { e, m }, P.outputSteelProducts.at(e).at(m));
        const auto& profile = P.batchLoadProfile.at(e).at(m);
        for (int z = 0; z < (int)profile.size(); ++z)
            c.add("batch_load_profile", { e, m, str(z) }, profile[z]);
    }

    // ---------- variables ----------
    c.table("equipment_decision_turnon", A.turnOn, vKeys);
    c.series("electrolysers_decision_turnon", A.electrolyserOn);
    c.series("electricity_consumption_electrolysers", A.electrolyserLoad);
    c.series("fc_generation", A.fcGeneration);
    c.series("h2_MWh_for_DRI", A.h2ForDri);
    c.series("h2_MWh_storage_flow", A.h2StorageFlow);
    c.series("h2_storage_content", A.h2StorageContent);
    c.series("DRI_storage_content", A.driStorageContent);
    c.table("equipment_load_profile", A.equipmentLoad, eKeys);
    c.table("virtual_eq_running", A.virtualRunning, vKeys);
    c.table("equipment_running", A.equipmentRunning, eKeys);
    c.table("slabs_and_billets_storage", A.slabsStorage, vKeys);
    c.table("rolling_running", A.rollingRunning, eKeys);
    c.table("rolling_load", A.rollingLoad, eKeys);
    c.table("steel_produced_in_eq", A.steelProduced, eKeys);
    c.series("power_exchange", A.powerExchange);
    c.series("power_to_grid", A.powerToGrid);
    c.series("dist_power_exchange_above_mean", A.aboveMean);
    c.series("dist_power_exchange_below_mean", A.belowMean);
    c.series("load_jump", A.loadJump);
    c.series("load_jump_up", A.loadJumpUp);
    c.series("load_jump_down", A.loadJumpDown);
    c.series("electricity_market_profit", A.marketProfit);
    if (!P.givenGoalLoad)
        c.add("mean_power_exchange", {}, cplex.getValue(A.meanPowerExchange));
    if (P.drawPowerFromGrid) {
        c.series("power_from_grid", A.powerFromGrid);
        c.series("electricity_market_cost", A.marketCost);
        c.series("grid_charges_energy", A.gridChargesEnergy);
        c.add("max_power_from_grid", {}, cplex.getValue(A.maxPowerFromGrid));
        c.add("grid_charges_power", {}, cplex.getValue(A.gridChargesPower));
    }
    return out;
}

void reportSolution(const SolveResult& r, const PlanKPI& kpi, const BuildArtifacts& A) {
    const IndexDomains& D = A.D;

    std::cout << "\n[report] objective " << objectiveName(A.objectiveKind)
        << "  outcome " << outcomeName(r.outcome) << "\n";

    std::cout << "\n--- Plan evaluation ---\n";
    std::cout << std::fixed << std::setprecision(3);
    std::cout << "Raw CPLEX objective     : " << kpi.rawObj << "\n";
    std::cout << "Market profit           : " << kpi.marketProfit << "\n";
    std::cout << "Market cost             : " << kpi.marketCost << "\n";
    std::cout << "Grid charge (power)     : " << kpi.gridChargePower << "\n";
    std::cout << "  Net                   : " << kpi.marketProfit - kpi.marketCost - kpi.gridChargePower << "\n";
    std::cout << "Mean abs deviation      : " << kpi.meanDeviation << "\n";
    std::cout << "Total load jumps        : " << kpi.totalLoadJumps << "\n";
    std::cout << "Final steel             : " << kpi.finalSteel << "\n";
    std::cout << "Energy residual (max)   : " << std::scientific << kpi.maxEnergyResidual << std::fixed << "\n";
    std::cout << "H2 content range        : [" << kpi.minH2 << ", " << kpi.maxH2 << "]\n";

    std::cout << "\nBatch starts:\n";
    for (int v = 0; v < (int)D.V.size(); ++v) {
        std::cout << "  " << D.V[v].equipment << "." << D.V[v].mode << ": ";
        if (kpi.starts[v].empty()) std::cout << "(none)";
        for (int s : kpi.starts[v]) std::cout << s << " ";
        std::cout << "\n";
    }
    std::cout << std::defaultfloat;
}

std::string exportSolution(
    const std::string& outDir,
    const std::vector<ResultEntry>& entries,
    const SolveResult& r,
    const PlanKPI& kpi,
    const BuildArtifacts& A,
    const PlantData& P
) {
    const IndexDomains& D = A.D;
    fs::create_directories(outDir);

    auto path = [&](const std::string& fname) {
        return (fs::path(outDir) / fname).string();
    };

    // 1) meta
    {
        std::ofstream jf(path("sol_meta.json"));
        jf << std::fixed << std::setprecision(6);
        jf << "{\n";
        jf << "  \"T\": " << D.T << ",\n";
        jf << "  \"E\": " << D.E.size() << ",\n";
        jf << "  \"V\": " << D.V.size() << ",\n";
        jf << "  \"dt_hours\": " << A.dt << ",\n";
        jf << "  \"objective_kind\": \"" << objectiveName(A.objectiveKind) << "\",\n";
        jf << "  \"outcome\": \"" << outcomeName(r.outcome) << "\",\n";
        jf << "  \"objective\": " << r.objective << ",\n";
        jf << "  \"mip_gap\": " << r.mipGap << ",\n";
        jf << "  \"final_steel\": " << kpi.finalSteel << "\n";
        jf << "}\n";
    }

    // 2) flat results
    const std::string results = path("sol_results.csv");
    {
        std::ofstream rf(results);
        if (!rf) throw std::runtime_error("cannot write '" + results + "'");
        rf << std::setprecision(10);
        rf << "name,index...,value\n";
        for (const auto& en : entries) {
            rf << en.name;
            for (const auto& i : en.index) rf << "," << i;
            rf << "," << en.value << "\n";
        }
    }

    // 3) batch schedule
    {
        std::ofstream sch(path("sol_schedule.csv"));
        sch << "equipment,mode,start,end,rolling_start,rolling_end,steel_out\n";
        for (int v = 0; v < (int)D.V.size(); ++v) {
            const VirtualEquipment& ve = D.V[v];
            const int roll = P.rollingDuration.at(ve.equipment);
            for (int s : kpi.starts[v]) {
                const int end = s + D.Z[v];
                sch << ve.equipment << "," << ve.mode << "," << s << "," << end << ","
                    << end + 1 << "," << end + 1 + roll << ","
                    << P.outputSteelProducts.at(ve.equipment).at(ve.mode) * P.rollingMassEfficiency.at(ve.equipment)
                    << "\n";
            }
        }
    }

    std::cout << "[report] " << entries.size() << " entries written to " << results << "\n";
    return results;
}
