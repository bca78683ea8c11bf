// build.cpp
// Flexible batch production of a green steel plant as one MILP:
//  reduction unit (electrolysers, hydrogen tank, fuel cell, DRI stock),
//  steelmaking equipment whose virtual equipment (operating modes) run batches,
//  rolling coupled to steelmaking, and power exchange with the grid.
//
// Notes:
//  - A batch is only its turn-on binary. Occupancy, load, rolling and the
//    intermediate storage are fixed-lag sums over turn-on[v][t - z].
//  - |x| terms are linearised by splitting x into a nonnegative pair.

#include "build.h"
#include "config.h"
#include "domains.h"

#include <iostream>
ILOSTLBEGIN

Objective parseObjective(const std::string& token) {
    if (token == "max_profit")     return Objective::MAX_PROFIT;
    if (token == "stability")      return Objective::STABILITY;
    if (token == "min_load_jumps") return Objective::MIN_LOAD_JUMPS;
    throw ObjectiveError("unknown objective '" + token
        + "' (expected max_profit, stability or min_load_jumps)");
}

const char* objectiveName(Objective obj) {
    switch (obj) {
    case Objective::MAX_PROFIT:     return "max_profit";
    case Objective::STABILITY:      return "stability";
    case Objective::MIN_LOAD_JUMPS: return "min_load_jumps";
    }
    return "?";
}

// ----------------- parameters bound to domain positions -----------------
struct Params {
    double dt = 1.0;                          // hours per step
    std::vector<double> gen, price;           // [t]
    std::vector<int> dur;                     // [v]
    std::vector<double> dri, out;             // [v]
    std::vector<std::vector<double>> profile; // [v][z]
    std::vector<int> pause, rollDur;          // [e]
    std::vector<double> rollCap, rollEff;     // [e]
};

static Params bindParameters(const PlantData& P, const TimeSeries& S, const IndexDomains& D) {
    Params p;
    p.dt = P.minutesPerStep / 60.0;
    p.gen = S.generation;
    p.price = S.price;
    for (const auto& ve : D.V) {
        p.dur.push_back(P.virtualEquipmentDuration.at(ve.equipment).at(ve.mode));
        p.dri.push_back(P.driDemand.at(ve.equipment).at(ve.mode));
        p.out.push_back(P.outputSteelProducts.at(ve.equipment).at(ve.mode));
        p.profile.push_back(P.batchLoadProfile.at(ve.equipment).at(ve.mode));
    }
    for (const auto& e : D.E) {
        p.pause.push_back(P.pauseDuration.at(e));
        p.rollDur.push_back(P.rollingDuration.at(e));
        p.rollCap.push_back(P.rollingCapacity.at(e));
        p.rollEff.push_back(P.rollingMassEfficiency.at(e));
    }
    return p;
}

// ----------------- naming -----------------
static std::string nm(const char* base, int t) {
    return std::string(base) + "(" + std::to_string(t) + ")";
}
static std::string nm(const char* base, const std::string& a, int t) {
    return std::string(base) + "(" + a + "," + std::to_string(t) + ")";
}
static std::string nm(const char* base, const VirtualEquipment& v, int t) {
    return std::string(base) + "(" + v.equipment + "," + v.mode + "," + std::to_string(t) + ")";
}

static void addNamed(IloRangeArray& family, IloRange r, const std::string& name) {
    r.setName(name.c_str());
    family.add(r);
}

// x = pos - neg, pos,neg >= 0. Minimising pos + neg keeps at most one nonzero.
static IloRange absSplit(const IloNumExprArg& x, const IloNumVar& pos, const IloNumVar& neg) {
    return (pos - neg - x == 0);
}

// ----------------- variables -----------------
static void allocateVariables(const PlantData& P, IloEnv& env, BuildArtifacts& A) {
    const IndexDomains& D = A.D;
    const int T = D.T;
    const int nV = (int)D.V.size(), nE = (int)D.E.size();

    for (int v = 0; v < nV; ++v) {
        A.turnOn[v] = IloBoolVarArray(env, T);
        A.virtualRunning[v] = IloBoolVarArray(env, T);
        A.slabsStorage[v] = IloNumVarArray(env, T, 0.0, IloInfinity, ILOFLOAT);
        for (int t = 0; t < T; ++t) {
            A.turnOn[v][t] = IloBoolVar(env, nm("equipment_decision_turnon", D.V[v], t).c_str());
            A.virtualRunning[v][t] = IloBoolVar(env, nm("virtual_eq_running", D.V[v], t).c_str());
            A.slabsStorage[v][t].setName(nm("slabs_and_billets_storage", D.V[v], t).c_str());
        }
    }

    for (int e = 0; e < nE; ++e) {
        A.equipmentLoad[e] = IloNumVarArray(env, T, 0.0, IloInfinity, ILOFLOAT);
        A.equipmentRunning[e] = IloBoolVarArray(env, T);
        A.rollingRunning[e] = IloBoolVarArray(env, T);
        A.rollingLoad[e] = IloNumVarArray(env, T, 0.0, IloInfinity, ILOFLOAT);
        A.steelProduced[e] = IloNumVarArray(env, T, 0.0, IloInfinity, ILOFLOAT);
        const std::string& id = D.E[e];
        for (int t = 0; t < T; ++t) {
            A.equipmentLoad[e][t].setName(nm("equipment_load_profile", id, t).c_str());
            A.equipmentRunning[e][t] = IloBoolVar(env, nm("equipment_running", id, t).c_str());
            A.rollingRunning[e][t] = IloBoolVar(env, nm("rolling_running", id, t).c_str());
            A.rollingLoad[e][t].setName(nm("rolling_load", id, t).c_str());
            A.steelProduced[e][t].setName(nm("steel_produced_in_eq", id, t).c_str());
        }
    }

    if (P.drawPowerFromGrid) {
        A.powerFromGrid = IloNumVarArray(env, T, 0.0, IloInfinity, ILOFLOAT);
        A.marketCost = IloNumVarArray(env, T, -IloInfinity, IloInfinity, ILOFLOAT);
        A.gridChargesEnergy = IloNumVarArray(env, T, 0.0, IloInfinity, ILOFLOAT);
        A.maxPowerFromGrid = IloNumVar(env, 0.0, IloInfinity, ILOFLOAT, "max_power_from_grid");
        A.gridChargesPower = IloNumVar(env, 0.0, IloInfinity, ILOFLOAT, "grid_charges_power");
    }
    if (!P.givenGoalLoad)
        A.meanPowerExchange = IloNumVar(env, -IloInfinity, IloInfinity, ILOFLOAT, "mean_power_exchange");

    for (int t = 0; t < T; ++t) {
        A.electrolyserOn[t] = IloBoolVar(env, nm("electrolysers_decision_turnon", t).c_str());
        A.electrolyserLoad[t].setName(nm("electricity_consumption_electrolysers", t).c_str());
        A.fcGeneration[t].setName(nm("fc_generation", t).c_str());
        A.h2ForDri[t].setName(nm("h2_MWh_for_DRI", t).c_str());
        A.h2StorageFlow[t].setName(nm("h2_MWh_storage_flow", t).c_str());
        A.h2StorageContent[t].setName(nm("h2_storage_content", t).c_str());
        A.driStorageContent[t].setName(nm("DRI_storage_content", t).c_str());
        A.powerExchange[t].setName(nm("power_exchange", t).c_str());
        A.powerToGrid[t].setName(nm("power_to_grid", t).c_str());
        A.aboveMean[t].setName(nm("dist_power_exchange_above_mean", t).c_str());
        A.belowMean[t].setName(nm("dist_power_exchange_below_mean", t).c_str());
        A.loadJump[t].setName(nm("load_jump", t).c_str());
        A.loadJumpUp[t].setName(nm("load_jump_up", t).c_str());
        A.loadJumpDown[t].setName(nm("load_jump_down", t).c_str());
        A.marketProfit[t].setName(nm("electricity_market_profit", t).c_str());
        if (P.drawPowerFromGrid) {
            A.powerFromGrid[t].setName(nm("power_from_grid", t).c_str());
            A.marketCost[t].setName(nm("electricity_market_cost", t).c_str());
            A.gridChargesEnergy[t].setName(nm("grid_charges_energy", t).c_str());
        }
    }
}

// ----------------- reduction unit, hydrogen tank, fuel cell -----------------
static void addReductionUnit(const PlantData& P, const Params& p, IloEnv& env, BuildArtifacts& A) {
    const IndexDomains& D = A.D;
    const int T = D.T, nV = (int)D.V.size();
    const double h2PerStepMax = P.maxCapacityElectrolyser * p.dt * P.electrolyserEfficiency;

    for (int t = 0; t < T; ++t) {
        // semi-continuous load: 0 or in [min, max]
        addNamed(A.cElectrolyserMax,
            A.electrolyserLoad[t] <= P.maxCapacityElectrolyser * A.electrolyserOn[t],
            nm("electrolyser_max_consumption", t));
        addNamed(A.cElectrolyserMin,
            A.electrolyserLoad[t] >= P.minConsumptionElectrolyser * A.electrolyserOn[t],
            nm("electrolyser_min_consumption", t));

        // produced hydrogen goes to DRI or into (out of, if negative) the tank
        addNamed(A.cH2Flow,
            A.electrolyserLoad[t] * (P.electrolyserEfficiency * p.dt) == A.h2ForDri[t] + A.h2StorageFlow[t],
            nm("h2_flow", t));
        addNamed(A.cReductionMaxH2, A.h2ForDri[t] <= h2PerStepMax,
            nm("reduction_unit_max_h2_consumption", t));

        IloExpr dri(env);
        if (t == 0) dri += P.initialDriContent;
        else        dri += A.driStorageContent[t - 1];
        dri += A.h2ForDri[t] / P.h2MWhPerDri;
        for (int v = 0; v < nV; ++v) dri -= p.dri[v] * A.turnOn[v][t];
        addNamed(A.cDriContent, A.driStorageContent[t] == dri, nm("DRI_storage_content", t));
        dri.end();

        IloExpr h2(env);
        if (t == 0) h2 += P.initialH2TankFilling * P.capacityH2Tank;
        else        h2 += A.h2StorageContent[t - 1];
        h2 += A.h2StorageFlow[t];
        h2 -= A.fcGeneration[t] * (p.dt / P.fuelCellEfficiency);
        addNamed(A.cH2Content, A.h2StorageContent[t] == h2, nm("hydrogen_storage_content", t));
        h2.end();

        addNamed(A.cH2ContentMax, A.h2StorageContent[t] <= P.capacityH2Tank,
            nm("max_hydrogen_storage_content", t));
        addNamed(A.cFcMax, A.fcGeneration[t] <= P.fuelCellCapacity, nm("max_fc_generation", t));
    }

    A.model.add(A.cElectrolyserMax);
    A.model.add(A.cElectrolyserMin);
    A.model.add(A.cH2Flow);
    A.model.add(A.cReductionMaxH2);
    A.model.add(A.cDriContent);
    A.model.add(A.cH2Content);
    A.model.add(A.cH2ContentMax);
    A.model.add(A.cFcMax);

    if (P.storageGoals) {
        A.cGoalH2 = (A.h2StorageContent[T - 1] >= P.storageGoals->h2Content);
        A.cGoalH2.setName("goal_hydrogen_content");
        A.cGoalDri = (A.driStorageContent[T - 1] >= P.storageGoals->driContent);
        A.cGoalDri.setName("goal_DRI_content");
        A.model.add(A.cGoalH2);
        A.model.add(A.cGoalDri);
    }
}

// ----------------- steelmaking: batches, downtime, load, intermediate storage -----------------
static void addSteelmaking(const Params& p, IloEnv& env, BuildArtifacts& A) {
    const IndexDomains& D = A.D;
    const int T = D.T, nV = (int)D.V.size(), nE = (int)D.E.size();

    for (int v = 0; v < nV; ++v) {
        const VirtualEquipment& ve = D.V[v];
        const int e = ve.e;
        const int dur = p.dur[v], roll = p.rollDur[e], pause = p.pause[e];
        const double out = p.out[v];

        if (dur + roll > T) {
            std::cerr << "[build] " << ve.equipment << "." << ve.mode << ": batch + rolling ("
                << dur + roll << " steps) exceeds the horizon of " << T << " steps\n";
        }

        A.cVirtualRunning[v] = IloRangeArray(env);
        A.cStartWindow[v] = IloRangeArray(env);
        A.cPause[v] = IloRangeArray(env);
        A.cSlabsStorage[v] = IloRangeArray(env);

        for (int t = 0; t < T; ++t) {
            // running while any batch started in the last dur steps is active
            IloExpr window(env);
            for (int z = 0; z < dur; ++z) if (t >= z) window += A.turnOn[v][t - z];
            addNamed(A.cVirtualRunning[v], A.virtualRunning[v][t] == window,
                nm("virtual_eq_running", ve, t));
            window.end();

            // batch and rolling must finish inside the horizon
            addNamed(A.cStartWindow[v], IloRange(env, -IloInfinity, A.turnOn[v][t] * t, T - dur - roll),
                nm("starting_time", ve, t));

            // no start unless the equipment idled the last `pause` steps
            IloExpr busy(env);
            for (int k = 0; k < pause; ++k) if (t > k) busy += A.equipmentRunning[e][t - k - 1];
            addNamed(A.cPause[v], A.turnOn[v][t] * pause <= pause - busy, nm("T_pause", ve, t));
            busy.end();

            // filled dur steps after a turn-on, drained roll steps later
            if (t < dur) {
                addNamed(A.cSlabsStorage[v], A.slabsStorage[v][t] == 0,
                    nm("slabs_and_billets_storage", ve, t));
            }
            else if (t < dur + roll) {
                addNamed(A.cSlabsStorage[v],
                    A.slabsStorage[v][t] == A.slabsStorage[v][t - 1] + out * A.turnOn[v][t - dur],
                    nm("slabs_and_billets_storage", ve, t));
            }
            else {
                addNamed(A.cSlabsStorage[v],
                    A.slabsStorage[v][t] == A.slabsStorage[v][t - 1]
                    + out * A.turnOn[v][t - dur] - out * A.turnOn[v][t - dur - roll],
                    nm("slabs_and_billets_storage", ve, t));
            }
        }
        A.model.add(A.cVirtualRunning[v]);
        A.model.add(A.cStartWindow[v]);
        A.model.add(A.cPause[v]);
        A.model.add(A.cSlabsStorage[v]);
    }

    for (int e = 0; e < nE; ++e) {
        const std::string& id = D.E[e];
        A.cEquipmentRunning[e] = IloRangeArray(env);
        A.cOneModeRunning[e] = IloRangeArray(env);
        A.cEquipmentLoad[e] = IloRangeArray(env);

        for (int t = 0; t < T; ++t) {
            IloExpr running(env);
            for (int v : D.VofE[e]) running += A.virtualRunning[v][t];
            addNamed(A.cEquipmentRunning[e], A.equipmentRunning[e][t] == running,
                nm("equipment_running", id, t));
            running.end();

            addNamed(A.cOneModeRunning[e], IloRange(env, -IloInfinity, A.equipmentRunning[e][t], 1.0),
                nm("one_veq_running", id, t));

            // superposition of the profiles of all batches active at t
            IloExpr load(env);
            for (int v : D.VofE[e])
                for (int z = 0; z < D.Z[v]; ++z)
                    if (t >= z) load += p.profile[v][z] * A.turnOn[v][t - z];
            addNamed(A.cEquipmentLoad[e], A.equipmentLoad[e][t] == load,
                nm("equipment_load", id, t));
            load.end();
        }
        A.model.add(A.cEquipmentRunning[e]);
        A.model.add(A.cOneModeRunning[e]);
        A.model.add(A.cEquipmentLoad[e]);
    }
}

// ----------------- rolling and finished steel -----------------
static void addRolling(const PlantData& P, const Params& p, IloEnv& env, BuildArtifacts& A) {
    const IndexDomains& D = A.D;
    const int T = D.T, nE = (int)D.E.size();

    for (int e = 0; e < nE; ++e) {
        const std::string& id = D.E[e];
        const int roll = p.rollDur[e];
        A.cRollingRunning[e] = IloRangeArray(env);
        A.cRollingLoad[e] = IloRangeArray(env);
        A.cSteelProduced[e] = IloRangeArray(env);

        for (int t = 0; t < T; ++t) {
            IloExpr rolling(env);
            for (int v : D.VofE[e])
                for (int o = p.dur[v]; o < p.dur[v] + roll; ++o)
                    if (t > o) rolling += A.turnOn[v][t - o - 1];
            addNamed(A.cRollingRunning[e], A.rollingRunning[e][t] == rolling,
                nm("rolling_running", id, t));
            rolling.end();

            addNamed(A.cRollingLoad[e], A.rollingLoad[e][t] == p.rollCap[e] * A.rollingRunning[e][t],
                nm("rolling_load", id, t));

            if (t == 0) {
                addNamed(A.cSteelProduced[e], A.steelProduced[e][t] == 0,
                    nm("steel_produced_in_eq", id, t));
            }
            else {
                IloExpr rolled(env);
                for (int v : D.VofE[e]) rolled += A.slabsStorage[v][t];
                addNamed(A.cSteelProduced[e],
                    A.steelProduced[e][t] == A.steelProduced[e][t - 1] + (p.rollEff[e] / roll) * rolled,
                    nm("steel_produced_in_eq", id, t));
                rolled.end();
            }
        }
        A.model.add(A.cRollingRunning[e]);
        A.model.add(A.cRollingLoad[e]);
        A.model.add(A.cSteelProduced[e]);
    }

    IloExpr finalSteel(env);
    for (int e = 0; e < nE; ++e) finalSteel += A.steelProduced[e][T - 1];
    A.cSteelDemand = (finalSteel >= P.steelDemand);
    A.cSteelDemand.setName("meet_steel_demand");
    A.model.add(A.cSteelDemand);
    finalSteel.end();
}

// ----------------- energy balance, exchange, load jumps -----------------
static void addEnergyManagement(const PlantData& P, const Params& p, IloEnv& env, BuildArtifacts& A) {
    const IndexDomains& D = A.D;
    const int T = D.T, nE = (int)D.E.size();
    const bool grid = P.drawPowerFromGrid;

    for (int t = 0; t < T; ++t) {
        IloExpr bal(env);
        bal += p.gen[t];
        bal += A.fcGeneration[t];
        if (grid) bal += A.powerFromGrid[t];
        for (int e = 0; e < nE; ++e) bal -= A.equipmentLoad[e][t] + A.rollingLoad[e][t];
        bal -= A.electrolyserLoad[t];
        bal -= A.powerToGrid[t];
        addNamed(A.cEnergyBalance, bal == 0, nm("energy_balance", t));
        bal.end();

        if (grid) {
            addNamed(A.cPowerExchange, A.powerExchange[t] == A.powerToGrid[t] - A.powerFromGrid[t],
                nm("power_exchange", t));
            addNamed(A.cMaxPowerFromGrid, A.maxPowerFromGrid >= A.powerFromGrid[t],
                nm("max_power_from_grid", t));
        }
        else {
            addNamed(A.cPowerExchange, A.powerExchange[t] == A.powerToGrid[t], nm("power_exchange", t));
        }
    }

    if (!P.givenGoalLoad) {
        IloExpr sum(env);
        for (int t = 0; t < T; ++t) sum += A.powerExchange[t];
        A.cMeanExchange = (A.meanPowerExchange == sum / T);
        A.cMeanExchange.setName("mean_power_exchange");
        A.model.add(A.cMeanExchange);
        sum.end();
    }

    for (int t = 0; t < T; ++t) {
        if (P.givenGoalLoad)
            addNamed(A.cExchangeSplit, absSplit(A.powerExchange[t] - *P.goalLoad, A.aboveMean[t], A.belowMean[t]),
                nm("power_exchange_split", t));
        else
            addNamed(A.cExchangeSplit, absSplit(A.powerExchange[t] - A.meanPowerExchange, A.aboveMean[t], A.belowMean[t]),
                nm("power_exchange_split", t));

        if (t == 0)
            addNamed(A.cLoadJump, A.loadJump[t] == 0, nm("load_jump", t));
        else
            addNamed(A.cLoadJump, A.loadJump[t] == A.powerExchange[t - 1] - A.powerExchange[t],
                nm("load_jump", t));

        addNamed(A.cLoadJumpSplit, absSplit(A.loadJump[t], A.loadJumpUp[t], A.loadJumpDown[t]),
            nm("load_jump_split", t));
    }

    A.model.add(A.cEnergyBalance);
    A.model.add(A.cPowerExchange);
    A.model.add(A.cExchangeSplit);
    A.model.add(A.cLoadJump);
    A.model.add(A.cLoadJumpSplit);
    if (grid) A.model.add(A.cMaxPowerFromGrid);
}

// ----------------- market profit, cost and grid charges -----------------
static void addEconomics(const PlantData& P, const Params& p, BuildArtifacts& A) {
    const int T = A.D.T;

    for (int t = 0; t < T; ++t) {
        addNamed(A.cMarketProfit, A.marketProfit[t] == A.powerToGrid[t] * (p.dt * p.price[t]),
            nm("electricity_market_profit", t));
    }
    A.model.add(A.cMarketProfit);

    if (!P.drawPowerFromGrid) return;

    const GridCharges& gc = *P.gridCharges;
    for (int t = 0; t < T; ++t) {
        addNamed(A.cGridChargesEnergy,
            A.gridChargesEnergy[t] == A.powerFromGrid[t] * (p.dt * gc.energyPrice),
            nm("grid_charges_energy", t));
        addNamed(A.cMarketCost,
            A.marketCost[t] == A.powerFromGrid[t] * (p.dt * p.price[t]) + A.gridChargesEnergy[t],
            nm("electricity_market_cost", t));
    }
    A.cGridChargesPower = (A.gridChargesPower == gc.powerPrice * A.maxPowerFromGrid);
    A.cGridChargesPower.setName("grid_charges_power");

    A.model.add(A.cGridChargesEnergy);
    A.model.add(A.cMarketCost);
    A.model.add(A.cGridChargesPower);
}

// ----------------- objective -----------------
static void attachObjective(const PlantData& P, IloEnv& env, BuildArtifacts& A) {
    const int T = A.D.T;
    IloExpr obj(env);

    switch (A.objectiveKind) {
    case Objective::MAX_PROFIT:
        for (int t = 0; t < T; ++t) obj += A.marketProfit[t];
        if (P.drawPowerFromGrid) {
            for (int t = 0; t < T; ++t) obj -= A.marketCost[t];
            obj -= A.gridChargesPower;
        }
        A.objective = IloMaximize(env, obj, "objective");
        break;
    case Objective::STABILITY:
        // mean absolute deviation from the mean (or goal) exchange
        for (int t = 0; t < T; ++t) obj += A.aboveMean[t] + A.belowMean[t];
        A.objective = IloMinimize(env, obj / T, "objective");
        break;
    case Objective::MIN_LOAD_JUMPS:
        for (int t = 0; t < T; ++t) obj += A.loadJumpUp[t] + A.loadJumpDown[t];
        A.objective = IloMinimize(env, obj, "objective");
        break;
    }
    A.model.add(A.objective);
    obj.end();
}

// ----------------- buildModel -----------------
BuildArtifacts buildModel(const PlantData& P, const TimeSeries& S,
    const std::string& objective, IloEnv& env)
{
    // all checks run before anything is created in env
    const Objective kind = parseObjective(objective);
    validatePlantData(P, S);
    IndexDomains D = buildIndexDomains(P, (int)S.generation.size());
    const Params p = bindParameters(P, S, D);

    BuildArtifacts A(env, D);
    A.objectiveKind = kind;
    A.dt = p.dt;

    allocateVariables(P, env, A);
    addReductionUnit(P, p, env, A);
    addSteelmaking(p, env, A);
    addRolling(P, p, env, A);
    addEnergyManagement(P, p, env, A);
    addEconomics(P, p, A);
    attachObjective(P, env, A);

    std::cout << "[build] T=" << D.T << " E=" << D.E.size() << " V=" << D.V.size()
        << " dt=" << p.dt << "h objective=" << objectiveName(kind)
        << (P.drawPowerFromGrid ? " grid-import" : "")
        << (P.givenGoalLoad ? " goal-load" : "")
        << (P.useStorageGoals ? " storage-goals" : "") << "\n";
    return A;
}
