#pragma once
#include <ilcplex/ilocplex.h>
#include "definitions.h"

// One equipment "EAF" with one virtual equipment "std": a 2-step batch
// followed by 1 step of rolling, 10 t per batch, demand 5 t.
inline PlantData singleModePlant() {
    PlantData P;
    P.equipment = { "EAF" };
    P.modes["EAF"] = { "std" };
    P.minutesPerStep = 60.0;
    P.steelDemand = 5.0;

    P.maxCapacityElectrolyser = 10.0;
    P.minConsumptionElectrolyser = 0.0;
    P.electrolyserEfficiency = 0.7;
    P.capacityH2Tank = 10.0;
    P.initialH2TankFilling = 0.5;
    P.initialDriContent = 10.0;
    P.h2MWhPerDri = 2.0;
    P.fuelCellCapacity = 1.0;
    P.fuelCellEfficiency = 0.5;

    P.batchLoadProfile["EAF"]["std"] = { 5.0, 5.0 };
    P.driDemand["EAF"]["std"] = 1.0;
    P.outputSteelProducts["EAF"]["std"] = 10.0;
    P.virtualEquipmentDuration["EAF"]["std"] = 2;
    P.pauseDuration["EAF"] = 0;
    P.rollingDuration["EAF"] = 1;
    P.rollingCapacity["EAF"] = 2.0;
    P.rollingMassEfficiency["EAF"] = 0.9;
    return P;
}

// Adds a second equipment "LF" with two virtual equipment.
inline PlantData twoEquipmentPlant() {
    PlantData P = singleModePlant();
    P.equipment.push_back("LF");
    P.modes["LF"] = { "slow", "fast" };
    P.batchLoadProfile["LF"]["slow"] = { 2.0, 3.0, 2.0 };
    P.batchLoadProfile["LF"]["fast"] = { 4.0, 4.0 };
    P.driDemand["LF"]["slow"] = 1.0;
    P.driDemand["LF"]["fast"] = 1.0;
    P.outputSteelProducts["LF"]["slow"] = 6.0;
    P.outputSteelProducts["LF"]["fast"] = 6.0;
    P.virtualEquipmentDuration["LF"]["slow"] = 3;
    P.virtualEquipmentDuration["LF"]["fast"] = 2;
    P.pauseDuration["LF"] = 1;
    P.rollingDuration["LF"] = 2;
    P.rollingCapacity["LF"] = 1.0;
    P.rollingMassEfficiency["LF"] = 0.8;
    return P;
}

inline PlantData withGrid(PlantData P, double powerPrice = 10.0, double energyPrice = 5.0) {
    P.drawPowerFromGrid = true;
    P.gridCharges = GridCharges{ powerPrice, energyPrice };
    return P;
}

inline PlantData withGoalLoad(PlantData P, double goal) {
    P.givenGoalLoad = true;
    P.goalLoad = goal;
    return P;
}

inline TimeSeries flatSeries(int N, double generation = 20.0, double price = 50.0) {
    TimeSeries S;
    S.generation.assign(N, generation);
    S.price.assign(N, price);
    return S;
}

// Ends the environment (and everything built in it) when the test finishes.
struct EnvGuard {
    IloEnv env;
    EnvGuard() = default;
    EnvGuard(const EnvGuard&) = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;
    ~EnvGuard() { env.end(); }
};
