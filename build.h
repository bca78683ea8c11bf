#pragma once
#include <ilcplex/ilocplex.h>
#include <string>
#include "definitions.h"

// Everything needed later for solving, evaluating and exporting.
// Gated groups stay empty (size 0 / null handle) when their switch is off.
struct BuildArtifacts {
    IloModel model;
    IndexDomains D;
    Objective objectiveKind = Objective::MAX_PROFIT;
    double dt = 1.0;          // hours per step

    // ----- decision variables -----
    IloArray<IloBoolVarArray> turnOn;           // [v][t]
    IloBoolVarArray electrolyserOn;             // [t]
    IloNumVarArray electrolyserLoad;            // [t] MW
    IloNumVarArray fcGeneration;                // [t] MW
    IloNumVarArray h2ForDri;                    // [t] MWh
    IloNumVarArray h2StorageFlow;               // [t] MWh, negative = drawn from tank
    IloNumVarArray powerFromGrid;               // [t] MW (grid only)
    IloNumVar maxPowerFromGrid;                 // MW (grid only)

    // ----- derived variables -----
    IloNumVarArray h2StorageContent;            // [t] MWh
    IloNumVarArray driStorageContent;           // [t] tons
    IloArray<IloNumVarArray> equipmentLoad;     // [e][t] MW
    IloArray<IloBoolVarArray> virtualRunning;   // [v][t]
    IloArray<IloBoolVarArray> equipmentRunning; // [e][t]
    IloArray<IloNumVarArray> slabsStorage;      // [v][t] tons
    IloArray<IloBoolVarArray> rollingRunning;   // [e][t]
    IloArray<IloNumVarArray> rollingLoad;       // [e][t] MW
    IloArray<IloNumVarArray> steelProduced;     // [e][t] tons, cumulative
    IloNumVarArray powerExchange;               // [t] MW, positive = export
    IloNumVarArray powerToGrid;                 // [t] MW
    IloNumVar meanPowerExchange;                // null if a goal load is given
    IloNumVarArray aboveMean;                   // [t]
    IloNumVarArray belowMean;                   // [t]
    IloNumVarArray loadJump;                    // [t]
    IloNumVarArray loadJumpUp;                  // [t]
    IloNumVarArray loadJumpDown;                // [t]
    IloNumVarArray marketProfit;                // [t] EUR
    IloNumVarArray marketCost;                  // [t] EUR (grid only)
    IloNumVarArray gridChargesEnergy;           // [t] EUR (grid only)
    IloNumVar gridChargesPower;                 // EUR (grid only)

    // ----- constraint families -----
    IloRangeArray cElectrolyserMax, cElectrolyserMin, cH2Flow, cReductionMaxH2;
    IloRangeArray cDriContent, cH2Content, cH2ContentMax, cFcMax;
    IloRange cGoalH2, cGoalDri;                                     // storage goals only
    IloArray<IloRangeArray> cVirtualRunning, cStartWindow, cPause, cSlabsStorage;   // [v][t]
    IloArray<IloRangeArray> cEquipmentRunning, cOneModeRunning, cEquipmentLoad;     // [e][t]
    IloArray<IloRangeArray> cRollingRunning, cRollingLoad, cSteelProduced;          // [e][t]
    IloRange cSteelDemand;
    IloRangeArray cEnergyBalance, cPowerExchange, cExchangeSplit;
    IloRange cMeanExchange;                                         // no goal load only
    IloRangeArray cMaxPowerFromGrid;                                // grid only
    IloRangeArray cLoadJump, cLoadJumpSplit;
    IloRangeArray cMarketProfit, cMarketCost, cGridChargesEnergy;   // cost/charges: grid only
    IloRange cGridChargesPower;                                     // grid only

    IloObjective objective;

    bool hasObjective() const { return objective.getImpl() != nullptr; }

    BuildArtifacts(IloEnv& env, const IndexDomains& dom)
        : model(env), D(dom),
        turnOn(env, (IloInt)dom.V.size()), electrolyserOn(env, dom.T),
        electrolyserLoad(env, dom.T, 0.0, IloInfinity, ILOFLOAT),
        fcGeneration(env, dom.T, 0.0, IloInfinity, ILOFLOAT),
        h2ForDri(env, dom.T, 0.0, IloInfinity, ILOFLOAT),
        h2StorageFlow(env, dom.T, -IloInfinity, IloInfinity, ILOFLOAT),
        powerFromGrid(env),
        h2StorageContent(env, dom.T, 0.0, IloInfinity, ILOFLOAT),
        driStorageContent(env, dom.T, 0.0, IloInfinity, ILOFLOAT),
        equipmentLoad(env, (IloInt)dom.E.size()), virtualRunning(env, (IloInt)dom.V.size()),
        equipmentRunning(env, (IloInt)dom.E.size()), slabsStorage(env, (IloInt)dom.V.size()),
        rollingRunning(env, (IloInt)dom.E.size()), rollingLoad(env, (IloInt)dom.E.size()),
        steelProduced(env, (IloInt)dom.E.size()),
        powerExchange(env, dom.T, -IloInfinity, IloInfinity, ILOFLOAT),
        powerToGrid(env, dom.T, 0.0, IloInfinity, ILOFLOAT),
        aboveMean(env, dom.T, 0.0, IloInfinity, ILOFLOAT),
        belowMean(env, dom.T, 0.0, IloInfinity, ILOFLOAT),
        loadJump(env, dom.T, -IloInfinity, IloInfinity, ILOFLOAT),
        loadJumpUp(env, dom.T, 0.0, IloInfinity, ILOFLOAT),
        loadJumpDown(env, dom.T, 0.0, IloInfinity, ILOFLOAT),
        marketProfit(env, dom.T, -IloInfinity, IloInfinity, ILOFLOAT),
        marketCost(env), gridChargesEnergy(env),
        cElectrolyserMax(env), cElectrolyserMin(env), cH2Flow(env), cReductionMaxH2(env),
        cDriContent(env), cH2Content(env), cH2ContentMax(env), cFcMax(env),
        cVirtualRunning(env, (IloInt)dom.V.size()), cStartWindow(env, (IloInt)dom.V.size()),
        cPause(env, (IloInt)dom.V.size()), cSlabsStorage(env, (IloInt)dom.V.size()),
        cEquipmentRunning(env, (IloInt)dom.E.size()), cOneModeRunning(env, (IloInt)dom.E.size()),
        cEquipmentLoad(env, (IloInt)dom.E.size()), cRollingRunning(env, (IloInt)dom.E.size()),
        cRollingLoad(env, (IloInt)dom.E.size()), cSteelProduced(env, (IloInt)dom.E.size()),
        cEnergyBalance(env), cPowerExchange(env), cExchangeSplit(env),
        cMaxPowerFromGrid(env), cLoadJump(env), cLoadJumpSplit(env),
        cMarketProfit(env), cMarketCost(env), cGridChargesEnergy(env) {}
};

// Build the full optimization model (vars + constraints + objective) for the
// plant and series, but DO NOT solve. The objective token is checked first;
// an unknown token throws ObjectiveError and nothing is added to env.
//   IloCplex cplex(art.model); solveModel(cplex, ctl); collectResults(...);
BuildArtifacts buildModel(const PlantData& P, const TimeSeries& S,
    const std::string& objective, IloEnv& env);
