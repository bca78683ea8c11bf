#include <catch2/catch.hpp>

#include <sstream>
#include <string>
#include <vector>

#include "build.h"
#include "fixtures.h"

namespace {

// Every extractable in the model, printed with names and bounds
std::vector<std::string> dumpModel(const BuildArtifacts& A) {
    std::vector<std::string> out;
    for (IloModel::Iterator it(A.model); it.ok(); ++it) {
        std::ostringstream os;
        os << *it;
        out.push_back(os.str());
    }
    return out;
}

std::vector<std::string> dumpBounds(const IloNumVarArray& x) {
    std::vector<std::string> out;
    for (IloInt t = 0; t < x.getSize(); ++t) {
        std::ostringstream os;
        os << x[t].getName() << "[" << x[t].getLB() << "," << x[t].getUB() << "]";
        out.push_back(os.str());
    }
    return out;
}

} // namespace

TEST_CASE("objective tokens", "[build]") {
    CHECK(parseObjective("max_profit") == Objective::MAX_PROFIT);
    CHECK(parseObjective("stability") == Objective::STABILITY);
    CHECK(parseObjective("min_load_jumps") == Objective::MIN_LOAD_JUMPS);
    CHECK_THROWS_AS(parseObjective("Max_Profit"), ObjectiveError);
    CHECK_THROWS_AS(parseObjective(""), ObjectiveError);
    CHECK(std::string(objectiveName(Objective::STABILITY)) == "stability");
}

TEST_CASE("unknown objective yields no model", "[build]") {
    EnvGuard g;
    CHECK_THROWS_AS(buildModel(singleModePlant(), flatSeries(10), "maximize", g.env), ObjectiveError);
    // the token is checked before the data
    CHECK_THROWS_AS(buildModel(singleModePlant(), TimeSeries{}, "maximize", g.env), ObjectiveError);
}

TEST_CASE("construction errors surface from buildModel", "[build]") {
    EnvGuard g;
    PlantData P = singleModePlant();
    P.drawPowerFromGrid = true;
    CHECK_THROWS_AS(buildModel(P, flatSeries(10), "max_profit", g.env), ConfigurationError);

    P = singleModePlant();
    P.batchLoadProfile["EAF"]["std"].push_back(5.0);
    CHECK_THROWS_AS(buildModel(P, flatSeries(10), "max_profit", g.env), DomainError);
}

TEST_CASE("constraint families span their index domains", "[build]") {
    EnvGuard g;
    const int T = 10;
    auto A = buildModel(twoEquipmentPlant(), flatSeries(T), "max_profit", g.env);

    CHECK(A.D.T == T);
    CHECK(A.dt == Approx(1.0));
    for (const IloRangeArray* fam : { &A.cElectrolyserMax, &A.cElectrolyserMin, &A.cH2Flow,
             &A.cReductionMaxH2, &A.cDriContent, &A.cH2Content, &A.cH2ContentMax, &A.cFcMax,
             &A.cEnergyBalance, &A.cPowerExchange, &A.cExchangeSplit, &A.cLoadJump,
             &A.cLoadJumpSplit, &A.cMarketProfit })
        CHECK(fam->getSize() == T);

    REQUIRE(A.cVirtualRunning.getSize() == 3);
    for (const auto* fam : { &A.cVirtualRunning, &A.cStartWindow, &A.cPause, &A.cSlabsStorage })
        for (IloInt v = 0; v < fam->getSize(); ++v) CHECK((*fam)[v].getSize() == T);

    REQUIRE(A.cEquipmentLoad.getSize() == 2);
    for (const auto* fam : { &A.cEquipmentRunning, &A.cOneModeRunning, &A.cEquipmentLoad,
             &A.cRollingRunning, &A.cRollingLoad, &A.cSteelProduced })
        for (IloInt e = 0; e < fam->getSize(); ++e) CHECK((*fam)[e].getSize() == T);

    CHECK(A.cSteelDemand.getLB() == Approx(5.0));
    CHECK(A.hasObjective());
    CHECK(A.objective.getSense() == IloObjective::Maximize);
}

TEST_CASE("variables and constraints carry indexed names", "[build]") {
    EnvGuard g;
    auto A = buildModel(singleModePlant(), flatSeries(10), "max_profit", g.env);

    CHECK(std::string(A.turnOn[0][4].getName()) == "equipment_decision_turnon(EAF,std,4)");
    CHECK(std::string(A.steelProduced[0][9].getName()) == "steel_produced_in_eq(EAF,9)");
    CHECK(std::string(A.powerExchange[2].getName()) == "power_exchange(2)");
    CHECK(std::string(A.cEnergyBalance[0].getName()) == "energy_balance(0)");
    CHECK(std::string(A.cSlabsStorage[0][3].getName()) == "slabs_and_billets_storage(EAF,std,3)");
}

TEST_CASE("latest start leaves room for batch and rolling", "[build]") {
    EnvGuard g;
    const int T = 10;
    auto A = buildModel(singleModePlant(), flatSeries(T), "max_profit", g.env);
    // duration 2, rolling 1
    for (int t = 0; t < T; ++t) CHECK(A.cStartWindow[0][t].getUB() == Approx(T - 2 - 1));
    CHECK(A.cOneModeRunning[0][0].getUB() == Approx(1.0));
}

TEST_CASE("grid import group exists only when switched on", "[build]") {
    EnvGuard g;
    const int T = 8;

    auto off = buildModel(singleModePlant(), flatSeries(T), "max_profit", g.env);
    CHECK(off.powerFromGrid.getSize() == 0);
    CHECK(off.maxPowerFromGrid.getImpl() == nullptr);
    CHECK(off.marketCost.getSize() == 0);
    CHECK(off.gridChargesEnergy.getSize() == 0);
    CHECK(off.gridChargesPower.getImpl() == nullptr);
    CHECK(off.cMaxPowerFromGrid.getSize() == 0);
    CHECK(off.cMarketCost.getSize() == 0);
    CHECK(off.cGridChargesEnergy.getSize() == 0);
    CHECK(off.cGridChargesPower.getImpl() == nullptr);
    for (const auto& line : dumpModel(off))
        CHECK(line.find("power_from_grid") == std::string::npos);

    auto on = buildModel(withGrid(singleModePlant()), flatSeries(T), "max_profit", g.env);
    CHECK(on.powerFromGrid.getSize() == T);
    CHECK(on.maxPowerFromGrid.getImpl() != nullptr);
    CHECK(on.cMaxPowerFromGrid.getSize() == T);
    CHECK(on.cMarketCost.getSize() == T);
    CHECK(on.cGridChargesEnergy.getSize() == T);
    CHECK(on.cGridChargesPower.getImpl() != nullptr);
}

TEST_CASE("a given goal load replaces the mean exchange", "[build]") {
    EnvGuard g;
    auto mean = buildModel(singleModePlant(), flatSeries(6), "stability", g.env);
    CHECK(mean.meanPowerExchange.getImpl() != nullptr);
    CHECK(mean.cMeanExchange.getImpl() != nullptr);
    CHECK(mean.objective.getSense() == IloObjective::Minimize);

    auto goal = buildModel(withGoalLoad(singleModePlant(), 5.0), flatSeries(6), "stability", g.env);
    CHECK(goal.meanPowerExchange.getImpl() == nullptr);
    CHECK(goal.cMeanExchange.getImpl() == nullptr);
    CHECK(goal.cExchangeSplit.getSize() == 6);
    for (const auto& line : dumpModel(goal))
        CHECK(line.find("mean_power_exchange") == std::string::npos);
}

TEST_CASE("storage goals bound the final contents", "[build]") {
    EnvGuard g;
    PlantData P = singleModePlant();
    auto without = buildModel(P, flatSeries(6), "max_profit", g.env);
    CHECK(without.cGoalH2.getImpl() == nullptr);
    CHECK(without.cGoalDri.getImpl() == nullptr);

    P.useStorageGoals = true;
    P.storageGoals = StorageGoals{ 4.0, 2.0 };
    auto with = buildModel(P, flatSeries(6), "max_profit", g.env);
    REQUIRE(with.cGoalH2.getImpl() != nullptr);
    CHECK(with.cGoalH2.getLB() == Approx(4.0));
    CHECK(with.cGoalDri.getLB() == Approx(2.0));
}

TEST_CASE("step length scales hours per step", "[build]") {
    EnvGuard g;
    PlantData P = singleModePlant();
    P.minutesPerStep = 15.0;
    auto A = buildModel(P, flatSeries(6), "min_load_jumps", g.env);
    CHECK(A.dt == Approx(0.25));
    // h2 per step capped at max * dt * efficiency
    CHECK(A.cReductionMaxH2[0].getUB() == Approx(10.0 * 0.25 * 0.7));
}

TEST_CASE("identical inputs build identical models", "[build]") {
    EnvGuard g1, g2;
    const PlantData P = withGrid(twoEquipmentPlant());
    const TimeSeries S = flatSeries(8, 15.0, 42.0);

    auto a = buildModel(P, S, "max_profit", g1.env);
    auto b = buildModel(P, S, "max_profit", g2.env);

    CHECK(dumpModel(a) == dumpModel(b));
    CHECK(dumpBounds(a.h2StorageFlow) == dumpBounds(b.h2StorageFlow));
    CHECK(dumpBounds(a.powerExchange) == dumpBounds(b.powerExchange));
    CHECK(dumpBounds(a.powerFromGrid) == dumpBounds(b.powerFromGrid));
}
