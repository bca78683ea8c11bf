#include <catch2/catch.hpp>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <fstream>

#include "config.h"
#include "fixtures.h"

namespace fs = std::filesystem;

namespace {

const char* kPlant = R"(
E: [EAF]
V:
  EAF: [std, eco]
minutes_per_step: 15
steel_demand: 5
max_capacity_electrolyser: 10
min_consumption_electrolyser: 1
efficiency_electrolyser: 0.7
capacity_h2_tank: 10
initial_h2_tank_filling: 0.5
DRI_init_content: 10
h2_MWh_per_DRI: 2
fuel_cell_capacity: 1
fuel_cell_efficiency: 0.5
batch_load_profile:
  EAF: {std: [5, 5], eco: [3, 3, 3]}
DRI_demand:
  EAF: {std: 1, eco: 1}
output_steel_products:
  EAF: {std: 10, eco: 10}
virtual_equipment_duration:
  EAF: {std: 2, eco: 3}
T_down: {EAF: 1}
rolling_duration: {EAF: 1}
rolling_cap: {EAF: 2}
rolling_mass_efficiency: {EAF: 0.9}
use_storage_goals: false
draw_power_from_grid: false
given_goal_load: false
)";

YAML::Node plantNode() { return YAML::Load(kPlant); }

fs::path writeTemp(const std::string& name, const std::string& text) {
    fs::path p = fs::temp_directory_path() / name;
    std::ofstream(p) << text;
    return p;
}

} // namespace

TEST_CASE("plant configuration is read into PlantData", "[config]") {
    const PlantData P = parsePlantData(plantNode());

    CHECK(P.equipment == std::vector<std::string>{ "EAF" });
    CHECK(P.modes.at("EAF") == std::vector<std::string>{ "std", "eco" });
    CHECK(P.boundaries.empty());
    CHECK(P.minutesPerStep == Approx(15.0));
    CHECK(P.batchLoadProfile.at("EAF").at("eco") == std::vector<double>{ 3, 3, 3 });
    CHECK(P.virtualEquipmentDuration.at("EAF").at("std") == 2);
    CHECK(P.pauseDuration.at("EAF") == 1);
    CHECK(P.rollingMassEfficiency.at("EAF") == Approx(0.9));
    CHECK_FALSE(P.storageGoals);
    CHECK_FALSE(P.gridCharges);
    CHECK_FALSE(P.goalLoad);
}

TEST_CASE("missing required keys are configuration errors", "[config]") {
    YAML::Node n = plantNode();
    n.remove("steel_demand");
    CHECK_THROWS_AS(parsePlantData(n), ConfigurationError);

    n = plantNode();
    n.remove("rolling_cap");
    CHECK_THROWS_AS(parsePlantData(n), ConfigurationError);
}

TEST_CASE("gated groups need their values only when switched on", "[config]") {
    SECTION("grid import") {
        YAML::Node n = plantNode();
        n["draw_power_from_grid"] = true;
        CHECK_THROWS_AS(parsePlantData(n), ConfigurationError);

        n["grid_charge_power_price"] = 12.5;
        n["grid_charge_energy_price"] = 3;
        const PlantData P = parsePlantData(n);
        REQUIRE(P.gridCharges);
        CHECK(P.gridCharges->powerPrice == Approx(12.5));
        CHECK(P.gridCharges->energyPrice == Approx(3.0));
    }
    SECTION("storage goals") {
        YAML::Node n = plantNode();
        n["use_storage_goals"] = true;
        n["goal_h2_content"] = 4;
        CHECK_THROWS_AS(parsePlantData(n), ConfigurationError);
        n["goal_DRI_content"] = 2;
        CHECK(parsePlantData(n).storageGoals->driContent == Approx(2.0));
    }
    SECTION("goal load") {
        YAML::Node n = plantNode();
        n["given_goal_load"] = true;
        CHECK_THROWS_AS(parsePlantData(n), ConfigurationError);
        n["goal_load"] = 5;
        CHECK(*parsePlantData(n).goalLoad == Approx(5.0));
    }
    SECTION("values of switched-off groups are ignored") {
        YAML::Node n = plantNode();
        n["goal_load"] = "not a number";
        CHECK_FALSE(parsePlantData(n).goalLoad);
    }
}

TEST_CASE("malformed values are configuration errors", "[config]") {
    YAML::Node n = plantNode();
    n["efficiency_electrolyser"] = "high";
    CHECK_THROWS_AS(parsePlantData(n), ConfigurationError);

    n = plantNode();
    n["E"] = "EAF";
    CHECK_THROWS_AS(parsePlantData(n), ConfigurationError);

    n = plantNode();
    n["batch_load_profile"]["EAF"]["std"] = 5;
    CHECK_THROWS_AS(parsePlantData(n), ConfigurationError);
}

TEST_CASE("plant configuration and series load from files", "[config]") {
    const fs::path plant = writeTemp("flexbatch_test_plant.yaml", kPlant);
    const fs::path series = writeTemp("flexbatch_test_series.csv",
        "generation,price\n20,50.5\n18.5,40\n\n22,-3\n");

    const PlantData P = loadPlantData(plant.string());
    CHECK(P.equipment.size() == 1);

    const TimeSeries S = loadTimeSeries(series.string());
    CHECK(S.generation == std::vector<double>{ 20, 18.5, 22 });
    CHECK(S.price == std::vector<double>{ 50.5, 40, -3 });

    CHECK_THROWS_AS(loadPlantData("/nonexistent/plant.yaml"), ConfigurationError);
    CHECK_THROWS_AS(loadTimeSeries("/nonexistent/series.csv"), ConfigurationError);

    const fs::path broken = writeTemp("flexbatch_test_broken.csv", "generation,price\n20,abc\n");
    CHECK_THROWS_AS(loadTimeSeries(broken.string()), ConfigurationError);

    fs::remove(plant);
    fs::remove(series);
    fs::remove(broken);
}

TEST_CASE("series files must be exactly two numeric columns under a header", "[config]") {
    auto rejects = [](const std::string& text) {
        const fs::path p = writeTemp("flexbatch_test_series_bad.csv", text);
        bool threw = false;
        try {
            loadTimeSeries(p.string());
        }
        catch (const ConfigurationError&) {
            threw = true;
        }
        fs::remove(p);
        return threw;
    };

    CHECK(rejects("20,50\n18,40\n"));                         // no header
    CHECK(rejects("gen,price\n20,50\n"));                     // wrong header
    CHECK(rejects("generation,price\n12abc,50\n"));           // trailing text
    CHECK(rejects("generation,price\n12,50x\n"));
    CHECK(rejects("generation,price\n12,50,7\n"));            // extra column
    CHECK(rejects("generation,price\n12,\n"));                // empty field
    CHECK(rejects(""));

    const fs::path crlf = writeTemp("flexbatch_test_series_crlf.csv",
        "generation,price\r\n 12 , 50\r\n13,51\r\n");
    const TimeSeries S = loadTimeSeries(crlf.string());
    CHECK(S.generation == std::vector<double>{ 12, 13 });
    CHECK(S.price == std::vector<double>{ 50, 51 });
    fs::remove(crlf);
}

TEST_CASE("plant values are validated against the series", "[config]") {
    const PlantData P = singleModePlant();
    CHECK_NOTHROW(validatePlantData(P, flatSeries(10)));

    SECTION("series lengths") {
        TimeSeries S = flatSeries(10);
        S.price.pop_back();
        CHECK_THROWS_AS(validatePlantData(P, S), ConfigurationError);
        CHECK_THROWS_AS(validatePlantData(P, TimeSeries{}), ConfigurationError);
    }
    SECTION("efficiencies") {
        PlantData Q = P;
        Q.electrolyserEfficiency = 0.0;
        CHECK_THROWS_AS(validatePlantData(Q, flatSeries(10)), ConfigurationError);
        Q = P;
        Q.rollingMassEfficiency["EAF"] = 1.5;
        CHECK_THROWS_AS(validatePlantData(Q, flatSeries(10)), ConfigurationError);
    }
    SECTION("electrolyser range") {
        PlantData Q = P;
        Q.minConsumptionElectrolyser = 20.0;
        CHECK_THROWS_AS(validatePlantData(Q, flatSeries(10)), ConfigurationError);
    }
    SECTION("per-equipment entries") {
        PlantData Q = P;
        Q.rollingDuration.erase("EAF");
        CHECK_THROWS_AS(validatePlantData(Q, flatSeries(10)), ConfigurationError);
        Q = P;
        Q.rollingDuration["EAF"] = 0;
        CHECK_THROWS_AS(validatePlantData(Q, flatSeries(10)), ConfigurationError);
    }
    SECTION("switch without values") {
        PlantData Q = P;
        Q.drawPowerFromGrid = true;
        CHECK_THROWS_AS(validatePlantData(Q, flatSeries(10)), ConfigurationError);
    }
}
