// config.cpp
// Plant configuration (YAML) and input series (CSV).

#include "config.h"

#include <fstream>
#include <iostream>
#include <sstream>

namespace {

YAML::Node required(const YAML::Node& root, const std::string& key) {
    YAML::Node n = root[key];
    if (!n || n.IsNull())
        throw ConfigurationError("missing required key '" + key + "'");
    return n;
}

template <typename T>
T scalarAs(const YAML::Node& n, const std::string& path) {
    if (!n.IsScalar())
        throw ConfigurationError("'" + path + "' must be a scalar");
    try {
        return n.as<T>();
    }
    catch (const YAML::BadConversion&) {
        throw ConfigurationError("'" + path + "' has an invalid value '" + n.Scalar() + "'");
    }
}

template <typename T>
T requiredScalar(const YAML::Node& root, const std::string& key) {
    return scalarAs<T>(required(root, key), key);
}

std::vector<std::string> stringList(const YAML::Node& n, const std::string& path) {
    if (!n.IsSequence())
        throw ConfigurationError("'" + path + "' must be a list");
    std::vector<std::string> out;
    for (std::size_t i = 0; i < n.size(); ++i)
        out.push_back(scalarAs<std::string>(n[i], path + "[" + std::to_string(i) + "]"));
    return out;
}

std::vector<double> numberList(const YAML::Node& n, const std::string& path) {
    if (!n.IsSequence())
        throw ConfigurationError("'" + path + "' must be a list");
    std::vector<double> out;
    for (std::size_t i = 0; i < n.size(); ++i)
        out.push_back(scalarAs<double>(n[i], path + "[" + std::to_string(i) + "]"));
    return out;
}

template <typename T>
ByEquipment<T> equipmentTable(const YAML::Node& root, const std::string& key) {
    YAML::Node n = required(root, key);
    if (!n.IsMap())
        throw ConfigurationError("'" + key + "' must map equipment to values");
    ByEquipment<T> out;
    for (const auto& kv : n) {
        const std::string e = kv.first.as<std::string>();
        out[e] = scalarAs<T>(kv.second, key + "." + e);
    }
    return out;
}

// e -> v -> value; values are read by the caller-supplied converter
template <typename T, typename Conv>
ByMode<T> modeTable(const YAML::Node& root, const std::string& key, Conv conv) {
    YAML::Node n = required(root, key);
    if (!n.IsMap())
        throw ConfigurationError("'" + key + "' must map equipment to virtual equipment");
    ByMode<T> out;
    for (const auto& ekv : n) {
        const std::string e = ekv.first.as<std::string>();
        if (!ekv.second.IsMap())
            throw ConfigurationError("'" + key + "." + e + "' must map virtual equipment to values");
        for (const auto& vkv : ekv.second) {
            const std::string v = vkv.first.as<std::string>();
            out[e][v] = conv(vkv.second, key + "." + e + "." + v);
        }
    }
    return out;
}

// strips blanks and a trailing '\r'
std::string trimField(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return "";
    const auto e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

// whole field must be a number
double seriesValue(const std::string& field, const std::string& path, int row) {
    const std::string f = trimField(field);
    std::size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(f, &used);
    }
    catch (const std::logic_error&) {
        used = 0;
    }
    if (f.empty() || used != f.size())
        throw ConfigurationError(path + ":" + std::to_string(row) + ": '" + f + "' is not a number");
    return value;
}

} // namespace

PlantData parsePlantData(const YAML::Node& root) {
    if (!root.IsMap())
        throw ConfigurationError("plant configuration must be a mapping");

    PlantData P;

    // ---------- sets ----------
    P.equipment = stringList(required(root, "E"), "E");
    YAML::Node vNode = required(root, "V");
    if (!vNode.IsMap())
        throw ConfigurationError("'V' must map equipment to a list of virtual equipment");
    for (const auto& kv : vNode) {
        const std::string e = kv.first.as<std::string>();
        P.modes[e] = stringList(kv.second, "V." + e);
    }
    if (root["B"] && !root["B"].IsNull())
        P.boundaries = stringList(root["B"], "B");

    // ---------- scalars ----------
    P.minutesPerStep = requiredScalar<double>(root, "minutes_per_step");
    P.steelDemand = requiredScalar<double>(root, "steel_demand");
    P.maxCapacityElectrolyser = requiredScalar<double>(root, "max_capacity_electrolyser");
    P.minConsumptionElectrolyser = requiredScalar<double>(root, "min_consumption_electrolyser");
    P.electrolyserEfficiency = requiredScalar<double>(root, "efficiency_electrolyser");
    P.capacityH2Tank = requiredScalar<double>(root, "capacity_h2_tank");
    P.initialH2TankFilling = requiredScalar<double>(root, "initial_h2_tank_filling");
    P.initialDriContent = requiredScalar<double>(root, "DRI_init_content");
    P.h2MWhPerDri = requiredScalar<double>(root, "h2_MWh_per_DRI");
    P.fuelCellCapacity = requiredScalar<double>(root, "fuel_cell_capacity");
    P.fuelCellEfficiency = requiredScalar<double>(root, "fuel_cell_efficiency");

    // ---------- steelmaking / rolling ----------
    P.batchLoadProfile = modeTable<std::vector<double>>(root, "batch_load_profile", numberList);
    P.driDemand = modeTable<double>(root, "DRI_demand", scalarAs<double>);
    P.outputSteelProducts = modeTable<double>(root, "output_steel_products", scalarAs<double>);
    P.virtualEquipmentDuration = modeTable<int>(root, "virtual_equipment_duration", scalarAs<int>);
    P.pauseDuration = equipmentTable<int>(root, "T_down");
    P.rollingDuration = equipmentTable<int>(root, "rolling_duration");
    P.rollingCapacity = equipmentTable<double>(root, "rolling_cap");
    P.rollingMassEfficiency = equipmentTable<double>(root, "rolling_mass_efficiency");

    // ---------- gated groups ----------
    P.useStorageGoals = requiredScalar<bool>(root, "use_storage_goals");
    if (P.useStorageGoals) {
        StorageGoals g;
        g.h2Content = requiredScalar<double>(root, "goal_h2_content");
        g.driContent = requiredScalar<double>(root, "goal_DRI_content");
        P.storageGoals = g;
    }

    P.drawPowerFromGrid = requiredScalar<bool>(root, "draw_power_from_grid");
    if (P.drawPowerFromGrid) {
        GridCharges c;
        c.powerPrice = requiredScalar<double>(root, "grid_charge_power_price");
        c.energyPrice = requiredScalar<double>(root, "grid_charge_energy_price");
        P.gridCharges = c;
    }

    P.givenGoalLoad = requiredScalar<bool>(root, "given_goal_load");
    if (P.givenGoalLoad)
        P.goalLoad = requiredScalar<double>(root, "goal_load");

    return P;
}

PlantData loadPlantData(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    }
    catch (const YAML::BadFile&) {
        throw ConfigurationError("cannot open plant configuration '" + path + "'");
    }
    catch (const YAML::ParserException& ex) {
        throw ConfigurationError("cannot parse '" + path + "': " + ex.what());
    }
    PlantData P = parsePlantData(root);
    std::cout << "[config] " << path << ": " << P.equipment.size() << " equipment, "
        << P.boundaries.size() << " boundaries\n";
    return P;
}

TimeSeries loadTimeSeries(const std::string& path) {
    std::ifstream in(path);
    if (!in)
        throw ConfigurationError("cannot open series file '" + path + "'");

    std::string line;
    if (!std::getline(in, line) || trimField(line) != "generation,price")
        throw ConfigurationError(path + ":1: expected header 'generation,price'");

    TimeSeries S;
    int row = 1;
    while (std::getline(in, line)) {
        ++row;
        if (trimField(line).empty()) continue;
        std::stringstream ss(line);
        std::string g, p, extra;
        if (!std::getline(ss, g, ',') || !std::getline(ss, p, ',') || std::getline(ss, extra, ','))
            throw ConfigurationError(path + ":" + std::to_string(row) + ": expected 'generation,price'");
        S.generation.push_back(seriesValue(g, path, row));
        S.price.push_back(seriesValue(p, path, row));
    }
    std::cout << "[config] " << path << ": " << S.generation.size() << " time steps\n";
    return S;
}

void validatePlantData(const PlantData& P, const TimeSeries& S) {
    auto fail = [](const std::string& msg) { throw ConfigurationError(msg); };

    if (S.generation.empty())
        fail("renewable generation series is empty");
    if (S.price.size() != S.generation.size())
        fail("price series has " + std::to_string(S.price.size()) + " values, generation has "
            + std::to_string(S.generation.size()));

    if (P.minutesPerStep <= 0.0) fail("minutes_per_step must be positive");
    if (P.electrolyserEfficiency <= 0.0 || P.electrolyserEfficiency > 1.0)
        fail("efficiency_electrolyser must be in (0, 1]");
    if (P.fuelCellEfficiency <= 0.0 || P.fuelCellEfficiency > 1.0)
        fail("fuel_cell_efficiency must be in (0, 1]");
    if (P.h2MWhPerDri <= 0.0) fail("h2_MWh_per_DRI must be positive");
    if (P.minConsumptionElectrolyser < 0.0 || P.minConsumptionElectrolyser > P.maxCapacityElectrolyser)
        fail("min_consumption_electrolyser must lie in [0, max_capacity_electrolyser]");
    if (P.initialH2TankFilling < 0.0 || P.initialH2TankFilling > 1.0)
        fail("initial_h2_tank_filling must be a share in [0, 1]");
    if (P.capacityH2Tank < 0.0) fail("capacity_h2_tank must not be negative");

    for (const auto& e : P.equipment) {
        auto pause = P.pauseDuration.find(e);
        if (pause == P.pauseDuration.end()) fail("T_down has no entry for '" + e + "'");
        if (pause->second < 0) fail("T_down." + e + " must not be negative");

        auto roll = P.rollingDuration.find(e);
        if (roll == P.rollingDuration.end()) fail("rolling_duration has no entry for '" + e + "'");
        if (roll->second < 1) fail("rolling_duration." + e + " must be at least 1");

        auto cap = P.rollingCapacity.find(e);
        if (cap == P.rollingCapacity.end()) fail("rolling_cap has no entry for '" + e + "'");

        auto eff = P.rollingMassEfficiency.find(e);
        if (eff == P.rollingMassEfficiency.end())
            fail("rolling_mass_efficiency has no entry for '" + e + "'");
        if (eff->second <= 0.0 || eff->second > 1.0)
            fail("rolling_mass_efficiency." + e + " must be in (0, 1]");
    }

    if (P.useStorageGoals && !P.storageGoals)
        fail("use_storage_goals is set but goal_h2_content / goal_DRI_content are missing");
    if (P.drawPowerFromGrid && !P.gridCharges)
        fail("draw_power_from_grid is set but grid charge prices are missing");
    if (P.givenGoalLoad && !P.goalLoad)
        fail("given_goal_load is set but goal_load is missing");
}
