#pragma once
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

//===============================
// Errors raised while assembling a model
//===============================
struct ModelError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// required parameter missing or malformed for the active switches
struct ConfigurationError : ModelError {
    using ModelError::ModelError;
};

// index data inconsistent with the declared equipment / virtual equipment
struct DomainError : ModelError {
    using ModelError::ModelError;
};

// unknown objective token
struct ObjectiveError : ModelError {
    using ModelError::ModelError;
};

//===============================
// Plant data
//===============================
struct StorageGoals {
    double h2Content = 0.0;    // MWh in the tank at the last step
    double driContent = 0.0;   // tons of DRI at the last step
};

struct GridCharges {
    double powerPrice = 0.0;   // demand rate on peak import [EUR/MW]
    double energyPrice = 0.0;  // rate per imported energy [EUR/MWh]
};

template <typename T>
using ByEquipment = std::map<std::string, T>;                        // e -> value
template <typename T>
using ByMode = std::map<std::string, std::map<std::string, T>>;      // e -> v -> value

struct PlantData {
    // Sets
    std::vector<std::string> equipment;                            // E
    std::map<std::string, std::vector<std::string>> modes;         // V_e
    std::vector<std::string> boundaries;                           // B (not wired)

    double minutesPerStep = 60.0;
    double steelDemand = 0.0;                                       // tons

    // Reduction unit
    double maxCapacityElectrolyser = 0.0;   // MW
    double minConsumptionElectrolyser = 0.0;// MW
    double electrolyserEfficiency = 1.0;
    double capacityH2Tank = 0.0;            // MWh
    double initialH2TankFilling = 0.0;      // share of capacity
    double initialDriContent = 0.0;         // tons
    double h2MWhPerDri = 1.0;               // MWh H2 per ton DRI

    // Fuel cell
    double fuelCellCapacity = 0.0;          // MW
    double fuelCellEfficiency = 1.0;

    // Steelmaking
    ByMode<std::vector<double>> batchLoadProfile;   // MW per batch step
    ByMode<double> driDemand;                       // tons per batch
    ByMode<double> outputSteelProducts;             // tons per batch
    ByMode<int>    virtualEquipmentDuration;        // steps
    ByEquipment<int> pauseDuration;                 // T_down

    // Rolling
    ByEquipment<int>    rollingDuration;
    ByEquipment<double> rollingCapacity;            // MW
    ByEquipment<double> rollingMassEfficiency;

    // Gated groups
    bool useStorageGoals = false;
    std::optional<StorageGoals> storageGoals;
    bool drawPowerFromGrid = false;
    std::optional<GridCharges> gridCharges;
    bool givenGoalLoad = false;
    std::optional<double> goalLoad;         // MW
};

struct TimeSeries {
    std::vector<double> generation;   // MW
    std::vector<double> price;        // EUR/MWh
};

//===============================
// Index domains
//===============================
struct VirtualEquipment {
    int e = 0;              // position in IndexDomains::E
    std::string equipment;
    std::string mode;
};

struct IndexDomains {
    int T = 0;                              // horizon length N
    std::vector<std::string> E;
    std::vector<VirtualEquipment> V;
    std::vector<std::vector<int>> VofE;     // VofE[e] -> indices into V
    std::vector<int> Z;                     // batch steps per V (profile length)
    std::vector<std::string> B;
};

//===============================
// Objective / solver options
//===============================
enum class Objective { MAX_PROFIT, STABILITY, MIN_LOAD_JUMPS };

struct SolverControl {
    double timeLimit = -1.0;   // seconds; <= 0 means none
    double mipGap = 0.0;       // relative gap; <= 0 means solver default
    bool verbose = false;      // solver trace on std::cout
};

enum class SolveOutcome {
    OPTIMAL,
    OPTIMAL_WITHIN_GAP,
    FEASIBLE,                 // time limit hit with an incumbent
    TIME_LIMIT_NO_SOLUTION,
    INFEASIBLE,
    UNBOUNDED,
    INFEASIBLE_OR_UNBOUNDED,
    ERROR
};

struct SolveResult {
    SolveOutcome outcome = SolveOutcome::ERROR;
    bool hasSolution = false;
    double objective = 0.0;
    double mipGap = 0.0;
    std::string cplexStatus;
};

Objective parseObjective(const std::string& token);
const char* objectiveName(Objective obj);
const char* outcomeName(SolveOutcome outcome);
