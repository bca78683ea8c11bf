// domains.cpp
#include "domains.h"

#include <set>

namespace {

template <typename T>
const T& modeEntry(const ByMode<T>& table, const std::string& tableName,
    const std::string& e, const std::string& v) {
    auto eIt = table.find(e);
    if (eIt == table.end())
        throw DomainError(tableName + " has no entry for equipment '" + e + "'");
    auto vIt = eIt->second.find(v);
    if (vIt == eIt->second.end())
        throw DomainError(tableName + " has no entry for virtual equipment '" + e + "." + v + "'");
    return vIt->second;
}

} // namespace

IndexDomains buildIndexDomains(const PlantData& P, int horizon) {
    if (horizon <= 0)
        throw DomainError("time horizon must contain at least one step");
    if (P.equipment.empty())
        throw DomainError("no equipment declared");

    IndexDomains D;
    D.T = horizon;
    D.B = P.boundaries;

    std::set<std::string> seenE;
    for (const auto& e : P.equipment) {
        if (!seenE.insert(e).second)
            throw DomainError("equipment '" + e + "' declared twice");

        auto modes = P.modes.find(e);
        if (modes == P.modes.end() || modes->second.empty())
            throw DomainError("equipment '" + e + "' has no virtual equipment");

        const int eIdx = (int)D.E.size();
        D.E.push_back(e);
        D.VofE.emplace_back();

        std::set<std::string> seenV;
        for (const auto& v : modes->second) {
            if (!seenV.insert(v).second)
                throw DomainError("virtual equipment '" + e + "." + v + "' declared twice");

            const auto& profile = modeEntry(P.batchLoadProfile, "batch_load_profile", e, v);
            const int duration = modeEntry(P.virtualEquipmentDuration, "virtual_equipment_duration", e, v);
            modeEntry(P.driDemand, "DRI_demand", e, v);
            modeEntry(P.outputSteelProducts, "output_steel_products", e, v);

            if (profile.empty())
                throw DomainError("batch_load_profile." + e + "." + v + " is empty");
            if ((int)profile.size() != duration)
                throw DomainError("batch_load_profile." + e + "." + v + " has "
                    + std::to_string(profile.size()) + " steps but virtual_equipment_duration is "
                    + std::to_string(duration));

            D.VofE[eIdx].push_back((int)D.V.size());
            D.V.push_back({ eIdx, e, v });
            D.Z.push_back(duration);
        }
    }

    // modes declared for an equipment that is not in E
    for (const auto& kv : P.modes)
        if (!seenE.count(kv.first))
            throw DomainError("virtual equipment declared for unknown equipment '" + kv.first + "'");

    return D;
}
