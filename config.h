#pragma once
#include <string>
#include <yaml-cpp/yaml.h>
#include "definitions.h"

// Read the plant configuration record. Throws ConfigurationError when a
// required key is missing, has the wrong shape, or a gated group is
// switched on without its values.
PlantData parsePlantData(const YAML::Node& root);
PlantData loadPlantData(const std::string& path);

// Two-column CSV "generation,price" with one header line.
TimeSeries loadTimeSeries(const std::string& path);

// Value checks on an in-memory plant record (also run by buildModel).
void validatePlantData(const PlantData& P, const TimeSeries& S);
