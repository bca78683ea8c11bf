#pragma once
#include "definitions.h"

// Derive T, E, V, Z and B from the plant record; the horizon is the length
// of the generation series. Throws DomainError on inconsistent index data.
IndexDomains buildIndexDomains(const PlantData& P, int horizon);
