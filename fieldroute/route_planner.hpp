#pragma once
#include "geocache.hpp"
#include <optional>
#include <string>
#include <vector>

struct PlannedRoute {
    std::vector<std::string> route;
    double distance_km = 0.0;                 // rounded to 2 decimals
    std::vector<std::string> dropped;         // inputs the geocache could not resolve
};

/**
 * Greedy nearest-neighbor ordering of the given locations.
 *
 * Locations are resolved through the geocache in caller order; unknown keys
 * are reported in `dropped` and repeated keys are visited once. The route
 * starts at `depot` when it is one of the resolved locations, otherwise at
 * the first resolved location. Each step moves to the closest unvisited
 * location by haversine distance, the earliest one in caller order winning
 * ties. Not globally optimal.
 */
PlannedRoute plan_route(
    const Geocache& geocache,
    const std::vector<std::string>& locations,
    const std::optional<std::string>& depot
);
