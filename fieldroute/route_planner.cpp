#include "route_planner.hpp"
#include <limits>
#include <unordered_set>
using namespace std;

struct RouteNode {
    string key;
    LatLon coord;
};

static vector<RouteNode> resolve_nodes(const Geocache& geocache,
                                       const vector<string>& locations,
                                       vector<string>& dropped)
{
    vector<RouteNode> nodes;
    unordered_set<string> seen;

    for (auto &loc : locations) {
        if (!seen.insert(loc).second) continue;

        auto coord = geocache.lookup(loc);
        if (!coord) {
            dropped.push_back(loc);
            continue;
        }
        nodes.push_back({loc, *coord});
    }
    return nodes;
}

PlannedRoute plan_route(
    const Geocache& geocache,
    const vector<string>& locations,
    const optional<string>& depot
) {
    PlannedRoute result;
    vector<RouteNode> nodes = resolve_nodes(geocache, locations, result.dropped);
    if (nodes.empty()) return result;

    int start = 0;
    if (depot) {
        for (int i = 0; i < (int)nodes.size(); i++) {
            if (nodes[i].key == *depot) {
                start = i;
                break;
            }
        }
    }

    vector<bool> visited(nodes.size(), false);
    visited[start] = true;
    result.route.push_back(nodes[start].key);

    int current = start;
    int remaining = (int)nodes.size() - 1;
    double total = 0.0;

    while (remaining > 0) {
        double best = numeric_limits<double>::infinity();
        int best_idx = -1;

        for (int i = 0; i < (int)nodes.size(); i++) {
            if (visited[i]) continue;
            double d = haversine_km(nodes[current].coord, nodes[i].coord);
            if (d < best) {
                best = d;
                best_idx = i;
            }
        }

        if (best_idx == -1) break;

        visited[best_idx] = true;
        result.route.push_back(nodes[best_idx].key);
        total += best;
        current = best_idx;
        remaining--;
    }

    result.distance_km = round2(total);
    return result;
}
