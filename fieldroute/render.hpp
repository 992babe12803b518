#pragma once
#include "geocache.hpp"
#include <optional>
#include <string>
#include <vector>

enum class StopRole {
    ORIGIN = 0,
    WAYPOINT,
    TERMINUS,
};

struct RouteStop {
    std::string location;
    LatLon coord;
    StopRole role;
};

struct RouteSegment {
    std::string from;
    std::string to;
    LatLon midpoint;
    double distance_km;     // rounded to 2 decimals
};

// Everything a map renderer needs to draw one route.
struct RenderPlan {
    std::vector<RouteStop> stops;
    std::vector<RouteSegment> segments;
    LatLon center;
};

// Stops without coordinates are skipped. nullopt when none resolve.
std::optional<RenderPlan> build_render_plan(const Geocache& geocache,
                                            const std::vector<std::string>& route);

class RouteRenderer {
public:
    virtual ~RouteRenderer() = default;
    virtual std::string render(const RenderPlan& plan, const std::string& title) const = 0;
};

// Standalone HTML page with an inline SVG map of the route.
class SvgRouteRenderer : public RouteRenderer {
public:
    SvgRouteRenderer(int width = 800, int height = 600);
    std::string render(const RenderPlan& plan, const std::string& title) const override;

private:
    int width_;
    int height_;
};

std::optional<std::string> render_route(const RouteRenderer& renderer,
                                        const Geocache& geocache,
                                        const std::vector<std::string>& route,
                                        const std::string& title);
