#include "render.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

static constexpr double kDegreeToRadian = 0.017453292519943295;
static constexpr double kMargin = 40.0;

std::optional<RenderPlan> build_render_plan(const Geocache& geocache,
                                            const std::vector<std::string>& route)
{
    RenderPlan plan;
    for (const auto& loc : route) {
        auto coord = geocache.lookup(loc);
        if (!coord) continue;
        plan.stops.push_back({loc, *coord, StopRole::WAYPOINT});
    }
    if (plan.stops.empty()) return std::nullopt;

    plan.stops.front().role = StopRole::ORIGIN;
    if (plan.stops.size() > 1) plan.stops.back().role = StopRole::TERMINUS;

    double lat_sum = 0.0, lon_sum = 0.0;
    for (const auto& s : plan.stops) {
        lat_sum += s.coord.lat;
        lon_sum += s.coord.lon;
    }
    plan.center = LatLon(lat_sum / plan.stops.size(), lon_sum / plan.stops.size());

    for (size_t i = 0; i + 1 < plan.stops.size(); i++) {
        const auto& a = plan.stops[i];
        const auto& b = plan.stops[i + 1];
        plan.segments.push_back({a.location, b.location,
                                 midpoint(a.coord, b.coord),
                                 round2(haversine_km(a.coord, b.coord))});
    }
    return plan;
}

// ---------------------------------------------------------------------------
// SVG output
// ---------------------------------------------------------------------------

static std::string escape_xml(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out += c;
        }
    }
    return out;
}

static const char* stop_color(StopRole role)
{
    switch (role) {
        case StopRole::ORIGIN: return "green";
        case StopRole::TERMINUS: return "red";
        default: return "blue";
    }
}

// Equirectangular projection around the plan center, fitted into the
// viewport with a fixed margin and y growing downwards.
class Projection {
public:
    Projection(const RenderPlan& plan, int width, int height)
        : center_(plan.center), cos_lat_(std::cos(plan.center.lat * kDegreeToRadian)),
          width_(width), height_(height)
    {
        double min_x = 0, max_x = 0, min_y = 0, max_y = 0;
        for (const auto& s : plan.stops) {
            double x = raw_x(s.coord), y = raw_y(s.coord);
            min_x = std::min(min_x, x);
            max_x = std::max(max_x, x);
            min_y = std::min(min_y, y);
            max_y = std::max(max_y, y);
        }
        double span_x = std::max(std::abs(min_x), std::abs(max_x));
        double span_y = std::max(std::abs(min_y), std::abs(max_y));

        double sx = span_x > 0 ? (width_ / 2.0 - kMargin) / span_x : 1.0;
        double sy = span_y > 0 ? (height_ / 2.0 - kMargin) / span_y : 1.0;
        scale_ = std::min(sx, sy);
    }

    double x(const LatLon& p) const { return width_ / 2.0 + raw_x(p) * scale_; }
    double y(const LatLon& p) const { return height_ / 2.0 - raw_y(p) * scale_; }

private:
    double raw_x(const LatLon& p) const { return (p.lon - center_.lon) * cos_lat_; }
    double raw_y(const LatLon& p) const { return p.lat - center_.lat; }

    LatLon center_;
    double cos_lat_;
    int width_;
    int height_;
    double scale_ = 1.0;
};

SvgRouteRenderer::SvgRouteRenderer(int width, int height)
    : width_(width), height_(height) {}

std::string SvgRouteRenderer::render(const RenderPlan& plan, const std::string& title) const
{
    Projection proj(plan, width_, height_);
    std::ostringstream out;
    out << std::fixed << std::setprecision(2);

    out << "<!DOCTYPE html>\n<html>\n<head>\n<meta charset=\"utf-8\">\n"
        << "<title>" << escape_xml(title) << "</title>\n</head>\n<body>\n";
    out << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << width_
        << "\" height=\"" << height_ << "\" viewBox=\"0 0 " << width_ << " " << height_ << "\">\n";
    out << "<rect width=\"100%\" height=\"100%\" fill=\"#f4f4f0\"/>\n";

    if (plan.stops.size() > 1) {
        out << "<polyline class=\"route\" fill=\"none\" stroke=\"red\" stroke-width=\"3\" stroke-opacity=\"0.8\" points=\"";
        for (size_t i = 0; i < plan.stops.size(); i++) {
            if (i) out << ' ';
            out << proj.x(plan.stops[i].coord) << ',' << proj.y(plan.stops[i].coord);
        }
        out << "\"/>\n";

        for (const auto& seg : plan.segments) {
            out << "<circle class=\"segment\" cx=\"" << proj.x(seg.midpoint) << "\" cy=\"" << proj.y(seg.midpoint)
                << "\" r=\"3\" fill=\"black\"><title>" << seg.distance_km << " km</title></circle>\n";
        }
    }

    for (size_t i = 0; i < plan.stops.size(); i++) {
        const auto& s = plan.stops[i];
        out << "<circle class=\"stop\" cx=\"" << proj.x(s.coord) << "\" cy=\"" << proj.y(s.coord)
            << "\" r=\"8\" fill=\"" << stop_color(s.role) << "\"><title>Stop " << (i + 1) << ": "
            << escape_xml(s.location) << "</title></circle>\n";
        out << "<text x=\"" << proj.x(s.coord) + 10 << "\" y=\"" << proj.y(s.coord) - 10
            << "\" font-size=\"12\">Stop " << (i + 1) << "</text>\n";
    }

    out << "</svg>\n</body>\n</html>\n";
    return out.str();
}

std::optional<std::string> render_route(const RouteRenderer& renderer,
                                        const Geocache& geocache,
                                        const std::vector<std::string>& route,
                                        const std::string& title)
{
    auto plan = build_render_plan(geocache, route);
    if (!plan) return std::nullopt;
    return renderer.render(*plan, title);
}
