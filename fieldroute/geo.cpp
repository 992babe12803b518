#include "geo.hpp"
#include <algorithm>

static constexpr double kDegreeToRadian = 0.017453292519943295;

double haversine_km(const LatLon& a, const LatLon& b)
{
    double lat1 = a.lat * kDegreeToRadian;
    double lon1 = a.lon * kDegreeToRadian;
    double lat2 = b.lat * kDegreeToRadian;
    double lon2 = b.lon * kDegreeToRadian;

    double dlat = lat2 - lat1;
    double dlon = lon2 - lon1;

    double h = std::sin(dlat / 2) * std::sin(dlat / 2) +
               std::cos(lat1) * std::cos(lat2) * std::sin(dlon / 2) * std::sin(dlon / 2);
    // rounding can push h past 1 for antipodal points
    h = std::min(1.0, std::max(0.0, h));
    double c = 2 * std::atan2(std::sqrt(h), std::sqrt(1 - h));
    return kEarthRadiusKm * c;
}

double round2(double value)
{
    return std::round(value * 100.0) / 100.0;
}

LatLon midpoint(const LatLon& a, const LatLon& b)
{
    return LatLon((a.lat + b.lat) / 2.0, (a.lon + b.lon) / 2.0);
}

bool valid_latlon(double lat, double lon)
{
    if (!std::isfinite(lat) || !std::isfinite(lon)) return false;
    return lat >= -90.0 && lat <= 90.0 && lon >= -180.0 && lon <= 180.0;
}
