#pragma once
#include <cmath>

struct LatLon {
    double lat;
    double lon;
    LatLon() : lat(0.0), lon(0.0) {}
    LatLon(double latitude, double longitude) : lat(latitude), lon(longitude) {}

    bool operator==(const LatLon& other) const {
        return lat == other.lat && lon == other.lon;
    }
    bool operator!=(const LatLon& other) const { return !(*this == other); }
};

constexpr double kEarthRadiusKm = 6371.0;

// Great-circle distance in kilometers, inputs in degrees.
double haversine_km(const LatLon& a, const LatLon& b);

// Rounds half away from zero to two decimals.
double round2(double value);

LatLon midpoint(const LatLon& a, const LatLon& b);

bool valid_latlon(double lat, double lon);
