#include "geocache.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

static bool parse_point(const json &value, LatLon &out)
{
    if (!value.is_array() || value.size() != 2) return false;
    if (!value[0].is_number() || !value[1].is_number()) return false;

    double lat = value[0].get<double>();
    double lon = value[1].get<double>();
    if (!valid_latlon(lat, lon)) return false;

    out = LatLon(lat, lon);
    return true;
}

bool Geocache::loadFromJson(const json &j)
{
    if (!j.is_object()) return false;

    std::unordered_map<std::string, LatLon> parsed;
    parsed.reserve(j.size());

    for (auto it = j.begin(); it != j.end(); ++it) {
        LatLon p;
        if (!parse_point(it.value(), p)) {
            std::cerr << "Geocache entry '" << it.key() << "' is not a [lat, lon] pair\n";
            return false;
        }
        parsed[it.key()] = p;
    }

    points.swap(parsed);
    return true;
}

bool Geocache::loadFromFile(const std::string &path)
{
    std::ifstream fin(path);
    if (!fin) {
        std::cerr << "Could not open geocache file: " << path << "\n";
        return false;
    }

    json j;
    try {
        fin >> j;
    } catch (const std::exception &e) {
        std::cerr << "Error parsing geocache " << path << ": " << e.what() << "\n";
        return false;
    }

    if (!loadFromJson(j)) return false;
    source_path = path;
    return true;
}

Geocache Geocache::loadFirst(const std::vector<std::string> &candidates)
{
    for (const auto &path : candidates) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) continue;

        Geocache cache;
        if (cache.loadFromFile(path)) return cache;
        std::cerr << "Skipping geocache candidate " << path << "\n";
    }
    return Geocache();
}

std::optional<LatLon> Geocache::lookup(const std::string &location) const
{
    auto it = points.find(location);
    if (it == points.end()) return std::nullopt;
    return it->second;
}

bool Geocache::contains(const std::string &location) const
{
    return points.find(location) != points.end();
}
