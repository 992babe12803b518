#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "nlohmann/json.hpp"
#include "geo.hpp"

// Read-only lookup table from location key to coordinate.
class Geocache {
public:
    Geocache() = default;

    // Scans the candidates in order and keeps the first file that loads.
    // Returns an empty cache when none does.
    static Geocache loadFirst(const std::vector<std::string> &candidates);

    // Expects {"<location>": [lat, lon], ...}. On any malformed entry the
    // cache is left unchanged and false is returned.
    bool loadFromJson(const nlohmann::json &j);
    bool loadFromFile(const std::string &path);

    std::optional<LatLon> lookup(const std::string &location) const;
    bool contains(const std::string &location) const;

    size_t size() const { return points.size(); }
    bool empty() const { return points.empty(); }
    const std::string &source() const { return source_path; }

private:
    std::unordered_map<std::string, LatLon> points;
    std::string source_path;
};
