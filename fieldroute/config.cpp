#include "config.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>

using json = nlohmann::json;
namespace fs = std::filesystem;

static std::vector<std::string> path_list(const json &j, const char *key,
                                          const char *fallback, const fs::path &base)
{
    std::vector<std::string> raw;
    if (j.contains(key)) {
        const auto &v = j[key];
        if (v.is_string()) {
            raw.push_back(v.get<std::string>());
        } else if (v.is_array()) {
            for (const auto &p : v) {
                if (p.is_string()) raw.push_back(p.get<std::string>());
            }
        }
    }
    if (raw.empty()) raw.push_back(fallback);

    std::vector<std::string> out;
    for (const auto &p : raw) {
        fs::path path(p);
        if (path.is_relative()) path = base / path;
        out.push_back(path.lexically_normal().string());
    }
    return out;
}

EngineConfig config_from_json(const json &j, const std::string &base_dir)
{
    fs::path base(base_dir);

    EngineConfig config;
    config.geocache_paths = path_list(j, "geocache", "geocache_hyd.json", base);
    config.employee_paths = path_list(j, "employees", "employees.json", base);
    config.ticket_paths = path_list(j, "tickets", "customers_data.json", base);

    if (j.contains("default_depot") && j["default_depot"].is_string())
        config.default_depot = j["default_depot"].get<std::string>();
    return config;
}

bool load_config(const std::string &file, EngineConfig &config)
{
    std::ifstream fin(file);
    if (!fin) {
        std::cerr << "Could not open config file: " << file << "\n";
        return false;
    }

    json j;
    try {
        fin >> j;
    } catch (const std::exception &e) {
        std::cerr << "Error parsing config JSON: " << e.what() << "\n";
        return false;
    }

    if (!j.is_object()) {
        std::cerr << "Config must be a JSON object: " << file << "\n";
        return false;
    }

    config = config_from_json(j, fs::path(file).parent_path().string());
    return true;
}
