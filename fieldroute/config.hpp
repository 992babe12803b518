#pragma once
#include <optional>
#include <string>
#include <vector>
#include "nlohmann/json.hpp"

// Candidate file lists, each scanned in order, first usable file wins.
struct EngineConfig {
    std::vector<std::string> geocache_paths;
    std::vector<std::string> employee_paths;
    std::vector<std::string> ticket_paths;
    std::optional<std::string> default_depot;
};

// Relative paths are resolved against base_dir.
EngineConfig config_from_json(const nlohmann::json &j, const std::string &base_dir);

bool load_config(const std::string &file, EngineConfig &config);
