#pragma once
#include "assignment.hpp"
#include "config.hpp"
#include "geocache.hpp"
#include "render.hpp"
#include "route_planner.hpp"
#include "nlohmann/json.hpp"

/**
 * Answers one query object with one result object.
 *
 * Employee and ticket snapshots are re-read from the configured candidate
 * files for every query, so results always reflect what is on disk at the
 * time of the call. Failures are reported in the result as "error" and
 * "code"; nothing escapes process_query.
 */
class Dispatcher {
public:
    Dispatcher(const EngineConfig &config, const Geocache &geocache, const RouteRenderer &renderer);

    nlohmann::json process_query(const nlohmann::json &query) const;

private:
    nlohmann::json handle(const std::string &type, const nlohmann::json &query) const;

    nlohmann::json list_assignments() const;
    nlohmann::json employee_route(const nlohmann::json &query, bool with_route, bool with_map,
                                  bool map_required) const;
    nlohmann::json employees_filter(const nlohmann::json &query) const;
    nlohmann::json employees_list(const nlohmann::json &query) const;
    nlohmann::json tickets_list(const nlohmann::json &query) const;

    const EngineConfig &config;
    const Geocache &geocache;
    const RouteRenderer &renderer;
};
