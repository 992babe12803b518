#include "dispatch.hpp"
#include <iostream>

using json = nlohmann::json;

static json error_result(const std::string &code, const std::string &message)
{
    json result;
    result["error"] = message;
    result["code"] = code;
    return result;
}

// String or number field of the query; nullopt when absent, null or empty.
static std::optional<std::string> query_text(const json &query, const char *key)
{
    if (!query.contains(key)) return std::nullopt;
    const auto &v = query[key];
    std::string s;
    if (v.is_string()) s = v.get<std::string>();
    else if (v.is_number()) s = v.dump();
    else return std::nullopt;

    if (s.empty()) return std::nullopt;
    return s;
}

Dispatcher::Dispatcher(const EngineConfig &config, const Geocache &geocache,
                       const RouteRenderer &renderer)
    : config(config), geocache(geocache), renderer(renderer) {}

json Dispatcher::process_query(const json &query) const
{
    json result;
    try {
        if (!query.is_object() || !query.contains("type") || !query["type"].is_string()) {
            result = error_result("invalid_request", "Query must carry a string 'type'");
        } else {
            result = handle(query["type"].get<std::string>(), query);
        }
    } catch (const std::exception &e) {
        result = error_result("internal", e.what());
    }

    if (query.is_object() && query.contains("id")) result["id"] = query["id"];
    return result;
}

json Dispatcher::handle(const std::string &type, const json &query) const
{
    if (type == "assignments") return list_assignments();
    if (type == "optimized_route") return employee_route(query, true, false, false);
    if (type == "optimized_map") return employee_route(query, false, true, true);
    if (type == "assign_locations") return employee_route(query, true, true, false);
    if (type == "filter_employees") return employees_filter(query);
    if (type == "list_employees") return employees_list(query);
    if (type == "list_tickets") return tickets_list(query);

    return error_result("unknown_query", "Unknown query type: " + type);
}

json Dispatcher::list_assignments() const
{
    auto assignments = assign_locations(load_employees(config.employee_paths),
                                        load_tickets(config.ticket_paths));
    json arr = json::array();
    for (auto &a : assignments) arr.push_back(to_json(a));

    json result;
    result["assignments"] = arr;
    return result;
}

json Dispatcher::employee_route(const json &query, bool with_route, bool with_map,
                                bool map_required) const
{
    auto e_id = query_text(query, "e_id");
    auto name = query_text(query, "name");
    if (!e_id && !name)
        return error_result("invalid_request", "Provide e_id or name");

    auto employees = load_employees(config.employee_paths);
    if (employees.empty()) return error_result("no_data", "No employee data found");
    auto tickets = load_tickets(config.ticket_paths);
    if (tickets.empty()) return error_result("no_data", "No customer data found");

    auto assignments = assign_locations(employees, tickets);
    auto found = e_id ? find_assignment_by_id(assignments, *e_id)
                      : find_assignment_by_name(assignments, *name);
    if (!found)
        return error_result("employee_not_found", "Employee not found or no assigned locations");

    auto depot = query_text(query, "depot");
    if (!depot) depot = config.default_depot;

    PlannedRoute planned = plan_route(geocache, found->assigned_locations, depot);

    if (planned.route.empty()) {
        json result = error_result("no_route", "No assigned location has known coordinates");
        result["e_id"] = found->e_id;
        result["name"] = found->name;
        result["dropped_locations"] = planned.dropped;
        return result;
    }

    if (!planned.dropped.empty()) {
        std::cerr << "Employee " << found->e_id << ": " << planned.dropped.size()
                  << " location(s) without coordinates dropped\n";
    }

    json result;
    result["e_id"] = found->e_id;
    result["name"] = found->name;
    result["distance_km"] = planned.distance_km;
    result["dropped_locations"] = planned.dropped;
    if (with_route) result["route"] = planned.route;

    if (with_map) {
        auto html = render_route(renderer, geocache, planned.route, found->name);
        if (html) {
            result["map_html"] = *html;
        } else if (map_required) {
            return error_result("render_failed", "Failed to generate map (no coordinates)");
        } else {
            result["map_html"] = nullptr;
        }
    }
    return result;
}

json Dispatcher::employees_filter(const json &query) const
{
    auto problem = query_text(query, "problem_occured");
    if (!problem) return error_result("invalid_request", "Please provide problem_occured");

    auto employees = load_employees(config.employee_paths);
    auto filtered = filter_employees(employees, *problem,
                                     query_text(query, "availability").value_or(""),
                                     query_text(query, "skill").value_or(""));

    json arr = json::array();
    for (auto &e : filtered) arr.push_back(to_json(e));

    json result;
    result["employees"] = arr;
    return result;
}

json Dispatcher::employees_list(const json &query) const
{
    auto employees = list_employees(load_employees(config.employee_paths),
                                    query_text(query, "availability"),
                                    query_text(query, "skill"),
                                    query_text(query, "problem_occured"));

    json arr = json::array();
    for (auto &e : employees) arr.push_back(to_json(e));

    json result;
    result["employees"] = arr;
    result["count"] = employees.size();
    return result;
}

json Dispatcher::tickets_list(const json &query) const
{
    auto tickets = filter_tickets(load_tickets(config.ticket_paths),
                                  query_text(query, "username"),
                                  query_text(query, "ticket_number"));

    json arr = json::array();
    for (auto &t : tickets) arr.push_back(to_json(t));

    json result;
    result["customers"] = arr;
    result["count"] = tickets.size();
    return result;
}
