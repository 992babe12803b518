#pragma once
#include "records.hpp"
#include <optional>
#include <string>
#include <vector>

struct Assignment {
    std::string e_id;
    std::string name;
    std::string problem_occured;
    std::vector<std::string> assigned_locations;
};

std::vector<Assignment> assign_locations(
    const std::vector<Employee>& employees,
    const std::vector<Ticket>& tickets
);

std::optional<Assignment> find_assignment_by_id(
    const std::vector<Assignment>& assignments,
    const std::string& e_id
);

std::optional<Assignment> find_assignment_by_name(
    const std::vector<Assignment>& assignments,
    const std::string& name
);

nlohmann::json to_json(const Assignment& a);
