#include "assignment.hpp"
#include <unordered_map>
using namespace std;
using json = nlohmann::json;

static unordered_map<string, vector<string>> group_by_problem(const vector<Ticket>& tickets)
{
    unordered_map<string, vector<string>> by_problem;
    for (auto &t : tickets) {
        if (t.location.empty()) continue;
        string problem = normalize_text(t.problem_occured);
        if (problem.empty()) continue;
        by_problem[problem].push_back(t.location);
    }
    return by_problem;
}

vector<Assignment> assign_locations(
    const vector<Employee>& employees,
    const vector<Ticket>& tickets
) {
    vector<Assignment> assignments;
    auto by_problem = group_by_problem(tickets);

    for (auto &emp : employees) {
        if (!is_available(emp.availability)) continue;

        auto it = by_problem.find(normalize_text(emp.problem_occured));
        if (it == by_problem.end() || it->second.empty()) continue;

        Assignment a;
        a.e_id = emp.e_id;
        a.name = emp.name;
        a.problem_occured = emp.problem_occured;
        a.assigned_locations = it->second;
        assignments.push_back(a);
    }
    return assignments;
}

optional<Assignment> find_assignment_by_id(
    const vector<Assignment>& assignments,
    const string& e_id
) {
    for (auto &a : assignments) {
        if (a.e_id == e_id) return a;
    }
    return nullopt;
}

optional<Assignment> find_assignment_by_name(
    const vector<Assignment>& assignments,
    const string& name
) {
    string wanted = normalize_text(name);
    for (auto &a : assignments) {
        if (normalize_text(a.name) == wanted) return a;
    }
    return nullopt;
}

json to_json(const Assignment& a)
{
    return {
        {"e_id", a.e_id},
        {"name", a.name},
        {"problem_occured", a.problem_occured},
        {"assigned_locations", a.assigned_locations}
    };
}
