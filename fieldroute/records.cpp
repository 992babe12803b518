#include "records.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

static const std::vector<std::string> kTruthy = {"yes", "true", "1", "available", "y"};
static const std::vector<std::string> kFalsy = {"no", "false", "0", "n"};

static bool in_set(const std::vector<std::string> &set, const std::string &v)
{
    return std::find(set.begin(), set.end(), v) != set.end();
}

std::string normalize_text(const std::string &s)
{
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) b++;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;

    std::string out = s.substr(b, e - b);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool is_available(const std::string &availability)
{
    return in_set(kTruthy, normalize_text(availability));
}

bool availability_matches(const std::string &availability, const std::string &desired)
{
    std::string want = normalize_text(desired);
    if (want.empty()) return true;

    std::string have = normalize_text(availability);
    if (in_set(kTruthy, want)) return in_set(kTruthy, have);
    if (in_set(kFalsy, want)) return in_set(kFalsy, have);
    return have.find(want) != std::string::npos;
}

// Numbers and booleans are stringified, null and missing become "".
static std::string field(const json &j, const char *key)
{
    if (!j.contains(key)) return "";
    const auto &v = j[key];
    if (v.is_string()) return v.get<std::string>();
    if (v.is_null()) return "";
    return v.dump();
}

Employee employee_from_json(const json &j)
{
    Employee e;
    e.e_id = field(j, "e_id");
    e.name = field(j, "name");
    e.skill = field(j, "skill");
    e.problem_occured = field(j, "problem_occured");
    e.availability = field(j, "availability");
    return e;
}

Ticket ticket_from_json(const json &j)
{
    Ticket t;
    t.username = field(j, "username");
    t.ticket_number = field(j, "ticket_number");
    t.location = field(j, "location");
    t.contact = field(j, "contact");
    t.problem_occured = field(j, "problem_occured");
    return t;
}

json to_json(const Employee &e)
{
    return {
        {"e_id", e.e_id},
        {"name", e.name},
        {"skill", e.skill},
        {"problem_occured", e.problem_occured},
        {"availability", e.availability}
    };
}

json to_json(const Ticket &t)
{
    return {
        {"username", t.username},
        {"ticket_number", t.ticket_number},
        {"location", t.location},
        {"contact", t.contact},
        {"problem_occured", t.problem_occured}
    };
}

static const json *record_list(const json &j, const char *list_key)
{
    if (j.is_array()) return &j;
    if (j.is_object() && j.contains(list_key) && j[list_key].is_array())
        return &j[list_key];
    return nullptr;
}

std::vector<Employee> employees_from_json(const json &j)
{
    std::vector<Employee> out;
    const json *list = record_list(j, "employees");
    if (!list) return out;

    for (const auto &item : *list) {
        if (item.is_object()) out.push_back(employee_from_json(item));
    }
    return out;
}

std::vector<Ticket> tickets_from_json(const json &j)
{
    std::vector<Ticket> out;
    const json *list = record_list(j, "customers");
    if (!list) return out;

    for (const auto &item : *list) {
        if (item.is_object()) out.push_back(ticket_from_json(item));
    }
    return out;
}

static bool read_first_json(const std::vector<std::string> &candidates, json &out)
{
    for (const auto &path : candidates) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) continue;

        std::ifstream fin(path);
        if (!fin) continue;
        try {
            fin >> out;
            return true;
        } catch (const std::exception &e) {
            std::cerr << "Error parsing " << path << ": " << e.what() << "\n";
        }
    }
    return false;
}

std::vector<Employee> load_employees(const std::vector<std::string> &candidates)
{
    json j;
    if (!read_first_json(candidates, j)) return {};
    return employees_from_json(j);
}

std::vector<Ticket> load_tickets(const std::vector<std::string> &candidates)
{
    json j;
    if (!read_first_json(candidates, j)) return {};
    return tickets_from_json(j);
}

std::vector<Employee> filter_employees(const std::vector<Employee> &employees,
                                       const std::string &problem,
                                       const std::string &availability,
                                       const std::string &skill)
{
    std::string want_problem = normalize_text(problem);
    std::string want_skill = normalize_text(skill);

    std::vector<Employee> out;
    for (const auto &e : employees) {
        if (normalize_text(e.problem_occured) != want_problem) continue;
        if (!want_skill.empty() && normalize_text(e.skill) != want_skill) continue;
        if (!availability_matches(e.availability, availability)) continue;
        out.push_back(e);
    }
    return out;
}

static bool field_equals(const std::string &value, const std::optional<std::string> &wanted)
{
    return !wanted || normalize_text(value) == normalize_text(*wanted);
}

std::vector<Employee> list_employees(const std::vector<Employee> &employees,
                                     const std::optional<std::string> &availability,
                                     const std::optional<std::string> &skill,
                                     const std::optional<std::string> &problem)
{
    std::vector<Employee> out;
    for (const auto &e : employees) {
        if (!field_equals(e.availability, availability)) continue;
        if (!field_equals(e.skill, skill)) continue;
        if (!field_equals(e.problem_occured, problem)) continue;
        out.push_back(e);
    }
    return out;
}

std::vector<Ticket> filter_tickets(const std::vector<Ticket> &tickets,
                                   const std::optional<std::string> &username,
                                   const std::optional<std::string> &ticket_number)
{
    std::vector<Ticket> out;
    for (const auto &t : tickets) {
        if (username && t.username != *username) continue;
        if (ticket_number && t.ticket_number != *ticket_number) continue;
        out.push_back(t);
    }
    return out;
}
