#pragma once
#include <optional>
#include <string>
#include <vector>
#include "nlohmann/json.hpp"

struct Employee {
    std::string e_id;
    std::string name;
    std::string skill;
    std::string problem_occured;
    std::string availability;   // free text, see is_available()
};

struct Ticket {
    std::string username;
    std::string ticket_number;
    std::string location;
    std::string contact;
    std::string problem_occured;
};

// Trimmed and lower-cased.
std::string normalize_text(const std::string &s);

// yes / true / 1 / available / y, any case, surrounding spaces ignored.
bool is_available(const std::string &availability);

// Flexible availability filter: a truthy or falsy desired value matches the
// whole token class, anything else is a substring match. Empty matches all.
bool availability_matches(const std::string &availability, const std::string &desired);

Employee employee_from_json(const nlohmann::json &j);
Ticket ticket_from_json(const nlohmann::json &j);
nlohmann::json to_json(const Employee &e);
nlohmann::json to_json(const Ticket &t);

// Accept a bare array, or an object holding it under "employees" / "customers".
std::vector<Employee> employees_from_json(const nlohmann::json &j);
std::vector<Ticket> tickets_from_json(const nlohmann::json &j);

// First candidate that exists and parses wins; empty list otherwise.
std::vector<Employee> load_employees(const std::vector<std::string> &candidates);
std::vector<Ticket> load_tickets(const std::vector<std::string> &candidates);

std::vector<Employee> filter_employees(const std::vector<Employee> &employees,
                                       const std::string &problem,
                                       const std::string &availability,
                                       const std::string &skill);

// Plain listing: every given filter must equal the field after trim and
// lower-casing. No filters returns everything.
std::vector<Employee> list_employees(const std::vector<Employee> &employees,
                                     const std::optional<std::string> &availability,
                                     const std::optional<std::string> &skill,
                                     const std::optional<std::string> &problem);

std::vector<Ticket> filter_tickets(const std::vector<Ticket> &tickets,
                                   const std::optional<std::string> &username,
                                   const std::optional<std::string> &ticket_number);
