// solution.h
#pragma once
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace vrpeasy
{

using json = nlohmann::json;

// Status codes reported by the engine.
enum StatusCode
{
    kNotSolved = 0,
    kInputError = 1,
    kTimeLimitNoSolution = 2,
    kOptimalSolutionFound = 3,
    kBetterSolutionFound = 4,
    kSolutionFoundTimeLimit = 5,
    kInfeasible = 6,
    kEngineError = 7,
    kFeasibleRoutesEnumerated = 8
};

// Codes for which the engine ran an optimization and reports bounds/statistics.
inline bool in_solved_range(int code)
{
    return code >= kOptimalSolutionFound && code <= kSolutionFoundTimeLimit;
}

inline bool carries_routes(int code)
{
    return in_solved_range(code) || code == kFeasibleRoutesEnumerated;
}

class Statistics
{
public:
    Statistics() = default;
    explicit Statistics(const json &j);

    bool empty() const { return empty_; }

    double solution_time() const { return solution_time_; }
    double solution_value() const { return solution_value_; }
    double best_lb() const { return best_lb_; }
    double root_lb() const { return root_lb_; }
    double root_time() const { return root_time_; }
    int nb_branch_and_bound_nodes() const { return nb_branch_and_bound_nodes_; }

    const json &raw() const { return raw_; }

private:
    bool empty_ = true;
    double solution_time_ = 0.0;
    double solution_value_ = 0.0;
    double best_lb_ = 0.0;
    double root_lb_ = 0.0;
    double root_time_ = 0.0;
    int nb_branch_and_bound_nodes_ = 0;
    json raw_;
};

// One vehicle's tour. The per-visit sequences are index aligned.
class Route
{
public:
    explicit Route(const json &j);

    int vehicle_type_id() const { return vehicle_type_id_; }
    double route_cost() const { return route_cost_; }
    std::size_t size() const { return point_ids_.size(); }

    const std::vector<int> &point_ids() const { return point_ids_; }
    const std::vector<std::string> &point_names() const { return point_names_; }
    const std::vector<double> &cap_consumption() const { return cap_consumption_; }
    const std::vector<double> &time_consumption() const { return time_consumption_; }
    const std::vector<std::string> &incoming_arc_names() const { return incoming_arc_names_; }

    const json &raw() const { return raw_; }

private:
    int vehicle_type_id_ = 0;
    double route_cost_ = 0.0;
    std::vector<int> point_ids_;
    std::vector<std::string> point_names_;
    std::vector<double> cap_consumption_;
    std::vector<double> time_consumption_;
    std::vector<std::string> incoming_arc_names_;
    json raw_;
};

// Parsed engine response. Statistics are filled only for solved-range codes,
// routes for solved-range codes and enumerated routes; both stay empty otherwise.
// Malformed or empty documents raise nlohmann::json exceptions. A default
// Solution stands for a model that was never solved.
class Solution
{
public:
    Solution() = default;
    explicit Solution(const json &response);
    static Solution parse(const std::string &response_text);

    int status() const { return status_; }
    const std::string &message() const { return message_; }
    const Statistics &statistics() const { return statistics_; }
    const std::vector<Route> &routes() const { return routes_; }

    const json &document() const { return document_; }
    std::string to_string() const;

    // Writes <name>.json with the whole response document.
    void export_to(const std::string &name = "instance") const;

private:
    int status_ = kNotSolved;
    std::string message_;
    Statistics statistics_;
    std::vector<Route> routes_;
    json document_ = json::object();
};

} // namespace vrpeasy
