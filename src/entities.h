// entities.h
#pragma once
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace vrpeasy
{

using json = nlohmann::json;

// ---------- VehicleType ----------
// A class of identical vehicles. id 0 is reserved, so ids start at 1.
// max_number is the number of vehicles available of this type.
class VehicleType
{
public:
    VehicleType(int id,
                int start_point_id,
                int end_point_id,
                std::string name = std::string(),
                int capacity = 0,
                double fixed_cost = 0.0,
                double var_cost_dist = 0.0,
                double var_cost_time = 0.0,
                int max_number = 1,
                double tw_begin = 0.0,
                double tw_end = 0.0);

    int key() const { return id_; }

    int id() const { return id_; }
    int start_point_id() const { return start_point_id_; }
    int end_point_id() const { return end_point_id_; }
    const std::string &name() const { return name_; }
    int capacity() const { return capacity_; }
    double fixed_cost() const { return fixed_cost_; }
    double var_cost_dist() const { return var_cost_dist_; }
    double var_cost_time() const { return var_cost_time_; }
    int max_number() const { return max_number_; }
    double tw_begin() const { return tw_begin_; }
    double tw_end() const { return tw_end_; }

    void set_id(int id);
    void set_start_point_id(int start_point_id);
    void set_end_point_id(int end_point_id);
    void set_name(std::string name) { name_ = std::move(name); }
    void set_capacity(int capacity);
    void set_fixed_cost(double fixed_cost) { fixed_cost_ = fixed_cost; }
    void set_var_cost_dist(double var_cost_dist) { var_cost_dist_ = var_cost_dist; }
    void set_var_cost_time(double var_cost_time) { var_cost_time_ = var_cost_time; }
    void set_max_number(int max_number);
    void set_tw_begin(double tw_begin) { tw_begin_ = tw_begin; }
    void set_tw_end(double tw_end) { tw_end_ = tw_end; }

    // Wire form; only non-default fields unless debug.
    json to_json(bool debug = false) const;

private:
    int id_ = 1;
    int start_point_id_ = 0;
    int end_point_id_ = 0;
    std::string name_;
    int capacity_ = 0;
    double fixed_cost_ = 0.0;
    double var_cost_dist_ = 0.0;
    double var_cost_time_ = 0.0;
    int max_number_ = 0;
    double tw_begin_ = 0.0;
    double tw_end_ = 0.0;
};

// ---------- Point ----------
// A depot or a customer. penalty_or_cost is the penalty for leaving a customer
// unvisited, or the cost of using a depot; demand_or_capacity is the customer
// demand or the depot capacity. begin <= end on the time window is not checked.
class Point
{
public:
    static constexpr int kMaxId = 10000;
    static constexpr int kMaxCustomerId = 1022;
    static constexpr int kDepotCustomerId = 0;

    explicit Point(int id,
                   std::string name = std::string(),
                   int id_customer = 0,
                   double penalty_or_cost = 0.0,
                   double service_time = 0.0,
                   double tw_begin = 0.0,
                   double tw_end = 0.0,
                   int demand_or_capacity = 0,
                   std::vector<int> incompatible_vehicles = {});

    int key() const { return id_; }

    int id() const { return id_; }
    const std::string &name() const { return name_; }
    int id_customer() const { return id_customer_; }
    bool is_depot() const { return id_customer_ == kDepotCustomerId; }
    double service_time() const { return service_time_; }
    double tw_begin() const { return tw_begin_; }
    double tw_end() const { return tw_end_; }
    std::pair<double, double> time_windows() const { return {tw_begin_, tw_end_}; }
    double penalty_or_cost() const { return penalty_or_cost_; }
    int demand_or_capacity() const { return demand_or_capacity_; }
    const std::vector<int> &incompatible_vehicles() const { return incompatible_vehicles_; }

    // customer / depot views of the shared fields
    double penalty() const { return penalty_or_cost_; }
    double cost() const { return penalty_or_cost_; }
    int demand() const { return demand_or_capacity_; }
    int capacity() const { return demand_or_capacity_; }

    void set_id(int id);
    void set_name(std::string name) { name_ = std::move(name); }
    void set_id_customer(int id_customer);
    void set_service_time(double service_time) { service_time_ = service_time; }
    void set_tw_begin(double tw_begin) { tw_begin_ = tw_begin; }
    void set_tw_end(double tw_end) { tw_end_ = tw_end; }
    void set_time_windows(std::pair<double, double> tw);
    void set_penalty_or_cost(double value) { penalty_or_cost_ = value; }
    void set_penalty(double penalty) { penalty_or_cost_ = penalty; }
    void set_cost(double cost) { penalty_or_cost_ = cost; }
    void set_demand_or_capacity(int value);
    void set_demand(int demand);
    void set_capacity(int capacity);
    void set_incompatible_vehicles(std::vector<int> vehicle_type_ids);

    json to_json(bool debug = false) const;

private:
    void set_shared_quantity(int value, const char *field);

    int id_ = 0;
    std::string name_;
    int id_customer_ = 0;
    double service_time_ = 0.0;
    double tw_begin_ = 0.0;
    double tw_end_ = 0.0;
    double penalty_or_cost_ = 0.0;
    int demand_or_capacity_ = 0;
    std::vector<int> incompatible_vehicles_;
};

// Customer preset. id_customer == 0 means "use the point id".
Point make_customer(int id,
                    std::string name = std::string(),
                    int id_customer = 0,
                    double penalty = 0.0,
                    double service_time = 0.0,
                    double tw_begin = 0.0,
                    double tw_end = 0.0,
                    int demand = 0,
                    std::vector<int> incompatible_vehicles = {});

// Depot preset; id_customer is always the depot sentinel.
Point make_depot(int id,
                 std::string name = std::string(),
                 double cost = 0.0,
                 double service_time = 0.0,
                 double tw_begin = 0.0,
                 double tw_end = 0.0,
                 int capacity = 0,
                 std::vector<int> incompatible_vehicles = {});

// ---------- Link ----------
// An arc (is_directed) or an edge between two points.
class Link
{
public:
    explicit Link(std::string name = std::string(),
                  bool is_directed = false,
                  int start_point_id = 0,
                  int end_point_id = 0,
                  double distance = 0.0,
                  double time = 0.0,
                  double fixed_cost = 0.0);

    const std::string &key() const { return name_; }

    const std::string &name() const { return name_; }
    bool is_directed() const { return is_directed_; }
    int start_point_id() const { return start_point_id_; }
    int end_point_id() const { return end_point_id_; }
    double distance() const { return distance_; }
    double time() const { return time_; }
    double fixed_cost() const { return fixed_cost_; }

    void set_name(std::string name) { name_ = std::move(name); }
    void set_is_directed(bool is_directed) { is_directed_ = is_directed; }
    void set_start_point_id(int start_point_id);
    void set_end_point_id(int end_point_id);
    void set_distance(double distance);
    void set_time(double time);
    void set_fixed_cost(double fixed_cost) { fixed_cost_ = fixed_cost; }

    json to_json(bool debug = false) const;

private:
    std::string name_;
    bool is_directed_ = false;
    int start_point_id_ = 0;
    int end_point_id_ = 0;
    double distance_ = 0.0;
    double time_ = 0.0;
    double fixed_cost_ = 0.0;
};

// ---------- Parameters ----------
namespace solvers
{
inline constexpr const char *kClp = "CLP";
inline constexpr const char *kCplex = "CPLEX";
} // namespace solvers

namespace actions
{
inline constexpr const char *kSolve = "solve";
inline constexpr const char *kEnumAllFeasibleRoutes = "enumAllFeasibleRoutes";
} // namespace actions

const std::vector<std::string> &legal_solver_names();
const std::vector<int> &legal_print_levels();
const std::vector<std::string> &legal_actions();

// Solver settings. upper_bound is a cutoff hint for the engine, config_file
// points at an advanced engine configuration and cplex_path at an alternate
// backend library loaded by the binding before the engine.
class Parameters
{
public:
    static constexpr double kDefaultTimeLimit = 300;
    static constexpr double kDefaultUpperBound = 1000000;
    static constexpr double kDefaultTimeLimitHeuristic = 20;
    static constexpr int kDefaultPrintLevel = -1;

    Parameters(double time_limit = kDefaultTimeLimit,
               double upper_bound = kDefaultUpperBound,
               bool heuristic_used = false,
               double time_limit_heuristic = kDefaultTimeLimitHeuristic,
               std::string config_file = std::string(),
               std::string solver_name = solvers::kClp,
               int print_level = kDefaultPrintLevel,
               std::string action = actions::kSolve,
               std::string cplex_path = std::string());

    double time_limit() const { return time_limit_; }
    double upper_bound() const { return upper_bound_; }
    bool heuristic_used() const { return heuristic_used_; }
    double time_limit_heuristic() const { return time_limit_heuristic_; }
    const std::string &config_file() const { return config_file_; }
    const std::string &solver_name() const { return solver_name_; }
    int print_level() const { return print_level_; }
    const std::string &action() const { return action_; }
    const std::string &cplex_path() const { return cplex_path_; }

    void set_time_limit(double time_limit);
    void set_upper_bound(double upper_bound) { upper_bound_ = upper_bound; }
    void set_heuristic_used(bool heuristic_used) { heuristic_used_ = heuristic_used; }
    void set_time_limit_heuristic(double time_limit_heuristic);
    void set_config_file(std::string config_file) { config_file_ = std::move(config_file); }
    void set_solver_name(std::string solver_name);
    void set_print_level(int print_level);
    void set_action(std::string action);
    void set_cplex_path(std::string cplex_path) { cplex_path_ = std::move(cplex_path); }

    // cplex_path is consumed by the binding and only written in debug mode.
    json to_json(bool debug = false) const;

private:
    double time_limit_ = kDefaultTimeLimit;
    double upper_bound_ = kDefaultUpperBound;
    bool heuristic_used_ = false;
    double time_limit_heuristic_ = kDefaultTimeLimitHeuristic;
    std::string config_file_;
    std::string solver_name_ = solvers::kClp;
    int print_level_ = kDefaultPrintLevel;
    std::string action_ = actions::kSolve;
    std::string cplex_path_;
};

} // namespace vrpeasy
