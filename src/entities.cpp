#include "entities.h"
#include "compaction.h"
#include "errors.h"
#include "fields.h"

#include <algorithm>
#include <string>

namespace vrpeasy
{
    namespace vt = fields::vehicle_type;
    namespace pt = fields::point;
    namespace lk = fields::link;
    namespace pr = fields::parameters;

    // ---------- range helpers ----------
    static void require_at_least(int value, int lower, const char *field)
    {
        if (value < lower)
            throw ValidationError(field, ValidationKind::kRange,
                                  "must be greater than or equal to " + std::to_string(lower));
    }

    static void require_non_negative(double value, const char *field)
    {
        if (value < 0)
            throw ValidationError(field, ValidationKind::kRange, "must be greater than or equal to 0");
    }

    static void require_at_most(int value, int upper, const char *field)
    {
        if (value > upper)
            throw ValidationError(field, ValidationKind::kRange,
                                  "must be less than or equal to " + std::to_string(upper));
    }

    // ---------- VehicleType ----------
    VehicleType::VehicleType(int id,
                             int start_point_id,
                             int end_point_id,
                             std::string name,
                             int capacity,
                             double fixed_cost,
                             double var_cost_dist,
                             double var_cost_time,
                             int max_number,
                             double tw_begin,
                             double tw_end)
        : name_(std::move(name)),
          fixed_cost_(fixed_cost),
          var_cost_dist_(var_cost_dist),
          var_cost_time_(var_cost_time),
          tw_begin_(tw_begin),
          tw_end_(tw_end)
    {
        set_id(id);
        set_start_point_id(start_point_id);
        set_end_point_id(end_point_id);
        set_capacity(capacity);
        set_max_number(max_number);
    }

    void VehicleType::set_id(int id)
    {
        require_at_least(id, 1, vt::kId);
        id_ = id;
    }

    void VehicleType::set_start_point_id(int start_point_id)
    {
        require_at_least(start_point_id, 0, vt::kStartPointId);
        start_point_id_ = start_point_id;
    }

    void VehicleType::set_end_point_id(int end_point_id)
    {
        require_at_least(end_point_id, 0, vt::kEndPointId);
        end_point_id_ = end_point_id;
    }

    void VehicleType::set_capacity(int capacity)
    {
        require_at_least(capacity, 0, vt::kCapacity);
        capacity_ = capacity;
    }

    void VehicleType::set_max_number(int max_number)
    {
        require_at_least(max_number, 0, vt::kMaxNumber);
        max_number_ = max_number;
    }

    json VehicleType::to_json(bool debug) const
    {
        FieldWriter w(debug);
        w.always(vt::kId, id_)
            .always(vt::kStartPointId, start_point_id_)
            .always(vt::kEndPointId, end_point_id_)
            .unless_default(vt::kName, name_, "")
            .unless_default(vt::kCapacity, capacity_, 0)
            .unless_default(vt::kFixedCost, fixed_cost_, 0)
            .unless_default(vt::kVarCostDist, var_cost_dist_, 0)
            .unless_default(vt::kVarCostTime, var_cost_time_, 0)
            .unless_default(vt::kMaxNumber, max_number_, 0)
            .unless_default(vt::kTwBegin, tw_begin_, 0)
            .unless_default(vt::kTwEnd, tw_end_, 0);
        return w.release();
    }

    // ---------- Point ----------
    Point::Point(int id,
                 std::string name,
                 int id_customer,
                 double penalty_or_cost,
                 double service_time,
                 double tw_begin,
                 double tw_end,
                 int demand_or_capacity,
                 std::vector<int> incompatible_vehicles)
        : name_(std::move(name)),
          service_time_(service_time),
          tw_begin_(tw_begin),
          tw_end_(tw_end),
          penalty_or_cost_(penalty_or_cost),
          incompatible_vehicles_(std::move(incompatible_vehicles))
    {
        set_id_customer(id_customer);
        set_id(id);
        set_demand_or_capacity(demand_or_capacity);
    }

    void Point::set_id(int id)
    {
        require_at_least(id, 0, pt::kId);
        require_at_most(id, kMaxId, pt::kId);
        id_ = id;
    }

    void Point::set_id_customer(int id_customer)
    {
        require_at_least(id_customer, 0, pt::kIdCustomer);
        require_at_most(id_customer, kMaxCustomerId, pt::kIdCustomer);
        id_customer_ = id_customer;
    }

    void Point::set_time_windows(std::pair<double, double> tw)
    {
        tw_begin_ = tw.first;
        tw_end_ = tw.second;
    }

    void Point::set_shared_quantity(int value, const char *field)
    {
        require_at_least(value, 0, field);
        demand_or_capacity_ = value;
    }

    void Point::set_demand_or_capacity(int value) { set_shared_quantity(value, pt::kDemandOrCapacity); }
    void Point::set_demand(int demand) { set_shared_quantity(demand, pt::kDemand); }
    void Point::set_capacity(int capacity) { set_shared_quantity(capacity, pt::kCapacity); }

    void Point::set_incompatible_vehicles(std::vector<int> vehicle_type_ids)
    {
        incompatible_vehicles_ = std::move(vehicle_type_ids);
    }

    json Point::to_json(bool debug) const
    {
        FieldWriter w(debug);
        w.always(pt::kId, id_)
            .unless_default(pt::kName, name_, "")
            .unless_default(pt::kIdCustomer, id_customer_, 0)
            .unless_default(pt::kServiceTime, service_time_, 0)
            .unless_default(pt::kTwBegin, tw_begin_, 0)
            .unless_default(pt::kTwEnd, tw_end_, 0)
            .unless_default(pt::kPenaltyOrCost, penalty_or_cost_, 0)
            .unless_default(pt::kDemandOrCapacity, demand_or_capacity_, 0)
            .unless_default(pt::kIncompatibleVehicles, incompatible_vehicles_, 0);
        return w.release();
    }

    Point make_customer(int id,
                        std::string name,
                        int id_customer,
                        double penalty,
                        double service_time,
                        double tw_begin,
                        double tw_end,
                        int demand,
                        std::vector<int> incompatible_vehicles)
    {
        const int customer_id = (id_customer == 0) ? id : id_customer;
        Point p(id, std::move(name), customer_id, 0.0, service_time, tw_begin, tw_end, 0,
                std::move(incompatible_vehicles));
        p.set_penalty(penalty);
        p.set_demand(demand);
        return p;
    }

    Point make_depot(int id,
                     std::string name,
                     double cost,
                     double service_time,
                     double tw_begin,
                     double tw_end,
                     int capacity,
                     std::vector<int> incompatible_vehicles)
    {
        Point p(id, std::move(name), Point::kDepotCustomerId, 0.0, service_time, tw_begin, tw_end, 0,
                std::move(incompatible_vehicles));
        p.set_cost(cost);
        p.set_capacity(capacity);
        return p;
    }

    // ---------- Link ----------
    Link::Link(std::string name,
               bool is_directed,
               int start_point_id,
               int end_point_id,
               double distance,
               double time,
               double fixed_cost)
        : name_(std::move(name)),
          is_directed_(is_directed),
          fixed_cost_(fixed_cost)
    {
        set_start_point_id(start_point_id);
        set_end_point_id(end_point_id);
        set_distance(distance);
        set_time(time);
    }

    void Link::set_start_point_id(int start_point_id)
    {
        require_at_least(start_point_id, 0, lk::kStartPointId);
        start_point_id_ = start_point_id;
    }

    void Link::set_end_point_id(int end_point_id)
    {
        require_at_least(end_point_id, 0, lk::kEndPointId);
        end_point_id_ = end_point_id;
    }

    void Link::set_distance(double distance)
    {
        require_non_negative(distance, lk::kDistance);
        distance_ = distance;
    }

    void Link::set_time(double time)
    {
        require_non_negative(time, lk::kTime);
        time_ = time;
    }

    json Link::to_json(bool debug) const
    {
        FieldWriter w(debug);
        w.always(lk::kStartPointId, start_point_id_)
            .always(lk::kEndPointId, end_point_id_)
            .unless_default(lk::kName, name_, "")
            .unless_default(lk::kIsDirected, is_directed_, false)
            .unless_default(lk::kDistance, distance_, 0)
            .unless_default(lk::kTime, time_, 0)
            .unless_default(lk::kFixedCost, fixed_cost_, 0);
        return w.release();
    }

    // ---------- Parameters ----------
    const std::vector<std::string> &legal_solver_names()
    {
        static const std::vector<std::string> names{solvers::kClp, solvers::kCplex};
        return names;
    }

    const std::vector<int> &legal_print_levels()
    {
        static const std::vector<int> levels{-2, -1, 0, 1, 2};
        return levels;
    }

    const std::vector<std::string> &legal_actions()
    {
        static const std::vector<std::string> names{actions::kSolve, actions::kEnumAllFeasibleRoutes};
        return names;
    }

    static void require_member(const std::string &value,
                               const std::vector<std::string> &legal,
                               const char *field)
    {
        if (std::find(legal.begin(), legal.end(), value) == legal.end())
            throw ValidationError(field, ValidationKind::kEnum, "must be one of", legal);
    }

    Parameters::Parameters(double time_limit,
                           double upper_bound,
                           bool heuristic_used,
                           double time_limit_heuristic,
                           std::string config_file,
                           std::string solver_name,
                           int print_level,
                           std::string action,
                           std::string cplex_path)
        : upper_bound_(upper_bound),
          heuristic_used_(heuristic_used),
          config_file_(std::move(config_file)),
          cplex_path_(std::move(cplex_path))
    {
        set_time_limit(time_limit);
        set_time_limit_heuristic(time_limit_heuristic);
        set_solver_name(std::move(solver_name));
        set_print_level(print_level);
        set_action(std::move(action));
    }

    void Parameters::set_time_limit(double time_limit)
    {
        require_non_negative(time_limit, pr::kTimeLimit);
        time_limit_ = time_limit;
    }

    void Parameters::set_time_limit_heuristic(double time_limit_heuristic)
    {
        require_non_negative(time_limit_heuristic, pr::kTimeLimitHeuristic);
        time_limit_heuristic_ = time_limit_heuristic;
    }

    void Parameters::set_solver_name(std::string solver_name)
    {
        require_member(solver_name, legal_solver_names(), pr::kSolverName);
        solver_name_ = std::move(solver_name);
    }

    void Parameters::set_print_level(int print_level)
    {
        const auto &legal = legal_print_levels();
        if (std::find(legal.begin(), legal.end(), print_level) == legal.end())
        {
            std::vector<std::string> names;
            for (int level : legal)
                names.push_back(std::to_string(level));
            throw ValidationError(pr::kPrintLevel, ValidationKind::kEnum, "must be one of", names);
        }
        print_level_ = print_level;
    }

    void Parameters::set_action(std::string action)
    {
        require_member(action, legal_actions(), pr::kAction);
        action_ = std::move(action);
    }

    json Parameters::to_json(bool debug) const
    {
        FieldWriter w(debug);
        w.always(pr::kTimeLimit, time_limit_)
            .always(pr::kAction, action_)
            .unless_default(pr::kUpperBound, upper_bound_, kDefaultUpperBound)
            .unless_default(pr::kHeuristicUsed, heuristic_used_, false)
            .unless_default(pr::kTimeLimitHeuristic, time_limit_heuristic_, kDefaultTimeLimitHeuristic)
            .unless_default(pr::kConfigFile, config_file_, "")
            .unless_default(pr::kSolverName, solver_name_, solvers::kClp)
            .unless_default(pr::kPrintLevel, print_level_, kDefaultPrintLevel);
        if (debug)
            w.always(pr::kCplexPath, cplex_path_);
        return w.release();
    }

} // namespace vrpeasy
