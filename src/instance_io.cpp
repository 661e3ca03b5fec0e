#include "instance_io.h"
#include "errors.h"
#include "fields.h"
#include "json_io.h"

#include <cstdint>
#include <limits>

namespace vrpeasy
{
    namespace vt = fields::vehicle_type;
    namespace pt = fields::point;
    namespace lk = fields::link;
    namespace pr = fields::parameters;

    [[noreturn]] static void wrong_type(const char *key, const char *expected)
    {
        throw ValidationError(key, ValidationKind::kType, std::string("must be ") + expected);
    }

    // JSON integers are 64-bit; anything outside int is rejected, not wrapped.
    static int narrow_int(const json &v, const char *key)
    {
        const bool fits = v.is_number_unsigned()
                              ? v.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
                              : v.get<std::int64_t>() >= std::numeric_limits<int>::min() &&
                                    v.get<std::int64_t>() <= std::numeric_limits<int>::max();
        if (!fits)
            throw ValidationError(key, ValidationKind::kRange, "does not fit a 32-bit integer");
        return static_cast<int>(v.get<std::int64_t>());
    }

    // ---------- typed member readers ----------
    static int read_int(const json &obj, const char *key, int def)
    {
        if (!obj.contains(key))
            return def;
        const auto &v = obj.at(key);
        if (!v.is_number_integer())
            wrong_type(key, "an integer");
        return narrow_int(v, key);
    }

    static double read_number(const json &obj, const char *key, double def)
    {
        if (!obj.contains(key))
            return def;
        const auto &v = obj.at(key);
        if (!v.is_number())
            wrong_type(key, "a number");
        return v.get<double>();
    }

    static std::string read_string(const json &obj, const char *key, const std::string &def)
    {
        if (!obj.contains(key))
            return def;
        const auto &v = obj.at(key);
        if (!v.is_string())
            wrong_type(key, "a string");
        return v.get<std::string>();
    }

    static bool read_bool(const json &obj, const char *key, bool def)
    {
        if (!obj.contains(key))
            return def;
        const auto &v = obj.at(key);
        if (!v.is_boolean())
            wrong_type(key, "a boolean");
        return v.get<bool>();
    }

    static std::vector<int> read_int_list(const json &obj, const char *key)
    {
        std::vector<int> out;
        if (!obj.contains(key))
            return out;
        const auto &v = obj.at(key);
        if (!v.is_array())
            wrong_type(key, "a list of integers");
        for (const auto &x : v)
        {
            if (!x.is_number_integer())
                wrong_type(key, "a list of integers");
            out.push_back(narrow_int(x, key));
        }
        return out;
    }

    static const json &read_array(const json &doc, const char *key)
    {
        static const json empty = json::array();
        if (!doc.contains(key))
            return empty;
        const auto &v = doc.at(key);
        if (!v.is_array())
            wrong_type(key, "a list");
        return v;
    }

    static void require_object(const json &j, const char *what)
    {
        if (!j.is_object())
            wrong_type(what, "an object");
    }

    // ---------- entities ----------
    static VehicleTypeSpec parse_vehicle_type(const json &j)
    {
        require_object(j, fields::kVehicleTypes);
        VehicleTypeSpec s;
        s.id = read_int(j, vt::kId, s.id);
        s.start_point_id = read_int(j, vt::kStartPointId, 0);
        s.end_point_id = read_int(j, vt::kEndPointId, 0);
        s.name = read_string(j, vt::kName, "");
        s.capacity = read_int(j, vt::kCapacity, 0);
        s.fixed_cost = read_number(j, vt::kFixedCost, 0.0);
        s.var_cost_dist = read_number(j, vt::kVarCostDist, 0.0);
        s.var_cost_time = read_number(j, vt::kVarCostTime, 0.0);
        // compact documents leave out a zero max_number
        s.max_number = read_int(j, vt::kMaxNumber, 0);
        s.tw_begin = read_number(j, vt::kTwBegin, 0.0);
        s.tw_end = read_number(j, vt::kTwEnd, 0.0);
        return s;
    }

    static PointSpec parse_point(const json &j)
    {
        require_object(j, fields::kPoints);
        PointSpec s;
        s.id = read_int(j, pt::kId, 0);
        s.name = read_string(j, pt::kName, "");
        s.id_customer = read_int(j, pt::kIdCustomer, 0);
        s.service_time = read_number(j, pt::kServiceTime, 0.0);
        s.penalty_or_cost = read_number(j, pt::kPenaltyOrCost, 0.0);
        s.tw_begin = read_number(j, pt::kTwBegin, 0.0);
        s.tw_end = read_number(j, pt::kTwEnd, 0.0);
        s.demand_or_capacity = read_int(j, pt::kDemandOrCapacity, 0);
        s.incompatible_vehicles = read_int_list(j, pt::kIncompatibleVehicles);

        if (j.contains(pt::kTimeWindows))
        {
            const auto &tw = j.at(pt::kTimeWindows);
            if (!tw.is_array() || tw.size() != 2)
                throw ValidationError(pt::kTimeWindows, ValidationKind::kTuple, "must be a pair [begin, end]");
            if (!tw[0].is_number() || !tw[1].is_number())
                wrong_type(pt::kTwBegin, "a number");
            s.tw_begin = tw[0].get<double>();
            s.tw_end = tw[1].get<double>();
        }
        return s;
    }

    static LinkSpec parse_link(const json &j)
    {
        require_object(j, fields::kLinks);
        LinkSpec s;
        s.name = read_string(j, lk::kName, "");
        s.is_directed = read_bool(j, lk::kIsDirected, false);
        s.start_point_id = read_int(j, lk::kStartPointId, 0);
        s.end_point_id = read_int(j, lk::kEndPointId, 0);
        s.distance = read_number(j, lk::kDistance, 0.0);
        s.time = read_number(j, lk::kTime, 0.0);
        s.fixed_cost = read_number(j, lk::kFixedCost, 0.0);
        return s;
    }

    void apply_parameters(const json &j, Parameters &p)
    {
        require_object(j, fields::kParameters);
        p.set_time_limit(read_number(j, pr::kTimeLimit, p.time_limit()));
        p.set_upper_bound(read_number(j, pr::kUpperBound, p.upper_bound()));
        p.set_heuristic_used(read_bool(j, pr::kHeuristicUsed, p.heuristic_used()));
        p.set_time_limit_heuristic(read_number(j, pr::kTimeLimitHeuristic, p.time_limit_heuristic()));
        p.set_config_file(read_string(j, pr::kConfigFile, p.config_file()));
        p.set_solver_name(read_string(j, pr::kSolverName, p.solver_name()));
        p.set_print_level(read_int(j, pr::kPrintLevel, p.print_level()));
        p.set_action(read_string(j, pr::kAction, p.action()));
        p.set_cplex_path(read_string(j, pr::kCplexPath, p.cplex_path()));
    }

    Model load_model(const json &doc)
    {
        require_object(doc, "instance");
        Model model;
        for (const auto &j : read_array(doc, fields::kVehicleTypes))
            model.add_vehicle_type(parse_vehicle_type(j));
        for (const auto &j : read_array(doc, fields::kPoints))
            model.add_point(parse_point(j));
        for (const auto &j : read_array(doc, fields::kLinks))
            model.add_link(parse_link(j));

        if (doc.contains(fields::kParameters))
        {
            Parameters p;
            apply_parameters(doc.at(fields::kParameters), p);
            model.set_parameters(std::move(p));
        }
        return model;
    }

    Model load_model_file(const std::string &path)
    {
        return load_model(load_json(path));
    }

} // namespace vrpeasy
