// model.h
#pragma once
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "engine.h"
#include "entities.h"
#include "registry.h"
#include "solution.h"

namespace vrpeasy
{

using json = nlohmann::json;

using VehicleTypeRegistry = Registry<int, VehicleType>;
using PointRegistry = Registry<int, Point>;
using LinkRegistry = Registry<std::string, Link>;

// The engine format cannot address more points than this.
inline constexpr std::size_t kMaxPoints = 1022;

// ---------- add_* arguments (all fields defaulted, as the engine expects) ----------
struct VehicleTypeSpec
{
    int id = 1;
    int start_point_id = 0;
    int end_point_id = 0;
    std::string name;
    int capacity = 0;
    double fixed_cost = 0.0;
    double var_cost_dist = 0.0;
    double var_cost_time = 0.0;
    int max_number = 1;
    double tw_begin = 0.0;
    double tw_end = 0.0;
};

// Generic point. id_customer 0 makes it a depot; otherwise it must be <= 1022.
struct PointSpec
{
    int id = 0;
    std::string name;
    int id_customer = 0;
    double service_time = 0.0;
    double penalty_or_cost = 0.0;
    double tw_begin = 0.0;
    double tw_end = 0.0;
    int demand_or_capacity = 0;
    std::vector<int> incompatible_vehicles;
};

// id_customer left at 0 takes the point id.
struct CustomerSpec
{
    int id = 0;
    std::string name;
    int id_customer = 0;
    double service_time = 0.0;
    double penalty = 0.0;
    double tw_begin = 0.0;
    double tw_end = 0.0;
    int demand = 0;
    std::vector<int> incompatible_vehicles;
};

struct DepotSpec
{
    int id = 0;
    std::string name;
    double service_time = 0.0;
    double cost = 0.0;
    double tw_begin = 0.0;
    double tw_end = 0.0;
    int capacity = 0;
    std::vector<int> incompatible_vehicles;
};

struct LinkSpec
{
    std::string name;
    bool is_directed = false;
    int start_point_id = 0;
    int end_point_id = 0;
    double distance = 0.0;
    double time = 0.0;
    double fixed_cost = 0.0;
};

// A routing problem: vehicle types, points, links and solver parameters,
// plus the solution of the last solve().
class Model
{
public:
    Model();

    void add_vehicle_type(const VehicleTypeSpec &spec);
    void delete_vehicle_type(int id);

    void add_point(const PointSpec &spec);
    void delete_point(int id);

    void add_customer(const CustomerSpec &spec);
    void delete_customer(int id);

    void add_depot(const DepotSpec &spec);
    void delete_depot(int id);

    void add_link(const LinkSpec &spec);
    void delete_link(const std::string &name);

    void set_parameters(Parameters parameters) { parameters_ = std::move(parameters); }

    const Parameters &parameters() const { return parameters_; }
    Parameters &parameters() { return parameters_; }

    const VehicleTypeRegistry &vehicle_types() const { return vehicle_types_; }
    VehicleTypeRegistry &vehicle_types() { return vehicle_types_; }
    const PointRegistry &points() const { return points_; }
    PointRegistry &points() { return points_; }
    const LinkRegistry &links() const { return links_; }
    LinkRegistry &links() { return links_; }

    // Request document. Throws ModelError when a registry is empty.
    json to_json(bool debug = false) const;

    // Compact request text as sent to the engine.
    std::string to_string() const;

    // Writes <name>.json with every field (debug form). Diagnostic only.
    void export_to(const std::string &name = "instance") const;

    // Serializes the model, calls the engine and replaces the solution.
    const Solution &solve(EngineOptions options = EngineOptions());

    const Solution &solution() const { return solution_; }

private:
    VehicleTypeRegistry vehicle_types_;
    PointRegistry points_;
    LinkRegistry links_;
    Parameters parameters_;
    Solution solution_;
};

} // namespace vrpeasy
