#include "model.h"
#include "errors.h"
#include "fields.h"
#include "json_io.h"

namespace vrpeasy
{

    Model::Model()
        : vehicle_types_({fields::vehicle_type::kId, ModelErrorCode::kAddVehicleType,
                          ModelErrorCode::kDeleteVehicleType, ModelErrorCode::kMinVehicleTypes}),
          points_({fields::point::kId, ModelErrorCode::kAddPoint, ModelErrorCode::kDeletePoint,
                   ModelErrorCode::kMinPoints, kMaxPoints}),
          links_({fields::link::kName, ModelErrorCode::kAddLink, ModelErrorCode::kDeleteLink,
                  ModelErrorCode::kMinLinks})
    {
    }

    // ---------- vehicle types ----------
    void Model::add_vehicle_type(const VehicleTypeSpec &spec)
    {
        if (vehicle_types_.contains(spec.id))
            throw ModelError(ModelErrorCode::kAddVehicleType, std::to_string(spec.id));
        vehicle_types_.insert(spec.id,
                              VehicleType(spec.id, spec.start_point_id, spec.end_point_id, spec.name,
                                          spec.capacity, spec.fixed_cost, spec.var_cost_dist,
                                          spec.var_cost_time, spec.max_number, spec.tw_begin, spec.tw_end));
    }

    void Model::delete_vehicle_type(int id)
    {
        vehicle_types_.erase(id);
    }

    // ---------- points ----------
    void Model::add_point(const PointSpec &spec)
    {
        if (points_.contains(spec.id))
            throw ModelError(ModelErrorCode::kAddPoint, std::to_string(spec.id));
        points_.insert(spec.id,
                       Point(spec.id, spec.name, spec.id_customer, spec.penalty_or_cost, spec.service_time,
                             spec.tw_begin, spec.tw_end, spec.demand_or_capacity,
                             spec.incompatible_vehicles));
    }

    void Model::delete_point(int id)
    {
        points_.erase(id);
    }

    void Model::add_customer(const CustomerSpec &spec)
    {
        if (points_.contains(spec.id))
            throw ModelError(ModelErrorCode::kAddPoint, std::to_string(spec.id));
        points_.insert(spec.id,
                       make_customer(spec.id, spec.name, spec.id_customer, spec.penalty, spec.service_time,
                                     spec.tw_begin, spec.tw_end, spec.demand, spec.incompatible_vehicles));
    }

    void Model::delete_customer(int id)
    {
        delete_point(id);
    }

    void Model::add_depot(const DepotSpec &spec)
    {
        PointSpec p;
        p.id = spec.id;
        p.name = spec.name;
        p.id_customer = Point::kDepotCustomerId;
        p.service_time = spec.service_time;
        p.penalty_or_cost = spec.cost;
        p.tw_begin = spec.tw_begin;
        p.tw_end = spec.tw_end;
        p.demand_or_capacity = spec.capacity;
        p.incompatible_vehicles = spec.incompatible_vehicles;
        add_point(p);
    }

    void Model::delete_depot(int id)
    {
        delete_point(id);
    }

    // ---------- links ----------
    void Model::add_link(const LinkSpec &spec)
    {
        if (links_.contains(spec.name))
            throw ModelError(ModelErrorCode::kAddLink, spec.name);
        links_.insert(spec.name, Link(spec.name, spec.is_directed, spec.start_point_id, spec.end_point_id,
                                      spec.distance, spec.time, spec.fixed_cost));
    }

    void Model::delete_link(const std::string &name)
    {
        links_.erase(name);
    }

    // ---------- request document ----------
    json Model::to_json(bool debug) const
    {
        json j = json::object();
        j[fields::kPoints] = points_.materialize(debug);
        j[fields::kVehicleTypes] = vehicle_types_.materialize(debug);
        j[fields::kLinks] = links_.materialize(debug);
        j[fields::kParameters] = parameters_.to_json(debug);
        return j;
    }

    std::string Model::to_string() const
    {
        return to_json(false).dump(1);
    }

    void Model::export_to(const std::string &name) const
    {
        const json full = to_json(true);
        try
        {
            save_json(name + ".json", full);
        }
        catch (const std::exception &e)
        {
            throw ModelError(ModelErrorCode::kExport, e.what());
        }
    }

    // ---------- engine ----------
    const Solution &Model::solve(EngineOptions options)
    {
        options.cplex_path = parameters_.cplex_path();
        EngineBinding engine(std::move(options));
        engine.load();

        const std::string request = to_string();
        const std::string response = engine.solve(request);
        try
        {
            solution_ = Solution::parse(response);
        }
        catch (const json::exception &e)
        {
            throw ModelError(ModelErrorCode::kEngineInvocation, std::string("malformed response: ") + e.what());
        }
        return solution_;
    }

} // namespace vrpeasy
