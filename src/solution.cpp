#include "solution.h"
#include "errors.h"
#include "fields.h"
#include "json_io.h"

namespace vrpeasy
{
    namespace st = fields::statistics;
    namespace rt = fields::route;

    Statistics::Statistics(const json &j)
        : empty_(false),
          solution_time_(j.at(st::kSolutionTime).get<double>()),
          solution_value_(j.at(st::kSolutionValue).get<double>()),
          best_lb_(j.at(st::kBestLowerBound).get<double>()),
          root_lb_(j.at(st::kRootLowerBound).get<double>()),
          root_time_(j.at(st::kRootTime).get<double>()),
          nb_branch_and_bound_nodes_(j.at(st::kNbBranchAndBoundNodes).get<int>()),
          raw_(j)
    {
    }

    Route::Route(const json &j)
        : vehicle_type_id_(j.at(rt::kVehicleTypeId).get<int>()),
          route_cost_(j.at(rt::kRouteCost).get<double>()),
          raw_(j)
    {
        const auto &visits = j.at(rt::kVisitedPoints);
        point_ids_.reserve(visits.size());
        point_names_.reserve(visits.size());
        cap_consumption_.reserve(visits.size());
        time_consumption_.reserve(visits.size());
        incoming_arc_names_.reserve(visits.size());
        for (const auto &visit : visits)
        {
            point_ids_.push_back(visit.at(rt::kPointId).get<int>());
            point_names_.push_back(visit.at(rt::kPointName).get<std::string>());
            cap_consumption_.push_back(visit.at(rt::kLoad).get<double>());
            time_consumption_.push_back(visit.at(rt::kTime).get<double>());
            incoming_arc_names_.push_back(visit.at(rt::kIncomingArcName).get<std::string>());
        }
    }

    Solution::Solution(const json &response) : document_(response)
    {
        const auto &status = response.at(fields::kStatus);
        status_ = status.at(fields::status::kCode).get<int>();
        message_ = status.at(fields::status::kMessage).get<std::string>();

        if (in_solved_range(status_))
            statistics_ = Statistics(response.at(fields::kStatistics));

        if (carries_routes(status_) && response.contains(fields::kSolution))
        {
            const auto &routes = response.at(fields::kSolution);
            routes_.reserve(routes.size());
            for (const auto &r : routes)
                routes_.emplace_back(r);
        }
    }

    Solution Solution::parse(const std::string &response_text)
    {
        return Solution(json::parse(response_text));
    }

    std::string Solution::to_string() const
    {
        return document_.dump(1);
    }

    void Solution::export_to(const std::string &name) const
    {
        try
        {
            save_json(name + ".json", document_);
        }
        catch (const std::exception &e)
        {
            throw ModelError(ModelErrorCode::kExport, e.what());
        }
    }

} // namespace vrpeasy
