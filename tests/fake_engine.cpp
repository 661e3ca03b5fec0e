// fake_engine.cpp
// Stand-in for the engine library: same entry points and file name, canned
// answers chosen by Parameters.configFile:
//   "throw"    solveModel throws
//   "null"     solveModel returns nullptr
//   "garbage"  response is not JSON
//   "empty"    response is an empty string
//   "timeout"  status 2 (statistics and routes still present in the document)
// Otherwise status 3 with one route through every point, or status 8 when
// the action is enumAllFeasibleRoutes.
#include <cstring>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

#if defined(_WIN32)
#define FAKE_ENGINE_EXPORT __declspec(dllexport)
#else
#define FAKE_ENGINE_EXPORT __attribute__((visibility("default")))
#endif

namespace {

int g_solve_count = 0;
int g_release_count = 0;
std::string g_last_request;

char* copy_out(const std::string& text) {
  char* out = new char[text.size() + 1];
  std::memcpy(out, text.c_str(), text.size() + 1);
  return out;
}

json route_through(const json& points, int vehicle_type_id) {
  json visits = json::array();
  double load = 0.0;
  double time = 0.0;
  int prev = -1;
  for (const auto& p : points) {
    const int id = p.at("id").get<int>();
    load += p.value("demandOrCapacity", 0);
    time += 1.0 + p.value("serviceTime", 0.0);
    visits.push_back({{"pointId", id},
                      {"pointName", p.value("name", std::string())},
                      {"load", load},
                      {"time", time},
                      {"incomingArcName", prev < 0 ? std::string() : std::to_string(prev) + "-" + std::to_string(id)}});
    prev = id;
  }
  return {{"vehicleTypeId", vehicle_type_id}, {"routeCost", 42.5}, {"visitedPoints", visits}};
}

json statistics() {
  return {{"solutionTime", 0.25},
          {"solutionValue", 42.5},
          {"bestLB", 40.0},
          {"rootLB", 39.5},
          {"rootTime", 0.1},
          {"nbBranchAndBoundNodes", 3}};
}

}  // namespace

extern "C" {

FAKE_ENGINE_EXPORT char* solveModel(const char* request) {
  ++g_solve_count;
  g_last_request = request ? request : "";

  const json model = json::parse(g_last_request);
  const json& params = model.at("Parameters");
  const std::string mode = params.value("configFile", std::string());

  if (mode == "throw") throw std::runtime_error("engine crashed");
  if (mode == "null") return nullptr;
  if (mode == "garbage") return copy_out("{\"Status\": {\"code\": 3,");
  if (mode == "empty") return copy_out("");

  const int vehicle_type_id = model.at("VehicleTypes").at(0).at("id").get<int>();
  json response;
  if (mode == "timeout") {
    response["Status"] = {{"code", 2}, {"message", "time limit"}};
    response["Statistics"] = statistics();
    response["Solution"] = json::array({route_through(model.at("Points"), vehicle_type_id)});
  } else if (params.at("action").get<std::string>() == "enumAllFeasibleRoutes") {
    response["Status"] = {{"code", 8}, {"message", "feasible routes enumerated"}};
    response["Solution"] = json::array({route_through(model.at("Points"), vehicle_type_id),
                                        route_through(model.at("Points"), vehicle_type_id)});
  } else {
    response["Status"] = {{"code", 3}, {"message", "optimal solution found"}};
    response["Statistics"] = statistics();
    response["Solution"] = json::array({route_through(model.at("Points"), vehicle_type_id)});
  }
  return copy_out(response.dump());
}

FAKE_ENGINE_EXPORT void freeMemory(char* response) {
  ++g_release_count;
  delete[] response;
}

// ---- test hooks ----
FAKE_ENGINE_EXPORT int fakeEngineSolveCount() { return g_solve_count; }
FAKE_ENGINE_EXPORT int fakeEngineReleaseCount() { return g_release_count; }
FAKE_ENGINE_EXPORT const char* fakeEngineLastRequest() { return g_last_request.c_str(); }

}  // extern "C"
