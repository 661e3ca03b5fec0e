// fields.h
#pragma once

// Member names of the engine's request/response documents.
namespace vrpeasy::fields
{

// ---------- request root ----------
inline constexpr const char *kVehicleTypes = "VehicleTypes";
inline constexpr const char *kPoints = "Points";
inline constexpr const char *kLinks = "Links";
inline constexpr const char *kParameters = "Parameters";

namespace vehicle_type
{
inline constexpr const char *kId = "id";
inline constexpr const char *kStartPointId = "startPointId";
inline constexpr const char *kEndPointId = "endPointId";
inline constexpr const char *kName = "name";
inline constexpr const char *kCapacity = "capacity";
inline constexpr const char *kFixedCost = "fixedCost";
inline constexpr const char *kVarCostDist = "varCostDist";
inline constexpr const char *kVarCostTime = "varCostTime";
inline constexpr const char *kMaxNumber = "maxNumber";
inline constexpr const char *kTwBegin = "twBegin";
inline constexpr const char *kTwEnd = "twEnd";
} // namespace vehicle_type

namespace point
{
inline constexpr const char *kId = "id";
inline constexpr const char *kName = "name";
inline constexpr const char *kIdCustomer = "idCustomer";
inline constexpr const char *kServiceTime = "serviceTime";
inline constexpr const char *kTwBegin = "twBegin";
inline constexpr const char *kTwEnd = "twEnd";
inline constexpr const char *kTimeWindows = "timeWindows";
inline constexpr const char *kPenaltyOrCost = "penaltyOrCost";
inline constexpr const char *kDemandOrCapacity = "demandOrCapacity";
inline constexpr const char *kIncompatibleVehicles = "incompatibleVehicles";
// aliases used by the customer/depot views
inline constexpr const char *kPenalty = "penalty";
inline constexpr const char *kCost = "cost";
inline constexpr const char *kDemand = "demand";
inline constexpr const char *kCapacity = "capacity";
} // namespace point

namespace link
{
inline constexpr const char *kName = "name";
inline constexpr const char *kIsDirected = "isDirected";
inline constexpr const char *kStartPointId = "startPointId";
inline constexpr const char *kEndPointId = "endPointId";
inline constexpr const char *kDistance = "distance";
inline constexpr const char *kTime = "time";
inline constexpr const char *kFixedCost = "fixedCost";
} // namespace link

namespace parameters
{
inline constexpr const char *kTimeLimit = "timeLimit";
inline constexpr const char *kUpperBound = "upperBound";
inline constexpr const char *kHeuristicUsed = "heuristicUsed";
inline constexpr const char *kTimeLimitHeuristic = "timeLimitHeuristic";
inline constexpr const char *kConfigFile = "configFile";
inline constexpr const char *kSolverName = "solverName";
inline constexpr const char *kPrintLevel = "printLevel";
inline constexpr const char *kAction = "action";
inline constexpr const char *kCplexPath = "cplexPath";
} // namespace parameters

// ---------- response ----------
inline constexpr const char *kStatus = "Status";
inline constexpr const char *kStatistics = "Statistics";
inline constexpr const char *kSolution = "Solution";

namespace status
{
inline constexpr const char *kCode = "code";
inline constexpr const char *kMessage = "message";
} // namespace status

namespace statistics
{
inline constexpr const char *kSolutionTime = "solutionTime";
inline constexpr const char *kSolutionValue = "solutionValue";
inline constexpr const char *kBestLowerBound = "bestLB";
inline constexpr const char *kRootLowerBound = "rootLB";
inline constexpr const char *kRootTime = "rootTime";
inline constexpr const char *kNbBranchAndBoundNodes = "nbBranchAndBoundNodes";
} // namespace statistics

namespace route
{
inline constexpr const char *kVehicleTypeId = "vehicleTypeId";
inline constexpr const char *kRouteCost = "routeCost";
inline constexpr const char *kVisitedPoints = "visitedPoints";
inline constexpr const char *kPointId = "pointId";
inline constexpr const char *kPointName = "pointName";
inline constexpr const char *kLoad = "load";
inline constexpr const char *kTime = "time";
inline constexpr const char *kIncomingArcName = "incomingArcName";
} // namespace route

} // namespace vrpeasy::fields
