#include "qrouter/common/enums/query_type.hpp"
#include "qrouter/common/enums/plan_node_type.hpp"

namespace qrouter {

string QueryTypeToString(QueryType type) {
    switch (type) {
    case QueryType::TRANSACTIONAL:
        return "Transactional";
    case QueryType::ANALYTICAL:
        return "Analytical";
    case QueryType::HYBRID:
        return "Hybrid";
    }
    return "Unknown";
}

string PlanNodeTypeToString(PlanNodeType type) {
    switch (type) {
    case PlanNodeType::SCAN:
        return "Scan";
    case PlanNodeType::JOIN:
        return "Join";
    case PlanNodeType::AGGREGATION:
        return "Aggregation";
    case PlanNodeType::SORT:
        return "Sort";
    case PlanNodeType::LIMIT:
        return "Limit";
    }
    return "Unknown";
}

string JoinKindToString(JoinKind kind) {
    switch (kind) {
    case JoinKind::INNER:
        return "Inner";
    case JoinKind::LEFT:
        return "Left";
    case JoinKind::RIGHT:
        return "Right";
    case JoinKind::FULL:
        return "Full";
    }
    return "Unknown";
}

} // namespace qrouter
