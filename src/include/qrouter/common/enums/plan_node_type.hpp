#pragma once

#include "qrouter/common/common.hpp"

namespace qrouter {

enum class PlanNodeType : uint8_t {
    SCAN = 0,
    JOIN = 1,
    AGGREGATION = 2,
    SORT = 3,
    LIMIT = 4
};

enum class JoinKind : uint8_t {
    INNER = 0,
    LEFT = 1,
    RIGHT = 2,
    FULL = 3
};

string PlanNodeTypeToString(PlanNodeType type);
string JoinKindToString(JoinKind kind);

} // namespace qrouter
