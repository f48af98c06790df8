#pragma once

#include "qrouter/common/common.hpp"

namespace qrouter {

//! Workload class of a single query string
enum class QueryType : uint8_t {
    TRANSACTIONAL = 0, // point lookups and mutations
    ANALYTICAL = 1,    // aggregation, sorting, limited scans
    HYBRID = 2         // joins; executed by the analytical engine
};

string QueryTypeToString(QueryType type);

} // namespace qrouter
