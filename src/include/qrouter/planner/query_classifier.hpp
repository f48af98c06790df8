#pragma once

#include "qrouter/common/common.hpp"
#include "qrouter/common/enums/query_type.hpp"
#include "qrouter/parser/query_features.hpp"

namespace qrouter {

class PlanNode;

//! Assigns a QueryType to query text. Total and deterministic: every input, including
//! malformed SQL, resolves to a type.
class QueryClassifier {
public:
    static QueryType Classify(const string &query);
    //! Rules are priority-ordered and the first match wins:
    //! mutation > join > grouping/aggregates > ORDER BY > top-level LIMIT > plain select
    static QueryType Classify(const QueryFeatures &features);
    //! Workload class implied by an already built plan: any join makes it HYBRID,
    //! a bare scan is TRANSACTIONAL, everything else ANALYTICAL
    static QueryType ClassifyPlan(const PlanNode &plan);
};

} // namespace qrouter
