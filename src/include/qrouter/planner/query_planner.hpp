#pragma once

#include "qrouter/common/common.hpp"
#include "qrouter/parser/query_features.hpp"
#include "qrouter/planner/plan_node.hpp"

namespace qrouter {

//! Builds logical plans from query text without touching any engine
class QueryPlanner {
public:
    //! Plans `query`. Never fails for text the classifier accepts, which is all text.
    static unique_ptr<PlanNode> Plan(const string &query);
    //! Builds the plan from already extracted features. Nesting, innermost first:
    //! Scan, Join, Aggregation, Sort, Limit; only the applicable wrappers are added.
    static unique_ptr<PlanNode> Plan(const QueryFeatures &features);

    //! Renders one line per node; children are indented two spaces deeper than their parent
    static string ExplainPlan(const PlanNode &plan, const string &indent = "");
};

} // namespace qrouter
