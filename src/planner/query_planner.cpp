#include "qrouter/planner/query_planner.hpp"
#include "qrouter/common/string_util.hpp"

namespace qrouter {

unique_ptr<PlanNode> QueryPlanner::Plan(const string &query) {
    return Plan(QueryFeatureExtractor::Extract(query));
}

unique_ptr<PlanNode> QueryPlanner::Plan(const QueryFeatures &features) {
    auto plan = make_uniq<PlanNode>();
    if (!features.scan_relation.empty()) {
        plan->SetAttribute("table", features.scan_relation);
    }
    plan->SetAttribute("sql", features.query_text);

    if (features.has_join) {
        auto join = make_uniq<PlanNode>(features.join_kind, std::move(plan));
        join->SetAttribute("table", features.join_relation);
        if (!features.join_condition.empty()) {
            join->SetAttribute("condition", features.join_condition);
        }
        if (features.num_joins > 1) {
            join->SetAttribute("joins", std::to_string(features.num_joins));
        }
        plan = std::move(join);
    }
    if (features.HasAggregation()) {
        auto aggregate = make_uniq<PlanNode>(PlanNodeType::AGGREGATION, std::move(plan));
        aggregate->SetAttribute("aggregates", StringUtil::Join(features.aggregates, ", "));
        if (features.has_groupby) {
            aggregate->SetAttribute("group_by", features.group_by);
        }
        if (!features.having.empty()) {
            aggregate->SetAttribute("having", features.having);
        }
        plan = std::move(aggregate);
    }
    if (features.has_orderby) {
        auto sort = make_uniq<PlanNode>(PlanNodeType::SORT, std::move(plan));
        sort->SetAttribute("order_by", features.order_by);
        plan = std::move(sort);
    }
    if (features.has_limit) {
        auto limit = make_uniq<PlanNode>(PlanNodeType::LIMIT, std::move(plan));
        limit->SetAttribute("count", features.limit_count);
        if (!features.limit_offset.empty()) {
            limit->SetAttribute("offset", features.limit_offset);
        }
        plan = std::move(limit);
    }
    return plan;
}

string QueryPlanner::ExplainPlan(const PlanNode &plan, const string &indent) {
    string result = indent + plan.ToString() + "\n";
    for (auto &child : plan.children) {
        result += ExplainPlan(*child, indent + "  ");
    }
    return result;
}

} // namespace qrouter
