#include "qrouter/planner/query_classifier.hpp"
#include "qrouter/planner/plan_node.hpp"

namespace qrouter {

QueryType QueryClassifier::Classify(const string &query) {
    return Classify(QueryFeatureExtractor::Extract(query));
}

QueryType QueryClassifier::Classify(const QueryFeatures &features) {
    if (features.is_mutation) {
        return QueryType::TRANSACTIONAL;
    }
    if (features.has_join) {
        return QueryType::HYBRID;
    }
    if (features.HasAggregation()) {
        return QueryType::ANALYTICAL;
    }
    if (features.has_orderby) {
        return QueryType::ANALYTICAL;
    }
    if (features.has_limit) {
        return QueryType::ANALYTICAL;
    }
    // simple SELECT ... [WHERE ...], or anything unrecognized: the cheapest assumption
    return QueryType::TRANSACTIONAL;
}

QueryType QueryClassifier::ClassifyPlan(const PlanNode &plan) {
    if (plan.Contains(PlanNodeType::JOIN)) {
        return QueryType::HYBRID;
    }
    if (plan.type == PlanNodeType::SCAN) {
        return QueryType::TRANSACTIONAL;
    }
    return QueryType::ANALYTICAL;
}

} // namespace qrouter
