#include "qrouter/main/query_router.hpp"
#include "qrouter/common/exception.hpp"
#include "qrouter/parser/query_features.hpp"
#include "qrouter/planner/query_classifier.hpp"
#include "qrouter/planner/query_planner.hpp"

namespace qrouter {

QueryRouter::QueryRouter(QueryEngine &transactional_p, QueryEngine &analytical_p)
    : transactional(transactional_p), analytical(analytical_p) {
    if (&transactional == &analytical) {
        throw InvalidInputException("the transactional and analytical engines must be distinct instances");
    }
}

QueryEngine &QueryRouter::SelectEngine(QueryType type) const {
    switch (type) {
    case QueryType::TRANSACTIONAL:
        return transactional;
    case QueryType::ANALYTICAL:
    case QueryType::HYBRID:
        // the analytical engine is the capability superset for joins and aggregation
        return analytical;
    }
    throw InternalException("unhandled query type in SelectEngine");
}

QueryResult QueryRouter::RouteQuery(ClientContext &context, const string &query, bool with_explanation) const {
    return RouteQuery(context, query, vector<Value>(), with_explanation);
}

QueryResult QueryRouter::RouteQuery(ClientContext &context, const string &query, const vector<Value> &args,
                                    bool with_explanation) const {
    context.CheckInterrupted("before dispatch");

    auto features = QueryFeatureExtractor::Extract(query);
    auto type = QueryClassifier::Classify(features);
    auto result = Dispatch(context, type, SelectEngine(type), query, args);
    if (with_explanation) {
        auto plan = QueryPlanner::Plan(features);
        result.plan_explanation = QueryPlanner::ExplainPlan(*plan);
    }
    return result;
}

QueryResult QueryRouter::Dispatch(ClientContext &context, QueryType type, QueryEngine &engine, const string &query,
                                  const vector<Value> &args) const {
    QueryResult result;
    try {
        result = engine.Execute(context, query, args);
    } catch (const CancellationException &) {
        throw;
    } catch (const std::exception &e) {
        throw EngineExecutionException(type, engine.GetName(), e.what());
    }
    if (result.engine_name.empty()) {
        result.engine_name = engine.GetName();
    }
    return result;
}

QueryResult QueryRouter::RouteWithPlan(ClientContext &context, const PlanNode &plan) const {
    context.CheckInterrupted("before dispatch");

    auto &preferred = plan.type == PlanNodeType::SCAN ? transactional : analytical;
    auto &other = &preferred == &transactional ? analytical : transactional;

    QueryEngine *engine;
    if (preferred.CanExecutePlan(plan)) {
        engine = &preferred;
    } else if (other.CanExecutePlan(plan)) {
        engine = &other;
    } else {
        throw PlanningException("no engine accepts a plan rooted at " + plan.GetTypeName());
    }

    auto type = QueryClassifier::ClassifyPlan(plan);
    QueryResult result;
    try {
        result = engine->ExecuteWithPlan(context, plan);
    } catch (const CancellationException &) {
        throw;
    } catch (const PlanningException &) {
        throw;
    } catch (const std::exception &e) {
        throw EngineExecutionException(type, engine->GetName(), e.what());
    }
    if (result.engine_name.empty()) {
        result.engine_name = engine->GetName();
    }
    return result;
}

string QueryRouter::ExplainQuery(ClientContext &context, const string &query) const {
    auto plan = QueryPlanner::Plan(query);
    return QueryPlanner::ExplainPlan(*plan);
}

QueryType QueryRouter::ClassifyQuery(const string &query) const {
    return QueryClassifier::Classify(query);
}

string QueryRouter::DescribeRouting(const string &query) const {
    auto features = QueryFeatureExtractor::Extract(query);
    auto type = QueryClassifier::Classify(features);
    auto plan = QueryPlanner::Plan(features);

    string report = "Query Type: " + QueryTypeToString(type) + "\n";
    report += "\nExecution Plan:\n";
    report += QueryPlanner::ExplainPlan(*plan, "  ");
    report += "\nRouting: ";
    switch (type) {
    case QueryType::TRANSACTIONAL:
        report += "Query will be executed on the transactional engine (" + transactional.GetName() + ").\n";
        break;
    case QueryType::ANALYTICAL:
        report += "Query will be executed on the analytical engine (" + analytical.GetName() + ").\n";
        break;
    case QueryType::HYBRID:
        report += "Join query will be executed on the analytical engine (" + analytical.GetName() + ").\n";
        break;
    }
    return report;
}

} // namespace qrouter
