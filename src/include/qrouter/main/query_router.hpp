#pragma once

#include "qrouter/common/common.hpp"
#include "qrouter/common/enums/query_type.hpp"
#include "qrouter/main/client_context.hpp"
#include "qrouter/main/query_engine.hpp"
#include "qrouter/main/query_result.hpp"
#include "qrouter/planner/plan_node.hpp"

namespace qrouter {

//! Couples a QueryType to one of two engines and is the single entry point callers use instead of
//! talking to the engines directly. Holds no mutable state; a single instance may be shared by any
//! number of threads. The router does not own the engines: they must outlive it.
class QueryRouter {
public:
    QueryRouter(QueryEngine &transactional, QueryEngine &analytical);

    QueryRouter(const QueryRouter &) = delete;
    QueryRouter &operator=(const QueryRouter &) = delete;

    //! Classifies `query` and executes it on exactly one engine. TRANSACTIONAL goes to the
    //! transactional engine, ANALYTICAL and HYBRID to the analytical engine. When
    //! `with_explanation` is set the plan explanation is attached to the result.
    //! Throws CancellationException if the context is already interrupted (no engine is invoked),
    //! EngineExecutionException if the engine fails.
    QueryResult RouteQuery(ClientContext &context, const string &query, const vector<Value> &args,
                           bool with_explanation = false) const;
    QueryResult RouteQuery(ClientContext &context, const string &query, bool with_explanation = false) const;

    //! Executes a caller-supplied plan. A Scan root prefers the transactional engine, any other root
    //! the analytical engine; if the preferred engine declines the plan and the other accepts it, the
    //! other engine runs it. Throws PlanningException if neither accepts it.
    QueryResult RouteWithPlan(ClientContext &context, const PlanNode &plan) const;

    //! The plan explanation for `query`; never executes anything
    string ExplainQuery(ClientContext &context, const string &query) const;
    QueryType ClassifyQuery(const string &query) const;

    //! Query type, execution plan and target engine as a multi-line report
    string DescribeRouting(const string &query) const;

    //! The engine a query of the given type is dispatched to
    QueryEngine &SelectEngine(QueryType type) const;

    QueryEngine &GetTransactionalEngine() const {
        return transactional;
    }
    QueryEngine &GetAnalyticalEngine() const {
        return analytical;
    }

private:
    QueryEngine &transactional;
    QueryEngine &analytical;

    QueryResult Dispatch(ClientContext &context, QueryType type, QueryEngine &engine, const string &query,
                         const vector<Value> &args) const;
};

} // namespace qrouter
