#pragma once

#include "qrouter/common/common.hpp"
#include "qrouter/common/types/value.hpp"
#include "qrouter/main/client_context.hpp"
#include "qrouter/main/query_result.hpp"
#include "qrouter/planner/plan_node.hpp"

namespace qrouter {

//! A backing execution engine. Implementations adapt their native result shape into QueryResult
//! and report failures by throwing (EngineException, ConnectionException, CancellationException).
//! Engines may be called from many threads at once and serialize internally where they must.
class QueryEngine {
public:
    virtual ~QueryEngine() = default;

    //! Executes `query`, binding `args` as positional parameters
    virtual QueryResult Execute(ClientContext &context, const string &query, const vector<Value> &args) = 0;
    QueryResult Execute(ClientContext &context, const string &query) {
        return Execute(context, query, vector<Value>());
    }
    //! Executes a (possibly caller-built) plan
    virtual QueryResult ExecuteWithPlan(ClientContext &context, const PlanNode &plan) = 0;
    //! Stable name used for diagnostics only
    virtual string GetName() const = 0;

    //! Whether this engine accepts `plan` for ExecuteWithPlan
    virtual bool CanExecutePlan(const PlanNode &plan) const {
        return true;
    }
    virtual bool IsAvailable() {
        return true;
    }
    virtual string GetEngineInfo() {
        return GetName();
    }
};

} // namespace qrouter
