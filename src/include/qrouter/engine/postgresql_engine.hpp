#pragma once

#include "qrouter/main/query_engine.hpp"

#include <mutex>

namespace qrouter {

//! Transactional engine backed by a PostgreSQL server through libpq.
//! A single connection is shared and guarded by a mutex; it is re-established on demand.
class PostgreSQLEngine : public QueryEngine {
public:
    explicit PostgreSQLEngine(const string &connection_string, const string &name = "PostgreSQL");
    ~PostgreSQLEngine() override;

    using QueryEngine::Execute;
    QueryResult Execute(ClientContext &context, const string &query, const vector<Value> &args) override;
    QueryResult ExecuteWithPlan(ClientContext &context, const PlanNode &plan) override;
    string GetName() const override {
        return name;
    }
    bool IsAvailable() override;
    string GetEngineInfo() override;

private:
    string connection_string;
    string name;
    void *conn; // PGconn* (forward declaration to avoid libpq dependency in header)
    std::mutex lock;

    //! Verifies the connection, resetting or reopening it when needed. Caller holds `lock`
    bool TestConnection();
    bool ConnectToDatabase();
    void DisconnectFromDatabase();
    //! Runs a statement whose result is discarded; throws EngineException on failure
    void RunCommand(const string &command);
};

} // namespace qrouter
