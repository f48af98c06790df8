#pragma once

#include "qrouter/main/query_engine.hpp"

namespace duckdb {
class DuckDB;
class Connection;
} // namespace duckdb

namespace qrouter {

//! Analytical engine backed by an embedded DuckDB database.
//! Every call opens its own duckdb::Connection, so concurrent callers do not serialize.
class DuckDBEngine : public QueryEngine {
public:
    //! `path` is a database file, or ":memory:" for a private in-memory database
    explicit DuckDBEngine(const string &path = ":memory:", const string &name = "DuckDB");
    ~DuckDBEngine() override;

    using QueryEngine::Execute;
    QueryResult Execute(ClientContext &context, const string &query, const vector<Value> &args) override;
    QueryResult ExecuteWithPlan(ClientContext &context, const PlanNode &plan) override;
    string GetName() const override {
        return name;
    }
    bool IsAvailable() override;
    string GetEngineInfo() override;

private:
    string path;
    string name;
    unique_ptr<duckdb::DuckDB> database;

    QueryResult RunQuery(ClientContext &context, duckdb::Connection &con, const string &query,
                         const vector<Value> &args);
};

} // namespace qrouter
