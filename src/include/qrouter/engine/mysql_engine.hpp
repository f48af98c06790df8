#pragma once

#include "qrouter/main/query_engine.hpp"

#include <mutex>

namespace qrouter {

struct MySQLConnectionInfo {
    string host = "127.0.0.1";
    uint16_t port = 3306;
    string user = "root";
    string password;
    string database;
};

//! Transactional engine backed by a MySQL server through libmysqlclient.
//! Positional `?` parameters are bound client side as escaped literals.
class MySQLEngine : public QueryEngine {
public:
    explicit MySQLEngine(MySQLConnectionInfo info, const string &name = "MySQL");
    ~MySQLEngine() override;

    using QueryEngine::Execute;
    QueryResult Execute(ClientContext &context, const string &query, const vector<Value> &args) override;
    QueryResult ExecuteWithPlan(ClientContext &context, const PlanNode &plan) override;
    string GetName() const override {
        return name;
    }
    bool IsAvailable() override;
    string GetEngineInfo() override;

private:
    MySQLConnectionInfo info;
    string name;
    void *conn; // MYSQL*
    std::mutex lock;

    bool Connect();
    void Disconnect();
    void RunCommand(const string &command);
    string BindParameters(const string &query, const vector<Value> &args);
};

} // namespace qrouter
