#include "qrouter/engine/postgresql_engine.hpp"
#include "qrouter/common/exception.hpp"
#include "qrouter/common/logging.hpp"
#include "qrouter/planner/query_planner.hpp"

#include <chrono>
#include <cstdlib>

extern "C" {
#include <libpq-fe.h>
}

namespace qrouter {

// Type OIDs from pg_type.h; the server catalog headers are not part of the client library
static constexpr Oid BOOLOID = 16;
static constexpr Oid INT8OID = 20;
static constexpr Oid INT2OID = 21;
static constexpr Oid INT4OID = 23;
static constexpr Oid OIDOID = 26;
static constexpr Oid FLOAT4OID = 700;
static constexpr Oid FLOAT8OID = 701;
static constexpr Oid NUMERICOID = 1700;

// SQLSTATE raised when statement_timeout fires or the query is cancelled
static const char *const QUERY_CANCELED_STATE = "57014";

static Value ConvertValue(PGresult *res, int row, int col) {
    if (PQgetisnull(res, row, col)) {
        return Value();
    }
    const char *text = PQgetvalue(res, row, col);
    switch (PQftype(res, col)) {
    case BOOLOID:
        return Value::BOOLEAN(text[0] == 't');
    case INT2OID:
    case INT4OID:
    case INT8OID:
    case OIDOID:
        return Value::BIGINT(std::strtoll(text, nullptr, 10));
    case FLOAT4OID:
    case FLOAT8OID:
    case NUMERICOID:
        return Value::DOUBLE(std::strtod(text, nullptr));
    default:
        return Value(string(text));
    }
}

PostgreSQLEngine::PostgreSQLEngine(const string &connection_string_p, const string &name_p)
    : connection_string(connection_string_p), name(name_p), conn(nullptr) {
    // Initial connection test
    std::lock_guard<std::mutex> guard(lock);
    ConnectToDatabase();
}

PostgreSQLEngine::~PostgreSQLEngine() {
    DisconnectFromDatabase();
}

bool PostgreSQLEngine::ConnectToDatabase() {
    if (conn) {
        DisconnectFromDatabase();
    }

    conn = PQconnectdb(connection_string.c_str());

    if (PQstatus(static_cast<PGconn *>(conn)) != CONNECTION_OK) {
        logW("[" + name + "] connection to PostgreSQL failed: " + PQerrorMessage(static_cast<PGconn *>(conn)));
        PQfinish(static_cast<PGconn *>(conn));
        conn = nullptr;
        return false;
    }
    logD("[" + name + "] connected to PostgreSQL");
    return true;
}

void PostgreSQLEngine::DisconnectFromDatabase() {
    if (conn) {
        PQfinish(static_cast<PGconn *>(conn));
        conn = nullptr;
    }
}

bool PostgreSQLEngine::TestConnection() {
    if (!conn) {
        return ConnectToDatabase();
    }
    if (PQstatus(static_cast<PGconn *>(conn)) == CONNECTION_OK) {
        return true;
    }
    // Try to reconnect
    PQreset(static_cast<PGconn *>(conn));
    if (PQstatus(static_cast<PGconn *>(conn)) == CONNECTION_OK) {
        logI("[" + name + "] connection re-established");
        return true;
    }
    return ConnectToDatabase();
}

void PostgreSQLEngine::RunCommand(const string &command) {
    PGresult *res = PQexec(static_cast<PGconn *>(conn), command.c_str());
    bool ok = PQresultStatus(res) == PGRES_COMMAND_OK;
    PQclear(res);
    if (!ok) {
        throw EngineException("PostgreSQL Error: " + string(PQerrorMessage(static_cast<PGconn *>(conn))));
    }
}

QueryResult PostgreSQLEngine::Execute(ClientContext &context, const string &query, const vector<Value> &args) {
    context.CheckInterrupted("before execution on " + name);

    std::lock_guard<std::mutex> guard(lock);
    if (!TestConnection()) {
        throw ConnectionException("PostgreSQL connection not available (" + name + ")");
    }
    auto pg = static_cast<PGconn *>(conn);

    bool has_timeout = context.HasDeadline();
    if (has_timeout) {
        auto remaining = context.RemainingTime().count();
        if (remaining <= 0) {
            throw CancellationException("query deadline expired before execution on " + name);
        }
        RunCommand("SET statement_timeout = " + std::to_string(remaining));
    }

    // text-format parameters; NULL is passed as a null pointer
    vector<string> param_text;
    vector<const char *> param_values;
    param_text.reserve(args.size());
    for (auto &arg : args) {
        param_text.push_back(arg.ToString());
    }
    for (idx_t i = 0; i < args.size(); i++) {
        param_values.push_back(args[i].IsNull() ? nullptr : param_text[i].c_str());
    }

    auto start_time = std::chrono::high_resolution_clock::now();
    PGresult *res;
    if (args.empty()) {
        res = PQexec(pg, query.c_str());
    } else {
        res = PQexecParams(pg, query.c_str(), static_cast<int>(args.size()), nullptr, param_values.data(), nullptr,
                           nullptr, 0);
    }
    auto end_time = std::chrono::high_resolution_clock::now();

    QueryResult result;
    result.engine_name = name;
    result.execution_time = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time);

    ExecStatusType status = PQresultStatus(res);
    string error;
    bool cancelled = false;
    switch (status) {
    case PGRES_COMMAND_OK: {
        // For INSERT, UPDATE, DELETE, CREATE, etc.
        const char *affected = PQcmdTuples(res);
        result.rows_affected = (affected && affected[0]) ? std::strtoll(affected, nullptr, 10) : 0;
        break;
    }
    case PGRES_TUPLES_OK: {
        int rows = PQntuples(res);
        int cols = PQnfields(res);
        for (int col = 0; col < cols; col++) {
            result.columns.emplace_back(PQfname(res, col));
        }
        result.rows.reserve(rows);
        for (int row = 0; row < rows; row++) {
            vector<Value> values;
            values.reserve(cols);
            for (int col = 0; col < cols; col++) {
                values.push_back(ConvertValue(res, row, col));
            }
            result.rows.push_back(std::move(values));
        }
        break;
    }
    default: {
        const char *state = PQresultErrorField(res, PG_DIAG_SQLSTATE);
        cancelled = state && string(state) == QUERY_CANCELED_STATE;
        error = PQerrorMessage(pg);
        break;
    }
    }
    PQclear(res);

    if (has_timeout) {
        RunCommand("SET statement_timeout = 0");
    }
    if (cancelled) {
        throw CancellationException("PostgreSQL cancelled the statement on " + name + ": " + error);
    }
    if (!error.empty() || (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK)) {
        throw EngineException("PostgreSQL Error: " + error);
    }
    return result;
}

QueryResult PostgreSQLEngine::ExecuteWithPlan(ClientContext &context, const PlanNode &plan) {
    auto sql = plan.FindAttribute("sql");
    if (sql.empty()) {
        throw PlanningException("plan rooted at " + plan.GetTypeName() + " carries no source query for " + name);
    }
    auto result = Execute(context, sql);
    result.plan_explanation = QueryPlanner::ExplainPlan(plan);
    return result;
}

bool PostgreSQLEngine::IsAvailable() {
    std::lock_guard<std::mutex> guard(lock);
    return conn && (PQstatus(static_cast<PGconn *>(conn)) == CONNECTION_OK);
}

string PostgreSQLEngine::GetEngineInfo() {
    if (!IsAvailable()) {
        return "PostgreSQL (disconnected)";
    }

    std::lock_guard<std::mutex> guard(lock);
    int version = PQserverVersion(static_cast<PGconn *>(conn));
    int major = version / 10000;
    int minor = version % 10000;

    string info = "PostgreSQL " + std::to_string(major);
    if (major < 10) {
        // pre-10 servers encode major.minor.patch as XXYYZZ
        info += "." + std::to_string(minor / 100) + "." + std::to_string(minor % 100);
    } else {
        info += "." + std::to_string(minor);
    }
    return info;
}

} // namespace qrouter
