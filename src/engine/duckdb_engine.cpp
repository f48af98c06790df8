#include "qrouter/engine/duckdb_engine.hpp"
#include "qrouter/common/exception.hpp"
#include "qrouter/common/logging.hpp"
#include "qrouter/planner/query_planner.hpp"

#include "duckdb.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace qrouter {

// How often the watchdog polls the client context while a statement runs
static constexpr std::chrono::milliseconds INTERRUPT_POLL_INTERVAL(5);

static duckdb::Value ToDuckDBValue(const Value &value) {
    switch (value.type()) {
    case ValueType::SQLNULL:
        return duckdb::Value();
    case ValueType::BOOLEAN:
        return duckdb::Value::BOOLEAN(value.GetBoolean());
    case ValueType::BIGINT:
        return duckdb::Value::BIGINT(value.GetBigint());
    case ValueType::DOUBLE:
        return duckdb::Value::DOUBLE(value.GetDouble());
    case ValueType::VARCHAR:
        return duckdb::Value(value.GetString());
    }
    throw InternalException("unhandled value type in ToDuckDBValue");
}

static Value FromDuckDBValue(const duckdb::Value &value) {
    if (value.IsNull()) {
        return Value();
    }
    switch (value.type().id()) {
    case duckdb::LogicalTypeId::BOOLEAN:
        return Value::BOOLEAN(value.GetValue<bool>());
    case duckdb::LogicalTypeId::TINYINT:
    case duckdb::LogicalTypeId::SMALLINT:
    case duckdb::LogicalTypeId::INTEGER:
    case duckdb::LogicalTypeId::BIGINT:
    case duckdb::LogicalTypeId::UTINYINT:
    case duckdb::LogicalTypeId::USMALLINT:
    case duckdb::LogicalTypeId::UINTEGER:
        return Value::BIGINT(value.GetValue<int64_t>());
    case duckdb::LogicalTypeId::HUGEINT:
    case duckdb::LogicalTypeId::UBIGINT: {
        // SUM over integers widens to HUGEINT; keep it integral when it fits
        duckdb::Value narrowed;
        string error;
        if (value.DefaultTryCastAs(duckdb::LogicalType::BIGINT, narrowed, &error)) {
            return Value::BIGINT(narrowed.GetValue<int64_t>());
        }
        return Value(value.ToString());
    }
    case duckdb::LogicalTypeId::FLOAT:
    case duckdb::LogicalTypeId::DOUBLE:
    case duckdb::LogicalTypeId::DECIMAL:
        return Value::DOUBLE(value.GetValue<double>());
    default:
        return Value(value.ToString());
    }
}

//! Interrupts the connection when the client context is cancelled or its deadline passes.
//! Polls until the guarded statement has returned.
class InterruptWatchdog {
public:
    InterruptWatchdog(ClientContext &context, duckdb::Connection &con) : context(context), con(con) {
        watcher = std::thread([this]() { Watch(); });
    }
    ~InterruptWatchdog() {
        {
            std::lock_guard<std::mutex> guard(lock);
            finished = true;
        }
        cv.notify_all();
        watcher.join();
    }

private:
    void Watch() {
        std::unique_lock<std::mutex> guard(lock);
        while (!finished) {
            // repeated because a statement that has not started yet clears the flag
            if (context.IsInterrupted()) {
                con.Interrupt();
            }
            cv.wait_for(guard, INTERRUPT_POLL_INTERVAL);
        }
    }

    ClientContext &context;
    duckdb::Connection &con;
    std::mutex lock;
    std::condition_variable cv;
    bool finished = false;
    std::thread watcher;
};

DuckDBEngine::DuckDBEngine(const string &path_p, const string &name_p) : path(path_p), name(name_p) {
    try {
        database = make_uniq<duckdb::DuckDB>(path == ":memory:" ? nullptr : path.c_str());
    } catch (const std::exception &e) {
        throw ConnectionException("failed to open DuckDB database \"" + path + "\": " + e.what());
    }
    logD("[" + name + "] opened DuckDB database " + path);
}

DuckDBEngine::~DuckDBEngine() = default;

QueryResult DuckDBEngine::RunQuery(ClientContext &context, duckdb::Connection &con, const string &query,
                                   const vector<Value> &args) {
    auto start_time = std::chrono::high_resolution_clock::now();

    duckdb::unique_ptr<duckdb::QueryResult> query_result;
    {
        InterruptWatchdog watchdog(context, con);
        if (args.empty()) {
            query_result = con.Query(query);
        } else {
            auto prepared = con.Prepare(query);
            if (prepared->HasError()) {
                throw EngineException("DuckDB Error: " + prepared->GetError());
            }
            duckdb::vector<duckdb::Value> values;
            for (auto &arg : args) {
                values.push_back(ToDuckDBValue(arg));
            }
            query_result = prepared->Execute(values, false);
        }
    }

    auto end_time = std::chrono::high_resolution_clock::now();

    if (query_result->HasError()) {
        // an interrupted statement surfaces as an error; report it as cancellation. A statement that
        // completed is returned even when the deadline passed meanwhile, its effects are committed.
        context.CheckInterrupted("during execution on " + name);
        throw EngineException("DuckDB Error: " + query_result->GetError());
    }

    QueryResult result;
    result.engine_name = name;
    result.execution_time = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time);

    auto &materialized = query_result->Cast<duckdb::MaterializedQueryResult>();
    if (materialized.properties.return_type == duckdb::StatementReturnType::CHANGED_ROWS) {
        // INSERT, UPDATE and DELETE return a single "Count" cell
        if (materialized.RowCount() > 0) {
            result.rows_affected = materialized.GetValue(0, 0).GetValue<int64_t>();
        }
        return result;
    }

    for (auto &column_name : materialized.names) {
        result.columns.push_back(column_name);
    }
    result.rows.reserve(materialized.RowCount());
    for (idx_t row = 0; row < materialized.RowCount(); row++) {
        vector<Value> values;
        values.reserve(materialized.ColumnCount());
        for (idx_t col = 0; col < materialized.ColumnCount(); col++) {
            values.push_back(FromDuckDBValue(materialized.GetValue(col, row)));
        }
        result.rows.push_back(std::move(values));
    }
    return result;
}

QueryResult DuckDBEngine::Execute(ClientContext &context, const string &query, const vector<Value> &args) {
    context.CheckInterrupted("before execution on " + name);

    duckdb::Connection con(*database);
    try {
        return RunQuery(context, con, query, args);
    } catch (const Exception &) {
        throw;
    } catch (const std::exception &e) {
        throw EngineException(string("DuckDB Exception: ") + e.what());
    }
}

QueryResult DuckDBEngine::ExecuteWithPlan(ClientContext &context, const PlanNode &plan) {
    auto sql = plan.FindAttribute("sql");
    if (sql.empty()) {
        throw PlanningException("plan rooted at " + plan.GetTypeName() + " carries no source query for " + name);
    }
    auto result = Execute(context, sql);
    result.plan_explanation = QueryPlanner::ExplainPlan(plan);
    return result;
}

bool DuckDBEngine::IsAvailable() {
    // DuckDB is embedded, it is available as long as the database opened
    return database != nullptr;
}

string DuckDBEngine::GetEngineInfo() {
    try {
        duckdb::Connection con(*database);
        auto version_result = con.Query("SELECT version()");
        if (version_result->HasError() || version_result->RowCount() == 0) {
            return "DuckDB (version unknown)";
        }
        return "DuckDB " + version_result->GetValue(0, 0).ToString();
    } catch (const std::exception &e) {
        logW("[" + name + "] version query failed: " + string(e.what()));
        return "DuckDB (version query failed)";
    }
}

} // namespace qrouter
