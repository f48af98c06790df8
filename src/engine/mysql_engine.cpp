#include "qrouter/engine/mysql_engine.hpp"
#include "qrouter/engine/mysql_parameters.hpp"
#include "qrouter/common/exception.hpp"
#include "qrouter/common/logging.hpp"
#include "qrouter/planner/query_planner.hpp"

#include <mysql/mysql.h>

#include <chrono>
#include <cstdlib>
#include <mutex>

namespace qrouter {

// max_execution_time exceeded, and statement killed by KILL QUERY
static constexpr unsigned ER_QUERY_TIMEOUT = 3024;
static constexpr unsigned ER_QUERY_INTERRUPTED = 1317;

static Value ConvertValue(const char *text, unsigned long length, enum_field_types type) {
    if (!text) {
        return Value();
    }
    switch (type) {
    case MYSQL_TYPE_TINY:
    case MYSQL_TYPE_SHORT:
    case MYSQL_TYPE_INT24:
    case MYSQL_TYPE_LONG:
    case MYSQL_TYPE_LONGLONG:
        return Value::BIGINT(std::strtoll(text, nullptr, 10));
    case MYSQL_TYPE_FLOAT:
    case MYSQL_TYPE_DOUBLE:
    case MYSQL_TYPE_DECIMAL:
    case MYSQL_TYPE_NEWDECIMAL:
        return Value::DOUBLE(std::strtod(text, nullptr));
    default:
        return Value(string(text, length));
    }
}

// mysql_init() is only thread-safe once the client library has been initialized
static void InitializeClientLibrary() {
    static std::once_flag initialized;
    std::call_once(initialized, []() {
        if (mysql_library_init(0, nullptr, nullptr)) {
            throw ConnectionException("mysql_library_init() failed");
        }
    });
}

MySQLEngine::MySQLEngine(MySQLConnectionInfo info_p, const string &name_p)
    : info(std::move(info_p)), name(name_p), conn(nullptr) {
    InitializeClientLibrary();
    std::lock_guard<std::mutex> guard(lock);
    Connect();
}

MySQLEngine::~MySQLEngine() {
    Disconnect();
}

bool MySQLEngine::Connect() {
    Disconnect();
    auto handle = mysql_init(nullptr);
    if (!handle) {
        throw ConnectionException("mysql_init() failed for " + name);
    }
    if (!mysql_real_connect(handle, info.host.c_str(), info.user.c_str(), info.password.c_str(),
                            info.database.empty() ? nullptr : info.database.c_str(), info.port, nullptr, 0)) {
        logW("[" + name + "] connection to MySQL failed: " + string(mysql_error(handle)));
        mysql_close(handle);
        return false;
    }
    conn = handle;
    logD("[" + name + "] connected to MySQL at " + info.host + ":" + std::to_string(info.port));
    return true;
}

void MySQLEngine::Disconnect() {
    if (conn) {
        mysql_close(static_cast<MYSQL *>(conn));
        conn = nullptr;
    }
}

void MySQLEngine::RunCommand(const string &command) {
    auto handle = static_cast<MYSQL *>(conn);
    if (mysql_query(handle, command.c_str()) != 0) {
        throw EngineException("MySQL Error: " + string(mysql_error(handle)));
    }
    if (MYSQL_RES *r = mysql_store_result(handle)) {
        mysql_free_result(r);
    }
}

string MySQLEngine::BindParameters(const string &query, const vector<Value> &args) {
    auto handle = static_cast<MYSQL *>(conn);
    return MySQLParameterBinder::Bind(query, args, [handle](const string &text) {
        string escaped(text.size() * 2 + 1, '\0');
        auto length = mysql_real_escape_string(handle, &escaped[0], text.c_str(), text.size());
        escaped.resize(length);
        return escaped;
    });
}

QueryResult MySQLEngine::Execute(ClientContext &context, const string &query, const vector<Value> &args) {
    context.CheckInterrupted("before execution on " + name);

    std::lock_guard<std::mutex> guard(lock);
    if (!conn || mysql_ping(static_cast<MYSQL *>(conn)) != 0) {
        if (!Connect()) {
            throw ConnectionException("MySQL connection not available (" + name + ")");
        }
    }
    auto handle = static_cast<MYSQL *>(conn);

    bool has_timeout = context.HasDeadline();
    if (has_timeout) {
        auto remaining = context.RemainingTime().count();
        if (remaining <= 0) {
            throw CancellationException("query deadline expired before execution on " + name);
        }
        RunCommand("SET SESSION max_execution_time = " + std::to_string(remaining));
    }

    auto statement = args.empty() ? query : BindParameters(query, args);

    QueryResult result;
    result.engine_name = name;
    auto start_time = std::chrono::high_resolution_clock::now();
    int rc = mysql_query(handle, statement.c_str());
    unsigned err_no = rc == 0 ? 0 : mysql_errno(handle);
    string error = rc == 0 ? string() : string(mysql_error(handle));
    if (rc == 0) {
        MYSQL_RES *res = mysql_store_result(handle);
        if (res) {
            unsigned num_fields = mysql_num_fields(res);
            MYSQL_FIELD *fields = mysql_fetch_fields(res);
            for (unsigned i = 0; i < num_fields; i++) {
                result.columns.emplace_back(fields[i].name);
            }
            while (MYSQL_ROW row = mysql_fetch_row(res)) {
                unsigned long *lengths = mysql_fetch_lengths(res);
                vector<Value> values;
                values.reserve(num_fields);
                for (unsigned i = 0; i < num_fields; i++) {
                    values.push_back(ConvertValue(row[i], lengths[i], fields[i].type));
                }
                result.rows.push_back(std::move(values));
            }
            mysql_free_result(res);
        } else if (mysql_field_count(handle) == 0) {
            result.rows_affected = static_cast<int64_t>(mysql_affected_rows(handle));
        } else {
            err_no = mysql_errno(handle);
            error = mysql_error(handle);
        }
    }
    auto end_time = std::chrono::high_resolution_clock::now();
    result.execution_time = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time);

    if (has_timeout) {
        RunCommand("SET SESSION max_execution_time = 0");
    }
    if (err_no == ER_QUERY_TIMEOUT || err_no == ER_QUERY_INTERRUPTED) {
        throw CancellationException("MySQL stopped the statement on " + name + ": " + error);
    }
    if (err_no != 0) {
        throw EngineException("MySQL Error " + std::to_string(err_no) + ": " + error);
    }
    return result;
}

QueryResult MySQLEngine::ExecuteWithPlan(ClientContext &context, const PlanNode &plan) {
    auto sql = plan.FindAttribute("sql");
    if (sql.empty()) {
        throw PlanningException("plan rooted at " + plan.GetTypeName() + " carries no source query for " + name);
    }
    auto result = Execute(context, sql);
    result.plan_explanation = QueryPlanner::ExplainPlan(plan);
    return result;
}

bool MySQLEngine::IsAvailable() {
    std::lock_guard<std::mutex> guard(lock);
    return conn && mysql_ping(static_cast<MYSQL *>(conn)) == 0;
}

string MySQLEngine::GetEngineInfo() {
    if (!IsAvailable()) {
        return "MySQL (disconnected)";
    }
    std::lock_guard<std::mutex> guard(lock);
    return "MySQL " + string(mysql_get_server_info(static_cast<MYSQL *>(conn)));
}

} // namespace qrouter
