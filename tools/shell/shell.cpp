/* -----------------------------------------------------------
 *  shell.cpp – command-line driver for the query router
 * ----------------------------------------------------------- */
#include "qrouter/common/exception.hpp"
#include "qrouter/common/logging.hpp"
#include "qrouter/common/string_util.hpp"
#include "qrouter/engine/engine_factory.hpp"
#include "qrouter/main/config.hpp"
#include "qrouter/main/query_feature_logger.hpp"
#include "qrouter/main/query_router.hpp"
#include "qrouter/parser/query_features.hpp"
#include "qrouter/planner/query_classifier.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <fstream>
#include <iostream>

using namespace qrouter;

enum class ShellMode { ROUTE, EXPLAIN, CLASSIFY, DESCRIBE };

static void usage(const char *prog) {
    std::cerr << "usage: " << prog
              << " [--config=file.json] [--mode=route|explain|classify|describe]\n"
                 "       [--query=SQL | --query_file=path] [--json] [--key=value ...]\n"
                 "Queries are read one per line from --query_file or stdin when --query is absent.\n"
                 "Options: --transactional_engine= --postgresql= --mysql_host= --mysql_port= --mysql_user=\n"
                 "         --mysql_password= --mysql_database= --duckdb_path= --timeout_ms= --explain=\n"
                 "         --log_level= --feature_log=\n";
}

static bool parse_mode(const string &text, ShellMode &mode) {
    auto m = StringUtil::Lower(text);
    if      (m == "route")    mode = ShellMode::ROUTE;
    else if (m == "explain")  mode = ShellMode::EXPLAIN;
    else if (m == "classify") mode = ShellMode::CLASSIFY;
    else if (m == "describe") mode = ShellMode::DESCRIBE;
    else return false;
    return true;
}

/* one query per line; blank lines and "--" comments are skipped */
static vector<string> read_queries(std::istream &in) {
    vector<string> queries;
    string line;
    while (std::getline(in, line)) {
        auto q = StringUtil::Trim(line);
        if (q.empty() || StringUtil::StartsWith(q, "--")) continue;
        queries.push_back(q);
    }
    return queries;
}

/* runs one query; returns false when it failed */
static bool run_query(const QueryRouter &router, const RouterConfig &config, ShellMode mode, bool as_json,
                      QueryFeatureLogger &feature_log, const string &query) {
    switch (mode) {
    case ShellMode::CLASSIFY: {
        auto type = router.ClassifyQuery(query);
        if (as_json) {
            nlohmann::json out;
            out["query"] = query;
            out["query_type"] = QueryTypeToString(type);
            std::cout << out.dump() << "\n";
        } else {
            std::cout << QueryTypeToString(type) << "\t" << query << "\n";
        }
        return true;
    }
    case ShellMode::DESCRIBE:
        std::cout << router.DescribeRouting(query) << "\n";
        return true;
    case ShellMode::EXPLAIN: {
        ClientContext context;
        std::cout << router.ExplainQuery(context, query) << "\n";
        return true;
    }
    case ShellMode::ROUTE:
        break;
    }

    auto features = QueryFeatureExtractor::Extract(query);
    auto type = QueryClassifier::Classify(features);
    ClientContext context(config.Timeout());
    auto start = std::chrono::steady_clock::now();
    try {
        auto result = router.RouteQuery(context, query, config.explain);
        double elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
        feature_log.LogQuery(features, type, result.engine_name, elapsed_ms);
        if (as_json) {
            std::cout << result.ToJSON() << "\n";
        } else {
            if (!result.plan_explanation.empty()) std::cout << result.plan_explanation;
            std::cout << result.ToString();
            logI(QueryTypeToString(type) + " query on " + result.engine_name + ": " +
                 std::to_string(result.RowCount()) + " rows in " + std::to_string(result.ExecutionTimeMs()) + " ms");
        }
        return true;
    } catch (const EngineExecutionException &e) {
        double elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
        feature_log.LogQuery(features, type, e.engine_name, elapsed_ms, e.cause);
        logE(e.what());
    } catch (const CancellationException &e) {
        double elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
        feature_log.LogQuery(features, type, router.SelectEngine(type).GetName(), elapsed_ms, e.what());
        logE(e.what());
    }
    return false;
}

/* ----------------------------------------------------------- */
int main(int argc, char *argv[]) {
    RouterConfig config;
    string config_file, query_sql, query_file;
    ShellMode mode = ShellMode::ROUTE;
    bool as_json = false;

    try {
        /* the config file is applied first so that environment and flags override it */
        for (int i = 1; i < argc; ++i) {
            string a(argv[i]);
            if (a.rfind("--config=", 0) == 0) config_file = a.substr(9);
        }
        if (!config_file.empty()) config.LoadFromFile(config_file);
        config.ApplyEnvironment();

        for (int i = 1; i < argc; ++i) {
            string a(argv[i]);
            if      (a.rfind("--config=", 0) == 0)     continue;
            else if (a.rfind("--mode=", 0) == 0) {
                if (!parse_mode(a.substr(7), mode)) { logE("unknown --mode=" + a.substr(7)); return 1; }
            }
            else if (a.rfind("--query=", 0) == 0)      query_sql = a.substr(8);
            else if (a.rfind("--query_file=", 0) == 0) query_file = a.substr(13);
            else if (a == "--json")                    as_json = true;
            else if (a == "--help" || a == "-h")       { usage(argv[0]); return 0; }
            else if (!config.ApplyArgument(a))         { logE("unknown argument " + a); usage(argv[0]); return 1; }
        }
        config.Validate();
    } catch (const ConfigurationException &e) {
        logE(e.what());
        return 1;
    }
    SetLogLevel(config.log_level);
    if (!query_sql.empty() && !query_file.empty()) { logE("use --query OR --query_file, not both"); return 1; }

    vector<string> queries;
    if (!query_sql.empty()) {
        queries.push_back(query_sql);
    } else if (!query_file.empty()) {
        std::ifstream in(query_file);
        if (!in.is_open()) { logE("cannot open query file " + query_file); return 1; }
        queries = read_queries(in);
    } else {
        queries = read_queries(std::cin);
    }
    if (queries.empty()) { logW("no queries to run"); return 0; }

    QueryFeatureLogger feature_log;
    if (!config.feature_log_path.empty()) {
        feature_log.SetLogPath(config.feature_log_path);
        feature_log.SetEnabled(true);
    }

    /* classification, planning and description never touch an engine; still the
       router needs both, so they are built for every mode */
    unique_ptr<QueryEngine> transactional, analytical;
    try {
        transactional = CreateTransactionalEngine(config);
        analytical = CreateAnalyticalEngine(config);
    } catch (const Exception &e) {
        logE(string("failed to start engines: ") + e.what());
        return 1;
    }
    QueryRouter router(*transactional, *analytical);

    size_t failed = 0;
    for (auto &q : queries) {
        try {
            if (!run_query(router, config, mode, as_json, feature_log, q)) failed++;
        } catch (const Exception &e) {
            logE(e.what());
            failed++;
        }
    }
    if (failed) {
        logE(std::to_string(failed) + " of " + std::to_string(queries.size()) + " queries failed");
        return 2;
    }
    return 0;
}
