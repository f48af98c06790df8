#include "qrouter/common/exception.hpp"
#include "qrouter/main/config.hpp"
#include "qrouter/main/query_feature_logger.hpp"
#include "qrouter/planner/query_classifier.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <thread>

using namespace qrouter;

static string TempPath(const string &name) {
    auto dir = std::getenv("TMPDIR");
    return string(dir ? dir : "/tmp") + "/qrouter_test_" + name;
}

TEST(RouterConfigTest, Defaults) {
    RouterConfig config;
    EXPECT_EQ(config.transactional_engine, "postgresql");
    EXPECT_EQ(config.duckdb_path, ":memory:");
    EXPECT_EQ(config.timeout_ms, 0);
    EXPECT_FALSE(config.explain);
    EXPECT_EQ(config.log_level, LogLevel::INFO);
    EXPECT_NO_THROW(config.Validate());
}

TEST(RouterConfigTest, ApplyJSON) {
    RouterConfig config;
    config.ApplyJSON(nlohmann::json::parse(R"({
        "transactional_engine": "MySQL",
        "mysql_host": "db.internal",
        "mysql_port": 3307,
        "duckdb_path": "/var/lib/qrouter/analytics.duckdb",
        "timeout_ms": 2500,
        "explain": true,
        "log_level": "debug",
        "dashboard_theme": "dark"
    })"));
    EXPECT_EQ(config.transactional_engine, "mysql");
    EXPECT_EQ(config.mysql_host, "db.internal");
    EXPECT_EQ(config.mysql_port, 3307);
    EXPECT_EQ(config.duckdb_path, "/var/lib/qrouter/analytics.duckdb");
    EXPECT_EQ(config.Timeout(), std::chrono::milliseconds(2500));
    EXPECT_TRUE(config.explain);
    EXPECT_EQ(config.log_level, LogLevel::DEBUG);
    // untouched
    EXPECT_EQ(config.mysql_user, "root");
}

TEST(RouterConfigTest, ApplyJSONRejectsWrongTypes) {
    RouterConfig config;
    EXPECT_THROW(config.ApplyJSON(nlohmann::json::parse(R"({"timeout_ms": "soon"})")), ConfigurationException);
    EXPECT_THROW(config.ApplyJSON(nlohmann::json::parse(R"({"explain": 1})")), ConfigurationException);
    EXPECT_THROW(config.ApplyJSON(nlohmann::json::parse(R"({"mysql_port": 70000})")), ConfigurationException);
    EXPECT_THROW(config.ApplyJSON(nlohmann::json::parse(R"({"log_level": "loud"})")), ConfigurationException);
    EXPECT_THROW(config.ApplyJSON(nlohmann::json::parse("[1, 2]")), ConfigurationException);
}

TEST(RouterConfigTest, LoadFromFile) {
    auto path = TempPath("config.json");
    {
        std::ofstream out(path);
        out << R"({"postgresql": "host=pg port=5433 dbname=app", "feature_log": "/tmp/features.jsonl"})";
    }
    RouterConfig config;
    config.LoadFromFile(path);
    EXPECT_EQ(config.postgresql_connection, "host=pg port=5433 dbname=app");
    EXPECT_EQ(config.feature_log_path, "/tmp/features.jsonl");
    std::remove(path.c_str());

    EXPECT_THROW(config.LoadFromFile(TempPath("does_not_exist.json")), ConfigurationException);

    auto broken = TempPath("broken.json");
    {
        std::ofstream out(broken);
        out << "{ not json";
    }
    EXPECT_THROW(config.LoadFromFile(broken), ConfigurationException);
    std::remove(broken.c_str());
}

TEST(RouterConfigTest, EnvironmentOverridesFile) {
    RouterConfig config;
    config.ApplyJSON(nlohmann::json::parse(R"({"duckdb_path": "from_file.duckdb"})"));
    setenv("QROUTER_DUCKDB_PATH", "from_env.duckdb", 1);
    setenv("QROUTER_TIMEOUT_MS", "750", 1);
    config.ApplyEnvironment();
    unsetenv("QROUTER_DUCKDB_PATH");
    unsetenv("QROUTER_TIMEOUT_MS");
    EXPECT_EQ(config.duckdb_path, "from_env.duckdb");
    EXPECT_EQ(config.timeout_ms, 750);
}

TEST(RouterConfigTest, ApplyArgument) {
    RouterConfig config;
    EXPECT_TRUE(config.ApplyArgument("--transactional_engine=mysql"));
    EXPECT_TRUE(config.ApplyArgument("--mysql_port=3310"));
    EXPECT_TRUE(config.ApplyArgument("--explain=on"));
    EXPECT_TRUE(config.ApplyArgument("--postgresql=host=a port=1"));
    EXPECT_FALSE(config.ApplyArgument("--mode=route"));
    EXPECT_FALSE(config.ApplyArgument("--json"));
    EXPECT_FALSE(config.ApplyArgument("route"));
    EXPECT_EQ(config.transactional_engine, "mysql");
    EXPECT_EQ(config.mysql_port, 3310);
    EXPECT_TRUE(config.explain);
    EXPECT_EQ(config.postgresql_connection, "host=a port=1");
    EXPECT_THROW(config.ApplyArgument("--timeout_ms=12abc"), ConfigurationException);
    EXPECT_THROW(config.ApplyArgument("--explain=maybe"), ConfigurationException);
}

TEST(RouterConfigTest, Validate) {
    RouterConfig config;
    config.transactional_engine = "sqlite";
    EXPECT_THROW(config.Validate(), ConfigurationException);
    config.transactional_engine = "mysql";
    config.timeout_ms = -1;
    EXPECT_THROW(config.Validate(), ConfigurationException);
    config.timeout_ms = 0;
    EXPECT_NO_THROW(config.Validate());
}

TEST(QueryFeatureLoggerTest, AppendsOneLinePerQuery) {
    auto path = TempPath("features.jsonl");
    std::remove(path.c_str());

    QueryFeatureLogger logger;
    logger.SetLogPath(path);
    auto features = QueryFeatureExtractor::Extract("SELECT * FROM users ORDER BY name");
    // disabled by default
    logger.LogQuery(features, QueryType::ANALYTICAL, "DuckDB", 1.0);

    logger.SetEnabled(true);
    logger.LogQuery(features, QueryClassifier::Classify(features), "DuckDB", 2.5);
    logger.LogQuery(features, QueryType::ANALYTICAL, "DuckDB", 0.1, "Engine Error: boom");
    logger.SetLogPath(path); // flushes and closes

    std::ifstream in(path);
    string line;
    vector<nlohmann::json> records;
    while (std::getline(in, line)) {
        records.push_back(nlohmann::json::parse(line));
    }
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0]["query_type"], "Analytical");
    EXPECT_EQ(records[0]["engine"], "DuckDB");
    EXPECT_EQ(records[0]["success"], true);
    EXPECT_EQ(records[0]["has_orderby"], true);
    EXPECT_EQ(records[0]["query_text"], "SELECT * FROM users ORDER BY name");
    EXPECT_EQ(records[1]["success"], false);
    EXPECT_EQ(records[1]["error"], "Engine Error: boom");
    std::remove(path.c_str());
}

TEST(QueryFeatureLoggerTest, ToggleWhileLogging) {
    auto path = TempPath("features_toggle.jsonl");
    std::remove(path.c_str());

    QueryFeatureLogger logger;
    logger.SetLogPath(path);
    auto features = QueryFeatureExtractor::Extract("SELECT COUNT(*) FROM events");

    std::atomic<bool> done {false};
    std::thread toggler([&]() {
        bool enabled = true;
        while (!done) {
            logger.SetEnabled(enabled);
            enabled = !enabled;
        }
    });
    vector<std::thread> writers;
    for (int t = 0; t < 4; t++) {
        writers.emplace_back([&]() {
            for (int i = 0; i < 500; i++) {
                logger.LogQuery(features, QueryType::ANALYTICAL, "DuckDB", 0.5);
            }
        });
    }
    for (auto &writer : writers) {
        writer.join();
    }
    done = true;
    toggler.join();
    logger.SetLogPath(path);

    std::ifstream in(path);
    string line;
    idx_t count = 0;
    while (std::getline(in, line)) {
        auto record = nlohmann::json::parse(line);
        EXPECT_EQ(record["engine"], "DuckDB");
        count++;
    }
    EXPECT_LE(count, 2000u);
    std::remove(path.c_str());
}
