#pragma once

#include "qrouter/common/common.hpp"
#include "qrouter/common/logging.hpp"

#include <nlohmann/json.hpp>

#include <chrono>

namespace qrouter {

//! Settings for building the engines and driving the router.
//! Sources, later ones overriding earlier: defaults, a JSON file, environment, command line.
struct RouterConfig {
    // "postgresql" or "mysql"
    string transactional_engine = "postgresql";
    string postgresql_connection = "host=localhost port=5432 dbname=postgres";

    string mysql_host = "127.0.0.1";
    uint16_t mysql_port = 3306;
    string mysql_user = "root";
    string mysql_password;
    string mysql_database;

    string duckdb_path = ":memory:";

    // 0 disables the per-query deadline
    int64_t timeout_ms = 0;
    bool explain = false;
    LogLevel log_level = LogLevel::INFO;
    // empty disables the JSONL feature log
    string feature_log_path;

    //! Overrides fields present in `json`; unknown keys are ignored
    void ApplyJSON(const nlohmann::json &json);
    void LoadFromFile(const string &path);
    //! Reads the QROUTER_* environment variables
    void ApplyEnvironment();
    //! Applies one "--key=value" argument; returns false when `arg` is not a config option
    bool ApplyArgument(const string &arg);
    //! Sets one option from its textual value
    void Set(const string &key, const string &value);

    //! Throws ConfigurationException on inconsistent settings
    void Validate() const;

    std::chrono::milliseconds Timeout() const {
        return std::chrono::milliseconds(timeout_ms);
    }
    nlohmann::json ToJSON() const;
};

} // namespace qrouter
