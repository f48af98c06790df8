#include "qrouter/main/config.hpp"
#include "qrouter/common/exception.hpp"
#include "qrouter/common/string_util.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>

namespace qrouter {

// option name -> environment variable
static const std::pair<const char *, const char *> ENVIRONMENT_OPTIONS[] = {
    {"transactional_engine", "QROUTER_TRANSACTIONAL_ENGINE"},
    {"postgresql", "QROUTER_POSTGRESQL"},
    {"mysql_host", "QROUTER_MYSQL_HOST"},
    {"mysql_port", "QROUTER_MYSQL_PORT"},
    {"mysql_user", "QROUTER_MYSQL_USER"},
    {"mysql_password", "QROUTER_MYSQL_PASSWORD"},
    {"mysql_database", "QROUTER_MYSQL_DATABASE"},
    {"duckdb_path", "QROUTER_DUCKDB_PATH"},
    {"timeout_ms", "QROUTER_TIMEOUT_MS"},
    {"explain", "QROUTER_EXPLAIN"},
    {"log_level", "QROUTER_LOG_LEVEL"},
    {"feature_log", "QROUTER_FEATURE_LOG"},
};

static int64_t ParseInteger(const string &key, const string &value) {
    try {
        size_t consumed = 0;
        auto result = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            throw ConfigurationException("option \"" + key + "\" expects an integer, got \"" + value + "\"");
        }
        return result;
    } catch (const std::logic_error &) {
        // std::invalid_argument and std::out_of_range
        throw ConfigurationException("option \"" + key + "\" expects an integer, got \"" + value + "\"");
    }
}

static bool ParseBoolean(const string &key, const string &value) {
    auto lower = StringUtil::Lower(value);
    if (lower == "1" || lower == "true" || lower == "on" || lower == "yes") {
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "off" || lower == "no") {
        return false;
    }
    throw ConfigurationException("option \"" + key + "\" expects a boolean, got \"" + value + "\"");
}

static uint16_t ParsePort(const string &key, int64_t port) {
    if (port <= 0 || port > std::numeric_limits<uint16_t>::max()) {
        throw ConfigurationException("option \"" + key + "\" is not a valid port: " + std::to_string(port));
    }
    return static_cast<uint16_t>(port);
}

void RouterConfig::Set(const string &key, const string &value) {
    if (key == "transactional_engine") {
        transactional_engine = StringUtil::Lower(value);
    } else if (key == "postgresql") {
        postgresql_connection = value;
    } else if (key == "mysql_host") {
        mysql_host = value;
    } else if (key == "mysql_port") {
        mysql_port = ParsePort(key, ParseInteger(key, value));
    } else if (key == "mysql_user") {
        mysql_user = value;
    } else if (key == "mysql_password") {
        mysql_password = value;
    } else if (key == "mysql_database") {
        mysql_database = value;
    } else if (key == "duckdb_path") {
        duckdb_path = value;
    } else if (key == "timeout_ms") {
        timeout_ms = ParseInteger(key, value);
    } else if (key == "explain") {
        explain = ParseBoolean(key, value);
    } else if (key == "log_level") {
        if (!ParseLogLevel(value, log_level)) {
            throw ConfigurationException("unknown log level \"" + value + "\"");
        }
    } else if (key == "feature_log") {
        feature_log_path = value;
    } else {
        throw ConfigurationException("unknown option \"" + key + "\"");
    }
}

void RouterConfig::ApplyJSON(const nlohmann::json &json) {
    if (!json.is_object()) {
        throw ConfigurationException("configuration must be a JSON object");
    }
    for (auto it = json.begin(); it != json.end(); ++it) {
        auto &key = it.key();
        auto &value = it.value();
        if (key == "mysql_port" || key == "timeout_ms") {
            if (!value.is_number_integer()) {
                throw ConfigurationException("option \"" + key + "\" expects an integer");
            }
            auto number = value.get<int64_t>();
            if (key == "mysql_port") {
                mysql_port = ParsePort(key, number);
            } else {
                timeout_ms = number;
            }
        } else if (key == "explain") {
            if (!value.is_boolean()) {
                throw ConfigurationException("option \"explain\" expects a boolean");
            }
            explain = value.get<bool>();
        } else if (key == "transactional_engine" || key == "postgresql" || key == "mysql_host" ||
                   key == "mysql_user" || key == "mysql_password" || key == "mysql_database" ||
                   key == "duckdb_path" || key == "log_level" || key == "feature_log") {
            if (!value.is_string()) {
                throw ConfigurationException("option \"" + key + "\" expects a string");
            }
            Set(key, value.get<string>());
        }
        // anything else belongs to other tools sharing the file
    }
}

void RouterConfig::LoadFromFile(const string &path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigurationException("cannot open configuration file \"" + path + "\"");
    }
    nlohmann::json json;
    try {
        in >> json;
    } catch (const nlohmann::json::parse_error &e) {
        throw ConfigurationException("malformed configuration file \"" + path + "\": " + e.what());
    }
    ApplyJSON(json);
}

void RouterConfig::ApplyEnvironment() {
    for (auto &option : ENVIRONMENT_OPTIONS) {
        const char *value = std::getenv(option.second);
        if (value) {
            Set(option.first, value);
        }
    }
}

bool RouterConfig::ApplyArgument(const string &arg) {
    if (!StringUtil::StartsWith(arg, "--")) {
        return false;
    }
    auto eq = arg.find('=');
    if (eq == string::npos) {
        return false;
    }
    auto key = arg.substr(2, eq - 2);
    for (auto &option : ENVIRONMENT_OPTIONS) {
        if (key == option.first) {
            Set(key, arg.substr(eq + 1));
            return true;
        }
    }
    return false;
}

void RouterConfig::Validate() const {
    if (transactional_engine != "postgresql" && transactional_engine != "mysql") {
        throw ConfigurationException("transactional_engine must be \"postgresql\" or \"mysql\", got \"" +
                                     transactional_engine + "\"");
    }
    if (timeout_ms < 0) {
        throw ConfigurationException("timeout_ms must not be negative");
    }
    if (duckdb_path.empty()) {
        throw ConfigurationException("duckdb_path must not be empty (use \":memory:\")");
    }
}

nlohmann::json RouterConfig::ToJSON() const {
    static const char *const LEVEL_NAMES[] = {"debug", "info", "warn", "error", "off"};
    nlohmann::json out;
    out["transactional_engine"] = transactional_engine;
    out["postgresql"] = postgresql_connection;
    out["mysql_host"] = mysql_host;
    out["mysql_port"] = mysql_port;
    out["mysql_user"] = mysql_user;
    out["mysql_database"] = mysql_database;
    out["duckdb_path"] = duckdb_path;
    out["timeout_ms"] = timeout_ms;
    out["explain"] = explain;
    out["log_level"] = LEVEL_NAMES[static_cast<uint8_t>(log_level)];
    out["feature_log"] = feature_log_path;
    return out;
}

} // namespace qrouter
