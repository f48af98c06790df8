#pragma once

#include "qrouter/common/common.hpp"
#include "qrouter/common/enums/query_type.hpp"
#include "qrouter/parser/query_features.hpp"

#include <atomic>
#include <fstream>
#include <mutex>

namespace qrouter {

//! Appends one JSON object per routed query to a file (JSON Lines)
class QueryFeatureLogger {
public:
    QueryFeatureLogger() = default;
    ~QueryFeatureLogger();

    // Log one routed query; `error` is empty on success
    void LogQuery(const QueryFeatures &features, QueryType type, const string &engine_name, double elapsed_ms,
                  const string &error = string());

    // Enable/disable logging
    void SetEnabled(bool enabled) {
        logging_enabled = enabled;
    }
    bool IsEnabled() const {
        return logging_enabled;
    }

    // Set log file path; opening is deferred to the first write
    void SetLogPath(const string &path);
    const string &GetLogPath() const {
        return log_path;
    }

private:
    std::atomic<bool> logging_enabled {false};
    string log_path;
    unique_ptr<std::ofstream> log_file;
    std::mutex lock;
};

} // namespace qrouter
