#include "qrouter/main/query_feature_logger.hpp"
#include "qrouter/common/exception.hpp"
#include "qrouter/common/logging.hpp"

#include <chrono>

namespace qrouter {

QueryFeatureLogger::~QueryFeatureLogger() {
    if (log_file && log_file->is_open()) {
        log_file->close();
    }
}

void QueryFeatureLogger::SetLogPath(const string &path) {
    std::lock_guard<std::mutex> guard(lock);
    log_path = path;
    if (log_file && log_file->is_open()) {
        log_file->close();
    }
    log_file.reset();
}

void QueryFeatureLogger::LogQuery(const QueryFeatures &features, QueryType type, const string &engine_name,
                                  double elapsed_ms, const string &error) {
    if (!logging_enabled) {
        return;
    }

    auto record = features.ToJSON();
    record["query_type"] = QueryTypeToString(type);
    record["engine"] = engine_name;
    record["elapsed_ms"] = elapsed_ms;
    record["success"] = error.empty();
    if (!error.empty()) {
        record["error"] = error;
    }
    auto now = std::chrono::system_clock::now();
    record["timestamp"] = std::chrono::system_clock::to_time_t(now);
    record["query_text"] = features.query_text;

    std::lock_guard<std::mutex> guard(lock);
    if (!log_file || !log_file->is_open()) {
        log_file = make_uniq<std::ofstream>(log_path, std::ios::app);
        if (!log_file->is_open()) {
            throw ConfigurationException("cannot open feature log \"" + log_path + "\"");
        }
        logD("feature log opened at " + log_path);
    }
    *log_file << record.dump() << std::endl;
}

} // namespace qrouter
