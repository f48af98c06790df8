#pragma once

#include "qrouter/common/common.hpp"
#include "qrouter/common/types/value.hpp"

#include <chrono>

namespace qrouter {

//! Uniform result shape returned by every engine, regardless of backend
struct QueryResult {
    vector<string> columns;
    vector<vector<Value>> rows;
    std::chrono::microseconds execution_time{0};
    //! Filled by the router when an explanation was requested, or by plan-based execution
    string plan_explanation;

    // Rows touched by INSERT/UPDATE/DELETE; zero for result sets
    int64_t rows_affected = 0;
    string engine_name;

    idx_t RowCount() const {
        return rows.size();
    }
    idx_t ColumnCount() const {
        return columns.size();
    }
    double ExecutionTimeMs() const {
        return execution_time.count() / 1000.0;
    }

    //! Column header line followed by one tab-separated line per row
    string ToString() const;
    string ToJSON() const;
};

} // namespace qrouter
