#include "qrouter/main/query_result.hpp"

#include <sstream>

namespace qrouter {

string QueryResult::ToString() const {
    std::stringstream ss;
    for (idx_t i = 0; i < columns.size(); i++) {
        if (i > 0) ss << "\t";
        ss << columns[i];
    }
    if (!columns.empty()) ss << "\n";

    for (auto &row : rows) {
        for (idx_t col = 0; col < row.size(); col++) {
            if (col > 0) ss << "\t";
            ss << row[col].ToString();
        }
        ss << "\n";
    }
    return ss.str();
}

string QueryResult::ToJSON() const {
    nlohmann::json out;
    out["engine"] = engine_name;
    out["columns"] = columns;

    auto json_rows = nlohmann::json::array();
    for (auto &row : rows) {
        auto json_row = nlohmann::json::array();
        for (auto &value : row) {
            json_row.push_back(value.ToJSON());
        }
        json_rows.push_back(std::move(json_row));
    }
    out["rows"] = std::move(json_rows);
    out["rows_affected"] = rows_affected;
    out["execution_time_ms"] = ExecutionTimeMs();
    if (!plan_explanation.empty()) {
        out["plan"] = plan_explanation;
    }
    return out.dump();
}

} // namespace qrouter
