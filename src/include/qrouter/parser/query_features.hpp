#pragma once

#include "qrouter/common/common.hpp"
#include "qrouter/common/enums/plan_node_type.hpp"
#include "qrouter/parser/sql_tokenizer.hpp"

#include <nlohmann/json.hpp>

namespace qrouter {

//! Structural cues of one query string. The classifier and the planner both
//! read this struct, so a query's QueryType and its plan shape always agree.
struct QueryFeatures {
    // Query identification
    string query_text;       // whitespace-collapsed, original case, trailing ';' removed
    string normalized_query; // query_text upper-cased
    uint64_t query_hash = 0;

    // Mutations (INSERT / UPDATE / DELETE)
    bool is_mutation = false;
    string mutation_keyword;

    // Join information; details describe the first JOIN clause
    bool has_join = false;
    idx_t num_joins = 0;
    JoinKind join_kind = JoinKind::INNER;
    string join_relation;
    string join_condition;

    // Aggregation information
    vector<string> aggregates; // aggregate calls as written, e.g. "COUNT(*)"
    bool has_groupby = false;
    string group_by;
    string having;

    // Sort / limit information
    bool has_orderby = false;
    string order_by;
    bool has_limit = false; // top-level LIMIT only
    string limit_count;
    string limit_offset;

    // Scan information
    string scan_relation; // first target relation, e.g. "users u"
    vector<string> tables;

    idx_t NumAggregates() const {
        return aggregates.size();
    }
    bool HasAggregation() const {
        return has_groupby || !aggregates.empty();
    }

    // Convert to JSON for the feature log
    nlohmann::json ToJSON() const;
};

class QueryFeatureExtractor {
public:
    //! Never fails: malformed or empty text yields a feature set with no cues
    static QueryFeatures Extract(const string &query);

private:
    static void ExtractMutation(const vector<SQLToken> &tokens, QueryFeatures &features);
    static void ExtractJoins(const string &sql, const vector<SQLToken> &tokens, QueryFeatures &features);
    static void ExtractAggregates(const string &sql, const vector<SQLToken> &tokens, QueryFeatures &features);
    static void ExtractGrouping(const string &sql, const vector<SQLToken> &tokens, QueryFeatures &features);
    static void ExtractOrdering(const string &sql, const vector<SQLToken> &tokens, QueryFeatures &features);
    static void ExtractLimit(const vector<SQLToken> &tokens, QueryFeatures &features);
    static void ExtractTables(const string &sql, const vector<SQLToken> &tokens, QueryFeatures &features);
};

} // namespace qrouter
