#include "qrouter/parser/query_features.hpp"
#include "qrouter/common/string_util.hpp"

#include <functional>
#include <unordered_set>

namespace qrouter {

//===--------------------------------------------------------------------===//
// Token helpers
//===--------------------------------------------------------------------===//

// Words that open a new clause and therefore end the text of the previous one
static const std::unordered_set<string> CLAUSE_KEYWORDS = {
    "SELECT", "FROM",  "WHERE",  "GROUP", "HAVING",  "ORDER", "LIMIT", "OFFSET",  "FETCH",
    "UNION",  "INTERSECT", "EXCEPT", "WINDOW", "QUALIFY", "RETURNING", "FOR", "JOIN", "INNER",
    "LEFT",   "RIGHT", "FULL",   "CROSS", "NATURAL", "ON",    "USING", "SET",     "VALUES"};

static const std::unordered_set<string> AGGREGATE_FUNCTIONS = {
    "COUNT",       "SUM",      "AVG",        "MIN",        "MAX",     "STDDEV",    "STDDEV_POP",
    "STDDEV_SAMP", "VARIANCE", "VAR_POP",    "VAR_SAMP",   "MEDIAN",  "MODE",      "GROUP_CONCAT",
    "STRING_AGG",  "ARRAY_AGG", "LIST",      "BIT_AND",    "BIT_OR",  "BIT_XOR",   "BOOL_AND",
    "BOOL_OR",     "EVERY",    "ANY_VALUE", "APPROX_COUNT_DISTINCT", "PERCENTILE_CONT", "PERCENTILE_DISC"};

static bool IsClauseKeyword(const SQLToken &token) {
    return token.type == SQLTokenType::WORD && CLAUSE_KEYWORDS.count(token.upper) > 0;
}

//! Index of the first token after the clause starting at `begin`. The clause ends at a clause keyword or
//! semicolon on its own nesting level, or where the enclosing parenthesis closes.
static idx_t FindClauseEnd(const vector<SQLToken> &tokens, idx_t begin, idx_t depth, bool stop_at_comma) {
    idx_t i = begin;
    for (; i < tokens.size(); i++) {
        auto &token = tokens[i];
        if (token.depth < depth) {
            break;
        }
        if (token.depth > depth) {
            continue;
        }
        if (token.type == SQLTokenType::SEMICOLON || IsClauseKeyword(token)) {
            break;
        }
        if (stop_at_comma && token.type == SQLTokenType::COMMA) {
            break;
        }
    }
    return i;
}

//! Source text covered by tokens [begin, end)
static string Slice(const string &sql, const vector<SQLToken> &tokens, idx_t begin, idx_t end) {
    if (begin >= end || begin >= tokens.size()) {
        return string();
    }
    auto from = tokens[begin].start;
    return sql.substr(from, tokens[end - 1].end - from);
}

//! Index of the first "<first> <second>" keyword pair on the outermost level it occurs on
static bool FindOutermostPair(const vector<SQLToken> &tokens, const char *first, const char *second, idx_t &result) {
    bool found = false;
    for (idx_t i = 0; i + 1 < tokens.size(); i++) {
        if (!tokens[i].IsWord(first) || !tokens[i + 1].IsWord(second)) {
            continue;
        }
        if (!found || tokens[i].depth < tokens[result].depth) {
            result = i;
            found = true;
        }
    }
    return found;
}

static string StripTrailingSemicolons(const string &sql) {
    string result = sql;
    while (!result.empty() && (result.back() == ';' || result.back() == ' ')) {
        result.pop_back();
    }
    return result;
}

//===--------------------------------------------------------------------===//
// QueryFeatureExtractor
//===--------------------------------------------------------------------===//

QueryFeatures QueryFeatureExtractor::Extract(const string &query) {
    QueryFeatures features;
    features.query_text = StripTrailingSemicolons(StringUtil::CollapseWhitespace(query));
    features.normalized_query = StringUtil::Upper(features.query_text);
    features.query_hash = std::hash<string>{}(features.normalized_query);

    auto &sql = features.query_text;
    auto tokens = SQLTokenizer::Tokenize(sql);

    ExtractMutation(tokens, features);
    ExtractJoins(sql, tokens, features);
    ExtractAggregates(sql, tokens, features);
    ExtractGrouping(sql, tokens, features);
    ExtractOrdering(sql, tokens, features);
    ExtractLimit(tokens, features);
    ExtractTables(sql, tokens, features);
    return features;
}

void QueryFeatureExtractor::ExtractMutation(const vector<SQLToken> &tokens, QueryFeatures &features) {
    for (auto &token : tokens) {
        if (token.IsWord("INSERT") || token.IsWord("UPDATE") || token.IsWord("DELETE")) {
            features.is_mutation = true;
            features.mutation_keyword = token.upper;
            return;
        }
    }
}

void QueryFeatureExtractor::ExtractJoins(const string &sql, const vector<SQLToken> &tokens, QueryFeatures &features) {
    for (idx_t i = 0; i < tokens.size(); i++) {
        if (!tokens[i].IsWord("JOIN")) {
            continue;
        }
        features.num_joins++;
        if (features.has_join) {
            continue;
        }
        features.has_join = true;

        // LEFT [OUTER] JOIN, RIGHT [OUTER] JOIN, FULL [OUTER] JOIN; everything else joins as INNER
        idx_t k = i;
        if (k > 0 && tokens[k - 1].IsWord("OUTER")) {
            k--;
        }
        if (k > 0) {
            auto &qualifier = tokens[k - 1];
            if (qualifier.IsWord("LEFT")) {
                features.join_kind = JoinKind::LEFT;
            } else if (qualifier.IsWord("RIGHT")) {
                features.join_kind = JoinKind::RIGHT;
            } else if (qualifier.IsWord("FULL")) {
                features.join_kind = JoinKind::FULL;
            }
        }

        auto depth = tokens[i].depth;
        auto relation_end = FindClauseEnd(tokens, i + 1, depth, true);
        features.join_relation = Slice(sql, tokens, i + 1, relation_end);
        if (relation_end >= tokens.size()) {
            continue;
        }
        auto &next = tokens[relation_end];
        if (next.IsWord("ON")) {
            auto condition_end = FindClauseEnd(tokens, relation_end + 1, depth, false);
            features.join_condition = Slice(sql, tokens, relation_end + 1, condition_end);
        } else if (next.IsWord("USING")) {
            auto condition_end = FindClauseEnd(tokens, relation_end + 1, depth, false);
            features.join_condition = Slice(sql, tokens, relation_end, condition_end);
        }
    }
}

//! Longest aggregate call kept verbatim; longer calls are recorded as "NAME(...)"
static constexpr idx_t MAX_AGGREGATE_TEXT = 64;

//! For every LPAREN, the index of its matching RPAREN (tokens.size() when it is never closed)
static vector<idx_t> MatchParentheses(const vector<SQLToken> &tokens) {
    vector<idx_t> match(tokens.size(), tokens.size());
    vector<idx_t> open;
    for (idx_t i = 0; i < tokens.size(); i++) {
        if (tokens[i].type == SQLTokenType::LPAREN) {
            open.push_back(i);
        } else if (tokens[i].type == SQLTokenType::RPAREN && !open.empty()) {
            match[open.back()] = i;
            open.pop_back();
        }
    }
    return match;
}

void QueryFeatureExtractor::ExtractAggregates(const string &sql, const vector<SQLToken> &tokens,
                                              QueryFeatures &features) {
    vector<idx_t> match;
    for (idx_t i = 0; i + 1 < tokens.size(); i++) {
        auto &token = tokens[i];
        if (token.type != SQLTokenType::WORD || AGGREGATE_FUNCTIONS.count(token.upper) == 0) {
            continue;
        }
        if (tokens[i + 1].type != SQLTokenType::LPAREN) {
            continue;
        }
        // schema.max(...) is a qualified user function, not an aggregate
        if (i > 0 && tokens[i - 1].type == SQLTokenType::SYMBOL && tokens[i - 1].text == ".") {
            continue;
        }
        if (match.empty()) {
            match = MatchParentheses(tokens);
        }
        auto close = match[i + 1];
        auto end = close < tokens.size() ? close + 1 : close;
        if (tokens[end - 1].end - token.start > MAX_AGGREGATE_TEXT) {
            features.aggregates.push_back(token.text + "(...)");
        } else {
            features.aggregates.push_back(Slice(sql, tokens, i, end));
        }
    }
}

void QueryFeatureExtractor::ExtractGrouping(const string &sql, const vector<SQLToken> &tokens,
                                            QueryFeatures &features) {
    idx_t group_idx = 0;
    if (!FindOutermostPair(tokens, "GROUP", "BY", group_idx)) {
        return;
    }
    features.has_groupby = true;
    auto depth = tokens[group_idx].depth;
    auto end = FindClauseEnd(tokens, group_idx + 2, depth, false);
    features.group_by = Slice(sql, tokens, group_idx + 2, end);

    if (end < tokens.size() && tokens[end].IsWord("HAVING") && tokens[end].depth == depth) {
        auto having_end = FindClauseEnd(tokens, end + 1, depth, false);
        features.having = Slice(sql, tokens, end + 1, having_end);
    }
}

void QueryFeatureExtractor::ExtractOrdering(const string &sql, const vector<SQLToken> &tokens,
                                            QueryFeatures &features) {
    idx_t order_idx = 0;
    if (!FindOutermostPair(tokens, "ORDER", "BY", order_idx)) {
        return;
    }
    features.has_orderby = true;
    auto end = FindClauseEnd(tokens, order_idx + 2, tokens[order_idx].depth, false);
    features.order_by = Slice(sql, tokens, order_idx + 2, end);
}

void QueryFeatureExtractor::ExtractLimit(const vector<SQLToken> &tokens, QueryFeatures &features) {
    auto &sql = features.query_text;
    for (idx_t i = 0; i < tokens.size(); i++) {
        if (!tokens[i].IsWord("LIMIT") || tokens[i].depth != 0) {
            continue;
        }
        features.has_limit = true;
        auto end = FindClauseEnd(tokens, i + 1, 0, true);
        features.limit_count = Slice(sql, tokens, i + 1, end);
        if (end < tokens.size() && tokens[end].type == SQLTokenType::COMMA) {
            // MySQL form: LIMIT offset, count
            auto count_end = FindClauseEnd(tokens, end + 1, 0, true);
            features.limit_offset = features.limit_count;
            features.limit_count = Slice(sql, tokens, end + 1, count_end);
        }
        break;
    }
    if (!features.has_limit || !features.limit_offset.empty()) {
        return;
    }
    for (idx_t i = 0; i < tokens.size(); i++) {
        if (tokens[i].IsWord("OFFSET") && tokens[i].depth == 0) {
            auto end = FindClauseEnd(tokens, i + 1, 0, true);
            features.limit_offset = Slice(sql, tokens, i + 1, end);
            break;
        }
    }
}

void QueryFeatureExtractor::ExtractTables(const string &sql, const vector<SQLToken> &tokens,
                                          QueryFeatures &features) {
    auto add_table = [&](const SQLToken &token) {
        if (token.type != SQLTokenType::WORD || IsClauseKeyword(token) || token.IsWord("LATERAL")) {
            return;
        }
        for (auto &existing : features.tables) {
            if (StringUtil::CIEquals(existing, token.text)) {
                return;
            }
        }
        features.tables.push_back(token.text);
    };

    idx_t from_idx = 0;
    bool has_from = false;
    for (idx_t i = 0; i + 1 < tokens.size(); i++) {
        auto &token = tokens[i];
        bool for_update = token.IsWord("UPDATE") && i > 0 && tokens[i - 1].IsWord("FOR");
        if (token.IsWord("FROM")) {
            if (!has_from || token.depth < tokens[from_idx].depth) {
                from_idx = i;
                has_from = true;
            }
            add_table(tokens[i + 1]);
            // comma-separated FROM list
            auto end = FindClauseEnd(tokens, i + 1, token.depth, false);
            for (idx_t k = i + 1; k + 1 < end; k++) {
                if (tokens[k].type == SQLTokenType::COMMA && tokens[k].depth == token.depth) {
                    add_table(tokens[k + 1]);
                }
            }
        } else if (token.IsWord("JOIN") || token.IsWord("INTO") || (token.IsWord("UPDATE") && !for_update)) {
            add_table(tokens[i + 1]);
        }
    }

    // relation the Scan leaf reads from
    for (idx_t i = 0; i + 1 < tokens.size() && features.is_mutation; i++) {
        if (features.mutation_keyword == "INSERT" && tokens[i].IsWord("INTO")) {
            if (tokens[i + 1].type == SQLTokenType::WORD) {
                features.scan_relation = tokens[i + 1].text;
            }
            return;
        }
        if (features.mutation_keyword == "UPDATE" && tokens[i].IsWord("UPDATE")) {
            if (i > 0 && tokens[i - 1].IsWord("FOR")) {
                break;
            }
            auto end = FindClauseEnd(tokens, i + 1, tokens[i].depth, true);
            features.scan_relation = Slice(sql, tokens, i + 1, end);
            return;
        }
    }
    if (has_from) {
        auto end = FindClauseEnd(tokens, from_idx + 1, tokens[from_idx].depth, true);
        features.scan_relation = Slice(sql, tokens, from_idx + 1, end);
    }
}

//===--------------------------------------------------------------------===//
// QueryFeatures
//===--------------------------------------------------------------------===//

nlohmann::json QueryFeatures::ToJSON() const {
    nlohmann::json out;
    out["query_hash"] = query_hash;
    out["is_mutation"] = is_mutation;
    out["num_tables"] = tables.size();
    out["tables"] = tables;
    out["num_joins"] = num_joins;
    if (has_join) {
        out["join_kind"] = JoinKindToString(join_kind);
    }
    out["num_aggregates"] = NumAggregates();
    out["has_groupby"] = has_groupby;
    out["has_orderby"] = has_orderby;
    out["has_limit"] = has_limit;
    return out;
}

} // namespace qrouter
