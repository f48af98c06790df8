#include "qrouter/parser/query_features.hpp"
#include "qrouter/parser/sql_tokenizer.hpp"

#include <gtest/gtest.h>

#include <chrono>

using namespace qrouter;

TEST(SQLTokenizerTest, TracksParenthesisDepth) {
    auto tokens = SQLTokenizer::Tokenize("SELECT COUNT(x) FROM t");
    ASSERT_EQ(tokens.size(), 7u);
    EXPECT_EQ(tokens[0].type, SQLTokenType::WORD);
    EXPECT_EQ(tokens[1].upper, "COUNT");
    EXPECT_EQ(tokens[2].type, SQLTokenType::LPAREN);
    EXPECT_EQ(tokens[2].depth, 0u);
    EXPECT_EQ(tokens[3].depth, 1u);
    EXPECT_EQ(tokens[4].type, SQLTokenType::RPAREN);
    EXPECT_EQ(tokens[4].depth, 0u);
    EXPECT_EQ(tokens[6].text, "t");
}

TEST(SQLTokenizerTest, UnbalancedParenthesesNeverGoNegative) {
    auto tokens = SQLTokenizer::Tokenize(")) SELECT (");
    for (auto &token : tokens) {
        EXPECT_EQ(token.depth, 0u);
    }
}

TEST(QueryFeaturesTest, NormalizesText) {
    auto features = QueryFeatureExtractor::Extract("  select *\n\tfrom   users ;  ");
    EXPECT_EQ(features.query_text, "select * from users");
    EXPECT_EQ(features.normalized_query, "SELECT * FROM USERS");
    EXPECT_EQ(features.query_hash, QueryFeatureExtractor::Extract("SELECT * FROM users").query_hash);
}

TEST(QueryFeaturesTest, DetectsMutations) {
    EXPECT_TRUE(QueryFeatureExtractor::Extract("insert into users values (1)").is_mutation);
    EXPECT_EQ(QueryFeatureExtractor::Extract("UPDATE users SET name = 'x'").mutation_keyword, "UPDATE");
    EXPECT_EQ(QueryFeatureExtractor::Extract("Delete From users").mutation_keyword, "DELETE");
    EXPECT_FALSE(QueryFeatureExtractor::Extract("SELECT updated_at, inserted FROM users").is_mutation);
}

TEST(QueryFeaturesTest, ExtractsJoinDetails) {
    auto features =
        QueryFeatureExtractor::Extract("SELECT u.name, p.title FROM users u JOIN posts p ON u.id = p.user_id");
    EXPECT_TRUE(features.has_join);
    EXPECT_EQ(features.num_joins, 1u);
    EXPECT_EQ(features.join_kind, JoinKind::INNER);
    EXPECT_EQ(features.join_relation, "posts p");
    EXPECT_EQ(features.join_condition, "u.id = p.user_id");
    EXPECT_EQ(features.scan_relation, "users u");
    EXPECT_EQ(features.tables, (vector<string>{"users", "posts"}));
}

TEST(QueryFeaturesTest, ExtractsJoinKinds) {
    EXPECT_EQ(QueryFeatureExtractor::Extract("SELECT * FROM a LEFT JOIN b ON a.id = b.id").join_kind, JoinKind::LEFT);
    EXPECT_EQ(QueryFeatureExtractor::Extract("SELECT * FROM a RIGHT OUTER JOIN b ON a.id = b.id").join_kind,
              JoinKind::RIGHT);
    EXPECT_EQ(QueryFeatureExtractor::Extract("SELECT * FROM a full outer join b USING (id)").join_kind,
              JoinKind::FULL);
    EXPECT_EQ(QueryFeatureExtractor::Extract("SELECT * FROM a CROSS JOIN b").join_kind, JoinKind::INNER);
}

TEST(QueryFeaturesTest, JoinUsingAndMultipleJoins) {
    auto features = QueryFeatureExtractor::Extract(
        "SELECT * FROM orders o JOIN customers c USING (customer_id) JOIN items i ON i.order_id = o.id WHERE o.id = 1");
    EXPECT_EQ(features.num_joins, 2u);
    EXPECT_EQ(features.join_relation, "customers c");
    EXPECT_EQ(features.join_condition, "USING (customer_id)");
    EXPECT_EQ(features.tables, (vector<string>{"orders", "customers", "items"}));
}

TEST(QueryFeaturesTest, ExtractsAggregatesAndGrouping) {
    auto features = QueryFeatureExtractor::Extract(
        "SELECT category, COUNT(*), SUM(price * qty) FROM products GROUP BY category HAVING COUNT(*) > 5");
    EXPECT_EQ(features.aggregates, (vector<string>{"COUNT(*)", "SUM(price * qty)", "COUNT(*)"}));
    EXPECT_TRUE(features.has_groupby);
    EXPECT_EQ(features.group_by, "category");
    EXPECT_EQ(features.having, "COUNT(*) > 5");
    EXPECT_TRUE(features.HasAggregation());
}

TEST(QueryFeaturesTest, LongAggregateIsRecordedByName) {
    string argument(100, 'x');
    auto features = QueryFeatureExtractor::Extract("SELECT count(" + argument + ") FROM t");
    EXPECT_EQ(features.aggregates, (vector<string>{"count(...)"}));
}

TEST(QueryFeaturesTest, DeeplyNestedAggregatesStayBounded) {
    const idx_t depth = 20000;
    string query = "SELECT ";
    for (idx_t i = 0; i < depth; i++) {
        query += "COUNT(";
    }
    query += "x";
    string closed = query + string(depth, ')') + " FROM t";
    string unclosed = query + " FROM t";

    for (auto &sql : {closed, unclosed}) {
        auto start = std::chrono::steady_clock::now();
        auto features = QueryFeatureExtractor::Extract(sql);
        auto elapsed = std::chrono::steady_clock::now() - start;

        ASSERT_EQ(features.aggregates.size(), depth);
        idx_t stored = 0;
        for (auto &aggregate : features.aggregates) {
            stored += aggregate.size();
        }
        EXPECT_LE(stored, depth * 64);
        EXPECT_EQ(features.aggregates.front(), "COUNT(...)");
        EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 2000);
    }
    auto features = QueryFeatureExtractor::Extract(closed);
    EXPECT_EQ(features.aggregates.back(), "COUNT(x)");
}

TEST(QueryFeaturesTest, QualifiedFunctionIsNotAnAggregate) {
    auto features = QueryFeatureExtractor::Extract("SELECT util.max(a, b) FROM t");
    EXPECT_TRUE(features.aggregates.empty());
    EXPECT_FALSE(features.HasAggregation());
}

TEST(QueryFeaturesTest, ExtractsOrdering) {
    auto features = QueryFeatureExtractor::Extract("SELECT * FROM users ORDER BY name DESC, id LIMIT 5");
    EXPECT_TRUE(features.has_orderby);
    EXPECT_EQ(features.order_by, "name DESC, id");
}

TEST(QueryFeaturesTest, LimitForms) {
    auto plain = QueryFeatureExtractor::Extract("SELECT * FROM users LIMIT 10");
    EXPECT_TRUE(plain.has_limit);
    EXPECT_EQ(plain.limit_count, "10");
    EXPECT_TRUE(plain.limit_offset.empty());

    auto offset = QueryFeatureExtractor::Extract("SELECT * FROM users LIMIT 10 OFFSET 20");
    EXPECT_EQ(offset.limit_count, "10");
    EXPECT_EQ(offset.limit_offset, "20");

    auto mysql = QueryFeatureExtractor::Extract("SELECT * FROM users LIMIT 20, 10");
    EXPECT_EQ(mysql.limit_count, "10");
    EXPECT_EQ(mysql.limit_offset, "20");
}

TEST(QueryFeaturesTest, NestedLimitIsNotTopLevel) {
    auto features = QueryFeatureExtractor::Extract("SELECT * FROM (SELECT * FROM users LIMIT 10) AS recent");
    EXPECT_FALSE(features.has_limit);
}

TEST(QueryFeaturesTest, MutationScanRelation) {
    EXPECT_EQ(QueryFeatureExtractor::Extract("INSERT INTO users (name) VALUES ('a')").scan_relation, "users");
    EXPECT_EQ(QueryFeatureExtractor::Extract("UPDATE users SET name = 'a' WHERE id = 1").scan_relation, "users");
    EXPECT_EQ(QueryFeatureExtractor::Extract("DELETE FROM users WHERE id = 1").scan_relation, "users");
}

TEST(QueryFeaturesTest, EmptyAndMalformedTextYieldNoCues) {
    for (auto query : {"", "   ", ";;", "((((", "SELECT FROM WHERE"}) {
        auto features = QueryFeatureExtractor::Extract(query);
        EXPECT_FALSE(features.is_mutation) << query;
        EXPECT_FALSE(features.has_join) << query;
        EXPECT_FALSE(features.HasAggregation()) << query;
        EXPECT_FALSE(features.has_orderby) << query;
        EXPECT_FALSE(features.has_limit) << query;
    }
}

TEST(QueryFeaturesTest, KeywordsInsideLiteralsAreStillDetected) {
    // lexical heuristic: string literals are not parsed
    auto features = QueryFeatureExtractor::Extract("SELECT * FROM notes WHERE body = 'please delete me'");
    EXPECT_TRUE(features.is_mutation);
}

TEST(QueryFeaturesTest, ToJSONCarriesCounts) {
    auto json = QueryFeatureExtractor::Extract("SELECT a, COUNT(*) FROM t JOIN u ON t.id = u.id GROUP BY a").ToJSON();
    EXPECT_EQ(json["num_joins"], 1);
    EXPECT_EQ(json["num_aggregates"], 1);
    EXPECT_EQ(json["join_kind"], "Inner");
    EXPECT_EQ(json["has_groupby"], true);
    EXPECT_EQ(json["num_tables"], 2);
}
