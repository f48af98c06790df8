#include "qrouter/common/exception.hpp"
#include "qrouter/planner/query_classifier.hpp"
#include "qrouter/planner/query_planner.hpp"

#include <gtest/gtest.h>

using namespace qrouter;

TEST(QueryPlannerTest, PlanRootTypes) {
    struct {
        const char *query;
        const char *plan_type;
    } cases[] = {
        {"SELECT * FROM users", "Scan"},
        {"SELECT u.name, p.title FROM users u JOIN posts p ON u.id = p.user_id", "Inner Join"},
        {"SELECT category, COUNT(*) FROM products GROUP BY category", "Aggregation"},
        {"SELECT * FROM users ORDER BY name", "Sort"},
        {"SELECT * FROM users LIMIT 10", "Limit"},
    };
    for (auto &c : cases) {
        auto plan = QueryPlanner::Plan(c.query);
        EXPECT_EQ(plan->GetTypeName(), c.plan_type) << c.query;
        EXPECT_FALSE(QueryPlanner::ExplainPlan(*plan).empty()) << c.query;
    }
}

TEST(QueryPlannerTest, PlainSelectIsBareScan) {
    auto plan = QueryPlanner::Plan("SELECT * FROM users WHERE id = 7");
    EXPECT_EQ(plan->type, PlanNodeType::SCAN);
    EXPECT_TRUE(plan->children.empty());
    EXPECT_EQ(plan->GetAttribute("table"), "users");
    EXPECT_EQ(plan->GetAttribute("sql"), "SELECT * FROM users WHERE id = 7");
    EXPECT_EQ(QueryPlanner::ExplainPlan(*plan), "Scan(users)\n");
}

TEST(QueryPlannerTest, WrappersNestInFixedOrder) {
    auto plan = QueryPlanner::Plan("SELECT u.country, COUNT(*) FROM users u JOIN orders o ON o.user_id = u.id "
                                   "GROUP BY u.country ORDER BY 2 DESC LIMIT 10 OFFSET 5");
    ASSERT_EQ(plan->type, PlanNodeType::LIMIT);
    auto &sort = plan->GetChild();
    ASSERT_EQ(sort.type, PlanNodeType::SORT);
    auto &aggregate = sort.GetChild();
    ASSERT_EQ(aggregate.type, PlanNodeType::AGGREGATION);
    auto &join = aggregate.GetChild();
    ASSERT_EQ(join.type, PlanNodeType::JOIN);
    auto &scan = join.GetChild();
    ASSERT_EQ(scan.type, PlanNodeType::SCAN);
    EXPECT_TRUE(scan.children.empty());
    EXPECT_EQ(plan->Depth(), 5u);

    EXPECT_EQ(QueryPlanner::ExplainPlan(*plan), "Limit(10 OFFSET 5)\n"
                                                "  Sort(2 DESC)\n"
                                                "    Aggregation(COUNT(*)) GROUP BY u.country\n"
                                                "      Inner Join(orders o ON o.user_id = u.id)\n"
                                                "        Scan(users u)\n");
}

TEST(QueryPlannerTest, JoinKindFromQualifier) {
    EXPECT_EQ(QueryPlanner::Plan("SELECT * FROM a LEFT JOIN b ON a.id = b.id")->GetTypeName(), "Left Join");
    EXPECT_EQ(QueryPlanner::Plan("SELECT * FROM a RIGHT JOIN b ON a.id = b.id")->GetTypeName(), "Right Join");
    EXPECT_EQ(QueryPlanner::Plan("SELECT * FROM a FULL OUTER JOIN b ON a.id = b.id")->GetTypeName(), "Full Join");
}

TEST(QueryPlannerTest, JoinNodeRendering) {
    auto plan = QueryPlanner::Plan("SELECT * FROM a JOIN b USING (id) JOIN c ON c.id = a.id");
    EXPECT_EQ(plan->ToString(), "Inner Join(b USING (id)) [2 joins]");
    EXPECT_EQ(plan->GetAttribute("joins"), "2");
}

TEST(QueryPlannerTest, AggregationWithoutGroupBy) {
    auto plan = QueryPlanner::Plan("SELECT MIN(price), MAX(price) FROM products");
    EXPECT_EQ(plan->ToString(), "Aggregation(MIN(price), MAX(price))");
    EXPECT_FALSE(plan->HasAttribute("group_by"));
}

TEST(QueryPlannerTest, AggregationWithHaving) {
    auto plan = QueryPlanner::Plan("SELECT dept, AVG(salary) FROM staff GROUP BY dept HAVING AVG(salary) > 1000");
    EXPECT_EQ(plan->ToString(), "Aggregation(AVG(salary), AVG(salary)) GROUP BY dept HAVING AVG(salary) > 1000");
}

TEST(QueryPlannerTest, MutationPlansAreScans) {
    auto plan = QueryPlanner::Plan("UPDATE users SET name = 'John' WHERE id = 1");
    EXPECT_EQ(plan->type, PlanNodeType::SCAN);
    EXPECT_EQ(plan->ToString(), "Scan(users)");
}

TEST(QueryPlannerTest, EmptyQueryStillExplains) {
    auto plan = QueryPlanner::Plan("");
    EXPECT_EQ(plan->type, PlanNodeType::SCAN);
    EXPECT_EQ(QueryPlanner::ExplainPlan(*plan), "Scan(?)\n");
}

TEST(QueryPlannerTest, ExplainPlanHonorsIndent) {
    auto plan = QueryPlanner::Plan("SELECT * FROM users ORDER BY name");
    EXPECT_EQ(QueryPlanner::ExplainPlan(*plan, "> "), "> Sort(name)\n>   Scan(users)\n");
}

TEST(QueryPlannerTest, ClassificationAndPlanAgree) {
    for (auto query : {"SELECT * FROM users", "SELECT * FROM a JOIN b ON a.x = b.x", "SELECT COUNT(*) FROM t",
                       "SELECT * FROM t ORDER BY x", "SELECT * FROM t LIMIT 1"}) {
        auto plan = QueryPlanner::Plan(query);
        EXPECT_EQ(QueryClassifier::ClassifyPlan(*plan), QueryClassifier::Classify(query)) << query;
    }
}

TEST(PlanNodeTest, NonScanNodesRequireInput) {
    EXPECT_THROW(PlanNode(PlanNodeType::SORT, nullptr), InternalException);
    EXPECT_THROW(PlanNode(PlanNodeType::SCAN, make_uniq<PlanNode>()), InternalException);
    PlanNode scan;
    EXPECT_THROW(scan.GetChild(), InternalException);
}

TEST(PlanNodeTest, FindAttributeSearchesInputs) {
    auto scan = make_uniq<PlanNode>();
    scan->SetAttribute("sql", "SELECT 1");
    PlanNode limit(PlanNodeType::LIMIT, std::move(scan));
    limit.SetAttribute("count", "1");
    EXPECT_EQ(limit.FindAttribute("sql"), "SELECT 1");
    EXPECT_EQ(limit.FindAttribute("count"), "1");
    EXPECT_EQ(limit.FindAttribute("missing"), "");
    EXPECT_TRUE(limit.Contains(PlanNodeType::SCAN));
    EXPECT_FALSE(limit.Contains(PlanNodeType::JOIN));
}
