#pragma once

#include "qrouter/common/common.hpp"
#include "qrouter/common/enums/plan_node_type.hpp"

#include <map>

namespace qrouter {

//! One node of a logical query plan. A SCAN is a leaf; every other node wraps exactly one input.
//! The node type is fixed at construction.
class PlanNode {
public:
    //! Creates a SCAN leaf
    PlanNode();
    //! Creates a JOIN, AGGREGATION, SORT or LIMIT node over `child`
    PlanNode(PlanNodeType type, unique_ptr<PlanNode> child);
    //! Creates a JOIN node of the given kind over `child`
    PlanNode(JoinKind join_kind, unique_ptr<PlanNode> child);

    //! The type of the plan node
    const PlanNodeType type;
    //! Only meaningful when type == JOIN
    const JoinKind join_kind;
    //! The input of this node; empty for SCAN, a single entry otherwise
    vector<unique_ptr<PlanNode>> children;
    //! Node-specific details such as the join condition or the limit count
    std::map<string, string> attributes;

public:
    //! "Inner Join", "Left Join", ... for joins, PlanNodeTypeToString otherwise
    string GetTypeName() const;
    //! One-line rendering of this node without its children
    string ToString() const;

    bool HasAttribute(const string &key) const;
    //! The attribute value, or an empty string if it is not set
    string GetAttribute(const string &key) const;
    void SetAttribute(const string &key, const string &value);

    const PlanNode &GetChild() const;
    //! Depth-first search for an attribute, starting at this node and descending through its inputs
    string FindAttribute(const string &key) const;
    //! True if this node or any node below it has the given type
    bool Contains(PlanNodeType node_type) const;
    idx_t Depth() const;

private:
    static unique_ptr<PlanNode> CheckChild(PlanNodeType type, unique_ptr<PlanNode> child);
};

} // namespace qrouter
