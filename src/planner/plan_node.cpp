#include "qrouter/planner/plan_node.hpp"
#include "qrouter/common/exception.hpp"
#include "qrouter/common/string_util.hpp"

#include <algorithm>

namespace qrouter {

PlanNode::PlanNode() : type(PlanNodeType::SCAN), join_kind(JoinKind::INNER) {
}

PlanNode::PlanNode(PlanNodeType type_p, unique_ptr<PlanNode> child)
    : type(type_p), join_kind(JoinKind::INNER) {
    if (type == PlanNodeType::SCAN) {
        throw InternalException("a Scan plan node cannot have an input");
    }
    children.push_back(CheckChild(type, std::move(child)));
}

PlanNode::PlanNode(JoinKind join_kind_p, unique_ptr<PlanNode> child)
    : type(PlanNodeType::JOIN), join_kind(join_kind_p) {
    children.push_back(CheckChild(type, std::move(child)));
}

unique_ptr<PlanNode> PlanNode::CheckChild(PlanNodeType type, unique_ptr<PlanNode> child) {
    if (!child) {
        throw InternalException(PlanNodeTypeToString(type) + " plan node requires an input");
    }
    return child;
}

string PlanNode::GetTypeName() const {
    if (type == PlanNodeType::JOIN) {
        return JoinKindToString(join_kind) + " Join";
    }
    return PlanNodeTypeToString(type);
}

string PlanNode::ToString() const {
    switch (type) {
    case PlanNodeType::SCAN: {
        auto table = GetAttribute("table");
        return "Scan(" + (table.empty() ? string("?") : table) + ")";
    }
    case PlanNodeType::JOIN: {
        string result = GetTypeName() + "(" + GetAttribute("table");
        auto condition = GetAttribute("condition");
        if (!condition.empty()) {
            if (StringUtil::StartsWith(StringUtil::Upper(condition), "USING")) {
                result += " " + condition;
            } else {
                result += " ON " + condition;
            }
        }
        result += ")";
        if (HasAttribute("joins")) {
            result += " [" + GetAttribute("joins") + " joins]";
        }
        return result;
    }
    case PlanNodeType::AGGREGATION: {
        string result = "Aggregation(" + GetAttribute("aggregates") + ")";
        if (HasAttribute("group_by")) {
            result += " GROUP BY " + GetAttribute("group_by");
        }
        if (HasAttribute("having")) {
            result += " HAVING " + GetAttribute("having");
        }
        return result;
    }
    case PlanNodeType::SORT:
        return "Sort(" + GetAttribute("order_by") + ")";
    case PlanNodeType::LIMIT: {
        string result = "Limit(" + GetAttribute("count");
        if (HasAttribute("offset")) {
            result += " OFFSET " + GetAttribute("offset");
        }
        return result + ")";
    }
    }
    return GetTypeName();
}

bool PlanNode::HasAttribute(const string &key) const {
    return attributes.find(key) != attributes.end();
}

string PlanNode::GetAttribute(const string &key) const {
    auto entry = attributes.find(key);
    return entry == attributes.end() ? string() : entry->second;
}

void PlanNode::SetAttribute(const string &key, const string &value) {
    attributes[key] = value;
}

const PlanNode &PlanNode::GetChild() const {
    if (children.empty()) {
        throw InternalException(GetTypeName() + " plan node has no input");
    }
    return *children[0];
}

string PlanNode::FindAttribute(const string &key) const {
    auto entry = attributes.find(key);
    if (entry != attributes.end()) {
        return entry->second;
    }
    for (auto &child : children) {
        auto result = child->FindAttribute(key);
        if (!result.empty()) {
            return result;
        }
    }
    return string();
}

bool PlanNode::Contains(PlanNodeType node_type) const {
    if (type == node_type) {
        return true;
    }
    for (auto &child : children) {
        if (child->Contains(node_type)) {
            return true;
        }
    }
    return false;
}

idx_t PlanNode::Depth() const {
    idx_t max_child = 0;
    for (auto &child : children) {
        max_child = std::max(max_child, child->Depth());
    }
    return max_child + 1;
}

} // namespace qrouter
