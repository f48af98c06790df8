#include "qrouter/engine/mysql_parameters.hpp"
#include "qrouter/common/exception.hpp"

#include <algorithm>
#include <cctype>

namespace qrouter {

// "--" only starts a comment when followed by whitespace or the end of the query
static bool StartsDashComment(const string &query, idx_t i) {
    if (query.compare(i, 2, "--") != 0) {
        return false;
    }
    return i + 2 >= query.size() || std::isspace(static_cast<unsigned char>(query[i + 2]));
}

string MySQLParameterBinder::RenderLiteral(const Value &value, const escape_function_t &escape) {
    switch (value.type()) {
    case ValueType::SQLNULL:
        return "NULL";
    case ValueType::BOOLEAN:
        return value.GetBoolean() ? "TRUE" : "FALSE";
    case ValueType::BIGINT:
    case ValueType::DOUBLE:
        return value.ToString();
    case ValueType::VARCHAR:
        return "'" + escape(value.GetString()) + "'";
    }
    throw InternalException("unhandled value type in parameter binding");
}

string MySQLParameterBinder::Bind(const string &query, const vector<Value> &args, const escape_function_t &escape) {
    string bound;
    bound.reserve(query.size());
    idx_t next = 0;
    idx_t i = 0;
    while (i < query.size()) {
        char c = query[i];
        if (c == '\'' || c == '"' || c == '`') {
            // copy the quoted text through its closing quote
            idx_t end = i + 1;
            while (end < query.size() && query[end] != c) {
                if (query[end] == '\\' && c != '`') {
                    end++;
                }
                end++;
            }
            end = std::min<idx_t>(end + 1, query.size());
            bound.append(query, i, end - i);
            i = end;
            continue;
        }
        if (c == '#' || StartsDashComment(query, i)) {
            auto end = query.find('\n', i);
            end = end == string::npos ? query.size() : end;
            bound.append(query, i, end - i);
            i = end;
            continue;
        }
        if (query.compare(i, 2, "/*") == 0) {
            auto end = query.find("*/", i + 2);
            end = end == string::npos ? query.size() : end + 2;
            bound.append(query, i, end - i);
            i = end;
            continue;
        }
        i++;
        if (c != '?') {
            bound += c;
            continue;
        }
        if (next >= args.size()) {
            throw InvalidInputException("query has more placeholders than the " + std::to_string(args.size()) +
                                        " bound parameters");
        }
        bound += RenderLiteral(args[next++], escape);
    }
    if (next != args.size()) {
        throw InvalidInputException("query uses " + std::to_string(next) + " placeholders but " +
                                    std::to_string(args.size()) + " parameters were bound");
    }
    return bound;
}

} // namespace qrouter
