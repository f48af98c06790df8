#pragma once

#include "qrouter/common/common.hpp"
#include "qrouter/common/types/value.hpp"

#include <functional>

namespace qrouter {

//! Client-side binding of positional `?` parameters for the MySQL text protocol.
class MySQLParameterBinder {
public:
    //! Escapes the body of a string literal, e.g. through mysql_real_escape_string()
    typedef std::function<string(const string &)> escape_function_t;

    //! Replaces every `?` outside of quoted text and comments with the matching argument rendered as a
    //! SQL literal. Backslash escapes inside '...' and "..." are honored, as are `-- `, `#` and `/* */`
    //! comments. Throws InvalidInputException when placeholders and arguments do not pair up.
    static string Bind(const string &query, const vector<Value> &args, const escape_function_t &escape);

private:
    static string RenderLiteral(const Value &value, const escape_function_t &escape);
};

} // namespace qrouter
