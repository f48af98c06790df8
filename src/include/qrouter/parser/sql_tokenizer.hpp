#pragma once

#include "qrouter/common/common.hpp"

namespace qrouter {

enum class SQLTokenType : uint8_t {
    WORD,      // keyword or identifier
    NUMBER,    // numeric literal
    LPAREN,
    RPAREN,
    COMMA,
    SEMICOLON,
    SYMBOL     // any other single character, quotes included
};

struct SQLToken {
    SQLTokenType type;
    string text;  // as written
    string upper; // upper-cased text, used for keyword matching
    //! Parenthesis nesting depth; a parenthesis token carries the depth of its enclosing level
    idx_t depth;
    //! Byte range [start, end) in the tokenized string
    idx_t start;
    idx_t end;

    bool IsWord(const char *keyword) const {
        return type == SQLTokenType::WORD && upper == keyword;
    }
};

//! Lexical scanner for the routing heuristics. It is not a SQL lexer: quoted
//! literals are not recognized, so words inside string literals become tokens
//! like any other word. Unbalanced parentheses never drive the depth below zero.
class SQLTokenizer {
public:
    static vector<SQLToken> Tokenize(const string &sql);
};

} // namespace qrouter
