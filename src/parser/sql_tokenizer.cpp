#include "qrouter/parser/sql_tokenizer.hpp"
#include "qrouter/common/string_util.hpp"

#include <cctype>

namespace qrouter {

static bool IsWordStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

static bool IsWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

vector<SQLToken> SQLTokenizer::Tokenize(const string &sql) {
    vector<SQLToken> tokens;
    idx_t depth = 0;
    idx_t pos = 0;
    while (pos < sql.size()) {
        char c = sql[pos];
        if (std::isspace(static_cast<unsigned char>(c))) {
            pos++;
            continue;
        }
        SQLToken token;
        token.start = pos;
        if (IsWordStart(c)) {
            token.type = SQLTokenType::WORD;
            while (pos < sql.size() && IsWordChar(sql[pos])) {
                pos++;
            }
        } else if (std::isdigit(static_cast<unsigned char>(c))) {
            token.type = SQLTokenType::NUMBER;
            while (pos < sql.size() && (std::isdigit(static_cast<unsigned char>(sql[pos])) || sql[pos] == '.')) {
                pos++;
            }
        } else {
            switch (c) {
            case '(':
                token.type = SQLTokenType::LPAREN;
                break;
            case ')':
                token.type = SQLTokenType::RPAREN;
                break;
            case ',':
                token.type = SQLTokenType::COMMA;
                break;
            case ';':
                token.type = SQLTokenType::SEMICOLON;
                break;
            default:
                token.type = SQLTokenType::SYMBOL;
                break;
            }
            pos++;
        }
        token.end = pos;
        token.text = sql.substr(token.start, token.end - token.start);
        token.upper = StringUtil::Upper(token.text);

        if (token.type == SQLTokenType::RPAREN && depth > 0) {
            depth--;
        }
        token.depth = depth;
        if (token.type == SQLTokenType::LPAREN) {
            depth++;
        }
        tokens.push_back(std::move(token));
    }
    return tokens;
}

} // namespace qrouter
