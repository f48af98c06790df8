#include "qrouter/common/string_util.hpp"

#include <algorithm>
#include <cctype>

namespace qrouter {

string StringUtil::Lower(const string &str) {
    string copy(str);
    std::transform(copy.begin(), copy.end(), copy.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return copy;
}

string StringUtil::Upper(const string &str) {
    string copy(str);
    std::transform(copy.begin(), copy.end(), copy.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return copy;
}

string StringUtil::Trim(const string &str) {
    auto begin = str.find_first_not_of(" \t\n\r\f\v");
    if (begin == string::npos) {
        return string();
    }
    auto end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(begin, end - begin + 1);
}

string StringUtil::CollapseWhitespace(const string &str) {
    string result;
    result.reserve(str.size());
    bool pending_space = false;
    for (char c : str) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !result.empty();
            continue;
        }
        if (pending_space) {
            result += ' ';
            pending_space = false;
        }
        result += c;
    }
    return result;
}

string StringUtil::Join(const vector<string> &input, const string &separator) {
    string result;
    for (idx_t i = 0; i < input.size(); i++) {
        if (i > 0) {
            result += separator;
        }
        result += input[i];
    }
    return result;
}

bool StringUtil::CIEquals(const string &l1, const string &l2) {
    if (l1.size() != l2.size()) {
        return false;
    }
    for (idx_t i = 0; i < l1.size(); i++) {
        if (std::tolower(static_cast<unsigned char>(l1[i])) != std::tolower(static_cast<unsigned char>(l2[i]))) {
            return false;
        }
    }
    return true;
}

bool StringUtil::StartsWith(const string &str, const string &prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

} // namespace qrouter
