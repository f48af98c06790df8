#pragma once

#include "qrouter/common/common.hpp"

namespace qrouter {

class StringUtil {
public:
    static string Lower(const string &str);
    static string Upper(const string &str);
    static string Trim(const string &str);
    //! Replaces every run of whitespace with a single space and trims both ends
    static string CollapseWhitespace(const string &str);
    static string Join(const vector<string> &input, const string &separator);
    static bool CIEquals(const string &l1, const string &l2);
    static bool StartsWith(const string &str, const string &prefix);
};

} // namespace qrouter
