#pragma once

#include <limits>
#include <string>
#include <string_view>
#include <vector>

#include "treat.const.hpp"

namespace indietreat {

using std::string;
using std::string_view;
using std::vector;

// splits at most (max_parts - 1) times, the last part keeps the remaining delimiters
inline vector<string_view> split(string_view str, string_view delims, size_t max_parts = 0) {
    vector<string_view> ret;
    size_t start = 0;
    while (true) {
        if (max_parts > 0 && ret.size() + 1 == max_parts) {
            ret.push_back(str.substr(start));
            break;
        }
        auto pos = str.find(delims, start);
        if (pos == string_view::npos) {
            ret.push_back(str.substr(start));
            break;
        }
        ret.push_back(str.substr(start, pos - start));
        start = pos + delims.size();
    }
    return ret;
}

inline uint64_t to_uint64(string_view str, const char* title) {
    CHECKC( !str.empty() && str.size() <= 20, err::PARAM_ERROR, string(title) + " must be a non-empty number" )
    uint64_t ret = 0;
    for (auto c : str) {
        CHECKC( c >= '0' && c <= '9', err::PARAM_ERROR, string(title) + " contains non-digit: " + string(str) )
        uint64_t digit = c - '0';
        CHECKC( ret <= (std::numeric_limits<uint64_t>::max() - digit) / 10, err::PARAM_ERROR, string(title) + " overflow: " + string(str) )
        ret = ret * 10 + digit;
    }
    return ret;
}

inline name to_name(string_view str, const char* title) {
    CHECKC( !str.empty() && str.size() <= 13, err::ACCOUNT_INVALID, string(title) + " is not a valid account name" )
    return name(str);
}

} //namespace indietreat
