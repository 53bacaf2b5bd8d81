#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <eosio/eosio.hpp>
#include <eosio/asset.hpp>

#define CHECK(exp, msg) { if (!(exp)) eosio::check(false, msg); }

#define TRACE(...) eosio::print(__VA_ARGS__, "\n")

using std::string;
using std::string_view;
using std::vector;

inline vector<string_view> split(string_view str, string_view delims = " ") {
    vector<string_view> res;
    std::size_t current, previous = 0;
    current = str.find_first_of(delims);
    while (current != string_view::npos) {
        res.push_back(str.substr(previous, current - previous));
        previous = current + 1;
        current = str.find_first_of(delims, previous);
    }
    res.push_back(str.substr(previous, current - previous));
    return res;
}

//decimal digits only, no sign
inline int64_t to_int64(string_view str, const char* title) {
    CHECK( !str.empty() && str.size() <= 19, string(title) + " is not a valid amount" )
    uint64_t ret = 0;
    for (auto c : str) {
        CHECK( c >= '0' && c <= '9', string(title) + " is not a valid amount" )
        ret = ret * 10 + (c - '0');
    }
    CHECK( ret <= (uint64_t)eosio::asset::max_amount, string(title) + " exceeds asset range" )
    return (int64_t)ret;
}
