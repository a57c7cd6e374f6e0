#pragma once

#include <eosio/eosio.hpp>
#include <eosio/print.hpp>

#include <string>
#include <string_view>
#include <vector>

#define PP(prop) "," #prop ":", prop
#define PP0(prop) #prop ":", prop
#define PRINT_PROPERTIES(...) eosio::print("{", __VA_ARGS__, "}")

#define CHECK(exp, msg) { if (!(exp)) eosio::check(false, msg); }

#ifndef ASSERT
    #define ASSERT(exp) CHECK(exp, #exp)
#endif

using std::string;
using std::string_view;
using std::vector;

inline vector<string_view> split(string_view str, string_view delims = " ") {
    vector<string_view> res;
    std::size_t current, previous = 0;
    current = str.find_first_of(delims);
    while (current != std::string_view::npos) {
        res.push_back(str.substr(previous, current - previous));
        previous = current + 1;
        current = str.find_first_of(delims, previous);
    }
    res.push_back(str.substr(previous, current - previous));
    return res;
}
