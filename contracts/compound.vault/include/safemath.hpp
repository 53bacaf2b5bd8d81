#pragma once

#include <eosio/eosio.hpp>
#include <eosio/asset.hpp>

namespace wasm { namespace safemath {

    static constexpr uint128_t UINT128_MAX_VALUE = ~uint128_t(0);

    inline uint128_t add(const uint128_t& a, const uint128_t& b) {
        eosio::check(a <= UINT128_MAX_VALUE - b, "safemath: addition overflow");
        return a + b;
    }

    inline uint128_t mul(const uint128_t& a, const uint128_t& b) {
        if (a == 0 || b == 0) return 0;
        eosio::check(a <= UINT128_MAX_VALUE / b, "safemath: multiplication overflow");
        return a * b;
    }

    //truncates toward zero
    inline uint128_t div_down(const uint128_t& a, const uint128_t& b) {
        eosio::check(b != 0, "safemath: division by zero");
        return a / b;
    }

    inline uint128_t div_up(const uint128_t& a, const uint128_t& b) {
        eosio::check(b != 0, "safemath: division by zero");
        return a / b + (a % b == 0 ? 0 : 1);
    }

    inline uint128_t mul_div(const uint128_t& a, const uint128_t& b, const uint128_t& c) {
        return div_down(mul(a, b), c);
    }

    inline uint128_t mul_div_up(const uint128_t& a, const uint128_t& b, const uint128_t& c) {
        return div_up(mul(a, b), c);
    }

    inline uint128_t power10(const uint8_t& exp) {
        uint128_t ret = 1;
        for (uint8_t i = 0; i < exp; i++) ret = mul(ret, 10);
        return ret;
    }

    inline int64_t to_amount(const uint128_t& v) {
        eosio::check(v <= uint128_t(eosio::asset::max_amount), "safemath: amount exceeds asset range");
        return (int64_t)v;
    }

} } //safemath
