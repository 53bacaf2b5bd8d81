#pragma once

#include <array>
#include <algorithm>

#include <eosio/asset.hpp>

#include <compound.vault/compound.vault.const.hpp>
#include <compound.vault/vault.config.hpp>
#include <safemath.hpp>

namespace compoundfi { namespace incentive {

using eosio::asset;
using eosio::symbol;
using namespace wasm::safemath;

struct reward_quote {
    asset           amount;                             //claimed reward in its own token
    uint64_t        price       = 0;                    //USD price of one whole token, oracle quote precision
};

struct incentive_split {
    std::array<asset, REWARD_TOKENS>    locker_cut;
    std::array<asset, REWARD_TOKENS>    caller_cut;
    uint128_t                           asset_value = 0;    //reward value in pooled asset units
    asset                               amount_to_compound;
};

/**
 * The claimer pays in `claimer_incentive / PCT_BOOST` of the rewards' asset value.
 */
inline uint128_t compound_amount(const uint128_t& asset_value, const vault_config& conf) {
    return mul(asset_value, conf.claimer_incentive) / PCT_BOOST;
}

inline int64_t locker_cut(const asset& amount, const vault_config& conf) {
    return to_amount( mul((uint128_t)amount.amount, conf.locker_incentive) / PCT_BOOST );
}

/**
 * The claimer keeps each claimed reward net of the locker cut.
 */
inline int64_t caller_cut(const asset& amount, const int64_t& locker_cut) {
    return amount.amount - locker_cut;
}

/**
 * Converts the rewards into pooled asset units at spot prices:
 *    sum(amount[i] * price[i]) / asset_price
 * Token precisions are scaled to the widest one before the single division.
 */
inline uint128_t asset_value(const std::array<reward_quote, REWARD_TOKENS>& rewards,
                             const uint64_t& asset_price, const symbol& asset_symbol) {
    CHECKC( asset_price > 0, err::PRECISION_ERROR, "asset price must be positive" )

    uint8_t widest = asset_symbol.precision();
    for (const auto& r : rewards)
        widest = std::max(widest, r.amount.symbol.precision());

    uint128_t numerator = 0;
    for (const auto& r : rewards) {
        CHECKC( r.price > 0, err::PRECISION_ERROR, "price of " + r.amount.symbol.code().to_string() + " must be positive" )
        CHECKC( r.amount.amount >= 0, err::NOT_POSITIVE, "reward amount must not be negative" )
        auto scaled = mul( mul((uint128_t)r.amount.amount, r.price), power10(widest - r.amount.symbol.precision()) );
        numerator   = add(numerator, scaled);
    }
    auto divisor = mul(asset_price, power10(widest - asset_symbol.precision()));
    return numerator / divisor;
}

inline incentive_split split(const std::array<reward_quote, REWARD_TOKENS>& rewards,
                             const uint64_t& asset_price, const symbol& asset_symbol,
                             const vault_config& conf) {
    incentive_split ret;
    for (uint8_t i = 0; i < REWARD_TOKENS; i++) {
        const auto& amount   = rewards[i].amount;
        CHECKC( amount.amount >= 0, err::NOT_POSITIVE, "reward amount must not be negative" )
        auto cut             = locker_cut(amount, conf);
        ret.locker_cut[i]    = asset(cut, amount.symbol);
        ret.caller_cut[i]    = asset(caller_cut(amount, cut), amount.symbol);
    }
    ret.asset_value          = asset_value(rewards, asset_price, asset_symbol);
    ret.amount_to_compound   = asset(to_amount(compound_amount(ret.asset_value, conf)), asset_symbol);
    return ret;
}

} } //namespace compoundfi::incentive
