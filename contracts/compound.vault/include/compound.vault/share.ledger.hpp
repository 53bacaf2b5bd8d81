#pragma once

#include <eosio/asset.hpp>

#include <compound.vault/compound.vault.const.hpp>
#include <safemath.hpp>

namespace compoundfi { namespace shares {

using eosio::asset;
using eosio::symbol;
using namespace wasm::safemath;

enum class rounding: uint8_t {
   DOWN     = 0,
   UP       = 1
};

// shares = assets * (total_shares + 1) / (total_assets + 1)
inline asset to_shares(const asset& assets, const asset& total_shares, const asset& total_assets, const rounding& r) {
    CHECKC( assets.symbol == total_assets.symbol, err::SYMBOL_MISMATCH, "asset symbol mismatch" )
    CHECKC( assets.amount >= 0, err::NOT_POSITIVE, "assets must not be negative" )
    auto num     = (uint128_t)assets.amount;
    auto supply  = (uint128_t)total_shares.amount + 1;
    auto backing = (uint128_t)total_assets.amount + 1;
    auto amount  = r == rounding::UP ? mul_div_up(num, supply, backing) : mul_div(num, supply, backing);
    return asset(to_amount(amount), total_shares.symbol);
}

// assets = shares * (total_assets + 1) / (total_shares + 1)
inline asset to_assets(const asset& shares, const asset& total_shares, const asset& total_assets, const rounding& r) {
    CHECKC( shares.symbol == total_shares.symbol, err::SYMBOL_MISMATCH, "share symbol mismatch" )
    CHECKC( shares.amount >= 0, err::NOT_POSITIVE, "shares must not be negative" )
    auto num     = (uint128_t)shares.amount;
    auto supply  = (uint128_t)total_shares.amount + 1;
    auto backing = (uint128_t)total_assets.amount + 1;
    auto amount  = r == rounding::UP ? mul_div_up(num, backing, supply) : mul_div(num, backing, supply);
    return asset(to_amount(amount), total_assets.symbol);
}

inline asset preview_deposit(const asset& assets, const asset& total_shares, const asset& total_assets) {
    return to_shares(assets, total_shares, total_assets, rounding::DOWN);
}

inline asset preview_mint(const asset& shares, const asset& total_shares, const asset& total_assets) {
    return to_assets(shares, total_shares, total_assets, rounding::UP);
}

inline asset preview_redeem(const asset& shares, const asset& total_shares, const asset& total_assets) {
    return to_assets(shares, total_shares, total_assets, rounding::DOWN);
}

inline asset preview_withdraw(const asset& assets, const asset& total_shares, const asset& total_assets) {
    return to_shares(assets, total_shares, total_assets, rounding::UP);
}

} } //namespace compoundfi::shares
