#pragma once

#include <eosio/asset.hpp>
#include <eosio/name.hpp>
#include <eosio/symbol.hpp>

#include <compound.vault/compound.vault.const.hpp>

namespace compoundfi {

using eosio::name;
using eosio::extended_symbol;

//upper bounds fixed by init, immutable afterwards
struct incentive_bounds {
    uint32_t        max_claimer_incentive       = 0;
    uint32_t        max_locker_incentive        = 0;

    EOSLIB_SERIALIZE( incentive_bounds, (max_claimer_incentive)(max_locker_incentive) )
};

/**
 * Incentive rates in basis points of PCT_BOOST plus the locker payout account.
 * Replaced as a whole by setconfig; `version` counts replacements.
 */
struct vault_config {
    uint32_t        claimer_incentive           = 0;    //share of reward value the claimer pays in
    uint32_t        locker_incentive            = 0;    //share of each claimed reward sent to locker_rewards
    name            locker_rewards;
    uint64_t        version                     = 0;

    EOSLIB_SERIALIZE( vault_config, (claimer_incentive)(locker_incentive)(locker_rewards)(version) )
};

struct vault_tokens {
    extended_symbol asset_token;                        //pooled asset staked in the reward pool
    extended_symbol primary_token;                      //reward paid by the pool
    extended_symbol secondary_token;                    //reward minted pro rata to the primary one

    EOSLIB_SERIALIZE( vault_tokens, (asset_token)(primary_token)(secondary_token) )
};

inline void validate_bounds(const incentive_bounds& bounds) {
    CHECKC( bounds.max_claimer_incentive <= PCT_BOOST, err::CONFIG_INVALID,
            "max claimer incentive exceeds " + std::to_string(PCT_BOOST) )
    CHECKC( bounds.max_locker_incentive <= PCT_BOOST, err::CONFIG_INVALID,
            "max locker incentive exceeds " + std::to_string(PCT_BOOST) )
}

inline void validate_config(const vault_config& conf, const incentive_bounds& bounds) {
    CHECKC( conf.claimer_incentive <= bounds.max_claimer_incentive, err::CONFIG_INVALID,
            "claimer incentive " + std::to_string(conf.claimer_incentive) + " exceeds max "
            + std::to_string(bounds.max_claimer_incentive) )
    CHECKC( conf.locker_incentive <= bounds.max_locker_incentive, err::CONFIG_INVALID,
            "locker incentive " + std::to_string(conf.locker_incentive) + " exceeds max "
            + std::to_string(bounds.max_locker_incentive) )
    CHECKC( conf.locker_rewards != name(), err::CONFIG_INVALID, "locker rewards account is null" )
}

/**
 * Builds the replacement of `current`; validation runs before anything is returned,
 * so a rejected update never reaches the caller's copy.
 */
inline vault_config next_config(const vault_config& current, const incentive_bounds& bounds,
                                const uint32_t& claimer_incentive, const uint32_t& locker_incentive,
                                const name& locker_rewards) {
    vault_config next;
    next.claimer_incentive     = claimer_incentive;
    next.locker_incentive      = locker_incentive;
    next.locker_rewards        = locker_rewards;
    next.version               = current.version + 1;
    validate_config(next, bounds);
    return next;
}

inline void validate_tokens(const vault_tokens& tokens) {
    CHECKC( tokens.asset_token.get_contract() != name()
         && tokens.primary_token.get_contract() != name()
         && tokens.secondary_token.get_contract() != name(), err::PARAM_ERROR, "token contract is null" )
    CHECKC( tokens.asset_token.get_symbol().is_valid()
         && tokens.primary_token.get_symbol().is_valid()
         && tokens.secondary_token.get_symbol().is_valid(), err::SYMBOL_MISMATCH, "invalid token symbol" )
    CHECKC( tokens.asset_token != tokens.primary_token
         && tokens.asset_token != tokens.secondary_token
         && tokens.primary_token != tokens.secondary_token, err::PARAM_ERROR, "tokens must be distinct" )
}

} //namespace compoundfi
