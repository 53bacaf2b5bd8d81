#pragma once

#include <compound.vault/compound.vault.const.hpp>
#include <safemath.hpp>

namespace compoundfi { namespace emission {

using namespace wasm::safemath;

static constexpr uint128_t REDUCTION_MULTIPLIER  = 5;
static constexpr uint128_t REDUCTION_DIVISOR     = 2;
static constexpr uint128_t REDUCTION_BASE        = 700;

/**
 * Emission schedule of the secondary reward token. Each cliff covers
 * `reduction_per_cliff` of emitted supply; the mint ratio per primary
 * reward decays cliff by cliff until `total_cliffs` or `max_emission_supply`
 * is reached.
 */
struct emission_conf {
    uint128_t       init_mint_amount            = 0;    //supply minted before emissions started
    uint128_t       total_cliffs                = 0;
    uint128_t       reduction_per_cliff         = 0;
    uint128_t       max_emission_supply         = 0;
    uint128_t       minter_minted               = 0;    //supply minted outside the schedule

    EOSLIB_SERIALIZE( emission_conf, (init_mint_amount)(total_cliffs)(reduction_per_cliff)
                                     (max_emission_supply)(minter_minted) )
};

inline void validate(const emission_conf& conf) {
    CHECKC( conf.total_cliffs > 0, err::PARAM_ERROR, "total cliffs must be positive" )
    CHECKC( conf.reduction_per_cliff > 0, err::PARAM_ERROR, "reduction per cliff must be positive" )
}

inline uint128_t emissions_minted(const uint128_t& secondary_supply, const emission_conf& conf) {
    CHECKC( secondary_supply >= conf.init_mint_amount, err::PRECISION_ERROR,
            "secondary supply below initial mint amount" )
    auto minted = secondary_supply - conf.init_mint_amount;
    CHECKC( minted >= conf.minter_minted, err::PRECISION_ERROR,
            "secondary supply below minter minted amount" )
    return minted - conf.minter_minted;
}

//supply minted outside the schedule must already be part of the live supply
inline void validate_minter_minted(const uint128_t& minter_minted, const uint128_t& secondary_supply,
                                   const emission_conf& conf) {
    CHECKC( secondary_supply >= add(conf.init_mint_amount, minter_minted), err::CONFIG_INVALID,
            "minter minted exceeds secondary supply beyond the initial mint" )
}

/**
 * Secondary tokens minted for `primary_amount` of primary rewards at the
 * current secondary supply. Returns 0 once the schedule is exhausted.
 */
inline uint128_t mintable_secondary(const uint128_t& primary_amount, const uint128_t& secondary_supply,
                                    const emission_conf& conf) {
    CHECKC( conf.total_cliffs > 0 && conf.reduction_per_cliff > 0, err::PRECISION_ERROR,
            "emission schedule not configured" )

    auto minted = emissions_minted(secondary_supply, conf);
    if (minted >= conf.max_emission_supply) return 0;

    auto cliff = minted / conf.reduction_per_cliff;
    if (cliff >= conf.total_cliffs) return 0;

    auto reduction = add(mul(conf.total_cliffs - cliff, REDUCTION_MULTIPLIER) / REDUCTION_DIVISOR, REDUCTION_BASE);
    auto amount    = mul(primary_amount, reduction) / conf.total_cliffs;

    auto remaining = conf.max_emission_supply - minted;
    if (amount > remaining)
        amount = remaining;
    return amount;
}

} } //namespace compoundfi::emission
