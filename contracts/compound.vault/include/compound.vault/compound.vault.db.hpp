#pragma once

#include <eosio/asset.hpp>
#include <eosio/singleton.hpp>
#include <eosio/multi_index.hpp>
#include <eosio/system.hpp>
#include <eosio/time.hpp>

#include <string>

#include <compound.vault/compound.vault.const.hpp>
#include <compound.vault/vault.config.hpp>
#include <compound.vault/emission.curve.hpp>

namespace compoundfi {

using namespace std;
using namespace eosio;

#define TBL struct [[eosio::table, eosio::contract("compound.vault")]]
#define NTBL(name) struct [[eosio::table(name), eosio::contract("compound.vault")]]

//price.oracle coin codes of the vault tokens
struct price_codes {
    name            asset_code;
    name            primary_code;
    name            secondary_code;

    EOSLIB_SERIALIZE( price_codes, (asset_code)(primary_code)(secondary_code) )
};

struct claim_stats {
    uint64_t        claim_count                 = 0;
    asset           total_compounded;
    asset           total_primary_claimed;
    asset           total_secondary_claimed;
    time_point_sec  last_claimed_at;

    EOSLIB_SERIALIZE( claim_stats, (claim_count)(total_compounded)(total_primary_claimed)
                                   (total_secondary_claimed)(last_claimed_at) )
};

NTBL("global") global_t {
    name                    admin;
    name                    reward_pool;                            //staking pool holding the pooled asset
    name                    price_oracle;
    vault_tokens            tokens;
    price_codes             codes;

    symbol                  share_symbol;
    asset                   total_shares;
    asset                   min_deposit;

    incentive_bounds        bounds;
    vault_config            config;
    emission::emission_conf emission;
    uint32_t                max_price_age_sec       = MAX_PRICE_AGE_SEC;

    claim_stats             stats;
    bool                    enabled                 = false;

    EOSLIB_SERIALIZE( global_t, (admin)(reward_pool)(price_oracle)(tokens)(codes)
                                (share_symbol)(total_shares)(min_deposit)
                                (bounds)(config)(emission)(max_price_age_sec)
                                (stats)(enabled) )
};
typedef eosio::singleton< "global"_n, global_t > global_singleton;

//Scope: _self
TBL holder_t {
    name                owner;                                      //PK
    asset               shares;
    asset               cum_deposited;                              //pooled asset paid in
    asset               cum_withdrawn;                              //pooled asset paid out
    time_point_sec      created_at;
    time_point_sec      updated_at;

    holder_t() {}
    holder_t(const name& o): owner(o) {}

    uint64_t primary_key()const { return owner.value; }

    typedef multi_index<"holders"_n, holder_t> tbl_t;

    EOSLIB_SERIALIZE( holder_t, (owner)(shares)(cum_deposited)(cum_withdrawn)(created_at)(updated_at) )
};

} //namespace compoundfi
