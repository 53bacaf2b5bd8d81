#pragma once

#include <string>

#include <eosio/asset.hpp>
#include <eosio/name.hpp>

namespace compoundfi {

using std::string;
using eosio::asset;
using eosio::extended_asset;
using eosio::extended_symbol;
using eosio::name;

/**
 * External staking pool holding the vault's pooled asset and paying the primary reward.
 * Every call either succeeds or aborts the enclosing action.
 */
class reward_pool_adapter {
   public:
      virtual ~reward_pool_adapter() {}

      //stakes `quantity` for `on_behalf_of`, returns the pool balance credited
      virtual asset deposit(const asset& quantity, const name& on_behalf_of) = 0;
      virtual void  withdraw(const asset& quantity, const bool& claim_extras) = 0;
      virtual asset balance_of(const name& account) const = 0;
      //moves all earned rewards into the vault's custody
      virtual void  get_reward() = 0;
      virtual asset earned(const name& account) const = 0;
};

class price_oracle_adapter {
   public:
      virtual ~price_oracle_adapter() {}

      //USD price of one whole `token`; fails when unsupported or stale
      virtual uint64_t price(const extended_symbol& token) const = 0;
};

class token_adapter {
   public:
      virtual ~token_adapter() {}

      //pays out of the vault's custody
      virtual void  transfer(const name& to, const extended_asset& quantity, const string& memo) = 0;
      //pulls from `from` into the vault's custody
      virtual void  collect(const name& from, const extended_asset& quantity) = 0;
      virtual asset balance_of(const name& owner, const extended_symbol& token) const = 0;
      virtual asset supply_of(const extended_symbol& token) const = 0;
};

class claim_event_sink {
   public:
      virtual ~claim_event_sink() {}

      virtual void claimed(const name& caller, const asset& primary, const asset& secondary, const asset& compounded) = 0;
};

} //namespace compoundfi
