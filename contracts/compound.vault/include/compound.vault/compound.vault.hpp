#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/permission.hpp>
#include <eosio/action.hpp>

#include <string>

#include <compound.vault/compound.vault.db.hpp>

namespace compoundfi {

using std::string;
using std::vector;

using namespace eosio;

struct chain_vault_env;

/**
 * The `compound.vault` contract stakes a pooled asset in an external reward pool and
 * lets anyone claim the pool's rewards by paying in part of their value in the pooled asset,
 * which is staked back for the vault's share holders.
 *
 * Transfer memos accepted on the pooled asset:
 *    deposit                          - mint vault shares to the sender
 *    claim:<primary>:<secondary>      - claim rewards, the transfer is the slippage ceiling
 *    claim:<primary>:*                - same, secondary amount taken from the emission curve
 *
 * Amounts in claim memos are raw integer amounts in the reward token precision.
 */
class [[eosio::contract("compound.vault")]] compound_vault : public contract {
   public:
      using contract::contract;

   compound_vault(eosio::name receiver, eosio::name code, datastream<const char*> ds): contract(receiver, code, ds),
        _global(get_self(), get_self().value)
    {
      _gstate = _global.exists() ? _global.get() : global_t{};
    }

    //read-only actions must not write
    ~compound_vault() { if (_changed) _global.set( _gstate, get_self() ); }

   [[eosio::on_notify("*::transfer")]]
   void ontransfer(const name& from, const name& to, const asset& quant, const string& memo);

   //admin
   ACTION init(const name& admin, const name& reward_pool, const name& price_oracle,
               const vault_tokens& tokens, const price_codes& codes, const symbol& share_symbol,
               const incentive_bounds& bounds, const vault_config& config,
               const emission::emission_conf& emission, const asset& min_deposit);
   ACTION setconfig(const uint32_t& claimer_incentive, const uint32_t& locker_incentive, const name& locker_rewards);
   ACTION setminted(const uint128_t& minter_minted);
   ACTION setenabled(const bool& enabled);
   ACTION setpriceage(const uint32_t& seconds);
   ACTION setmindep(const asset& quant);

   //USER
   ACTION redeem(const name& owner, const asset& shares);
   ACTION withdraw(const name& owner, const asset& assets);

   [[eosio::action, eosio::read_only]] asset previewrwd();
   [[eosio::action, eosio::read_only]] asset totalassets();
   [[eosio::action, eosio::read_only]] asset prevdeposit(const asset& assets);
   [[eosio::action, eosio::read_only]] asset prevmint(const asset& shares);
   [[eosio::action, eosio::read_only]] asset prevredeem(const asset& shares);
   [[eosio::action, eosio::read_only]] asset prevwithdraw(const asset& assets);
   [[eosio::action, eosio::read_only]] asset mintable(const asset& primary);

   //event, sent inline by claims
   ACTION claimlog(const name& caller, const asset& primary, const asset& secondary, const asset& compounded);

   using claimlog_action = eosio::action_wrapper<"claimlog"_n, &compound_vault::claimlog>;

   private:
      void _deposit(const name& from, const asset& quant);
      void _claim(const name& from, const extended_asset& paid, const vector<string_view>& params);
      void _payout(chain_vault_env& env, const name& owner, const asset& shares, const asset& assets);

      void _check_enabled();
      void _check_initialized();

      global_singleton     _global;
      global_t             _gstate;
      bool                 _changed = false;
};
} //namespace compoundfi
