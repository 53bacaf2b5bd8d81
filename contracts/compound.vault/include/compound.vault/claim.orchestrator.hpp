#pragma once

#include <eosio/asset.hpp>
#include <eosio/name.hpp>

#include <compound.vault/compound.vault.const.hpp>
#include <compound.vault/vault.config.hpp>
#include <compound.vault/vault.adapters.hpp>
#include <compound.vault/emission.curve.hpp>
#include <compound.vault/incentive.split.hpp>

namespace compoundfi {

using eosio::asset;
using eosio::name;

struct claim_request {
    name            caller;
    asset           primary_amount;
    asset           secondary_amount;
    bool            derive_secondary    = false;    //secondary_amount taken from the emission curve
    asset           max_asset_in;                   //slippage ceiling on the pooled asset paid in
};

//rewards the vault can hand out right now
struct claim_quote {
    asset           earned_primary;
    asset           available_primary;
    asset           available_secondary;
    asset           secondary_supply;
};

//a failed step aborts the whole action, there is no aborted state to observe
enum class claim_state: uint8_t {
   IDLE                 = 0,
   QUOTE                = 1,
   PULL_REWARDS         = 2,
   COMPUTE_SPLIT        = 3,
   SLIPPAGE_CHECK       = 4,
   COLLECT_PAYMENT      = 5,
   COMPOUND             = 6,
   DISTRIBUTE           = 7,
   EMIT                 = 8,
   SUCCEEDED            = 9
};

/**
 * Runs one claim cycle against injected pool, oracle and token adapters:
 * pull rewards, price them, charge the claimer `amount_to_compound` of the pooled
 * asset, stake it back into the pool and pay out the reward tokens.
 *
 * `config` is the live vault configuration; a copy is taken when the split is computed.
 */
class claim_orchestrator {
   public:
      claim_orchestrator(const name& vault, const vault_tokens& tokens, const emission::emission_conf& emission,
                         const vault_config& config, reward_pool_adapter& pool, price_oracle_adapter& oracle,
                         token_adapter& token, claim_event_sink& events);

      asset claim(const claim_request& req);

      //amount a claim of every available reward would compound now
      asset preview_reward() const;

      //pool balance plus the uncompounded reward value
      asset total_assets() const;

      asset mintable_secondary(const asset& primary) const;

      claim_quote quote() const;

      incentive::incentive_split split(const asset& primary, const asset& secondary, const vault_config& conf) const;

      claim_state state() const { return _state; }

   private:
      struct claim_guard {
         bool& locked;
         explicit claim_guard(bool& l): locked(l) { locked = true; }
         ~claim_guard() { locked = false; }
      };

      void _pay(const name& to, const asset& quantity, const name& bank, const string& memo);

      name                          _vault;
      vault_tokens                  _tokens;
      emission::emission_conf       _emission;
      const vault_config&           _config;
      reward_pool_adapter&          _pool;
      price_oracle_adapter&         _oracle;
      token_adapter&                _token;
      claim_event_sink&             _events;

      claim_state                   _state      = claim_state::IDLE;
      bool                          _claiming   = false;
};

} //namespace compoundfi
