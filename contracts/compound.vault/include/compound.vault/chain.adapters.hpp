#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>

#include <string>

#include <compound.vault/compound.vault.db.hpp>
#include <compound.vault/vault.adapters.hpp>
#include <compound.vault/claim.orchestrator.hpp>
#include <compound.vault/vault.payment.hpp>

namespace compoundfi {

using std::string;
using namespace eosio;

//reward.pool tables read in place, writes sent as inline actions from the vault
class chain_reward_pool: public reward_pool_adapter {
   public:
      chain_reward_pool(const name& vault, const name& pool, const extended_symbol& stake_token):
         _vault(vault), _pool(pool), _stake_token(stake_token) {}

      asset deposit(const asset& quantity, const name& on_behalf_of) override;
      void  withdraw(const asset& quantity, const bool& claim_extras) override;
      asset balance_of(const name& account) const override;
      void  get_reward() override;
      asset earned(const name& account) const override;

   private:
      name              _vault;
      name              _pool;
      extended_symbol   _stake_token;
};

class chain_price_oracle: public price_oracle_adapter {
   public:
      chain_price_oracle(const name& oracle, const vault_tokens& tokens, const price_codes& codes, const uint32_t& max_age_sec):
         _oracle(oracle), _tokens(tokens), _codes(codes), _max_age_sec(max_age_sec) {}

      uint64_t price(const extended_symbol& token) const override;

   private:
      name              _code_of(const extended_symbol& token) const;

      name              _oracle;
      vault_tokens      _tokens;
      price_codes       _codes;
      uint32_t          _max_age_sec;
};

//token ledger of the vault, collecting claim payments out of the claimer's transfer
class chain_token: public token_adapter {
   public:
      chain_token(const name& vault, const name& payer, const extended_asset& prepaid):
         _vault(vault), _payment(payer, prepaid) {}

      void  transfer(const name& to, const extended_asset& quantity, const string& memo) override;
      void  collect(const name& from, const extended_asset& quantity) override;
      asset balance_of(const name& owner, const extended_symbol& token) const override;
      asset supply_of(const extended_symbol& token) const override;

      void  refund_unused(const string& memo);

   private:
      name              _vault;
      prepaid_payment   _payment;
};

//folds the claim into the global stats and sends the claimlog event
class chain_claim_log: public claim_event_sink {
   public:
      chain_claim_log(const name& vault, claim_stats& stats): _vault(vault), _stats(stats) {}

      void claimed(const name& caller, const asset& primary, const asset& secondary, const asset& compounded) override;

   private:
      name              _vault;
      claim_stats&      _stats;
};

//adapters wired to the vault state, alive for one action
struct chain_vault_env {
   chain_reward_pool    pool;
   chain_price_oracle   oracle;
   chain_token          token;
   chain_claim_log      events;
   claim_orchestrator   orchestrator;

   chain_vault_env(const name& vault, global_t& gstate, const name& payer, const extended_asset& prepaid):
      pool(vault, gstate.reward_pool, gstate.tokens.asset_token),
      oracle(gstate.price_oracle, gstate.tokens, gstate.codes, gstate.max_price_age_sec),
      token(vault, payer, prepaid),
      events(vault, gstate.stats),
      orchestrator(vault, gstate.tokens, gstate.emission, gstate.config, pool, oracle, token, events) {}

   chain_vault_env(const name& vault, global_t& gstate):
      chain_vault_env(vault, gstate, name(), extended_asset(asset(0, gstate.tokens.asset_token.get_symbol()),
                                                            gstate.tokens.asset_token.get_contract())) {}
};

} //namespace compoundfi
