#pragma once

#include <eosio/asset.hpp>
#include <eosio/name.hpp>

#include <functional>
#include <map>
#include <string>
#include <tuple>
#include <vector>

#include <compound.vault/vault.adapters.hpp>
#include <compound.vault/vault.config.hpp>
#include <compound.vault/emission.curve.hpp>

namespace compoundfi { namespace testing {

using namespace eosio;
using std::string;

static const name        VAULT       = "compound.vlt"_n;
static const name        POOL        = "reward.pool"_n;
static const name        ALICE       = "alice"_n;
static const name        BOB         = "bob"_n;
static const name        LOCKER      = "locker"_n;

static const symbol      LPT_SYM     = symbol(symbol_code("LPT"), 4);
static const symbol      CRV_SYM     = symbol(symbol_code("CRV"), 4);
static const symbol      CVX_SYM     = symbol(symbol_code("CVX"), 4);
static const symbol      SHARE_SYM   = symbol(symbol_code("CVLPT"), 4);

inline vault_tokens make_tokens() {
   vault_tokens tokens;
   tokens.asset_token      = extended_symbol(LPT_SYM, "lp.token"_n);
   tokens.primary_token    = extended_symbol(CRV_SYM, "crv.token"_n);
   tokens.secondary_token  = extended_symbol(CVX_SYM, "cvx.token"_n);
   return tokens;
}

inline emission::emission_conf make_emission() {
   emission::emission_conf conf;
   conf.init_mint_amount      = 0;
   conf.total_cliffs          = 1000;
   conf.reduction_per_cliff   = 1'000'000;
   conf.max_emission_supply   = 1'000'000'000;
   conf.minter_minted         = 0;
   return conf;
}

struct transfer_record {
   name              to;
   extended_asset    quantity;
   string            memo;
};

//balances and supplies of every token the vault touches
class fake_token_ledger: public token_adapter {
   public:
      explicit fake_token_ledger(const name& vault): _vault(vault) {}

      void transfer(const name& to, const extended_asset& quantity, const string& memo) override {
         move(_vault, to, quantity);
         transfers.push_back({ to, quantity, memo });
      }

      void collect(const name& from, const extended_asset& quantity) override {
         move(from, _vault, quantity);
         collects.push_back({ from, quantity, "" });
      }

      asset balance_of(const name& owner, const extended_symbol& token) const override {
         auto itr = _balances.find(key(owner, token));
         return asset(itr == _balances.end() ? 0 : itr->second, token.get_symbol());
      }

      asset supply_of(const extended_symbol& token) const override {
         auto itr = _supplies.find(key(name(), token));
         return asset(itr == _supplies.end() ? 0 : itr->second, token.get_symbol());
      }

      void issue(const name& to, const extended_asset& quantity) {
         _balances[key(to, quantity.get_extended_symbol())] += quantity.quantity.amount;
         _supplies[key(name(), quantity.get_extended_symbol())] += quantity.quantity.amount;
      }

      void move(const name& from, const name& to, const extended_asset& quantity) {
         check( quantity.quantity.amount > 0, "fake ledger: transfer must be positive" );
         auto& from_balance = _balances[key(from, quantity.get_extended_symbol())];
         check( from_balance >= quantity.quantity.amount, "fake ledger: overdrawn balance" );
         from_balance -= quantity.quantity.amount;
         _balances[key(to, quantity.get_extended_symbol())] += quantity.quantity.amount;
      }

      std::vector<transfer_record>    transfers;
      std::vector<transfer_record>    collects;

   private:
      typedef std::tuple<uint64_t, uint64_t, uint64_t> balance_key;

      static balance_key key(const name& owner, const extended_symbol& token) {
         return balance_key{ owner.value, token.get_contract().value, token.get_symbol().raw() };
      }

      name                                _vault;
      std::map<balance_key, int64_t>      _balances;
      std::map<balance_key, int64_t>      _supplies;
};

/**
 * Staking pool paying `earned` primary rewards on get_reward and minting the
 * matching secondary along the emission curve, as the booster would.
 */
class fake_reward_pool: public reward_pool_adapter {
   public:
      fake_reward_pool(const name& vault, fake_token_ledger& ledger, const vault_tokens& tokens,
                       const emission::emission_conf& emission):
         _vault(vault), _ledger(ledger), _tokens(tokens), _emission(emission) {}

      asset deposit(const asset& quantity, const name& on_behalf_of) override {
         _ledger.move(_vault, POOL, extended_asset(quantity, _tokens.asset_token.get_contract()));
         _staked[on_behalf_of.value] += quantity.amount;
         deposits++;
         return asset(quantity.amount - credit_shortfall, quantity.symbol);
      }

      void withdraw(const asset& quantity, const bool& claim_extras) override {
         auto& staked = _staked[_vault.value];
         check( staked >= quantity.amount, "fake pool: withdraw exceeds stake" );
         staked -= quantity.amount;
         _ledger.move(POOL, _vault, extended_asset(quantity, _tokens.asset_token.get_contract()));
      }

      asset balance_of(const name& account) const override {
         auto itr = _staked.find(account.value);
         return asset(itr == _staked.end() ? 0 : itr->second, _tokens.asset_token.get_symbol());
      }

      void get_reward() override {
         get_reward_calls++;
         if (_earned <= 0) return;
         auto supply = _ledger.supply_of(_tokens.secondary_token).amount;
         auto minted = (int64_t)emission::mintable_secondary(_earned, supply, _emission);
         _ledger.issue(_vault, extended_asset(asset(_earned, _tokens.primary_token.get_symbol()), _tokens.primary_token.get_contract()));
         if (minted > 0)
            _ledger.issue(_vault, extended_asset(asset(minted, _tokens.secondary_token.get_symbol()), _tokens.secondary_token.get_contract()));
         _earned = 0;
      }

      asset earned(const name& account) const override {
         return asset(account == _vault ? _earned : 0, _tokens.primary_token.get_symbol());
      }

      //stake already in the pool, its tokens held by the pool account
      void seed_stake(const name& account, const int64_t& amount) {
         _staked[account.value] += amount;
         _ledger.issue(POOL, extended_asset(asset(amount, _tokens.asset_token.get_symbol()), _tokens.asset_token.get_contract()));
      }

      void accrue(const int64_t& amount) { _earned += amount; }

      int64_t     credit_shortfall    = 0;
      uint32_t    deposits            = 0;
      uint32_t    get_reward_calls    = 0;

   private:
      name                              _vault;
      fake_token_ledger&                _ledger;
      vault_tokens                      _tokens;
      emission::emission_conf           _emission;
      std::map<uint64_t, int64_t>       _staked;
      int64_t                           _earned = 0;
};

class fake_price_oracle: public price_oracle_adapter {
   public:
      uint64_t price(const extended_symbol& token) const override {
         auto itr = _prices.find(key(token));
         check( itr != _prices.end(), "[[1]] price not found: " + token.get_symbol().code().to_string() );
         return itr->second;
      }

      void set_price(const extended_symbol& token, const uint64_t& price) { _prices[key(token)] = price; }

   private:
      static std::tuple<uint64_t, uint64_t> key(const extended_symbol& token) {
         return std::make_tuple(token.get_contract().value, token.get_symbol().raw());
      }

      std::map<std::tuple<uint64_t, uint64_t>, uint64_t> _prices;
};

struct claim_record {
   name     caller;
   asset    primary;
   asset    secondary;
   asset    compounded;
};

class fake_event_log: public claim_event_sink {
   public:
      void claimed(const name& caller, const asset& primary, const asset& secondary, const asset& compounded) override {
         events.push_back({ caller, primary, secondary, compounded });
         if (on_claimed) on_claimed();
      }

      std::vector<claim_record>   events;
      std::function<void()>       on_claimed;
};

} } //namespace compoundfi::testing
