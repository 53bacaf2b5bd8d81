#include <compound.vault/compound.vault.hpp>
#include <compound.vault/chain.adapters.hpp>
#include <compound.vault/share.ledger.hpp>

#include "safemath.hpp"
#include <utils.hpp>
#include <eosio/time.hpp>

namespace compoundfi {
using namespace std;
using namespace wasm::safemath;

void compound_vault::init(const name& admin, const name& reward_pool, const name& price_oracle,
                          const vault_tokens& tokens, const price_codes& codes, const symbol& share_symbol,
                          const incentive_bounds& bounds, const vault_config& config,
                          const emission::emission_conf& emission, const asset& min_deposit) {
   require_auth( _self );
   CHECKC( !_global.exists(), err::RECORD_EXISTING, "vault already initialized" )
   CHECKC( is_account(admin), err::ACCOUNT_INVALID, "admin account invalid: " + admin.to_string() )
   CHECKC( is_account(reward_pool), err::ACCOUNT_INVALID, "reward pool account invalid: " + reward_pool.to_string() )
   CHECKC( is_account(price_oracle), err::ACCOUNT_INVALID, "price oracle account invalid: " + price_oracle.to_string() )
   CHECKC( codes.asset_code != name() && codes.primary_code != name() && codes.secondary_code != name(),
           err::PARAM_ERROR, "price code is null" )

   validate_tokens(tokens);
   validate_bounds(bounds);
   emission::validate(emission);

   auto asset_sym = tokens.asset_token.get_symbol();
   CHECKC( share_symbol.is_valid() && share_symbol.precision() == asset_sym.precision(), err::SYMBOL_MISMATCH,
           "share symbol must carry the pooled asset precision" )
   CHECKC( share_symbol.code() != asset_sym.code(), err::SYMBOL_MISMATCH, "share symbol code must differ from the pooled asset" )
   CHECKC( min_deposit.symbol == asset_sym, err::SYMBOL_MISMATCH, "min deposit symbol mismatch" )
   CHECKC( min_deposit.amount >= 0, err::NOT_POSITIVE, "min deposit must not be negative" )

   _gstate.admin                          = admin;
   _gstate.reward_pool                    = reward_pool;
   _gstate.price_oracle                   = price_oracle;
   _gstate.tokens                         = tokens;
   _gstate.codes                          = codes;
   _gstate.share_symbol                   = share_symbol;
   _gstate.total_shares                   = asset(0, share_symbol);
   _gstate.min_deposit                    = min_deposit;
   _gstate.bounds                         = bounds;
   _gstate.config                         = next_config(vault_config{}, bounds, config.claimer_incentive,
                                                        config.locker_incentive, config.locker_rewards);
   _gstate.emission                       = emission;
   _gstate.max_price_age_sec              = MAX_PRICE_AGE_SEC;
   _gstate.stats.total_compounded         = asset(0, asset_sym);
   _gstate.stats.total_primary_claimed    = asset(0, tokens.primary_token.get_symbol());
   _gstate.stats.total_secondary_claimed  = asset(0, tokens.secondary_token.get_symbol());
   _gstate.enabled                        = false;
   _changed                               = true;
}

void compound_vault::setconfig(const uint32_t& claimer_incentive, const uint32_t& locker_incentive, const name& locker_rewards) {
   _check_initialized();
   require_auth( _gstate.admin );

   _gstate.config = next_config(_gstate.config, _gstate.bounds, claimer_incentive, locker_incentive, locker_rewards);
   _changed       = true;
}

void compound_vault::setminted(const uint128_t& minter_minted) {
   _check_initialized();
   require_auth( _gstate.admin );

   chain_vault_env env(get_self(), _gstate);
   auto supply = env.token.supply_of(_gstate.tokens.secondary_token);
   CHECKC( supply.amount >= 0, err::EXTERNAL_FAILURE, "invalid secondary supply: " + supply.to_string() )
   emission::validate_minter_minted(minter_minted, supply.amount, _gstate.emission);

   _gstate.emission.minter_minted  = minter_minted;
   _changed                        = true;
}

void compound_vault::setenabled(const bool& enabled) {
   _check_initialized();
   require_auth( _gstate.admin );
   CHECKC( _gstate.enabled != enabled, err::PARAM_ERROR, "enabled unchanged" )

   _gstate.enabled = enabled;
   _changed        = true;
}

void compound_vault::setpriceage(const uint32_t& seconds) {
   _check_initialized();
   require_auth( _gstate.admin );
   CHECKC( seconds > 0, err::NOT_POSITIVE, "price age must be positive" )

   _gstate.max_price_age_sec   = seconds;
   _changed                    = true;
}

void compound_vault::setmindep(const asset& quant) {
   _check_initialized();
   require_auth( _gstate.admin );
   CHECKC( quant.symbol == _gstate.tokens.asset_token.get_symbol(), err::SYMBOL_MISMATCH, "min deposit symbol mismatch" )
   CHECKC( quant.amount >= 0, err::NOT_POSITIVE, "min deposit must not be negative" )

   _gstate.min_deposit = quant;
   _changed            = true;
}

/**
 * @param memo: three formats, all on the pooled asset:
 *       1) deposit
 *       2) claim:$primary:$secondary
 *       3) claim:$primary:*
 */
void compound_vault::ontransfer(const name& from, const name& to, const asset& quant, const string& memo) {
   if (from == get_self() || to != get_self()) return;

   _check_initialized();
   auto token_bank = get_first_receiver();
   //stake returned and rewards paid out by the pool
   if (from == _gstate.reward_pool) return;
   const auto& tokens = _gstate.tokens;
   if (extended_symbol(quant.symbol, token_bank) == tokens.primary_token
    || extended_symbol(quant.symbol, token_bank) == tokens.secondary_token) return;

   CHECKC( quant.symbol == tokens.asset_token.get_symbol(), err::SYMBOL_MISMATCH,
           "unsupported token: " + quant.to_string() )
   CHECKC( token_bank == tokens.asset_token.get_contract(), err::CONTRACT_MISMATCH,
           "pooled asset contract mismatch: " + token_bank.to_string() )
   CHECKC( quant.amount > 0, err::NOT_POSITIVE, "quantity must be positive" )
   _check_enabled();

   vector<string_view> params = split(memo, ":");
   if (params.size() == 1 && params[0] == "deposit") {
      _deposit(from, quant);
      return;
   }
   if (params.size() == 3 && params[0] == "claim") {
      _claim(from, extended_asset(quant, token_bank), params);
      return;
   }
   CHECKC( false, err::MEMO_FORMAT_ERROR, "invalid memo format: " + memo )
}

void compound_vault::_deposit(const name& from, const asset& quant) {
   CHECKC( quant >= _gstate.min_deposit, err::INCORRECT_AMOUNT,
           "deposit " + quant.to_string() + " below minimum " + _gstate.min_deposit.to_string() )

   chain_vault_env env(get_self(), _gstate);
   //the transfer is not staked yet, so the pool balance excludes it
   auto total  = env.orchestrator.total_assets();
   auto minted = shares::preview_deposit(quant, _gstate.total_shares, total);
   CHECKC( minted.amount > 0, err::NOT_POSITIVE, "deposit mints zero shares" )

   auto now       = time_point_sec(current_time_point());
   auto holders   = holder_t::tbl_t(_self, _self.value);
   auto itr       = holders.find(from.value);
   if (itr == holders.end()) {
      holders.emplace(_self, [&]( auto& h ) {
         h.owner           = from;
         h.shares          = minted;
         h.cum_deposited   = quant;
         h.cum_withdrawn   = asset(0, quant.symbol);
         h.created_at      = now;
         h.updated_at      = now;
      });
   } else {
      holders.modify(itr, same_payer, [&]( auto& h ) {
         h.shares          += minted;
         h.cum_deposited   += quant;
         h.updated_at      = now;
      });
   }
   _gstate.total_shares   += minted;
   _changed               = true;

   env.pool.deposit(quant, get_self());
   TRACE("deposit: ", from, " ", quant, " -> ", minted);
}

void compound_vault::_claim(const name& from, const extended_asset& paid, const vector<string_view>& params) {
   const auto& tokens   = _gstate.tokens;
   claim_request req;
   req.caller           = from;
   req.max_asset_in     = paid.quantity;
   req.primary_amount   = asset(to_int64(params[1], "primary amount"), tokens.primary_token.get_symbol());
   req.derive_secondary = params[2] == "*";
   req.secondary_amount = asset(req.derive_secondary ? 0 : to_int64(params[2], "secondary amount"),
                                tokens.secondary_token.get_symbol());

   chain_vault_env env(get_self(), _gstate, from, paid);
   auto amount_in = env.orchestrator.claim(req);
   env.token.refund_unused("claim refund");
   _changed = true;

   TRACE("claim: ", from, " compounded ", amount_in);
}

void compound_vault::_payout(chain_vault_env& env, const name& owner, const asset& shares, const asset& assets) {
   CHECKC( assets.amount > 0, err::NOT_POSITIVE, "payout must be positive" )
   auto staked = env.pool.balance_of(get_self());
   CHECKC( assets <= staked, err::EXTERNAL_FAILURE,
           "pool balance " + staked.to_string() + " insufficient for " + assets.to_string() )

   auto holders   = holder_t::tbl_t(_self, _self.value);
   auto itr       = holders.find(owner.value);
   CHECKC( itr != holders.end(), err::RECORD_NOT_FOUND, "holder not found: " + owner.to_string() )
   CHECKC( itr->shares >= shares, err::OVERSIZED,
           "redeem shares " + shares.to_string() + " exceed held " + itr->shares.to_string() )

   if (itr->shares == shares) {
      holders.erase(itr);
   } else {
      holders.modify(itr, same_payer, [&]( auto& h ) {
         h.shares          -= shares;
         h.cum_withdrawn   += assets;
         h.updated_at      = time_point_sec(current_time_point());
      });
   }
   _gstate.total_shares   -= shares;
   _changed               = true;

   env.pool.withdraw(assets, false);
   env.token.transfer(owner, extended_asset(assets, _gstate.tokens.asset_token.get_contract()), "redeem");
}

void compound_vault::redeem(const name& owner, const asset& shares) {
   require_auth( owner );
   _check_initialized();
   _check_enabled();
   CHECKC( shares.symbol == _gstate.share_symbol, err::SYMBOL_MISMATCH, "share symbol mismatch" )
   CHECKC( shares.amount > 0, err::NOT_POSITIVE, "shares must be positive" )

   chain_vault_env env(get_self(), _gstate);
   auto assets = shares::preview_redeem(shares, _gstate.total_shares, env.orchestrator.total_assets());
   _payout(env, owner, shares, assets);
}

void compound_vault::withdraw(const name& owner, const asset& assets) {
   require_auth( owner );
   _check_initialized();
   _check_enabled();
   CHECKC( assets.symbol == _gstate.tokens.asset_token.get_symbol(), err::SYMBOL_MISMATCH, "asset symbol mismatch" )
   CHECKC( assets.amount > 0, err::NOT_POSITIVE, "assets must be positive" )

   chain_vault_env env(get_self(), _gstate);
   auto burnt = shares::preview_withdraw(assets, _gstate.total_shares, env.orchestrator.total_assets());
   _payout(env, owner, burnt, assets);
}

asset compound_vault::previewrwd() {
   _check_initialized();
   chain_vault_env env(get_self(), _gstate);
   return env.orchestrator.preview_reward();
}

asset compound_vault::totalassets() {
   _check_initialized();
   chain_vault_env env(get_self(), _gstate);
   return env.orchestrator.total_assets();
}

asset compound_vault::prevdeposit(const asset& assets) {
   _check_initialized();
   chain_vault_env env(get_self(), _gstate);
   return shares::preview_deposit(assets, _gstate.total_shares, env.orchestrator.total_assets());
}

asset compound_vault::prevmint(const asset& shares) {
   _check_initialized();
   chain_vault_env env(get_self(), _gstate);
   return shares::preview_mint(shares, _gstate.total_shares, env.orchestrator.total_assets());
}

asset compound_vault::prevredeem(const asset& shares) {
   _check_initialized();
   chain_vault_env env(get_self(), _gstate);
   return shares::preview_redeem(shares, _gstate.total_shares, env.orchestrator.total_assets());
}

asset compound_vault::prevwithdraw(const asset& assets) {
   _check_initialized();
   chain_vault_env env(get_self(), _gstate);
   return shares::preview_withdraw(assets, _gstate.total_shares, env.orchestrator.total_assets());
}

asset compound_vault::mintable(const asset& primary) {
   _check_initialized();
   chain_vault_env env(get_self(), _gstate);
   return env.orchestrator.mintable_secondary(primary);
}

void compound_vault::claimlog(const name& caller, const asset& primary, const asset& secondary, const asset& compounded) {
   require_auth( _self );
   require_recipient( caller );
}

void compound_vault::_check_enabled() {
   CHECKC( _gstate.enabled, err::PAUSED, "vault not enabled" )
}

void compound_vault::_check_initialized() {
   CHECKC( _global.exists(), err::NOT_STARTED, "vault not initialized" )
}

} //namespace compoundfi
