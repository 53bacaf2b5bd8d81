#include <compound.vault/chain.adapters.hpp>
#include <compound.vault/compound.vault.hpp>
#include <reward.pool/reward.pool.hpp>
#include <price.oracle/price.oracle.states.hpp>
#include <xtoken/xtoken.hpp>

#include "safemath.hpp"
#include <utils.hpp>

namespace compoundfi {

using namespace std;
using namespace wasm::safemath;

#define TRANSFER(bank, from, to, quantity, memo) \
    {	xtoken::xtoken::transfer_action act{ bank, { {from, active_perm} } };\
            act.send( from, to, quantity , memo );}

asset chain_reward_pool::deposit(const asset& quantity, const name& on_behalf_of) {
   CHECKC( quantity.symbol == _stake_token.get_symbol(), err::SYMBOL_MISMATCH, "stake symbol mismatch" )
   CHECKC( quantity.amount > 0, err::NOT_POSITIVE, "stake amount must be positive" )
   TRANSFER( _stake_token.get_contract(), _vault, _pool, quantity, rewardpool::deposit_memo(on_behalf_of) )
   return quantity;
}

void chain_reward_pool::withdraw(const asset& quantity, const bool& claim_extras) {
   CHECKC( quantity.symbol == _stake_token.get_symbol(), err::SYMBOL_MISMATCH, "stake symbol mismatch" )
   CHECKC( quantity.amount > 0, err::NOT_POSITIVE, "withdraw amount must be positive" )
   rewardpool::reward_pool::withdraw_action act{ _pool, { {_vault, active_perm} } };
   act.send( _vault, quantity, claim_extras );
}

asset chain_reward_pool::balance_of(const name& account) const {
   auto stakers   = rewardpool::staker_t::idx_t(_pool, _pool.value);
   auto itr       = stakers.find(account.value);
   if (itr == stakers.end()) return asset(0, _stake_token.get_symbol());
   return itr->balance;
}

void chain_reward_pool::get_reward() {
   rewardpool::reward_pool::getreward_action act{ _pool, { {_vault, active_perm} } };
   act.send( _vault );
}

asset chain_reward_pool::earned(const name& account) const {
   auto pool_global = rewardpool::pool_global_t::idx_t(_pool, _pool.value);
   CHECKC( pool_global.exists(), err::EXTERNAL_FAILURE, "reward pool not initialized: " + _pool.to_string() )
   auto conf       = pool_global.get();
   auto reward_sym = conf.reward_token.get_symbol();

   auto stakers   = rewardpool::staker_t::idx_t(_pool, _pool.value);
   auto itr       = stakers.find(account.value);
   if (itr == stakers.end()) return asset(0, reward_sym);

   CHECKC( itr->unclaimed_rewards.symbol == reward_sym, err::SYMBOL_MISMATCH, "unclaimed reward symbol mismatch" )
   auto pending = pending_rewards(itr->balance.amount, conf.reward_per_share, itr->last_reward_per_share);
   return itr->unclaimed_rewards + asset(pending, reward_sym);
}

name chain_price_oracle::_code_of(const extended_symbol& token) const {
   if (token == _tokens.asset_token)      return _codes.asset_code;
   if (token == _tokens.primary_token)    return _codes.primary_code;
   if (token == _tokens.secondary_token)  return _codes.secondary_code;
   CHECKC( false, err::RECORD_NOT_FOUND, "no price code for " + token.get_symbol().code().to_string() )
   return name();
}

uint64_t chain_price_oracle::price(const extended_symbol& token) const {
   auto code      = _code_of(token);
   auto quote     = priceoracle::latest_quote(_oracle, code);
   CHECKC( quote.found, err::RECORD_NOT_FOUND, "price not found: " + code.to_string() )
   CHECKC( quote.price > 0, err::PRECISION_ERROR, "price of " + code.to_string() + " must be positive" )

   auto now       = current_time_point().sec_since_epoch();
   CHECKC( quote.quoted_at >= now || now - quote.quoted_at <= _max_age_sec, err::PRICE_STALE,
           "price of " + code.to_string() + " is stale, quoted at " + to_string(quote.quoted_at) )
   return quote.price;
}

void chain_token::transfer(const name& to, const extended_asset& quantity, const string& memo) {
   CHECKC( quantity.quantity.amount > 0, err::NOT_POSITIVE, "transfer amount must be positive" )
   TRANSFER( quantity.contract, _vault, to, quantity.quantity, memo )
}

void chain_token::collect(const name& from, const extended_asset& quantity) {
   _payment.collect(from, quantity);
}

void chain_token::refund_unused(const string& memo) {
   auto left = _payment.take_unused();
   if (left.quantity.amount <= 0) return;
   transfer(_payment.payer(), left, memo);
}

asset chain_token::balance_of(const name& owner, const extended_symbol& token) const {
   return xtoken::xtoken::get_balance(token.get_contract(), owner, token.get_symbol());
}

asset chain_token::supply_of(const extended_symbol& token) const {
   return xtoken::xtoken::get_supply(token.get_contract(), token.get_symbol());
}

void chain_claim_log::claimed(const name& caller, const asset& primary, const asset& secondary, const asset& compounded) {
   _stats.claim_count++;
   _stats.total_compounded          += compounded;
   _stats.total_primary_claimed     += primary;
   _stats.total_secondary_claimed   += secondary;
   _stats.last_claimed_at           = current_time_point();

   compound_vault::claimlog_action act{ _vault, { {_vault, active_perm} } };
   act.send( caller, primary, secondary, compounded );
}

} //namespace compoundfi
