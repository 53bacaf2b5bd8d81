#pragma once

#include <eosio/asset.hpp>
#include <eosio/name.hpp>

#include <compound.vault/compound.vault.const.hpp>
#include <reward.pool/reward.pool.hpp>
#include <safemath.hpp>

namespace compoundfi {

using eosio::asset;
using eosio::extended_asset;
using eosio::name;

//pool rewards accrued on `balance` since the staker's last reward-per-share checkpoint
inline int64_t pending_rewards(const int64_t& balance, const int128_t& reward_per_share, const int128_t& last_reward_per_share) {
   CHECKC( balance >= 0, err::EXTERNAL_FAILURE, "negative staked balance" )
   CHECKC( last_reward_per_share >= 0 && reward_per_share >= last_reward_per_share, err::EXTERNAL_FAILURE,
           "reward per share went backwards" )
   auto delta = (uint128_t)(reward_per_share - last_reward_per_share);
   return wasm::safemath::to_amount( wasm::safemath::mul((uint128_t)balance, delta) / (uint128_t)rewardpool::HIGH_PRECISION );
}

/**
 * Pooled asset a claimer transferred in ahead of the claim. The claim collects
 * its payment out of it; whatever is left goes back to the payer.
 */
class prepaid_payment {
   public:
      prepaid_payment(const name& payer, const extended_asset& prepaid):
         _payer(payer), _prepaid(prepaid), _collected(0, prepaid.quantity.symbol) {}

      void collect(const name& from, const extended_asset& quantity) {
         CHECKC( from == _payer, err::ACCOUNT_INVALID, "payment must come from " + _payer.to_string() )
         CHECKC( quantity.contract == _prepaid.contract, err::CONTRACT_MISMATCH, "payment token contract mismatch" )
         CHECKC( quantity.quantity.symbol == _prepaid.quantity.symbol, err::SYMBOL_MISMATCH, "payment symbol mismatch" )
         CHECKC( quantity.quantity.amount >= 0, err::NOT_POSITIVE, "payment must not be negative" )
         auto left = unused();
         CHECKC( quantity.quantity <= left, err::INCORRECT_AMOUNT,
                 "insufficient payment: " + left.to_string() + " for " + quantity.quantity.to_string() )
         _collected += quantity.quantity;
      }

      asset unused() const { return _prepaid.quantity - _collected; }

      //marks the remainder as refunded and returns it
      extended_asset take_unused() {
         auto left   = unused();
         _collected  += left;
         return extended_asset(left, _prepaid.contract);
      }

      const name& payer() const { return _payer; }

   private:
      name              _payer;
      extended_asset    _prepaid;
      asset             _collected;
};

} //namespace compoundfi
