#include <compound.vault/claim.orchestrator.hpp>

namespace compoundfi {

using namespace std;
using namespace wasm::safemath;

claim_orchestrator::claim_orchestrator(const name& vault, const vault_tokens& tokens, const emission::emission_conf& emission,
                                       const vault_config& config, reward_pool_adapter& pool, price_oracle_adapter& oracle,
                                       token_adapter& token, claim_event_sink& events):
   _vault(vault), _tokens(tokens), _emission(emission), _config(config),
   _pool(pool), _oracle(oracle), _token(token), _events(events) {}

asset claim_orchestrator::mintable_secondary(const asset& primary) const {
   CHECKC( primary.symbol == _tokens.primary_token.get_symbol(), err::SYMBOL_MISMATCH, "primary symbol mismatch" )
   CHECKC( primary.amount >= 0, err::NOT_POSITIVE, "primary amount must not be negative" )
   auto supply = _token.supply_of(_tokens.secondary_token);
   CHECKC( supply.amount >= 0, err::EXTERNAL_FAILURE, "invalid secondary supply: " + supply.to_string() )
   auto amount = emission::mintable_secondary(primary.amount, supply.amount, _emission);
   return asset(to_amount(amount), _tokens.secondary_token.get_symbol());
}

claim_quote claim_orchestrator::quote() const {
   claim_quote q;
   q.earned_primary        = _pool.earned(_vault);
   CHECKC( q.earned_primary.symbol == _tokens.primary_token.get_symbol(), err::SYMBOL_MISMATCH,
           "pool reward symbol mismatch: " + q.earned_primary.to_string() )

   q.secondary_supply      = _token.supply_of(_tokens.secondary_token);
   q.available_primary     = _token.balance_of(_vault, _tokens.primary_token) + q.earned_primary;
   q.available_secondary   = _token.balance_of(_vault, _tokens.secondary_token) + mintable_secondary(q.earned_primary);
   return q;
}

incentive::incentive_split claim_orchestrator::split(const asset& primary, const asset& secondary, const vault_config& conf) const {
   std::array<incentive::reward_quote, REWARD_TOKENS> rewards = {{
      { primary,     _oracle.price(_tokens.primary_token) },
      { secondary,   _oracle.price(_tokens.secondary_token) }
   }};
   auto asset_price = _oracle.price(_tokens.asset_token);
   return incentive::split(rewards, asset_price, _tokens.asset_token.get_symbol(), conf);
}

asset claim_orchestrator::preview_reward() const {
   auto q      = quote();
   auto conf   = _config;
   return split(q.available_primary, q.available_secondary, conf).amount_to_compound;
}

asset claim_orchestrator::total_assets() const {
   auto staked = _pool.balance_of(_vault);
   CHECKC( staked.symbol == _tokens.asset_token.get_symbol(), err::SYMBOL_MISMATCH,
           "pool balance symbol mismatch: " + staked.to_string() )
   return staked + preview_reward();
}

void claim_orchestrator::_pay(const name& to, const asset& quantity, const name& bank, const string& memo) {
   if (quantity.amount <= 0) return;
   _token.transfer(to, extended_asset(quantity, bank), memo);
}

asset claim_orchestrator::claim(const claim_request& req) {
   CHECKC( !_claiming, err::REENTRANT_CALL, "claim already in progress" )
   claim_guard guard(_claiming);

   CHECKC( req.caller != name(), err::ACCOUNT_INVALID, "caller is null" )
   CHECKC( req.primary_amount.symbol == _tokens.primary_token.get_symbol(), err::SYMBOL_MISMATCH, "primary symbol mismatch" )
   CHECKC( req.secondary_amount.symbol == _tokens.secondary_token.get_symbol(), err::SYMBOL_MISMATCH, "secondary symbol mismatch" )
   CHECKC( req.max_asset_in.symbol == _tokens.asset_token.get_symbol(), err::SYMBOL_MISMATCH, "asset symbol mismatch" )
   CHECKC( req.primary_amount.amount >= 0 && req.secondary_amount.amount >= 0, err::NOT_POSITIVE, "claim amount must not be negative" )

   _state = claim_state::QUOTE;
   auto q          = quote();
   auto primary    = req.primary_amount;
   auto secondary  = req.secondary_amount;
   if (req.derive_secondary)
      secondary    = std::min(mintable_secondary(primary), q.available_secondary);

   CHECKC( primary.amount > 0 || secondary.amount > 0, err::NOT_POSITIVE, "nothing to claim" )
   CHECKC( primary <= q.available_primary, err::OVERSIZED,
           "primary reward " + primary.to_string() + " exceeds available " + q.available_primary.to_string() )
   CHECKC( secondary <= q.available_secondary, err::OVERSIZED,
           "secondary reward " + secondary.to_string() + " exceeds available " + q.available_secondary.to_string() )

   _state = claim_state::PULL_REWARDS;
   _pool.get_reward();

   _state = claim_state::COMPUTE_SPLIT;
   auto conf       = _config;
   auto cuts       = split(primary, secondary, conf);
   auto amount_in  = cuts.amount_to_compound;

   _state = claim_state::SLIPPAGE_CHECK;
   CHECKC( amount_in <= req.max_asset_in, err::SLIPPAGE_EXCEEDED,
           "slippage: amount in " + amount_in.to_string() + " exceeds max " + req.max_asset_in.to_string() )

   auto asset_bank = _tokens.asset_token.get_contract();
   if (amount_in.amount > 0) {
      _state = claim_state::COLLECT_PAYMENT;
      _token.collect(req.caller, extended_asset(amount_in, asset_bank));

      _state = claim_state::COMPOUND;
      auto credited = _pool.deposit(amount_in, _vault);
      CHECKC( credited == amount_in, err::EXTERNAL_FAILURE, "pool credited " + credited.to_string() + " for " + amount_in.to_string() )
   }

   _state = claim_state::DISTRIBUTE;
   const name banks[REWARD_TOKENS] = { _tokens.primary_token.get_contract(), _tokens.secondary_token.get_contract() };
   for (uint8_t i = 0; i < REWARD_TOKENS; i++) {
      _pay(conf.locker_rewards, cuts.locker_cut[i], banks[i], "locker incentive");
      _pay(req.caller,          cuts.caller_cut[i], banks[i], "claim reward");
   }

   _state = claim_state::EMIT;
   _events.claimed(req.caller, primary, secondary, amount_in);

   _state = claim_state::SUCCEEDED;
   return amount_in;
}

} //namespace compoundfi
