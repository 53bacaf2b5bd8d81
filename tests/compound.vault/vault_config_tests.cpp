#include <eosio/tester.hpp>

#include <cstring>

#include <compound.vault/vault.config.hpp>

using namespace eosio;
using namespace compoundfi;

static incentive_bounds make_bounds() {
   incentive_bounds bounds;
   bounds.max_claimer_incentive  = 500;
   bounds.max_locker_incentive   = 1500;
   return bounds;
}

EOSIO_TEST_BEGIN(replacement_bumps_version)
   auto bounds = make_bounds();
   auto conf   = next_config(vault_config{}, bounds, 100, 1000, "locker"_n);
   CHECK_EQUAL( conf.version, 1ULL )

   conf = next_config(conf, bounds, 500, 1500, "locker2"_n);
   CHECK_EQUAL( conf.version, 2ULL )
   CHECK_EQUAL( conf.claimer_incentive, 500U )
   CHECK_EQUAL( conf.locker_incentive, 1500U )
   CHECK_EQUAL( conf.locker_rewards, "locker2"_n )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(rejected_update_leaves_config)
   auto bounds = make_bounds();
   auto conf   = next_config(vault_config{}, bounds, 100, 1000, "locker"_n);

   CHECK_ASSERT( "[[21]] claimer incentive 501 exceeds max 500", [&]() {
      conf = next_config(conf, bounds, 501, 1000, "locker"_n);
   })
   CHECK_ASSERT( "[[21]] locker incentive 1501 exceeds max 1500", [&]() {
      conf = next_config(conf, bounds, 100, 1501, "locker"_n);
   })
   CHECK_ASSERT( "[[21]] locker rewards account is null", [&]() {
      conf = next_config(conf, bounds, 100, 1000, name());
   })

   CHECK_EQUAL( conf.version, 1ULL )
   CHECK_EQUAL( conf.claimer_incentive, 100U )
   CHECK_EQUAL( conf.locker_incentive, 1000U )
   CHECK_EQUAL( conf.locker_rewards, "locker"_n )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(bounds_capped_at_boost)
   auto bounds = make_bounds();
   validate_bounds(bounds);

   bounds.max_locker_incentive = PCT_BOOST + 1;
   CHECK_ASSERT( "[[21]] max locker incentive exceeds 10000", [&]() { validate_bounds(bounds); })

   bounds.max_claimer_incentive = PCT_BOOST + 1;
   CHECK_ASSERT( "[[21]] max claimer incentive exceeds 10000", [&]() { validate_bounds(bounds); })
EOSIO_TEST_END

EOSIO_TEST_BEGIN(token_identities_validated)
   vault_tokens tokens;
   tokens.asset_token      = extended_symbol(symbol(symbol_code("LPT"), 4), "lp.token"_n);
   tokens.primary_token    = extended_symbol(symbol(symbol_code("CRV"), 4), "crv.token"_n);
   tokens.secondary_token  = extended_symbol(symbol(symbol_code("CVX"), 4), "cvx.token"_n);
   validate_tokens(tokens);

   auto dup = tokens;
   dup.secondary_token = dup.primary_token;
   CHECK_ASSERT( "[[5]] tokens must be distinct", [&]() { validate_tokens(dup); })

   auto no_bank = tokens;
   no_bank.asset_token = extended_symbol(no_bank.asset_token.get_symbol(), name());
   CHECK_ASSERT( "[[5]] token contract is null", [&]() { validate_tokens(no_bank); })
EOSIO_TEST_END

int main(int argc, char** argv) {
   bool verbose = false;
   if( argc >= 2 && std::strcmp( argv[1], "-v" ) == 0 ) {
      verbose = true;
   }
   silence_output(!verbose);

   EOSIO_TEST(replacement_bumps_version)
   EOSIO_TEST(rejected_update_leaves_config)
   EOSIO_TEST(bounds_capped_at_boost)
   EOSIO_TEST(token_identities_validated)
   return has_failed();
}
