#include <eosio/tester.hpp>

#include <cstring>

#include <compound.vault/emission.curve.hpp>

using namespace eosio;
using namespace compoundfi;
using namespace wasm::safemath;

static emission::emission_conf mainnet_schedule() {
   emission::emission_conf conf;
   conf.init_mint_amount      = 5 * power10(25);
   conf.total_cliffs          = 500;
   conf.reduction_per_cliff   = power10(23);
   conf.max_emission_supply   = 5 * power10(25);
   conf.minter_minted         = 0;
   return conf;
}

EOSIO_TEST_BEGIN(mintable_at_cliff_100)
   auto conf   = mainnet_schedule();
   //100 cliffs emitted on top of the initial mint
   auto supply = conf.init_mint_amount + 100 * conf.reduction_per_cliff;

   CHECK_EQUAL( emission::emissions_minted(supply, conf), 100 * conf.reduction_per_cliff )
   CHECK_EQUAL( emission::mintable_secondary(power10(19), supply, conf), 34 * power10(18) )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(minter_minted_excluded)
   auto conf            = mainnet_schedule();
   conf.minter_minted   = 7 * power10(22);
   auto supply          = conf.init_mint_amount + conf.minter_minted + 100 * conf.reduction_per_cliff;

   CHECK_EQUAL( emission::emissions_minted(supply, conf), 100 * conf.reduction_per_cliff )
   CHECK_EQUAL( emission::mintable_secondary(power10(19), supply, conf), 34 * power10(18) )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(exhausted_schedule_mints_nothing)
   auto conf = mainnet_schedule();

   //every cliff passed
   auto supply = conf.init_mint_amount + conf.total_cliffs * conf.reduction_per_cliff;
   CHECK_EQUAL( emission::mintable_secondary(power10(19), supply, conf), (uint128_t)0 )

   //max supply reached before the last cliff
   conf.max_emission_supply = 200 * conf.reduction_per_cliff;
   supply = conf.init_mint_amount + conf.max_emission_supply;
   CHECK_EQUAL( emission::mintable_secondary(power10(19), supply, conf), (uint128_t)0 )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(clamped_to_remaining_supply)
   auto conf                  = mainnet_schedule();
   conf.max_emission_supply   = 100 * conf.reduction_per_cliff + 1000;
   auto supply                = conf.init_mint_amount + 100 * conf.reduction_per_cliff;

   CHECK_EQUAL( emission::mintable_secondary(power10(19), supply, conf), (uint128_t)1000 )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(decays_cliff_by_cliff)
   auto conf      = mainnet_schedule();
   auto primary   = power10(19);

   uint128_t last = emission::mintable_secondary(primary, conf.init_mint_amount, conf);
   //cliff 0: (500 * 5 / 2 + 700) / 500 per primary
   CHECK_EQUAL( last, primary * 1950 / 500 )

   for (uint128_t cliff = 1; cliff <= conf.total_cliffs; cliff += 7) {
      auto supply  = conf.init_mint_amount + cliff * conf.reduction_per_cliff;
      auto minted  = emission::mintable_secondary(primary, supply, conf);
      CHECK_EQUAL( minted <= last, true )
      last = minted;
   }
EOSIO_TEST_END

EOSIO_TEST_BEGIN(supply_below_initial_mint_fails)
   auto conf = mainnet_schedule();
   CHECK_ASSERT( "[[23]] secondary supply below initial mint amount", [&]() {
      emission::mintable_secondary(power10(19), conf.init_mint_amount - 1, conf);
   })

   conf.minter_minted = power10(23);
   CHECK_ASSERT( "[[23]] secondary supply below minter minted amount", [&]() {
      emission::mintable_secondary(power10(19), conf.init_mint_amount, conf);
   })
EOSIO_TEST_END

EOSIO_TEST_BEGIN(unconfigured_schedule_fails)
   emission::emission_conf conf;
   CHECK_ASSERT( "[[5]] total cliffs must be positive", [&]() { emission::validate(conf); })
   CHECK_ASSERT( "[[23]] emission schedule not configured", [&]() {
      emission::mintable_secondary(1, 0, conf);
   })

   conf.total_cliffs = 10;
   CHECK_ASSERT( "[[5]] reduction per cliff must be positive", [&]() { emission::validate(conf); })
EOSIO_TEST_END

EOSIO_TEST_BEGIN(overflow_is_fatal)
   auto conf                  = mainnet_schedule();
   conf.max_emission_supply   = ~uint128_t(0);
   CHECK_ASSERT( "safemath: multiplication overflow", [&]() {
      emission::mintable_secondary(~uint128_t(0) / 100, conf.init_mint_amount, conf);
   })
EOSIO_TEST_END

EOSIO_TEST_BEGIN(minter_minted_bounded_by_supply)
   auto conf            = mainnet_schedule();
   auto minter_minted   = 7 * power10(22);

   emission::validate_minter_minted(minter_minted, conf.init_mint_amount + minter_minted, conf);
   emission::validate_minter_minted(0, conf.init_mint_amount, conf);
   CHECK_ASSERT( "[[21]] minter minted exceeds secondary supply beyond the initial mint", [&]() {
      emission::validate_minter_minted(minter_minted, conf.init_mint_amount + minter_minted - 1, conf);
   })
EOSIO_TEST_END

int main(int argc, char** argv) {
   bool verbose = false;
   if( argc >= 2 && std::strcmp( argv[1], "-v" ) == 0 ) {
      verbose = true;
   }
   silence_output(!verbose);

   EOSIO_TEST(mintable_at_cliff_100)
   EOSIO_TEST(minter_minted_excluded)
   EOSIO_TEST(exhausted_schedule_mints_nothing)
   EOSIO_TEST(clamped_to_remaining_supply)
   EOSIO_TEST(decays_cliff_by_cliff)
   EOSIO_TEST(supply_below_initial_mint_fails)
   EOSIO_TEST(unconfigured_schedule_fails)
   EOSIO_TEST(overflow_is_fatal)
   EOSIO_TEST(minter_minted_bounded_by_supply)
   return has_failed();
}
