#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>
#include <eosio/action.hpp>
#include <eosio/time.hpp>

#include <string>

//interface of the external reward pool contract: staking is a token transfer
//to the pool with memo "deposit:<owner>"
namespace rewardpool {

using std::string;
using namespace eosio;

static constexpr int128_t  HIGH_PRECISION    = 1'000'000'000'000'000'000; // 10^18

struct pool_global_t {
    extended_symbol     stake_token;
    extended_symbol     reward_token;
    asset               total_staked;
    int128_t            reward_per_share    = 0;
    time_point_sec      reward_added_at;

    EOSLIB_SERIALIZE( pool_global_t, (stake_token)(reward_token)(total_staked)(reward_per_share)(reward_added_at) )

    typedef eosio::singleton< "global"_n, pool_global_t > idx_t;
};

//Scope: pool contract
struct staker_t {
    name                owner;
    asset               balance;
    asset               unclaimed_rewards;
    int128_t            last_reward_per_share   = 0;

    staker_t() {}
    staker_t(const name& o): owner(o) {}

    uint64_t primary_key() const { return owner.value; }

    typedef eosio::multi_index< "stakers"_n, staker_t > idx_t;

    EOSLIB_SERIALIZE( staker_t, (owner)(balance)(unclaimed_rewards)(last_reward_per_share) )
};

class reward_pool {
   public:
      [[eosio::action]]
      void withdraw( const name& owner, const asset& quantity, const bool& claim_extras );

      [[eosio::action]]
      void getreward( const name& owner );

      using withdraw_action   = eosio::action_wrapper<"withdraw"_n,  &reward_pool::withdraw>;
      using getreward_action  = eosio::action_wrapper<"getreward"_n, &reward_pool::getreward>;
};

inline string deposit_memo(const name& owner) {
    return "deposit:" + owner.to_string();
}

} //namespace rewardpool
