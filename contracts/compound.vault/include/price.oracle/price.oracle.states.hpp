#pragma once

#include <eosio/asset.hpp>
#include <eosio/singleton.hpp>
#include <eosio/multi_index.hpp>
#include <eosio/time.hpp>
#include <eosio/name.hpp>

#include <map>

//read-only view of the price.oracle contract tables
namespace priceoracle {

using namespace std;
using namespace eosio;

struct price_global_t {
    name                    version;
    map<name, uint64_t>     prices;                 //coin code => latest price in quote_symbol precision
    uint64_t                price_history_count = 0;
    name                    quote_code;
    symbol                  quote_symbol;

    EOSLIB_SERIALIZE(price_global_t, (version)(prices)(price_history_count)(quote_code)(quote_symbol))

    typedef eosio::singleton< "global"_n, price_global_t > idx_t;
};

//scope: coin code
struct coin_price_t {
    uint64_t        id;
    name            tpcode;
    asset           price;
    time_point      updated_at;

    uint64_t primary_key() const { return id; }
    uint64_t by_time() const { return updated_at.sec_since_epoch(); }

    typedef eosio::multi_index< "prices"_n, coin_price_t,
        indexed_by<"bytime"_n, const_mem_fun<coin_price_t, uint64_t, &coin_price_t::by_time>>
    > idx_t;

    EOSLIB_SERIALIZE(coin_price_t, (id)(tpcode)(price)(updated_at))
};

struct coin_quote {
    bool            found       = false;
    uint64_t        price       = 0;
    uint32_t        quoted_at   = 0;    //seconds since epoch of the newest history row
};

/**
 * Latest quote of `code` published by `oracle`. `found` is false when the oracle
 * is not initialized, the coin is not listed or it has no price history.
 */
inline coin_quote latest_quote(const name& oracle, const name& code) {
    coin_quote ret;
    auto global = price_global_t::idx_t(oracle, oracle.value);
    if (!global.exists()) return ret;

    const auto prices = global.get().prices;
    auto itr = prices.find(code);
    if (itr == prices.end()) return ret;

    auto history = coin_price_t::idx_t(oracle, code.value);
    auto idx     = history.get_index<"bytime"_n>();
    if (idx.begin() == idx.end()) return ret;
    auto newest  = idx.end();
    newest--;

    ret.found       = true;
    ret.price       = itr->second;
    ret.quoted_at   = newest->updated_at.sec_since_epoch();
    return ret;
}

} // namespace priceoracle
