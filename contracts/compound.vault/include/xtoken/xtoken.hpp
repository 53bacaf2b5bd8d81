#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/action.hpp>

#include <string>

//token contract interface shared by the pooled asset and both reward tokens
namespace xtoken
{

    using std::string;
    using namespace eosio;

    class xtoken
    {
    public:
        [[eosio::action]]
        void transfer(const name &from, const name &to, const asset &quantity, const string &memo);

        using transfer_action = eosio::action_wrapper<"transfer"_n, &xtoken::transfer>;

        struct account
        {
            asset balance;

            uint64_t primary_key() const { return balance.symbol.code().raw(); }
        };

        struct currency_stats
        {
            asset supply;
            asset max_supply;
            name issuer;

            uint64_t primary_key() const { return supply.symbol.code().raw(); }
        };

        typedef eosio::multi_index<"accounts"_n, account> accounts;
        typedef eosio::multi_index<"stat"_n, currency_stats> stats;

        static asset get_balance(const name &token_contract_account, const name &owner, const symbol &sym)
        {
            accounts accountstable(token_contract_account, owner.value);
            auto ac = accountstable.find(sym.code().raw());
            if (ac == accountstable.end())
                return asset(0, sym);
            return ac->balance;
        }

        static asset get_supply(const name &token_contract_account, const symbol &sym)
        {
            stats statstable(token_contract_account, sym.code().raw());
            const auto &st = statstable.get(sym.code().raw(), "token stat not found");
            return st.supply;
        }
    };

} //namespace xtoken
