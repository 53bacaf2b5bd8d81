#pragma once

#include <cstdint>
#include <string>
#include <eosio/eosio.hpp>
#include <eosio/name.hpp>

#define CHECKC(exp, code, msg) \
   { if (!(exp)) eosio::check(false, std::string("[[") + std::to_string((int)code) + std::string("]] ") + msg); }

namespace compoundfi {

static constexpr uint32_t    PCT_BOOST         = 10000;
static constexpr uint32_t    MAX_PRICE_AGE_SEC = 3600;
static constexpr uint8_t     REWARD_TOKENS     = 2;                         // primary, secondary

static constexpr eosio::name active_perm       {"active"_n};

enum class err: uint8_t {
   NONE                 = 0,
   RECORD_NOT_FOUND     = 1,
   RECORD_EXISTING      = 2,
   CONTRACT_MISMATCH    = 3,
   SYMBOL_MISMATCH      = 4,
   PARAM_ERROR          = 5,
   MEMO_FORMAT_ERROR    = 6,
   PAUSED               = 7,
   NOT_POSITIVE         = 9,
   NOT_STARTED          = 10,
   OVERSIZED            = 11,
   ACCOUNT_INVALID      = 15,
   INCORRECT_AMOUNT     = 19,
   CONFIG_INVALID       = 21,
   SLIPPAGE_EXCEEDED    = 22,
   PRECISION_ERROR      = 23,
   PRICE_STALE          = 24,
   EXTERNAL_FAILURE     = 25,
   REENTRANT_CALL       = 26
};

} //namespace compoundfi
