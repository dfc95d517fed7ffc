#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <eosio/name.hpp>
#include <eosio/asset.hpp>
#include <eosio/check.hpp>

using namespace eosio;

#define SYMBOL(sym_code, precision) symbol(symbol_code(sym_code), precision)

namespace indietreat {

static constexpr eosio::name   active_perm         {"active"_n};
static constexpr name          SYS_BANK            = "amax.token"_n;
static constexpr symbol        SYS_SYMBOL          = SYMBOL("AMAX", 8);
static constexpr uint32_t      MAX_TEXT_SIZE       = 256;

static constexpr std::string_view PURCHASE_MEMO_TAG = "purchase";

enum class err: uint8_t {
   RECORD_NOT_FOUND        = 1,
   RECORD_EXISTING         = 2,
   SYMBOL_MISMATCH         = 4,
   PARAM_ERROR             = 5,
   PAYMENT_REJECTED        = 6,
   NOT_POSITIVE            = 9,
   NOT_STARTED             = 10,
   OVERSIZED               = 11,
   TIME_EXPIRED            = 12,
   ACCOUNT_INVALID         = 15,
   FORWARD_FAILED          = 21,
   TRANSFER_FAILED         = 22,
   INVALID_SIGNATURE       = 23,
   INSUFFICIENT_ALLOWANCE  = 24
};

} //namespace indietreat

#define CHECKC(exp, code, msg) \
   { if (!(exp)) eosio::check(false, std::string("[[") + std::to_string((int)code) + std::string("]] ") + msg); }
