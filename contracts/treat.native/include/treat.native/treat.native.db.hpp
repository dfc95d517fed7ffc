#pragma once

#include <eosio/asset.hpp>
#include <eosio/singleton.hpp>
#include <eosio/system.hpp>
#include <eosio/time.hpp>

#include <treat.const.hpp>

#define NATIVE_NTBL(name) struct [[eosio::table(name), eosio::contract("treat.native")]]
#define LEDGER_NTBL(name) NATIVE_NTBL(name)

#include <treat.ledger.hpp>

#include <string>

namespace indietreat {

using namespace std;
using namespace eosio;

NATIVE_NTBL("global") native_global_t {
    extended_symbol     pay_token       = extended_symbol(SYS_SYMBOL, SYS_BANK);     //AMAX@amax.token

    EOSLIB_SERIALIZE( native_global_t, (pay_token) )
};
typedef eosio::singleton< "global"_n, native_global_t > native_global_singleton;

} //namespace indietreat
