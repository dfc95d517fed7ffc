#pragma once

#include <eosio/asset.hpp>
#include <eosio/singleton.hpp>
#include <eosio/system.hpp>
#include <eosio/time.hpp>

#include <treat.const.hpp>

#define TOKEN_NTBL(name) struct [[eosio::table(name), eosio::contract("treat.token")]]
#define LEDGER_NTBL(name) TOKEN_NTBL(name)

#include <treat.ledger.hpp>

#include <string>

namespace indietreat {

using namespace std;
using namespace eosio;

TOKEN_NTBL("global") token_global_t {
    extended_symbol     pay_token;                  //set by init(), e.g. 4,TREAT@treat.coin

    bool initialized()const { return pay_token.get_contract() != name(); }

    EOSLIB_SERIALIZE( token_global_t, (pay_token) )
};
typedef eosio::singleton< "global"_n, token_global_t > token_global_singleton;

} //namespace indietreat
