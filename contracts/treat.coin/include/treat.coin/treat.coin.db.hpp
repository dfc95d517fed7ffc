#pragma once

#include <eosio/asset.hpp>
#include <eosio/crypto.hpp>
#include <eosio/singleton.hpp>
#include <eosio/system.hpp>
#include <eosio/time.hpp>

#include <treat.const.hpp>

#include <string>

namespace indietreat {

using namespace std;
using namespace eosio;

#define COIN_TBL struct [[eosio::table, eosio::contract("treat.coin")]]
#define COIN_NTBL(name) struct [[eosio::table(name), eosio::contract("treat.coin")]]

COIN_NTBL("global") coin_global_t {
    name                issuer;
    asset               supply;
    asset               max_supply;

    EOSLIB_SERIALIZE( coin_global_t, (issuer)(supply)(max_supply) )
};
typedef eosio::singleton< "global"_n, coin_global_t > coin_global_singleton;

//Scope: owner
COIN_TBL account_t {
    asset               balance;

    uint64_t primary_key()const { return balance.symbol.code().raw(); }

    typedef eosio::multi_index<"accounts"_n, account_t> tbl_t;

    EOSLIB_SERIALIZE( account_t, (balance) )
};

//Scope: owner
COIN_TBL allowance_t {
    name                spender;
    asset               quantity;               //remaining amount spender may move

    allowance_t() {}
    allowance_t(const name& s): spender(s) {}

    uint64_t primary_key()const { return spender.value; }

    typedef eosio::multi_index<"allowances"_n, allowance_t> tbl_t;

    EOSLIB_SERIALIZE( allowance_t, (spender)(quantity) )
};

//Scope: _self
COIN_TBL nonce_t {
    name                owner;
    uint64_t            nonce           = 0;    //consumed by permit()

    nonce_t() {}
    nonce_t(const name& o): owner(o) {}

    uint64_t primary_key()const { return owner.value; }

    typedef eosio::multi_index<"nonces"_n, nonce_t> tbl_t;

    EOSLIB_SERIALIZE( nonce_t, (owner)(nonce) )
};

// signed by the owner's active key, see treat_coin::permit
struct permit_message {
    name                contract;
    name                owner;
    name                spender;
    asset               quantity;
    uint64_t            nonce;
    time_point_sec      deadline;

    EOSLIB_SERIALIZE( permit_message, (contract)(owner)(spender)(quantity)(nonce)(deadline) )
};

} //namespace indietreat
