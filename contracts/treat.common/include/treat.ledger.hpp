#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/system.hpp>
#include <eosio/time.hpp>

#include <string>

#include "treat.const.hpp"

namespace indietreat {

using namespace std;
using namespace eosio;

// the including contract defines LEDGER_NTBL to tag the tables with its own contract name
#ifndef LEDGER_NTBL
#define LEDGER_NTBL(name) struct [[eosio::table(name)]]
#endif

//Scope: store_id
LEDGER_NTBL("purchases") purchase_t {
    uint64_t            id;                     //dense per store, starts at 0
    string              product_name;
    string              username;
    uint64_t            user_id         = 0;
    time_point_sec      timestamp;
    asset               quantity;
    name                wallet;                 //seller, receives the payment

    purchase_t() {}
    purchase_t(const uint64_t& i): id(i) {}

    uint64_t primary_key()const { return id; }

    typedef eosio::multi_index<"purchases"_n, purchase_t> tbl_t;

    EOSLIB_SERIALIZE( purchase_t, (id)(product_name)(username)(user_id)(timestamp)(quantity)(wallet) )
};

//Scope: _self
LEDGER_NTBL("stores") store_t {
    uint64_t            store_id;
    uint64_t            purchase_count  = 0;    //next purchase id

    store_t() {}
    store_t(const uint64_t& s): store_id(s) {}

    uint64_t primary_key()const { return store_id; }

    typedef eosio::multi_index<"stores"_n, store_t> tbl_t;

    EOSLIB_SERIALIZE( store_t, (store_id)(purchase_count) )
};

/**
 * Append-only purchase log shared by the checkout contracts.
 * Rows are only ever written by record(); nothing is modified or erased.
 */
class ledger {
public:
    explicit ledger(const name& self): _self(self) {}

    purchase_t record(const uint64_t& store_id,
                      const string& product_name,
                      const string& username,
                      const uint64_t& user_id,
                      const asset& quantity,
                      const name& wallet) {
        CHECKC( wallet.value != 0, err::ACCOUNT_INVALID, "wallet cannot be empty" )
        CHECKC( quantity.is_valid(), err::PARAM_ERROR, "invalid quantity: " + quantity.to_string() )
        CHECKC( quantity.amount > 0, err::NOT_POSITIVE, "must purchase with positive quantity: " + quantity.to_string() )
        CHECKC( product_name.size() <= MAX_TEXT_SIZE, err::OVERSIZED, "product name has more than 256 bytes" )
        CHECKC( username.size() <= MAX_TEXT_SIZE, err::OVERSIZED, "username has more than 256 bytes" )

        auto stores     = store_t::tbl_t(_self, _self.value);
        auto store_itr  = stores.find( store_id );
        uint64_t purchase_id = 0;
        if( store_itr == stores.end() ) {
            stores.emplace( _self, [&]( auto& s ) {
                s.store_id          = store_id;
                s.purchase_count    = 1;
            });
        } else {
            purchase_id = store_itr->purchase_count;
            stores.modify( store_itr, same_payer, [&]( auto& s ) {
                s.purchase_count++;
            });
        }

        auto purchase           = purchase_t( purchase_id );
        purchase.product_name   = product_name;
        purchase.username       = username;
        purchase.user_id        = user_id;
        purchase.timestamp      = time_point_sec( current_time_point() );
        purchase.quantity       = quantity;
        purchase.wallet         = wallet;

        auto purchases = purchase_t::tbl_t(_self, store_id);
        purchases.emplace( _self, [&]( auto& p ) {
            p = purchase;
        });
        return purchase;
    }

    purchase_t get_purchase(const uint64_t& store_id, const uint64_t& purchase_id) const {
        CHECKC( purchase_id < get_purchase_count(store_id), err::RECORD_NOT_FOUND,
                "purchase not found: " + to_string(store_id) + "/" + to_string(purchase_id) )
        auto purchases = purchase_t::tbl_t(_self, store_id);
        return purchases.get( purchase_id, "purchase row missing" );
    }

    uint64_t get_purchase_count(const uint64_t& store_id) const {
        auto stores     = store_t::tbl_t(_self, _self.value);
        auto store_itr  = stores.find( store_id );
        return store_itr == stores.end() ? 0 : store_itr->purchase_count;
    }

    bool store_exists(const uint64_t& store_id) const {
        return get_purchase_count(store_id) > 0;
    }

private:
    name _self;
};

} //namespace indietreat
