#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/action.hpp>

#include <string>

#include <treat.native/treat.native.db.hpp>

namespace indietreat {

using std::string;
using namespace eosio;

/**
 * Checkout paid in the chain's system token.
 *
 * The buyer pays by transferring to this contract with the memo
 * `purchase:<store_id>:<user_id>:<wallet>:<username>:<product_name>`.
 * The purchase is appended to the store's ledger and the whole transfer is forwarded to `wallet`
 * in the same transaction. Any other incoming transfer is rejected, so the contract never holds funds.
 */
class [[eosio::contract("treat.native")]] treat_native : public contract {
public:
    using contract::contract;

    treat_native(eosio::name receiver, eosio::name code, datastream<const char*> ds):
        contract(receiver, code, ds),
        _global(get_self(), get_self().value), _ledger(get_self())
    {
        _gstate = _global.exists() ? _global.get() : native_global_t{};
    }

    ACTION init(const extended_symbol& pay_token);

    [[eosio::on_notify("*::transfer")]]
    void ontransfer(const name& from, const name& to, const asset& quant, const string& memo);

    [[eosio::action]] purchase_t getpurchase(const uint64_t& store_id, const uint64_t& purchase_id);
    [[eosio::action]] uint64_t getcount(const uint64_t& store_id);
    [[eosio::action]] bool storeexists(const uint64_t& store_id);

    //inline action, sent by this contract after each purchase
    ACTION purchasemade(const uint64_t& store_id, const uint64_t& purchase_id,
                        const string& product_name, const string& username, const uint64_t& user_id,
                        const time_point_sec& timestamp, const asset& quantity, const name& wallet);
    using purchasemade_action = eosio::action_wrapper<"purchasemade"_n, &treat_native::purchasemade>;

private:
    void _purchase(const uint64_t& store_id, const string& product_name, const string& username,
                   const uint64_t& user_id, const asset& quant, const name& wallet);

    native_global_singleton     _global;
    native_global_t             _gstate;
    ledger                      _ledger;
};

} //namespace indietreat
