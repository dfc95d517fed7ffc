#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/action.hpp>
#include <eosio/crypto.hpp>

#include <string>

#include <treat.token/treat.token.db.hpp>

namespace indietreat {

using std::string;
using namespace eosio;

/**
 * Checkout paid in a `treat.coin` compatible token.
 *
 * The payment is pulled from the buyer into the seller wallet with `transferfrom`, so the buyer must
 * have granted this contract an allowance first, either with the token's `approve` or with a signed
 * permit handed to `purchasewp`.
 */
class [[eosio::contract("treat.token")]] treat_token : public contract {
public:
    using contract::contract;

    treat_token(eosio::name receiver, eosio::name code, datastream<const char*> ds):
        contract(receiver, code, ds),
        _global(get_self(), get_self().value), _ledger(get_self())
    {
        _gstate = _global.exists() ? _global.get() : token_global_t{};
    }

    ACTION init(const extended_symbol& pay_token);

    ACTION purchase(const name& buyer, const uint64_t& store_id, const string& product_name,
                    const string& username, const uint64_t& user_id, const asset& quantity, const name& wallet);

    /**
     * Grants the allowance with a permit signed by `buyer`, then purchases.
     *
     * @param deadline - last block time the permit is valid,
     * @param sig - buyer's signature, see treat_coin::permit.
     */
    ACTION purchasewp(const name& buyer, const uint64_t& store_id, const string& product_name,
                      const string& username, const uint64_t& user_id, const asset& quantity, const name& wallet,
                      const time_point_sec& deadline, const signature& sig);

    //inline action call by purchasewp, after the permit is applied
    ACTION afterpermit(const name& buyer, const uint64_t& store_id, const string& product_name,
                       const string& username, const uint64_t& user_id, const asset& quantity, const name& wallet);
    using afterpermit_action = eosio::action_wrapper<"afterpermit"_n, &treat_token::afterpermit>;

    [[eosio::on_notify("*::transfer")]]
    void ontransfer(const name& from, const name& to, const asset& quant, const string& memo);

    [[eosio::action]] purchase_t getpurchase(const uint64_t& store_id, const uint64_t& purchase_id);
    [[eosio::action]] uint64_t getcount(const uint64_t& store_id);
    [[eosio::action]] bool storeexists(const uint64_t& store_id);

    ACTION purchasemade(const uint64_t& store_id, const uint64_t& purchase_id,
                        const string& product_name, const string& username, const uint64_t& user_id,
                        const time_point_sec& timestamp, const asset& quantity, const name& wallet);
    using purchasemade_action = eosio::action_wrapper<"purchasemade"_n, &treat_token::purchasemade>;

private:
    void _check_payment(const name& buyer, const asset& quantity, const name& wallet);

    void _purchase(const name& buyer, const uint64_t& store_id, const string& product_name,
                   const string& username, const uint64_t& user_id, const asset& quantity, const name& wallet);

    token_global_singleton      _global;
    token_global_t              _gstate;
    ledger                      _ledger;
};

} //namespace indietreat
