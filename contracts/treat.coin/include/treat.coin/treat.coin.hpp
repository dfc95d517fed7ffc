#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/crypto.hpp>
#include <eosio/singleton.hpp>

#include <string>

#include <treat.coin/treat.coin.db.hpp>

namespace indietreat {

using std::string;
using namespace eosio;

/**
 * The `treat.coin` contract is the single-symbol fungible token used to pay at IndieTreat stores.
 *
 * Besides plain transfers it lets an owner grant a spender an allowance, either on-chain with `approve`
 * or off-chain by signing a permit message that anyone can submit with `permit`. A spender moves funds
 * out of an allowance with `transferfrom`.
 *
 * Balances live in the `accounts` table scoped by owner, allowances in the `allowances` table scoped by
 * owner and keyed by spender, and permit nonces in the `nonces` table scoped by the contract.
 */
class [[eosio::contract("treat.coin")]] treat_coin : public contract {
public:
    using contract::contract;

    treat_coin(eosio::name receiver, eosio::name code, datastream<const char*> ds):
        contract(receiver, code, ds), _global(get_self(), get_self().value)
    {
        _g = _global.exists() ? _global.get() : coin_global_t{};
    }

    ~treat_coin() { _global.set( _g, get_self() ); }

    ACTION init(const name& issuer, const asset& max_supply);

    /**
     * Mints `quantity` new tokens into `to`. Issuer only.
     */
    ACTION mint(const name& to, const asset& quantity, const string& memo);

    ACTION burn(const asset& quantity, const string& memo);

    /**
     * Allows `from` account to transfer to `to` account the `quantity` tokens.
     *
     * @param from - the account to transfer from,
     * @param to - the account to be transferred to,
     * @param quantity - the quantity of tokens to be transferred,
     * @param memo - the memo string to accompany the transaction.
     */
    ACTION transfer(const name& from, const name& to, const asset& quantity, const string& memo);

    /**
     * Sets the amount `spender` may move out of `owner`'s balance. Overwrites any previous allowance,
     * a zero quantity revokes it.
     */
    ACTION approve(const name& owner, const name& spender, const asset& quantity);

    /**
     * Moves `quantity` from `from` to `to` on behalf of `spender`, consuming the allowance `from` gave `spender`.
     */
    ACTION transferfrom(const name& spender, const name& from, const name& to, const asset& quantity, const string& memo);

    /**
     * Same effect as approve(), authorized by a signature of `owner`'s active key instead of an on-chain authority.
     *
     * @param owner - the account granting the allowance,
     * @param spender - the account receiving the allowance,
     * @param quantity - the allowance,
     * @param deadline - the permit is rejected once the block time passes it,
     * @param sig - signature over sha256(pack(permit_message)) with the owner's current nonce.
     * Any account can submit it.
     */
    ACTION permit(const name& owner, const name& spender, const asset& quantity,
                  const time_point_sec& deadline, const signature& sig);

    static asset get_balance(const name& token_contract, const name& owner, const symbol& sym) {
        account_t::tbl_t accts(token_contract, owner.value);
        auto itr = accts.find( sym.code().raw() );
        return itr == accts.end() ? asset(0, sym) : itr->balance;
    }

    static asset get_allowance(const name& token_contract, const name& owner, const name& spender, const symbol& sym) {
        allowance_t::tbl_t allowances(token_contract, owner.value);
        auto itr = allowances.find( spender.value );
        return itr == allowances.end() ? asset(0, sym) : itr->quantity;
    }

    static uint64_t get_nonce(const name& token_contract, const name& owner) {
        nonce_t::tbl_t nonces(token_contract, token_contract.value);
        auto itr = nonces.find( owner.value );
        return itr == nonces.end() ? 0 : itr->nonce;
    }

    using transfer_action       = eosio::action_wrapper<"transfer"_n,       &treat_coin::transfer>;
    using transferfrom_action   = eosio::action_wrapper<"transferfrom"_n,   &treat_coin::transferfrom>;
    using permit_action         = eosio::action_wrapper<"permit"_n,         &treat_coin::permit>;

private:
    void sub_balance(const name& owner, const asset& value);
    void add_balance(const name& owner, const asset& value, const name& ram_payer);
    void set_allowance(const name& owner, const name& spender, const asset& quantity, const name& ram_payer);

    void check_quantity(const asset& quantity);

    coin_global_singleton   _global;
    coin_global_t           _g;
};

} //namespace indietreat
