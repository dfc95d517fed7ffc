#include <treat.native/treat.native.hpp>
#include <treat.coin/treat.coin.hpp>
#include <treat.utils.hpp>

namespace indietreat {

// any eosio.token compatible bank accepts the same transfer arguments
#define TRANSFER(bank, to, quantity, memo) \
    {	treat_coin::transfer_action act{ bank, { {_self, active_perm} } };\
            act.send( _self, to, quantity, memo );}

#define NOTIFY_PURCHASE(store_id, p) \
    {	treat_native::purchasemade_action act{ _self, { {_self, active_perm} } };\
            act.send( store_id, p.id, p.product_name, p.username, p.user_id, p.timestamp, p.quantity, p.wallet );}

void treat_native::init(const extended_symbol& pay_token) {
   require_auth( _self );

   CHECKC( is_account(pay_token.get_contract()), err::ACCOUNT_INVALID, "pay token contract does not exist" )
   CHECKC( pay_token.get_symbol().is_valid(), err::PARAM_ERROR, "invalid pay token symbol" )

   _gstate.pay_token = pay_token;
   _global.set( _gstate, get_self() );
}

/**
 * @param memo: purchase:$store_id:$user_id:$wallet:$username:$product_name
 *       the product name takes the rest of the memo and may contain ':'
 */
void treat_native::ontransfer(const name& from, const name& to, const asset& quant, const string& memo) {
   if (from == get_self() || to != get_self()) return;

   auto bank = get_first_receiver();
   CHECKC( bank == _gstate.pay_token.get_contract(), err::PAYMENT_REJECTED, "payment not accepted from token contract: " + bank.to_string() )

   auto params = split(memo, ":", 6);
   CHECKC( params.size() == 6 && params[0] == PURCHASE_MEMO_TAG, err::PAYMENT_REJECTED, "direct payment not accepted, memo: " + memo )
   CHECKC( quant.symbol == _gstate.pay_token.get_symbol(), err::SYMBOL_MISMATCH, "symbol mismatch: " + quant.to_string() )

   auto store_id  = to_uint64(params[1], "store_id");
   auto user_id   = to_uint64(params[2], "user_id");
   auto wallet    = to_name(params[3], "wallet");

   _purchase( store_id, string(params[5]), string(params[4]), user_id, quant, wallet );
}

void treat_native::_purchase(const uint64_t& store_id, const string& product_name, const string& username,
                             const uint64_t& user_id, const asset& quant, const name& wallet) {
   CHECKC( wallet != get_self(), err::ACCOUNT_INVALID, "wallet cannot be the checkout contract" )

   auto purchase = _ledger.record( store_id, product_name, username, user_id, quant, wallet );

   CHECKC( is_account(wallet), err::FORWARD_FAILED, "wallet account does not exist: " + wallet.to_string() )
   TRANSFER( _gstate.pay_token.get_contract(), wallet, quant,
             "purchase:" + to_string(store_id) + ":" + to_string(purchase.id) )
   NOTIFY_PURCHASE( store_id, purchase )
}

purchase_t treat_native::getpurchase(const uint64_t& store_id, const uint64_t& purchase_id) {
   return _ledger.get_purchase( store_id, purchase_id );
}

uint64_t treat_native::getcount(const uint64_t& store_id) {
   return _ledger.get_purchase_count( store_id );
}

bool treat_native::storeexists(const uint64_t& store_id) {
   return _ledger.store_exists( store_id );
}

void treat_native::purchasemade(const uint64_t& store_id, const uint64_t& purchase_id,
                                const string& product_name, const string& username, const uint64_t& user_id,
                                const time_point_sec& timestamp, const asset& quantity, const name& wallet) {
   require_auth( get_self() );
   require_recipient( wallet );
}

} //namespace indietreat
