#include <treat.token/treat.token.hpp>
#include <treat.coin/treat.coin.hpp>

namespace indietreat {

#define TRANSFER_FROM(bank, from, to, quantity, memo) \
    {	treat_coin::transferfrom_action act{ bank, { {_self, active_perm} } };\
            act.send( _self, from, to, quantity, memo );}

#define PERMIT(bank, owner, quantity, deadline, sig) \
    {	treat_coin::permit_action act{ bank, { {_self, active_perm} } };\
            act.send( owner, _self, quantity, deadline, sig );}

#define AFTER_PERMIT(buyer, store_id, product_name, username, user_id, quantity, wallet) \
    {	treat_token::afterpermit_action act{ _self, { {_self, active_perm} } };\
            act.send( buyer, store_id, product_name, username, user_id, quantity, wallet );}

#define NOTIFY_PURCHASE(store_id, p) \
    {	treat_token::purchasemade_action act{ _self, { {_self, active_perm} } };\
            act.send( store_id, p.id, p.product_name, p.username, p.user_id, p.timestamp, p.quantity, p.wallet );}

void treat_token::init(const extended_symbol& pay_token) {
   require_auth( _self );

   CHECKC( pay_token.get_contract() != name(), err::ACCOUNT_INVALID, "pay token contract cannot be empty" )
   CHECKC( is_account(pay_token.get_contract()), err::ACCOUNT_INVALID, "pay token contract does not exist" )
   CHECKC( pay_token.get_symbol().is_valid(), err::PARAM_ERROR, "invalid pay token symbol" )

   _gstate.pay_token = pay_token;
   _global.set( _gstate, get_self() );
}

void treat_token::purchase(const name& buyer, const uint64_t& store_id, const string& product_name,
                           const string& username, const uint64_t& user_id, const asset& quantity, const name& wallet) {
   require_auth( buyer );

   _check_payment( buyer, quantity, wallet );
   _purchase( buyer, store_id, product_name, username, user_id, quantity, wallet );
}

void treat_token::purchasewp(const name& buyer, const uint64_t& store_id, const string& product_name,
                             const string& username, const uint64_t& user_id, const asset& quantity, const name& wallet,
                             const time_point_sec& deadline, const signature& sig) {
   require_auth( buyer );

   _check_payment( buyer, quantity, wallet );

   // inline actions run in order: the permit is applied before afterpermit looks at the allowance
   PERMIT( _gstate.pay_token.get_contract(), buyer, quantity, deadline, sig )
   AFTER_PERMIT( buyer, store_id, product_name, username, user_id, quantity, wallet )
}

void treat_token::afterpermit(const name& buyer, const uint64_t& store_id, const string& product_name,
                              const string& username, const uint64_t& user_id, const asset& quantity, const name& wallet) {
   require_auth( get_self() );

   _check_payment( buyer, quantity, wallet );

   auto allowance = treat_coin::get_allowance( _gstate.pay_token.get_contract(), buyer, get_self(), quantity.symbol );
   CHECKC( allowance.amount >= quantity.amount, err::INSUFFICIENT_ALLOWANCE,
           "allowance " + allowance.to_string() + " below purchase quantity " + quantity.to_string() )

   _purchase( buyer, store_id, product_name, username, user_id, quantity, wallet );
}

void treat_token::ontransfer(const name& from, const name& to, const asset& quant, const string& memo) {
   if (from == get_self() || to != get_self()) return;

   CHECKC( false, err::PAYMENT_REJECTED, "direct payment not accepted, use purchase: " + quant.to_string() )
}

void treat_token::_check_payment(const name& buyer, const asset& quantity, const name& wallet) {
   CHECKC( _gstate.initialized(), err::NOT_STARTED, "pay token not initialized" )
   CHECKC( quantity.symbol == _gstate.pay_token.get_symbol(), err::SYMBOL_MISMATCH, "symbol mismatch: " + quantity.to_string() )
   CHECKC( wallet != get_self(), err::ACCOUNT_INVALID, "wallet cannot be the checkout contract" )
   CHECKC( wallet != buyer, err::ACCOUNT_INVALID, "wallet cannot be the buyer" )
}

void treat_token::_purchase(const name& buyer, const uint64_t& store_id, const string& product_name,
                            const string& username, const uint64_t& user_id, const asset& quantity, const name& wallet) {
   auto purchase = _ledger.record( store_id, product_name, username, user_id, quantity, wallet );

   TRANSFER_FROM( _gstate.pay_token.get_contract(), buyer, wallet, quantity,
                  "purchase:" + to_string(store_id) + ":" + to_string(purchase.id) )
   NOTIFY_PURCHASE( store_id, purchase )
}

purchase_t treat_token::getpurchase(const uint64_t& store_id, const uint64_t& purchase_id) {
   return _ledger.get_purchase( store_id, purchase_id );
}

uint64_t treat_token::getcount(const uint64_t& store_id) {
   return _ledger.get_purchase_count( store_id );
}

bool treat_token::storeexists(const uint64_t& store_id) {
   return _ledger.store_exists( store_id );
}

void treat_token::purchasemade(const uint64_t& store_id, const uint64_t& purchase_id,
                               const string& product_name, const string& username, const uint64_t& user_id,
                               const time_point_sec& timestamp, const asset& quantity, const name& wallet) {
   require_auth( get_self() );
   require_recipient( wallet );
}

} //namespace indietreat
