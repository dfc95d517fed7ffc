#include <treat.coin/treat.coin.hpp>

#include <eosio/permission.hpp>

#include <set>

namespace indietreat {

void treat_coin::init(const name& issuer, const asset& max_supply) {
   require_auth( _self );

   CHECKC( _g.issuer == name(), err::RECORD_EXISTING, "token already initialized" )
   CHECKC( is_account(issuer), err::ACCOUNT_INVALID, "issuer account does not exist" )
   CHECKC( max_supply.is_valid(), err::PARAM_ERROR, "invalid max_supply" )
   CHECKC( max_supply.amount > 0, err::NOT_POSITIVE, "max_supply must be positive" )

   _g.issuer      = issuer;
   _g.max_supply  = max_supply;
   _g.supply      = asset(0, max_supply.symbol);
}

void treat_coin::mint(const name& to, const asset& quantity, const string& memo) {
   CHECKC( _g.issuer != name(), err::NOT_STARTED, "token not initialized" )
   require_auth( _g.issuer );

   check_quantity( quantity );
   CHECKC( memo.size() <= MAX_TEXT_SIZE, err::OVERSIZED, "memo has more than 256 bytes" )
   CHECKC( is_account(to), err::ACCOUNT_INVALID, "to account does not exist" )
   CHECKC( quantity.amount <= _g.max_supply.amount - _g.supply.amount, err::OVERSIZED, "quantity exceeds available supply" )

   _g.supply += quantity;

   add_balance( to, quantity, _g.issuer );
   require_recipient( to );
}

void treat_coin::burn(const asset& quantity, const string& memo) {
   CHECKC( _g.issuer != name(), err::NOT_STARTED, "token not initialized" )
   require_auth( _g.issuer );

   check_quantity( quantity );
   CHECKC( memo.size() <= MAX_TEXT_SIZE, err::OVERSIZED, "memo has more than 256 bytes" )
   CHECKC( _g.supply >= quantity, err::OVERSIZED, "supply over-burnt" )

   _g.supply -= quantity;

   sub_balance( _g.issuer, quantity );
}

void treat_coin::transfer(const name& from, const name& to, const asset& quantity, const string& memo) {
   require_auth( from );

   CHECKC( from != to, err::ACCOUNT_INVALID, "cannot transfer to self" )
   CHECKC( is_account(to), err::ACCOUNT_INVALID, "to account does not exist" )
   check_quantity( quantity );
   CHECKC( memo.size() <= MAX_TEXT_SIZE, err::OVERSIZED, "memo has more than 256 bytes" )

   require_recipient( from );
   require_recipient( to );

   auto payer = has_auth(to) ? to : from;

   sub_balance( from, quantity );
   add_balance( to, quantity, payer );
}

void treat_coin::approve(const name& owner, const name& spender, const asset& quantity) {
   require_auth( owner );

   CHECKC( owner != spender, err::ACCOUNT_INVALID, "cannot approve self" )
   CHECKC( is_account(spender), err::ACCOUNT_INVALID, "spender account does not exist" )
   CHECKC( quantity.is_valid(), err::PARAM_ERROR, "invalid quantity" )
   CHECKC( quantity.amount >= 0, err::NOT_POSITIVE, "must approve non-negative quantity" )
   CHECKC( quantity.symbol == _g.supply.symbol, err::SYMBOL_MISMATCH, "symbol mismatch" )

   set_allowance( owner, spender, quantity, owner );
}

void treat_coin::transferfrom(const name& spender, const name& from, const name& to, const asset& quantity, const string& memo) {
   require_auth( spender );

   CHECKC( from != to, err::ACCOUNT_INVALID, "cannot transfer to self" )
   CHECKC( is_account(to), err::ACCOUNT_INVALID, "to account does not exist" )
   check_quantity( quantity );
   CHECKC( memo.size() <= MAX_TEXT_SIZE, err::OVERSIZED, "memo has more than 256 bytes" )

   auto allowances   = allowance_t::tbl_t(_self, from.value);
   auto allowance    = allowances.find( spender.value );
   CHECKC( allowance != allowances.end() && allowance->quantity >= quantity, err::INSUFFICIENT_ALLOWANCE,
           "insufficient allowance of " + spender.to_string() + " on " + from.to_string() )

   if( allowance->quantity == quantity ) {
      allowances.erase( allowance );
   } else {
      allowances.modify( allowance, same_payer, [&]( auto& a ) {
         a.quantity -= quantity;
      });
   }

   require_recipient( from );
   require_recipient( to );

   sub_balance( from, quantity );
   add_balance( to, quantity, spender );
}

void treat_coin::permit(const name& owner, const name& spender, const asset& quantity,
                        const time_point_sec& deadline, const signature& sig) {
   CHECKC( owner != spender, err::ACCOUNT_INVALID, "cannot permit self" )
   CHECKC( is_account(owner), err::ACCOUNT_INVALID, "owner account does not exist" )
   CHECKC( is_account(spender), err::ACCOUNT_INVALID, "spender account does not exist" )
   CHECKC( quantity.is_valid(), err::PARAM_ERROR, "invalid quantity" )
   CHECKC( quantity.amount >= 0, err::NOT_POSITIVE, "must permit non-negative quantity" )
   CHECKC( quantity.symbol == _g.supply.symbol, err::SYMBOL_MISMATCH, "symbol mismatch" )

   auto now = time_point_sec( current_time_point() );
   CHECKC( now <= deadline, err::TIME_EXPIRED, "permit expired at " + to_string(deadline.sec_since_epoch()) )

   auto nonces       = nonce_t::tbl_t(_self, _self.value);
   auto nonce_itr    = nonces.find( owner.value );
   uint64_t nonce    = nonce_itr == nonces.end() ? 0 : nonce_itr->nonce;

   auto msg          = permit_message{ get_self(), owner, spender, quantity, nonce, deadline };
   auto packed       = pack( msg );
   auto digest       = sha256( packed.data(), packed.size() );
   auto signer_key   = recover_key( digest, sig );
   CHECKC( check_permission_authorization( owner, active_perm, std::set<public_key>{ signer_key } ),
           err::INVALID_SIGNATURE, "signature does not satisfy " + owner.to_string() + "@active" )

   if( nonce_itr == nonces.end() ) {
      nonces.emplace( _self, [&]( auto& n ) {
         n.owner = owner;
         n.nonce = 1;
      });
   } else {
      nonces.modify( nonce_itr, same_payer, [&]( auto& n ) {
         n.nonce++;
      });
   }

   set_allowance( owner, spender, quantity, _self );
}

void treat_coin::check_quantity(const asset& quantity) {
   CHECKC( _g.issuer != name(), err::NOT_STARTED, "token not initialized" )
   CHECKC( quantity.is_valid(), err::PARAM_ERROR, "invalid quantity" )
   CHECKC( quantity.amount > 0, err::NOT_POSITIVE, "must transfer positive quantity" )
   CHECKC( quantity.symbol == _g.supply.symbol, err::SYMBOL_MISMATCH, "symbol mismatch" )
}

void treat_coin::sub_balance(const name& owner, const asset& value) {
   auto from_accts   = account_t::tbl_t( get_self(), owner.value );
   auto from         = from_accts.find( value.symbol.code().raw() );
   CHECKC( from != from_accts.end(), err::TRANSFER_FAILED, "no balance object found" )
   CHECKC( from->balance >= value, err::TRANSFER_FAILED, "overdrawn balance" )

   from_accts.modify( from, same_payer, [&]( auto& a ) {
      a.balance -= value;
   });
}

void treat_coin::add_balance(const name& owner, const asset& value, const name& ram_payer) {
   auto to_accts     = account_t::tbl_t( get_self(), owner.value );
   auto to           = to_accts.find( value.symbol.code().raw() );
   if( to == to_accts.end() ) {
      to_accts.emplace( ram_payer, [&]( auto& a ) {
         a.balance = value;
      });
      return;
   }

   to_accts.modify( to, same_payer, [&]( auto& a ) {
      a.balance += value;
   });
}

void treat_coin::set_allowance(const name& owner, const name& spender, const asset& quantity, const name& ram_payer) {
   auto allowances   = allowance_t::tbl_t(_self, owner.value);
   auto allowance    = allowances.find( spender.value );
   if( quantity.amount == 0 ) {
      if( allowance != allowances.end() ) allowances.erase( allowance );
      return;
   }

   if( allowance == allowances.end() ) {
      allowances.emplace( ram_payer, [&]( auto& a ) {
         a.spender   = spender;
         a.quantity  = quantity;
      });
   } else {
      allowances.modify( allowance, same_payer, [&]( auto& a ) {
         a.quantity  = quantity;
      });
   }
}

} //namespace indietreat
