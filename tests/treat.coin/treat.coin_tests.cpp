#include <treat.tester.hpp>

using namespace indietreat_test;

BOOST_AUTO_TEST_SUITE(treat_coin_tests)

BOOST_FIXTURE_TEST_CASE( init_and_mint, treat_tester ) try {
   BOOST_REQUIRE_EQUAL( err_msg(err::RECORD_EXISTING, "token already initialized"),
                        push_action( COIN_BANK, COIN_BANK, "init"_n, mvo()
                           ("issuer",     COIN_BANK)
                           ("max_supply", "1.0000 TREAT") ) );

   BOOST_REQUIRE_EQUAL( error("missing authority of treat.coin"),
                        push_action( COIN_BANK, "alice"_n, "mint"_n, mvo()
                           ("to",       "alice")
                           ("quantity", "1.0000 TREAT")
                           ("memo",     "") ) );

   BOOST_REQUIRE_EQUAL( err_msg(err::OVERSIZED, "quantity exceeds available supply"),
                        mint( COIN_BANK, "seller1"_n, "999999000.0000 TREAT" ) );
   BOOST_REQUIRE_EQUAL( err_msg(err::SYMBOL_MISMATCH, "symbol mismatch"),
                        mint( COIN_BANK, "seller1"_n, "1.00000000 AMAX" ) );

   BOOST_REQUIRE_EQUAL( success(), mint( COIN_BANK, "seller1"_n, "12.5000 TREAT" ) );
   BOOST_REQUIRE_EQUAL( asset::from_string("12.5000 TREAT"), get_balance(COIN_BANK, "seller1"_n, "4,TREAT") );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( burn_from_issuer, treat_tester ) try {
   BOOST_REQUIRE_EQUAL( success(), mint( COIN_BANK, COIN_BANK, "10.0000 TREAT" ) );
   BOOST_REQUIRE_EQUAL( success(), push_action( COIN_BANK, COIN_BANK, "burn"_n, mvo()
      ("quantity", "4.0000 TREAT")
      ("memo",     "") ) );
   BOOST_REQUIRE_EQUAL( asset::from_string("6.0000 TREAT"), get_balance(COIN_BANK, COIN_BANK, "4,TREAT") );

   BOOST_REQUIRE_EQUAL( err_msg(err::TRANSFER_FAILED, "overdrawn balance"),
                        push_action( COIN_BANK, COIN_BANK, "burn"_n, mvo()
                           ("quantity", "7.0000 TREAT")
                           ("memo",     "") ) );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( transfer_moves_balance, treat_tester ) try {
   BOOST_REQUIRE_EQUAL( success(), transfer( COIN_BANK, "alice"_n, "bob"_n, "10.0000 TREAT", "hi" ) );
   BOOST_REQUIRE_EQUAL( asset::from_string("990.0000 TREAT"),  get_balance(COIN_BANK, "alice"_n, "4,TREAT") );
   BOOST_REQUIRE_EQUAL( asset::from_string("1010.0000 TREAT"), get_balance(COIN_BANK, "bob"_n, "4,TREAT") );

   BOOST_REQUIRE_EQUAL( err_msg(err::ACCOUNT_INVALID, "cannot transfer to self"),
                        transfer( COIN_BANK, "alice"_n, "alice"_n, "1.0000 TREAT", "" ) );
   BOOST_REQUIRE_EQUAL( err_msg(err::ACCOUNT_INVALID, "to account does not exist"),
                        transfer( COIN_BANK, "alice"_n, "nobody"_n, "1.0000 TREAT", "" ) );
   BOOST_REQUIRE_EQUAL( err_msg(err::NOT_POSITIVE, "must transfer positive quantity"),
                        transfer( COIN_BANK, "alice"_n, "bob"_n, "0.0000 TREAT", "" ) );
   BOOST_REQUIRE_EQUAL( err_msg(err::TRANSFER_FAILED, "overdrawn balance"),
                        transfer( COIN_BANK, "alice"_n, "bob"_n, "990.0001 TREAT", "" ) );
   BOOST_REQUIRE_EQUAL( err_msg(err::TRANSFER_FAILED, "no balance object found"),
                        transfer( COIN_BANK, "seller1"_n, "bob"_n, "1.0000 TREAT", "" ) );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( approve_and_transferfrom, treat_tester ) try {
   BOOST_REQUIRE_EQUAL( err_msg(err::INSUFFICIENT_ALLOWANCE, "insufficient allowance of bob on alice"),
                        transferfrom( "bob"_n, "alice"_n, "seller1"_n, "1.0000 TREAT" ) );

   BOOST_REQUIRE_EQUAL( success(), approve( "alice"_n, "bob"_n, "50.0000 TREAT" ) );
   BOOST_REQUIRE_EQUAL( asset::from_string("50.0000 TREAT"), get_allowance("alice"_n, "bob"_n) );

   BOOST_REQUIRE_EQUAL( success(), transferfrom( "bob"_n, "alice"_n, "seller1"_n, "20.0000 TREAT" ) );
   BOOST_REQUIRE_EQUAL( asset::from_string("30.0000 TREAT"),  get_allowance("alice"_n, "bob"_n) );
   BOOST_REQUIRE_EQUAL( asset::from_string("20.0000 TREAT"),  get_balance(COIN_BANK, "seller1"_n, "4,TREAT") );
   BOOST_REQUIRE_EQUAL( asset::from_string("980.0000 TREAT"), get_balance(COIN_BANK, "alice"_n, "4,TREAT") );

   BOOST_REQUIRE_EQUAL( err_msg(err::INSUFFICIENT_ALLOWANCE, "insufficient allowance of bob on alice"),
                        transferfrom( "bob"_n, "alice"_n, "seller1"_n, "30.0001 TREAT" ) );
   BOOST_REQUIRE_EQUAL( error("missing authority of bob"),
                        push_action( COIN_BANK, "seller1"_n, "transferfrom"_n, mvo()
                           ("spender",  "bob")
                           ("from",     "alice")
                           ("to",       "seller1")
                           ("quantity", "1.0000 TREAT")
                           ("memo",     "") ) );

   // approve overwrites, zero revokes
   BOOST_REQUIRE_EQUAL( success(), approve( "alice"_n, "bob"_n, "5000.0000 TREAT" ) );
   BOOST_REQUIRE_EQUAL( err_msg(err::TRANSFER_FAILED, "overdrawn balance"),
                        transferfrom( "bob"_n, "alice"_n, "seller1"_n, "2000.0000 TREAT" ) );
   BOOST_REQUIRE_EQUAL( asset::from_string("5000.0000 TREAT"), get_allowance("alice"_n, "bob"_n) );

   BOOST_REQUIRE_EQUAL( success(), approve( "alice"_n, "bob"_n, "0.0000 TREAT" ) );
   BOOST_REQUIRE( get_row_by_account( COIN_BANK, "alice"_n, "allowances"_n, "bob"_n ).empty() );

   BOOST_REQUIRE_EQUAL( err_msg(err::ACCOUNT_INVALID, "cannot approve self"),
                        approve( "alice"_n, "alice"_n, "1.0000 TREAT" ) );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( transferfrom_consumes_exact_allowance, treat_tester ) try {
   BOOST_REQUIRE_EQUAL( success(), approve( "alice"_n, "bob"_n, "10.0000 TREAT" ) );
   BOOST_REQUIRE_EQUAL( success(), transferfrom( "bob"_n, "alice"_n, "seller1"_n, "10.0000 TREAT" ) );
   BOOST_REQUIRE( get_row_by_account( COIN_BANK, "alice"_n, "allowances"_n, "bob"_n ).empty() );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( permit_sets_allowance, treat_tester ) try {
   BOOST_REQUIRE_EQUAL( 0u, get_nonce("alice"_n) );

   auto deadline  = head_time_offset( 3600 );
   auto sig       = sign_permit( "alice"_n, "alice"_n, "bob"_n, "25.0000 TREAT", 0, deadline );

   // anyone may submit the signed permit
   BOOST_REQUIRE_EQUAL( success(), permit( "seller1"_n, "alice"_n, "bob"_n, "25.0000 TREAT", deadline, sig ) );
   BOOST_REQUIRE_EQUAL( asset::from_string("25.0000 TREAT"), get_allowance("alice"_n, "bob"_n) );
   BOOST_REQUIRE_EQUAL( 1u, get_nonce("alice"_n) );

   BOOST_REQUIRE_EQUAL( success(), transferfrom( "bob"_n, "alice"_n, "seller2"_n, "25.0000 TREAT" ) );
   BOOST_REQUIRE_EQUAL( asset::from_string("25.0000 TREAT"), get_balance(COIN_BANK, "seller2"_n, "4,TREAT") );

   // the same signature is bound to nonce 0
   produce_blocks();
   BOOST_REQUIRE_EQUAL( err_msg(err::INVALID_SIGNATURE, "signature does not satisfy alice@active"),
                        permit( "seller1"_n, "alice"_n, "bob"_n, "25.0000 TREAT", deadline, sig ) );

   auto next_sig  = sign_permit( "alice"_n, "alice"_n, "bob"_n, "7.0000 TREAT", 1, deadline );
   BOOST_REQUIRE_EQUAL( success(), permit( "bob"_n, "alice"_n, "bob"_n, "7.0000 TREAT", deadline, next_sig ) );
   BOOST_REQUIRE_EQUAL( asset::from_string("7.0000 TREAT"), get_allowance("alice"_n, "bob"_n) );
   BOOST_REQUIRE_EQUAL( 2u, get_nonce("alice"_n) );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( permit_rejections, treat_tester ) try {
   auto deadline  = head_time_offset( 3600 );

   auto bob_sig   = sign_permit( "bob"_n, "alice"_n, "bob"_n, "25.0000 TREAT", 0, deadline );
   BOOST_REQUIRE_EQUAL( err_msg(err::INVALID_SIGNATURE, "signature does not satisfy alice@active"),
                        permit( "bob"_n, "alice"_n, "bob"_n, "25.0000 TREAT", deadline, bob_sig ) );

   // signed for a different quantity
   auto sig       = sign_permit( "alice"_n, "alice"_n, "bob"_n, "25.0000 TREAT", 0, deadline );
   BOOST_REQUIRE_EQUAL( err_msg(err::INVALID_SIGNATURE, "signature does not satisfy alice@active"),
                        permit( "bob"_n, "alice"_n, "bob"_n, "250.0000 TREAT", deadline, sig ) );

   auto expired     = head_time_offset( -10 );
   auto expired_sig = sign_permit( "alice"_n, "alice"_n, "bob"_n, "25.0000 TREAT", 0, expired );
   BOOST_REQUIRE_EQUAL( err_msg(err::TIME_EXPIRED, "permit expired at " + std::to_string(expired.sec_since_epoch())),
                        permit( "bob"_n, "alice"_n, "bob"_n, "25.0000 TREAT", expired, expired_sig ) );

   BOOST_REQUIRE_EQUAL( 0u, get_nonce("alice"_n) );
   BOOST_REQUIRE_EQUAL( asset::from_string("0.0000 TREAT"), get_allowance("alice"_n, "bob"_n) );
} FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_SUITE_END()
