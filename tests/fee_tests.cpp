#define BOOST_TEST_MODULE FeeTests
#include <boost/test/unit_test.hpp>

#include <pari/chain/exceptions.hpp>
#include <pari/chain/fee_engine.hpp>

#include <fc/exception/exception.hpp>
#include <fc/log/logger.hpp>

#include <limits>

using namespace pari::chain;

BOOST_AUTO_TEST_CASE( fee_is_floored )
{ try {
   BOOST_CHECK_EQUAL( compute_fee( 1000000000, 500 ), 50000000u );
   BOOST_CHECK_EQUAL( compute_fee( 199, 500 ), 9u );
   BOOST_CHECK_EQUAL( compute_fee( 19, 500 ), 0u );
   BOOST_CHECK_EQUAL( compute_fee( 12345, 0 ), 0u );
   BOOST_CHECK_EQUAL( compute_fee( 12345, 10000 ), 12345u );
   BOOST_CHECK_THROW( compute_fee( 12345, 10001 ), invalid_fee );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( fee_does_not_overflow_large_pools )
{ try {
   const share_type gross = std::numeric_limits<share_type>::max();
   const share_type fee = compute_fee( gross, 500 );
   BOOST_CHECK_EQUAL( fee, gross / 10000 * 500 + (gross % 10000) * 500 / 10000 );
   BOOST_CHECK( fee < gross );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( breakdown_with_and_without_winners )
{ try {
   const fee_breakdown with_winners = compute_fee_breakdown( 2000000000, 500, true );
   BOOST_CHECK_EQUAL( with_winners.gross, 2000000000u );
   BOOST_CHECK_EQUAL( with_winners.fee, 100000000u );
   BOOST_CHECK_EQUAL( with_winners.net, 1900000000u );
   BOOST_CHECK_EQUAL( with_winners.fee + with_winners.net, with_winners.gross );

   const fee_breakdown no_winners = compute_fee_breakdown( 2000000000, 500, false );
   BOOST_CHECK_EQUAL( no_winners.fee, 0u );
   BOOST_CHECK_EQUAL( no_winners.net, 2000000000u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( rollover_fee_decays_to_floor )
{ try {
   fee_bps_type fee = 500;
   fee = next_fee_bps_on_rollover( fee, 100, 300 );
   BOOST_CHECK_EQUAL( fee, 400 );
   fee = next_fee_bps_on_rollover( fee, 100, 300 );
   BOOST_CHECK_EQUAL( fee, 300 );
   fee = next_fee_bps_on_rollover( fee, 100, 300 );
   BOOST_CHECK_EQUAL( fee, 300 );

   // a rate already under the floor is clamped up
   BOOST_CHECK_EQUAL( next_fee_bps_on_rollover( 100, 100, 200 ), 200 );
   // a step larger than the rate never wraps
   BOOST_CHECK_EQUAL( next_fee_bps_on_rollover( 250, 1000, 0 ), 0 );
   BOOST_CHECK_EQUAL( next_fee_bps_on_rollover( 250, 0, 200 ), 250 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( carry_fee_is_unchanged_but_floored )
{ try {
   BOOST_CHECK_EQUAL( next_fee_bps_on_carry( 500, 200 ), 500 );
   BOOST_CHECK_EQUAL( next_fee_bps_on_carry( 150, 200 ), 200 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( blocked_number_rotation )
{ try {
   BOOST_CHECK_EQUAL( next_blocked_number( 0, 3 ), 3 );
   BOOST_CHECK_EQUAL( next_blocked_number( 3, 3 ), 3 );
   BOOST_CHECK_EQUAL( next_blocked_number( 7, 3 ), 7 );
} FC_LOG_AND_RETHROW() }
