#define BOOST_TEST_MODULE SelectionTests
#include <boost/test/unit_test.hpp>

#include <pari/chain/exceptions.hpp>
#include <pari/chain/selection.hpp>

#include <fc/exception/exception.hpp>
#include <fc/log/logger.hpp>

using namespace pari::chain;

namespace
{
   vector<uint8_t> numbers_of( const selection& s )
   {
      return s.numbers;
   }
}

BOOST_AUTO_TEST_CASE( single_number_selection )
{ try {
   const selection s = derive_selection( single_number_prediction, 7, 3 );
   BOOST_CHECK_EQUAL( s.count, 1 );
   BOOST_REQUIRE_EQUAL( s.numbers.size(), 1 );
   BOOST_CHECK_EQUAL( s.numbers[0], 7 );
   BOOST_CHECK_EQUAL( s.mask, 1 << 7 );
   BOOST_CHECK( s.contains( 7 ) );
   BOOST_CHECK( !s.contains( 3 ) );

   BOOST_CHECK_THROW( derive_selection( single_number_prediction, 3, 3 ), invalid_selection );
   BOOST_CHECK_THROW( derive_selection( single_number_prediction, 0, 3 ), invalid_selection );
   BOOST_CHECK_THROW( derive_selection( single_number_prediction, 12, 3 ), invalid_selection );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( digit_modes_are_canonical )
{ try {
   const selection a = derive_selection( two_numbers_prediction, 37, 5 );
   const selection b = derive_selection( two_numbers_prediction, 73, 5 );
   BOOST_CHECK( a == b );
   BOOST_CHECK( numbers_of( a ) == numbers_of( b ) );
   BOOST_CHECK_EQUAL( a.numbers[0], 3 );
   BOOST_CHECK_EQUAL( a.numbers[1], 7 );
   BOOST_CHECK_EQUAL( a.mask, (1 << 3) | (1 << 7) );

   const selection multi = derive_selection( multi_number_prediction, 9142, 3 );
   BOOST_CHECK_EQUAL( multi.count, 4 );
   const uint8_t expected[] = { 1, 2, 4, 9 };
   BOOST_CHECK( multi.numbers == vector<uint8_t>( expected, expected + 4 ) );
   multi.validate();
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( digit_mode_rejections )
{ try {
   // zero digit, duplicate digit, blocked digit
   BOOST_CHECK_THROW( derive_selection( two_numbers_prediction, 70, 3 ), invalid_selection );
   BOOST_CHECK_THROW( derive_selection( two_numbers_prediction, 77, 3 ), invalid_selection );
   BOOST_CHECK_THROW( derive_selection( two_numbers_prediction, 73, 3 ), invalid_selection );

   // wrong count for the mode
   BOOST_CHECK_THROW( derive_selection( two_numbers_prediction, 7, 3 ), invalid_selection );
   BOOST_CHECK_THROW( derive_selection( two_numbers_prediction, 127, 3 ), invalid_selection );
   BOOST_CHECK_THROW( derive_selection( multi_number_prediction, 12, 3 ), invalid_selection );

   // eight numbers is the most a selection can hold
   const selection eight = derive_selection( multi_number_prediction, 12456789, 3 );
   BOOST_CHECK_EQUAL( eight.count, PARI_MAX_SELECTIONS );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( high_low_excludes_blocked_number )
{ try {
   const selection low = derive_selection( high_low_prediction, 0, 3 );
   const uint8_t low_expected[] = { 1, 2, 4, 5 };
   BOOST_CHECK( low.numbers == vector<uint8_t>( low_expected, low_expected + 4 ) );

   const selection high = derive_selection( high_low_prediction, 1, 3 );
   const uint8_t high_expected[] = { 6, 7, 8, 9 };
   BOOST_CHECK( high.numbers == vector<uint8_t>( high_expected, high_expected + 4 ) );

   const selection high_blocked_9 = derive_selection( high_low_prediction, 1, 9 );
   const uint8_t high_9_expected[] = { 5, 6, 7, 8 };
   BOOST_CHECK( high_blocked_9.numbers == vector<uint8_t>( high_9_expected, high_9_expected + 4 ) );

   BOOST_CHECK_THROW( derive_selection( high_low_prediction, 2, 3 ), invalid_selection );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( even_odd_excludes_blocked_number )
{ try {
   const selection even = derive_selection( even_odd_prediction, 0, 3 );
   const uint8_t even_expected[] = { 2, 4, 6, 8 };
   BOOST_CHECK( even.numbers == vector<uint8_t>( even_expected, even_expected + 4 ) );

   const selection odd = derive_selection( even_odd_prediction, 1, 3 );
   const uint8_t odd_expected[] = { 1, 5, 7, 9 };
   BOOST_CHECK( odd.numbers == vector<uint8_t>( odd_expected, odd_expected + 4 ) );
   BOOST_CHECK( !odd.contains( 3 ) );

   const selection even_blocked_4 = derive_selection( even_odd_prediction, 0, 4 );
   BOOST_CHECK_EQUAL( even_blocked_4.count, 3 );

   BOOST_CHECK_THROW( derive_selection( even_odd_prediction, 5, 3 ), invalid_selection );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( blocked_number_must_be_set )
{ try {
   BOOST_CHECK_THROW( derive_selection( single_number_prediction, 7, 0 ), invalid_selection );
   BOOST_CHECK_THROW( derive_selection( high_low_prediction, 0, 10 ), invalid_selection );
   BOOST_CHECK_EQUAL( eligible_numbers( 3 ).size(), PARI_ELIGIBLE_NUMBER_COUNT );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( validate_rejects_inconsistent_selection )
{ try {
   selection s = derive_selection( two_numbers_prediction, 15, 3 );
   s.mask = 1 << 2;
   BOOST_CHECK_THROW( s.validate(), invalid_selection );

   selection unordered;
   unordered.numbers.push_back( 5 );
   unordered.numbers.push_back( 1 );
   unordered.count = 2;
   unordered.mask = unordered.compute_mask();
   BOOST_CHECK_THROW( unordered.validate(), invalid_selection );

   selection duplicate;
   duplicate.push_back( 4, 3 );
   BOOST_CHECK_THROW( duplicate.push_back( 4, 3 ), invalid_selection );
   BOOST_CHECK_THROW( duplicate.push_back( 3, 3 ), invalid_selection );
} FC_LOG_AND_RETHROW() }
