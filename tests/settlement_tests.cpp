#define BOOST_TEST_MODULE SettlementTests
#include <boost/test/unit_test.hpp>

#include "pari_fixture.hpp"

BOOST_FIXTURE_TEST_CASE( stake_finalize_claim_end_to_end, chain_fixture )
{ try {
   place( alice, 7, PARI_PRECISION );

   pool_record pool = get_pool();
   BOOST_CHECK_EQUAL( pool.blocked_number, 3 );
   BOOST_CHECK_EQUAL( pool.total_value, PARI_PRECISION );
   BOOST_CHECK_EQUAL( pool.count_per_number.data[7], 1u );

   advance_epochs();

   const share_type fee = PARI_PRECISION / 20;
   const share_type net = PARI_PRECISION - fee;
   const claim_leaf leaf = make_leaf( 0, 0, alice, net, 1 << 7 );
   vector<digest_type> leaves( 1, leaf.digest() );

   init_ledger( 0, 7 );
   ledger_record ledger = get_ledger( 0 );
   BOOST_CHECK( ledger.is_processing() );
   BOOST_CHECK_EQUAL( ledger.attempt_count, 1 );
   BOOST_CHECK_EQUAL( ledger.winning_number, 7 );
   BOOST_CHECK_EQUAL( ledger.blocked_number, 3 );
   BOOST_CHECK_EQUAL( ledger.rng_tick, 42u );

   finalize( 0, fee, net, 1, compute_merkle_root( leaves ) );

   ledger = get_ledger( 0 );
   BOOST_CHECK( ledger.is_resolved() );
   BOOST_CHECK_EQUAL( ledger.net_prize_pool, net );
   BOOST_CHECK_EQUAL( ledger.protocol_fee, fee );
   BOOST_CHECK_EQUAL( ledger.fee_bps, PARI_DEFAULT_BASE_FEE_BPS );
   BOOST_CHECK_EQUAL( ledger.total_count, 1u );
   BOOST_CHECK_EQUAL( ledger.carry_out_value, 0u );
   BOOST_CHECK_EQUAL( ledger.total_winners, 1u );
   BOOST_CHECK_EQUAL( ledger.claim_bitmap_bytes.size(), 1u );
   BOOST_CHECK( ledger.rollover_reason == no_rollover );
   BOOST_CHECK_EQUAL( results_pointer_to_string( ledger.results_pointer ), PARI_TEST_RESULTS_URI );

   // a new chain starts with the winning number blocked
   pool = get_pool();
   BOOST_CHECK_EQUAL( pool.epoch, 1u );
   BOOST_CHECK_EQUAL( pool.chain_start_epoch, 1u );
   BOOST_CHECK_EQUAL( pool.blocked_number, 7 );
   BOOST_CHECK_EQUAL( pool.total_value, 0u );
   BOOST_CHECK_EQUAL( pool.total_count, 0u );
   BOOST_CHECK_EQUAL( pool.times_carried, 0 );
   BOOST_CHECK_EQUAL( pool.fee_bps, PARI_DEFAULT_BASE_FEE_BPS );

   claim( alice, 0, 0, net, vector<digest_type>() );
   ledger = get_ledger( 0 );
   BOOST_CHECK( ledger.get_claim_bitmap().is_claimed( 0 ) );
   BOOST_CHECK_EQUAL( ledger.claimed_value, net );
   BOOST_CHECK_EQUAL( db->get_balance( alice ), PARI_TEST_INITIAL_BALANCE - PARI_PRECISION + net );
   BOOST_CHECK_EQUAL( db->get_balance( fee_vault ), fee );
   BOOST_CHECK_EQUAL( db->get_treasury().custody_balance, 0u );

   BOOST_CHECK_THROW( claim( alice, 0, 0, net, vector<digest_type>() ), too_many_claims );

   // the new chain keys predictions afresh and blocks 7
   BOOST_CHECK_THROW( place( alice, 7, PARI_PRECISION ), invalid_selection );
   place( alice, 3, PARI_PRECISION );
   BOOST_CHECK_EQUAL( get_prediction( alice ).index.chain_start_epoch, 1u );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE( ledger_preconditions, chain_fixture )
{ try {
   place( alice, 7, PARI_PRECISION );
   const share_type fee = PARI_PRECISION / 20;
   const share_type net = PARI_PRECISION - fee;

   BOOST_CHECK_THROW( init_ledger( 0, 7 ), epoch_not_complete );
   advance_epochs();

   signed_transaction unsigned_init;
   unsigned_init.init_ledger( 0, 1, 7, 42, digest_type() );
   BOOST_CHECK_THROW( push( unsigned_init, alice ), missing_signature );

   BOOST_CHECK_THROW( init_ledger( 1, 7 ), epoch_mismatch );
   BOOST_CHECK_THROW( init_ledger( 0, 10 ), invalid_winning_number );
   BOOST_CHECK_THROW( init_ledger( 0, 7, 2 ), unknown_pool );
   BOOST_CHECK_THROW( finalize( 0, fee, net, 1, digest_type() ), unknown_ledger );

   init_ledger( 0, 7 );
   BOOST_CHECK_THROW( init_ledger( 0, 7 ), ledger_already_exists );
   BOOST_CHECK_THROW( rollover( 0, 3 ), ledger_already_exists );

   signed_transaction close_processing;
   close_processing.close_ledger( 0, 1 );
   BOOST_CHECK_THROW( push( close_processing, authority ), ledger_not_resolved );

   signed_transaction reprocess;
   reprocess.reprocess_ledger( 0, 1 );
   push( reprocess, authority );
   BOOST_CHECK_EQUAL( get_ledger( 0 ).attempt_count, 2 );
   BOOST_CHECK( get_ledger( 0 ).is_processing() );

   BOOST_CHECK_THROW( finalize( 0, fee, net, 1, digest_type(), 1, "" ), empty_results_pointer );
   BOOST_CHECK_THROW( finalize( 0, fee + 1, net, 1, digest_type() ), invalid_fee );
   BOOST_CHECK_THROW( finalize( 0, fee, net - 1, 1, digest_type() ), invalid_pot_breakdown );
   BOOST_CHECK_THROW( finalize( 0, fee, net, 0, digest_type() ), invalid_fee );
   BOOST_CHECK_THROW( finalize( 0, fee, net, PARI_MAX_WINNERS_PER_LEDGER + 1, digest_type() ), too_many_winners );

   // nothing moved while every finalize failed
   BOOST_CHECK_EQUAL( db->get_treasury().custody_balance, PARI_PRECISION );
   BOOST_CHECK_EQUAL( get_pool().epoch, 0u );

   finalize( 0, fee, net, 1, digest_type() );

   signed_transaction close;
   close.close_ledger( 0, 1 );
   push( close, authority );
   BOOST_CHECK( !db->get_ledger_record( ledger_index( 0, 1 ) ).valid() );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE( empty_pools_cannot_be_resolved, chain_fixture )
{ try {
   advance_epochs();
   BOOST_CHECK_THROW( init_ledger( 0, 7 ), no_stakes_to_resolve );
   BOOST_CHECK_THROW( rollover( 0, 3 ), no_stakes_to_resolve );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE( no_winners_carry_the_whole_pool, chain_fixture )
{ try {
   place( alice, 7, PARI_PRECISION / 2 );
   place( bob, 5, PARI_PRECISION / 2 );
   const share_type gross = PARI_PRECISION;
   advance_epochs();

   init_ledger( 0, 2 );
   finalize( 0, 0, gross, 0, digest_type() );

   const ledger_record ledger = get_ledger( 0 );
   BOOST_CHECK( ledger.is_resolved() );
   BOOST_CHECK( ledger.rollover_reason == no_winners_rollover );
   BOOST_CHECK_EQUAL( ledger.protocol_fee, 0u );
   BOOST_CHECK_EQUAL( ledger.carry_out_value, gross );
   BOOST_CHECK_EQUAL( ledger.carried_count, 2u );
   BOOST_CHECK_EQUAL( db->get_balance( fee_vault ), 0u );

   pool_record pool = get_pool();
   BOOST_CHECK_EQUAL( pool.epoch, 1u );
   BOOST_CHECK_EQUAL( pool.chain_start_epoch, 0u );
   BOOST_CHECK_EQUAL( pool.total_value, gross );
   BOOST_CHECK_EQUAL( pool.carried_value, gross );
   BOOST_CHECK_EQUAL( pool.total_count, 2u );
   BOOST_CHECK_EQUAL( pool.carried_count, 2u );
   BOOST_CHECK_EQUAL( pool.times_carried, 1 );
   BOOST_CHECK_EQUAL( pool.blocked_number, 3 );
   BOOST_CHECK_EQUAL( pool.fee_bps, PARI_DEFAULT_BASE_FEE_BPS );
   BOOST_CHECK_EQUAL( pool.count_per_number.data[7], 1u );

   // the chain continues: existing stakes can grow and new players can join
   increase( alice, PARI_PRECISION / 2, 7 );
   BOOST_CHECK_THROW( place( alice, 9, PARI_PRECISION ), already_staked );
   place( carol, 9, PARI_PRECISION );

   pool = get_pool();
   const share_type total = gross + PARI_PRECISION / 2 + PARI_PRECISION;
   BOOST_CHECK_EQUAL( pool.total_value, total );
   BOOST_CHECK_EQUAL( pool.total_count, 3u );
   BOOST_CHECK_EQUAL( get_prediction( alice ).value_per_number, PARI_PRECISION );

   advance_epochs();

   const share_type fee = total / 20;
   const share_type net = total - fee;
   vector<digest_type> leaves( 1, make_leaf( 1, 0, alice, net, 1 << 7 ).digest() );

   init_ledger( 1, 7 );
   finalize( 1, fee, net, 1, compute_merkle_root( leaves ) );
   BOOST_CHECK_EQUAL( get_ledger( 1 ).carry_in_value, gross );
   BOOST_CHECK_EQUAL( get_ledger( 1 ).chain_start_epoch, 0u );

   claim( alice, 1, 0, net, vector<digest_type>() );
   BOOST_CHECK_EQUAL( db->get_balance( alice ), PARI_TEST_INITIAL_BALANCE - PARI_PRECISION + net );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE( rollover_on_blocked_number_decays_fee, chain_fixture )
{ try {
   place( alice, 7, PARI_PRECISION );
   place( bob, 5, PARI_PRECISION / 2 );
   const pool_record before = get_pool();
   advance_epochs();

   BOOST_CHECK_THROW( rollover( 0, 7 ), carry_not_allowed );
   rollover( 0, 3 );

   const ledger_record ledger = get_ledger( 0 );
   BOOST_CHECK( ledger.is_resolved() );
   BOOST_CHECK( ledger.rollover_reason == rollover_number_hit );
   BOOST_CHECK_EQUAL( ledger.carry_out_value, before.total_value );
   BOOST_CHECK_EQUAL( ledger.net_prize_pool, before.total_value );
   BOOST_CHECK_EQUAL( ledger.protocol_fee, 0u );
   BOOST_CHECK_EQUAL( ledger.total_winners, 0u );
   BOOST_CHECK( ledger.claim_bitmap_bytes.empty() );

   pool_record pool = get_pool();
   BOOST_CHECK_EQUAL( pool.epoch, 1u );
   BOOST_CHECK_EQUAL( pool.chain_start_epoch, 0u );
   BOOST_CHECK_EQUAL( pool.total_value, before.total_value );
   BOOST_CHECK_EQUAL( pool.carried_value, before.total_value );
   BOOST_CHECK_EQUAL( pool.carried_count, before.total_count );
   BOOST_CHECK( pool.value_per_number == before.value_per_number );
   BOOST_CHECK( pool.count_per_number == before.count_per_number );
   BOOST_CHECK_EQUAL( pool.blocked_number, 3 );
   BOOST_CHECK_EQUAL( pool.fee_bps, 400 );

   const fee_bps_type expected[] = { 300, 200, 200 };
   for( const fee_bps_type next : expected )
   {
      advance_epochs();
      rollover( get_pool().epoch, 3 );
      BOOST_CHECK_EQUAL( get_pool().fee_bps, next );
   }
   BOOST_CHECK_EQUAL( get_pool().times_carried, 4 );
   BOOST_CHECK_EQUAL( db->get_treasury().custody_balance, before.total_value );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE( rollover_on_unstaked_number_keeps_fee, chain_fixture )
{ try {
   place( alice, 7, PARI_PRECISION );
   BOOST_CHECK_THROW( rollover( 0, 2 ), epoch_not_complete );
   advance_epochs();

   BOOST_CHECK_THROW( rollover( 0, 10 ), invalid_winning_number );
   rollover( 0, 2 );
   BOOST_CHECK( get_ledger( 0 ).rollover_reason == no_winners_rollover );
   BOOST_CHECK_EQUAL( get_pool().fee_bps, PARI_DEFAULT_BASE_FEE_BPS );
   BOOST_CHECK_EQUAL( get_pool().blocked_number, 3 );

   // 0 is the configured primary rollover number
   advance_epochs();
   rollover( 1, 0 );
   BOOST_CHECK( get_ledger( 1 ).rollover_reason == rollover_number_hit );
   BOOST_CHECK_EQUAL( get_pool().fee_bps, PARI_DEFAULT_BASE_FEE_BPS - PARI_DEFAULT_ROLLOVER_FEE_STEP_BPS );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE( pool_administration, chain_fixture )
{ try {
   signed_transaction open_unsigned;
   open_unsigned.open_pool( 2 );
   BOOST_CHECK_THROW( push( open_unsigned, alice ), missing_signature );

   signed_transaction open;
   open.open_pool( 2 );
   push( open, authority );
   BOOST_CHECK( db->get_settings().is_tier_active( 2 ) );
   BOOST_CHECK_EQUAL( get_pool( 2 ).blocked_number, 0 );
   BOOST_CHECK_EQUAL( get_pool( 2 ).epoch, 0u );
   BOOST_CHECK_THROW( push( open, authority ), pool_already_open );

   // no stakes until a blocked number is chosen
   BOOST_CHECK_THROW( place( alice, 7, PARI_TIER2_MIN_STAKE, single_number_prediction, 2 ), invalid_selection );

   signed_transaction bad_reset;
   bad_reset.reset_pool( 2, 0 );
   BOOST_CHECK_THROW( push( bad_reset, authority ), invalid_rollover_number );

   signed_transaction reset;
   reset.reset_pool( 2, 4 );
   push( reset, authority );
   BOOST_CHECK_EQUAL( get_pool( 2 ).blocked_number, 4 );

   place( alice, 7, PARI_TIER2_MIN_STAKE, single_number_prediction, 2 );
   BOOST_CHECK_THROW( push( reset, authority ), pool_not_empty );

   signed_transaction close_busy;
   close_busy.close_pool( 2 );
   BOOST_CHECK_THROW( push( close_busy, authority ), pool_not_empty );

   signed_transaction open_unconfigured;
   open_unconfigured.open_pool( 4 );
   BOOST_CHECK_THROW( push( open_unconfigured, authority ), invalid_settings );

   signed_transaction open_unknown;
   open_unknown.open_pool( 9 );
   BOOST_CHECK_THROW( push( open_unknown, authority ), unknown_tier );

   signed_transaction close_empty;
   close_empty.close_pool( 1 );
   push( close_empty, authority );
   BOOST_CHECK( !db->get_pool_record( 1 ).valid() );
   BOOST_CHECK( !db->get_settings().is_tier_active( 1 ) );
   BOOST_CHECK_THROW( place( bob, 7, PARI_PRECISION ), inactive_tier );
} FC_LOG_AND_RETHROW() }
