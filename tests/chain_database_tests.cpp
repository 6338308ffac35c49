#define BOOST_TEST_MODULE ChainDatabaseTests
#include <boost/test/unit_test.hpp>

#include "pari_fixture.hpp"

#include <pari/chain/balance_operations.hpp>

#include <fc/filesystem.hpp>
#include <fc/io/json.hpp>

namespace
{
   string snapshot_json( const chain_database& db )
   {
      return fc::json::to_string( fc::variant( db.export_snapshot() ) );
   }
}

BOOST_FIXTURE_TEST_CASE( deposits_and_withdrawals, chain_fixture )
{ try {
   signed_transaction deposit;
   deposit.deposit( alice, 5 * PARI_PRECISION );
   BOOST_CHECK_THROW( push( deposit, alice ), missing_signature );
   BOOST_CHECK_EQUAL( db->get_balance( alice ), PARI_TEST_INITIAL_BALANCE );
   push( deposit, authority );
   BOOST_CHECK_EQUAL( db->get_balance( alice ), PARI_TEST_INITIAL_BALANCE + 5 * PARI_PRECISION );

   const address_type dave = make_address( "dave" );
   BOOST_CHECK( !db->get_balance_record( dave ).valid() );
   signed_transaction first_deposit;
   first_deposit.deposit( dave, PARI_PRECISION );
   BOOST_CHECK_THROW( push( first_deposit, dave ), missing_signature );
   push( first_deposit, authority );
   BOOST_CHECK_EQUAL( db->get_balance( dave ), PARI_PRECISION );

   signed_transaction empty_deposit;
   BOOST_CHECK_THROW( empty_deposit.deposit( alice, 0 ), fc::exception );
   empty_deposit.operations.push_back( deposit_operation( alice, 0 ) );
   BOOST_CHECK_THROW( push( empty_deposit, authority ), invalid_amount );

   signed_transaction withdraw;
   withdraw.withdraw( alice, PARI_PRECISION );
   BOOST_CHECK_THROW( push( withdraw, bob ), missing_signature );
   push( withdraw, alice );
   BOOST_CHECK_EQUAL( db->get_balance( alice ), PARI_TEST_INITIAL_BALANCE + 4 * PARI_PRECISION );

   signed_transaction overdraw;
   overdraw.withdraw( dave, 2 * PARI_PRECISION );
   BOOST_CHECK_THROW( push( overdraw, dave ), insufficient_funds );

   signed_transaction unknown;
   unknown.withdraw( make_address( "nobody" ), 1 );
   BOOST_CHECK_THROW( push( unknown, make_address( "nobody" ) ), insufficient_funds );

   // staking spends the same balance
   place( bob, 7, PARI_PRECISION );
   BOOST_CHECK_EQUAL( db->get_balance( bob ), PARI_TEST_INITIAL_BALANCE - PARI_PRECISION );
   BOOST_CHECK_EQUAL( db->get_treasury().custody_balance, PARI_PRECISION );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE( genesis_state_is_loaded, chain_fixture )
{ try {
   BOOST_CHECK( db->is_open() );

   const settings_record settings = db->get_settings();
   BOOST_CHECK( settings.authority == authority );
   BOOST_CHECK( settings.fee_vault == fee_vault );
   BOOST_CHECK_EQUAL( settings.base_fee_bps, PARI_DEFAULT_BASE_FEE_BPS );
   BOOST_CHECK( settings.is_tier_active( 1 ) );
   BOOST_CHECK( !settings.is_tier_active( 2 ) );

   BOOST_CHECK_EQUAL( db->get_pools().size(), 1u );
   BOOST_CHECK_EQUAL( db->get_balances().size(), 3u );
   BOOST_CHECK_EQUAL( db->get_epoch_schedule().ticks_per_epoch, PARI_TEST_TICKS_PER_EPOCH );
   BOOST_CHECK_EQUAL( db->get_clock().epoch, 0u );

   genesis_state bad_pool = create_genesis();
   bad_pool.pools[0].blocked_number = 0;
   chain_database_ptr other = std::make_shared<chain_database>();
   BOOST_CHECK_THROW( other->open( bad_pool ), invalid_rollover_number );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE( clock_only_moves_forward, chain_fixture )
{ try {
   advance_epochs( 2 );
   const clock_state clock = db->get_clock();
   BOOST_CHECK_EQUAL( clock.epoch, 2u );
   BOOST_CHECK_EQUAL( clock.tick, 2u * PARI_TEST_TICKS_PER_EPOCH );

   BOOST_CHECK_THROW( db->advance_to_tick( clock.tick - 1, clock.timestamp ), epoch_not_advanced );

   clock_state reported = clock;
   reported.tick += 5;
   reported.epoch = 7;
   db->set_clock( reported );
   BOOST_CHECK_EQUAL( db->get_clock().epoch, 7u );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE( simulation_does_not_commit, chain_fixture )
{ try {
   signed_transaction trx;
   trx.place_stake( alice, 1, single_number_prediction, 7, PARI_PRECISION );
   trx.sign( alice );

   const pending_chain_state_ptr pending = db->simulate_transaction( trx );
   const opool_record staged = pending->get_pool_record( 1 );
   BOOST_REQUIRE( staged.valid() );
   BOOST_CHECK_EQUAL( staged->total_value, PARI_PRECISION );

   BOOST_CHECK_EQUAL( get_pool().total_value, 0u );
   BOOST_CHECK_EQUAL( db->get_balance( alice ), PARI_TEST_INITIAL_BALANCE );
   BOOST_CHECK( !db->get_transaction_error( trx ).valid() );

   signed_transaction blocked;
   blocked.place_stake( alice, 1, single_number_prediction, 3, PARI_PRECISION );
   blocked.sign( alice );
   const optional<fc::exception> error = db->get_transaction_error( blocked );
   BOOST_REQUIRE( error.valid() );
   BOOST_CHECK_EQUAL( error->code(), invalid_selection::code_value );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE( snapshot_restores_every_record, chain_fixture )
{ try {
   place( alice, 7, PARI_PRECISION );
   place( bob, 45, PARI_PRECISION / 2, two_numbers_prediction );
   advance_epochs();
   init_ledger( 0, 7 );

   const chain_snapshot snapshot = db->export_snapshot();
   BOOST_CHECK_EQUAL( snapshot.predictions.size(), 2u );
   BOOST_CHECK_EQUAL( snapshot.ledgers.size(), 1u );

   chain_database_ptr restored = std::make_shared<chain_database>();
   restored->open( snapshot );
   BOOST_CHECK_EQUAL( snapshot_json( *restored ), snapshot_json( *db ) );

   // the restored copy continues independently
   const share_type gross = 2 * PARI_PRECISION;
   const share_type fee = gross / 20;
   signed_transaction trx;
   trx.finalize_ledger( 0, 1, fee, gross - fee, 1, digest_type(), PARI_TEST_RESULTS_URI );
   trx.sign( authority );
   restored->evaluate_transaction( trx );
   BOOST_CHECK( restored->get_ledger_record( ledger_index( 0, 1 ) )->is_resolved() );
   BOOST_CHECK( get_ledger( 0 ).is_processing() );

   chain_snapshot future = snapshot;
   future.version = PARI_SNAPSHOT_VERSION + 1;
   BOOST_CHECK_THROW( restored->open( future ), invalid_snapshot );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE( failed_open_keeps_current_state, chain_fixture )
{ try {
   place( alice, 7, PARI_PRECISION );
   const string before = snapshot_json( *db );

   // the second pool is rejected after the first one was already built
   genesis_state bad_genesis = create_genesis();
   genesis_pool second;
   second.tier = 2;
   second.blocked_number = 0;
   bad_genesis.pools.push_back( second );
   BOOST_CHECK_THROW( db->open( bad_genesis ), invalid_rollover_number );
   BOOST_CHECK( db->is_open() );
   BOOST_CHECK_EQUAL( snapshot_json( *db ), before );

   chain_snapshot bad_snapshot = db->export_snapshot();
   bad_snapshot.predictions.back().total_value += 1;
   BOOST_CHECK_THROW( db->open( bad_snapshot ), prediction_invariant_violated );
   BOOST_CHECK_EQUAL( snapshot_json( *db ), before );

   // still usable afterwards
   place( bob, 5, PARI_PRECISION );
   BOOST_CHECK_EQUAL( get_pool().total_value, 2 * PARI_PRECISION );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE( state_is_saved_to_the_data_directory, chain_fixture )
{ try {
   fc::temp_directory dir;
   place( carol, 2, PARI_PRECISION / 10 );
   db->save( dir.path() );
   BOOST_CHECK( fc::exists( dir.path() / "state.json" ) );

   chain_database_ptr reloaded = std::make_shared<chain_database>();
   reloaded->open( dir.path(), fc::optional<fc::path>() );
   BOOST_CHECK_EQUAL( snapshot_json( *reloaded ), snapshot_json( *db ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( empty_data_directory_uses_builtin_genesis )
{ try {
   fc::temp_directory dir;
   chain_database_ptr db = std::make_shared<chain_database>();
   db->open( dir.path() / "fresh", fc::optional<fc::path>() );
   BOOST_CHECK( db->is_open() );
   BOOST_CHECK( db->get_treasury().custody_balance == 0 );

   const genesis_state builtin = get_builtin_genesis_state();
   BOOST_CHECK( db->get_settings().authority == make_address( builtin.authority ) );
   BOOST_CHECK_EQUAL( db->get_epoch_schedule().ticks_per_epoch, builtin.ticks_per_epoch );

   BOOST_CHECK_THROW( db->open( dir.path() / "other", fc::path( dir.path() / "missing.json" ) ), fc::exception );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE( closed_database_rejects_work, chain_fixture )
{ try {
   db->close();
   BOOST_CHECK( !db->is_open() );

   signed_transaction trx;
   trx.deposit( alice, PARI_PRECISION );
   trx.sign( alice );
   BOOST_CHECK_THROW( db->evaluate_transaction( trx ), database_not_open );
   BOOST_CHECK_THROW( db->simulate_transaction( trx ), database_not_open );

   fc::temp_directory dir;
   BOOST_CHECK_THROW( db->save( dir.path() ), database_not_open );
} FC_LOG_AND_RETHROW() }
