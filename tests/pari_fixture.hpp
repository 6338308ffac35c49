#pragma once

#include <pari/chain/chain_database.hpp>
#include <pari/chain/exceptions.hpp>
#include <pari/chain/merkle.hpp>
#include <pari/chain/transaction_evaluation_state.hpp>

#include <fc/exception/exception.hpp>
#include <fc/log/logger.hpp>

using namespace pari::chain;

#define PARI_TEST_TICKS_PER_EPOCH   1000
#define PARI_TEST_INITIAL_BALANCE   (100 * PARI_PRECISION)
#define PARI_TEST_RESULTS_URI       "ipfs://pari-results"

/**
 *  A database opened from a small genesis: tier 1 has an open pool with
 *  blocked number 3, epochs are 1000 ticks long and three players are
 *  funded.  Every helper pushes a single operation transaction signed by
 *  the party the operation needs.
 */
struct chain_fixture
{
   chain_fixture()
   :db( std::make_shared<chain_database>() ),
    authority( make_address( "authority" ) ),
    fee_vault( make_address( "fee-vault" ) ),
    alice( make_address( "alice" ) ),
    bob( make_address( "bob" ) ),
    carol( make_address( "carol" ) )
   { try {
      db->open( create_genesis() );
   } FC_LOG_AND_RETHROW() }

   static genesis_state create_genesis()
   {
      genesis_state config = get_builtin_genesis_state();
      config.ticks_per_epoch = PARI_TEST_TICKS_PER_EPOCH;
      config.start_tick = 0;

      genesis_pool pool;
      pool.tier = 1;
      pool.blocked_number = 3;
      config.pools.push_back( pool );

      const char* players[] = { "alice", "bob", "carol" };
      for( const char* name : players )
      {
         genesis_balance balance;
         balance.owner = name;
         balance.balance = PARI_TEST_INITIAL_BALANCE;
         config.initial_balances.push_back( balance );
      }
      return config;
   }

   transaction_evaluation_state_ptr push( signed_transaction trx, const address_type& signer )
   {
      trx.sign( signer );
      return db->evaluate_transaction( trx );
   }

   void place( const address_type& player, const uint32_t choice, const share_type value_per_number,
               const prediction_type_enum type = single_number_prediction, const tier_id_type tier = 1 )
   {
      signed_transaction trx;
      trx.place_stake( player, tier, type, choice, value_per_number );
      push( trx, player );
   }

   void increase( const address_type& player, const share_type additional_value, const uint32_t choice = 1,
                  const tier_id_type tier = 1 )
   {
      signed_transaction trx;
      trx.increase_stake( player, tier, additional_value, choice );
      push( trx, player );
   }

   void change( const address_type& player, const prediction_type_enum type, const uint32_t choice,
                const tier_id_type tier = 1 )
   {
      signed_transaction trx;
      trx.change_selection( player, tier, type, choice );
      push( trx, player );
   }

   void init_ledger( const epoch_type epoch, const uint8_t winning_number, const tier_id_type tier = 1 )
   {
      signed_transaction trx;
      trx.init_ledger( epoch, tier, winning_number, 42, fc::sha256::hash( std::string( "seed" ) ) );
      push( trx, authority );
   }

   void finalize( const epoch_type epoch, const share_type fee, const share_type net, const uint32_t winners,
                  const digest_type& root, const tier_id_type tier = 1,
                  const string& results_uri = PARI_TEST_RESULTS_URI )
   {
      signed_transaction trx;
      trx.finalize_ledger( epoch, tier, fee, net, winners, root, results_uri );
      push( trx, authority );
   }

   void rollover( const epoch_type epoch, const uint8_t winning_number, const tier_id_type tier = 1 )
   {
      signed_transaction trx;
      trx.rollover_ledger( epoch, tier, winning_number, 42, fc::sha256::hash( std::string( "seed" ) ) );
      push( trx, authority );
   }

   void claim( const address_type& claimer, const epoch_type epoch, const uint32_t index, const share_type amount,
               const vector<digest_type>& proof, const tier_id_type tier = 1 )
   {
      signed_transaction trx;
      trx.claim( claimer, epoch, tier, index, amount, proof );
      push( trx, claimer );
   }

   /** moves the clock to the first tick of the epoch @p count epochs ahead */
   void advance_epochs( const uint32_t count = 1 )
   {
      const clock_state clock = db->get_clock();
      const tick_type tick = db->get_epoch_schedule().get_first_tick_in_epoch( clock.epoch + count );
      db->advance_to_tick( tick, clock.timestamp + count * 60 );
   }

   /** moves the clock into the cutoff window at the end of the current epoch */
   void advance_into_cutoff()
   {
      const clock_state clock = db->get_clock();
      const tick_type tick = db->get_epoch_schedule().get_last_tick_in_epoch( clock.epoch ) - 10;
      db->advance_to_tick( tick, clock.timestamp + 30 );
   }

   pool_record get_pool( const tier_id_type tier = 1 )const
   {
      const opool_record pool = db->get_pool_record( tier );
      FC_ASSERT( pool.valid() );
      return *pool;
   }

   prediction_record get_prediction( const address_type& player, const tier_id_type tier = 1 )const
   {
      const oprediction_record record = db->get_prediction_record( prediction_index( player, get_pool( tier ).chain_start_epoch, tier ) );
      FC_ASSERT( record.valid() );
      return *record;
   }

   ledger_record get_ledger( const epoch_type epoch, const tier_id_type tier = 1 )const
   {
      const oledger_record ledger = db->get_ledger_record( ledger_index( epoch, tier ) );
      FC_ASSERT( ledger.valid() );
      return *ledger;
   }

   static claim_leaf make_leaf( const epoch_type epoch, const uint32_t index, const address_type& claimer,
                                const share_type amount, const selection_mask_type mask, const tier_id_type tier = 1 )
   {
      claim_leaf leaf;
      leaf.epoch = epoch;
      leaf.tier = tier;
      leaf.index = index;
      leaf.claimer = claimer;
      leaf.amount = amount;
      leaf.selection_mask = mask;
      return leaf;
   }

   chain_database_ptr   db;
   address_type         authority;
   address_type         fee_vault;
   address_type         alice;
   address_type         bob;
   address_type         carol;
};
