#include <pari/chain/checked_math.hpp>
#include <pari/chain/exceptions.hpp>
#include <pari/chain/pending_chain_state.hpp>
#include <pari/chain/stake_operations.hpp>
#include <pari/chain/transaction_evaluation_state.hpp>

#include <fc/log/logger.hpp>

namespace pari { namespace chain {

   namespace
   {
      /** the active tier settings for @p tier_id */
      tier_settings get_active_tier( const settings_record& settings, const tier_id_type tier_id )
      {
         const optional<tier_settings> tier = settings.get_tier( tier_id );
         if( !tier.valid() )
            FC_CAPTURE_AND_THROW( unknown_tier, (tier_id) );
         if( !tier->active )
            FC_CAPTURE_AND_THROW( inactive_tier, (tier_id) );
         return *tier;
      }

      /** the pool of @p tier_id, open at the caller's epoch with staking still allowed */
      pool_record get_open_pool( const pending_chain_state& state, const tier_id_type tier_id )
      {
         const opool_record pool = state.get_pool_record( tier_id );
         if( !pool.valid() )
            FC_CAPTURE_AND_THROW( unknown_pool, (tier_id) );
         if( pool->tier != tier_id )
            FC_CAPTURE_AND_THROW( tier_mismatch, (pool->tier)(tier_id) );

         const clock_state clock = state.get_clock();
         if( clock.epoch != pool->epoch )
            FC_CAPTURE_AND_THROW( epoch_mismatch, (clock.epoch)(pool->epoch) );

         if( !is_staking_open( state.get_epoch_schedule(), clock, pool->cutoff_ticks ) )
            FC_CAPTURE_AND_THROW( staking_closed, (clock)(pool->cutoff_ticks) );

         return *pool;
      }
   }

   void place_stake_operation::evaluate( transaction_evaluation_state& eval_state )const
   { try {
      eval_state.require_signature( player );

      pending_chain_state& state = *eval_state.pending_state();
      const settings_record settings = state.get_settings();
      if( settings.pause_staking )
         FC_CAPTURE_AND_THROW( staking_paused, (tier) );

      if( value_per_number == 0 )
         FC_CAPTURE_AND_THROW( invalid_amount, (value_per_number) );

      const tier_settings tier_config = get_active_tier( settings, tier );
      if( !tier_config.is_valid_stake( value_per_number ) )
         FC_CAPTURE_AND_THROW( stake_out_of_range, (value_per_number)(tier_config) );

      pool_record pool = get_open_pool( state, tier );

      const selection chosen = derive_selection( prediction_type, choice, pool.blocked_number );

      const prediction_index index( player, pool.chain_start_epoch, tier );
      if( state.get_prediction_record( index ).valid() )
         FC_CAPTURE_AND_THROW( already_staked, (index) );

      const share_type total = checked_mul<share_type>( value_per_number, chosen.count );

      obalance_record balance = state.get_balance_record( player );
      if( !balance.valid() )
         FC_CAPTURE_AND_THROW( insufficient_funds, (player)(total) );
      balance->debit( total );
      balance->last_update = state.now();

      treasury_record treasury = state.get_treasury();
      treasury.deposit( total );

      pool.total_count = checked_add<uint32_t>( pool.total_count, 1 );
      pool.total_value = checked_add( pool.total_value, total );
      pool.increment_counts( chosen.numbers );
      pool.apply_value( chosen.numbers, value_per_number );

      const clock_state clock = state.get_clock();

      prediction_record record;
      record.index = index;
      record.placed_epoch = pool.epoch;
      record.prediction_type = prediction_type;
      record.numbers = chosen;
      record.value_per_number = value_per_number;
      record.total_value = total;
      record.placed_tick = clock.tick;
      record.placed_at = clock.timestamp;
      record.last_update = clock.timestamp;
      record.check_invariant();

      state.store_prediction_record( record );
      state.store_pool_record( pool );
      state.store_treasury( treasury );
      state.store_balance_record( *balance );

      ilog( "stake placed: tier ${t} epoch ${e} numbers ${n} value ${v}",
            ("t",tier)("e",pool.epoch)("n",chosen.numbers)("v",total) );
   } FC_CAPTURE_AND_RETHROW( (*this) ) }

   void increase_stake_operation::evaluate( transaction_evaluation_state& eval_state )const
   { try {
      eval_state.require_signature( player );

      if( choice == 0 )
         FC_CAPTURE_AND_THROW( invalid_selection, (choice) );
      if( additional_value == 0 )
         FC_CAPTURE_AND_THROW( invalid_amount, (additional_value) );

      pending_chain_state& state = *eval_state.pending_state();
      const settings_record settings = state.get_settings();
      if( settings.pause_staking )
         FC_CAPTURE_AND_THROW( staking_paused, (tier) );

      pool_record pool = get_open_pool( state, tier );

      const prediction_index index( player, pool.chain_start_epoch, tier );
      oprediction_record record = state.get_prediction_record( index );
      if( !record.valid() )
         FC_CAPTURE_AND_THROW( unknown_prediction, (index) );

      record->check_invariant();
      if( record->claimed )
         FC_CAPTURE_AND_THROW( already_claimed, (index) );

      if( record->placed_epoch < pool.chain_start_epoch || record->placed_epoch > pool.epoch )
         FC_CAPTURE_AND_THROW( epoch_mismatch, (record->placed_epoch)(pool.chain_start_epoch)(pool.epoch) );

      const tier_settings tier_config = get_active_tier( settings, tier );
      record->check_mask();

      const share_type new_value_per_number = checked_add( record->value_per_number, additional_value );
      if( !tier_config.is_valid_stake( new_value_per_number ) )
         FC_CAPTURE_AND_THROW( stake_out_of_range, (new_value_per_number)(tier_config) );

      const share_type added_total = checked_mul<share_type>( additional_value, record->numbers.count );

      obalance_record balance = state.get_balance_record( player );
      if( !balance.valid() )
         FC_CAPTURE_AND_THROW( insufficient_funds, (player)(added_total) );
      balance->debit( added_total );
      balance->last_update = state.now();

      treasury_record treasury = state.get_treasury();
      treasury.deposit( added_total );

      pool.apply_value( record->numbers.numbers, additional_value );
      pool.total_value = checked_add( pool.total_value, added_total );

      record->value_per_number = new_value_per_number;
      record->total_value = checked_add( record->total_value, added_total );
      record->change_count = saturating_add<uint32_t>( record->change_count, 1 );
      record->last_update = state.now();
      record->check_invariant();

      state.store_prediction_record( *record );
      state.store_pool_record( pool );
      state.store_treasury( treasury );
      state.store_balance_record( *balance );

      ilog( "stake increased: tier ${t} epoch ${e} per number ${v}",
            ("t",tier)("e",pool.epoch)("v",new_value_per_number) );
   } FC_CAPTURE_AND_RETHROW( (*this) ) }

   void change_selection_operation::evaluate( transaction_evaluation_state& eval_state )const
   { try {
      eval_state.require_signature( player );

      pending_chain_state& state = *eval_state.pending_state();
      const settings_record settings = state.get_settings();
      if( settings.pause_staking )
         FC_CAPTURE_AND_THROW( staking_paused, (tier) );

      get_active_tier( settings, tier );

      pool_record pool = get_open_pool( state, tier );

      const prediction_index index( player, pool.chain_start_epoch, tier );
      oprediction_record record = state.get_prediction_record( index );
      if( !record.valid() )
         FC_CAPTURE_AND_THROW( unknown_prediction, (index) );

      record->check_invariant();
      if( record->claimed )
         FC_CAPTURE_AND_THROW( already_claimed, (index) );

      if( record->placed_epoch < pool.chain_start_epoch || record->placed_epoch > pool.epoch )
         FC_CAPTURE_AND_THROW( epoch_mismatch, (record->placed_epoch)(pool.chain_start_epoch)(pool.epoch) );

      const selection chosen = derive_selection( new_prediction_type, new_choice, pool.blocked_number );

      if( chosen == record->numbers )
         FC_CAPTURE_AND_THROW( no_op_change, (chosen) );
      if( chosen.count != record->numbers.count )
         FC_CAPTURE_AND_THROW( selection_count_mismatch, (chosen.count)(record->numbers.count) );

      pool.retract_value( record->numbers.numbers, record->value_per_number );

      const selection_mask_type old_mask = record->numbers.mask;
      const selection_mask_type removed = old_mask & ~chosen.mask;
      const selection_mask_type added = chosen.mask & ~old_mask;

      vector<uint8_t> removed_numbers;
      vector<uint8_t> added_numbers;
      for( uint8_t n = PARI_MIN_SELECTABLE_NUMBER; n <= PARI_MAX_SELECTABLE_NUMBER; ++n )
      {
         const selection_mask_type bit = selection_mask_type( 1u << n );
         if( removed & bit ) removed_numbers.push_back( n );
         if( added & bit ) added_numbers.push_back( n );
      }
      pool.decrement_counts( removed_numbers );
      pool.increment_counts( added_numbers );

      record->prediction_type = new_prediction_type;
      record->numbers = chosen;
      record->change_count = saturating_add<uint32_t>( record->change_count, 1 );
      record->last_update = state.now();

      pool.apply_value( record->numbers.numbers, record->value_per_number );
      record->check_invariant();

      state.store_prediction_record( *record );
      state.store_pool_record( pool );

      ilog( "selection changed: tier ${t} epoch ${e} removed ${r} added ${a}",
            ("t",tier)("e",pool.epoch)("r",removed_numbers)("a",added_numbers) );
   } FC_CAPTURE_AND_RETHROW( (*this) ) }

} } // pari::chain
