#include <pari/chain/exceptions.hpp>
#include <pari/chain/pending_chain_state.hpp>
#include <pari/chain/pool_operations.hpp>
#include <pari/chain/transaction_evaluation_state.hpp>

#include <fc/log/logger.hpp>

namespace pari { namespace chain {

   void open_pool_operation::evaluate( transaction_evaluation_state& eval_state )const
   { try {
      settings_record settings = eval_state.require_authority();
      pending_chain_state& state = *eval_state.pending_state();

      tier_settings& tier_config = settings.get_tier_ref( tier );
      if( tier_config.max_stake == 0 )
         FC_CAPTURE_AND_THROW( invalid_settings, (tier_config) );

      if( state.get_pool_record( tier ).valid() )
         FC_CAPTURE_AND_THROW( pool_already_open, (tier) );

      tier_config.active = true;
      settings.validate();

      const pool_record pool = pool_record::open_new_chain( tier, state.get_current_epoch(),
                                                            settings.cutoff_ticks, settings.base_fee_bps );

      state.store_settings( settings );
      state.store_pool_record( pool );

      ilog( "pool opened: tier ${t} epoch ${e}", ("t",tier)("e",pool.epoch) );
   } FC_CAPTURE_AND_RETHROW( (*this) ) }

   void reset_pool_operation::evaluate( transaction_evaluation_state& eval_state )const
   { try {
      const settings_record settings = eval_state.require_authority();
      pending_chain_state& state = *eval_state.pending_state();

      opool_record pool = state.get_pool_record( tier );
      if( !pool.valid() )
         FC_CAPTURE_AND_THROW( unknown_pool, (tier) );
      if( pool->tier != tier )
         FC_CAPTURE_AND_THROW( tier_mismatch, (pool->tier)(tier) );

      const epoch_type current_epoch = state.get_current_epoch();
      if( current_epoch < pool->epoch )
         FC_CAPTURE_AND_THROW( epoch_not_advanced, (current_epoch)(pool->epoch) );

      if( blocked_number < PARI_MIN_SELECTABLE_NUMBER || blocked_number > PARI_MAX_SELECTABLE_NUMBER )
         FC_CAPTURE_AND_THROW( invalid_rollover_number, (blocked_number) );

      if( !pool->is_empty() )
         FC_CAPTURE_AND_THROW( pool_not_empty, (*pool) );

      pool_record reset = pool_record::open_new_chain( tier, current_epoch, settings.cutoff_ticks, settings.base_fee_bps );
      reset.blocked_number = blocked_number;

      state.store_pool_record( reset );

      ilog( "pool reset: tier ${t} epoch ${e} blocked ${b}", ("t",tier)("e",current_epoch)("b",blocked_number) );
   } FC_CAPTURE_AND_RETHROW( (*this) ) }

   void close_pool_operation::evaluate( transaction_evaluation_state& eval_state )const
   { try {
      settings_record settings = eval_state.require_authority();
      pending_chain_state& state = *eval_state.pending_state();

      const opool_record pool = state.get_pool_record( tier );
      if( !pool.valid() )
         FC_CAPTURE_AND_THROW( unknown_pool, (tier) );
      if( pool->total_count != 0 )
         FC_CAPTURE_AND_THROW( pool_not_empty, (pool->total_count) );

      settings.get_tier_ref( tier ).active = false;

      state.remove<pool_record>( tier );
      state.store_settings( settings );

      ilog( "pool closed: tier ${t}", ("t",tier) );
   } FC_CAPTURE_AND_RETHROW( (*this) ) }

} } // pari::chain
