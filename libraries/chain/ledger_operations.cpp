#include <pari/chain/checked_math.hpp>
#include <pari/chain/exceptions.hpp>
#include <pari/chain/fee_engine.hpp>
#include <pari/chain/ledger_operations.hpp>
#include <pari/chain/pending_chain_state.hpp>
#include <pari/chain/transaction_evaluation_state.hpp>

#include <fc/log/logger.hpp>

namespace pari { namespace chain {

   namespace
   {
      /**
       *  The pool of @p tier_id whose epoch @p epoch has concluded.  Every
       *  ledger transition works on exactly this pool.
       */
      pool_record get_concluded_pool( const pending_chain_state& state,
                                      const settings_record& settings,
                                      const epoch_type epoch,
                                      const tier_id_type tier_id )
      {
         const opool_record pool = state.get_pool_record( tier_id );
         if( !pool.valid() )
            FC_CAPTURE_AND_THROW( unknown_pool, (tier_id) );

         if( pool->epoch != epoch )
            FC_CAPTURE_AND_THROW( epoch_mismatch, (pool->epoch)(epoch) );

         const epoch_type current_epoch = state.get_current_epoch();
         if( pool->epoch >= current_epoch )
            FC_CAPTURE_AND_THROW( epoch_not_complete, (pool->epoch)(current_epoch) );

         if( pool->tier != tier_id )
            FC_CAPTURE_AND_THROW( tier_mismatch, (pool->tier)(tier_id) );

         const optional<tier_settings> tier = settings.get_tier( tier_id );
         if( !tier.valid() )
            FC_CAPTURE_AND_THROW( unknown_tier, (tier_id) );
         if( !tier->active )
            FC_CAPTURE_AND_THROW( inactive_tier, (tier_id) );

         return *pool;
      }
   }

   void init_ledger_operation::evaluate( transaction_evaluation_state& eval_state )const
   { try {
      const settings_record settings = eval_state.require_authority();
      pending_chain_state& state = *eval_state.pending_state();

      const pool_record pool = get_concluded_pool( state, settings, epoch, tier );

      if( winning_number > PARI_MAX_SELECTABLE_NUMBER )
         FC_CAPTURE_AND_THROW( invalid_winning_number, (winning_number) );

      if( !pool.has_activity() )
         FC_CAPTURE_AND_THROW( no_stakes_to_resolve, (pool.total_count)(pool.total_value) );

      const ledger_index index( epoch, tier );
      if( state.get_ledger_record( index ).valid() )
         FC_CAPTURE_AND_THROW( ledger_already_exists, (index) );

      const clock_state clock = state.get_clock();

      ledger_record ledger;
      ledger.index = index;
      ledger.chain_start_epoch = pool.chain_start_epoch;
      ledger.status = processing_status;
      ledger.winning_number = winning_number;
      ledger.rng_tick = rng_tick;
      ledger.rng_seed = rng_seed;
      ledger.attempt_count = 1;
      ledger.last_update_tick = clock.tick;
      ledger.last_update = clock.timestamp;
      ledger.carry_in_value = pool.carried_value;
      ledger.blocked_number = pool.blocked_number;

      state.store_ledger_record( ledger );

      ilog( "ledger ${e}/${t} processing, winning number ${w}", ("e",epoch)("t",tier)("w",winning_number) );
   } FC_CAPTURE_AND_RETHROW( (*this) ) }

   void reprocess_ledger_operation::evaluate( transaction_evaluation_state& eval_state )const
   { try {
      const settings_record settings = eval_state.require_authority();
      pending_chain_state& state = *eval_state.pending_state();

      get_concluded_pool( state, settings, epoch, tier );

      oledger_record ledger = state.get_ledger_record( ledger_index( epoch, tier ) );
      if( !ledger.valid() )
         FC_CAPTURE_AND_THROW( unknown_ledger, (epoch)(tier) );

      if( ledger->is_resolved() )
         FC_CAPTURE_AND_THROW( ledger_already_resolved, (ledger->index) );

      const clock_state clock = state.get_clock();

      ledger->attempt_count = saturating_add<uint8_t>( ledger->attempt_count, 1 );
      ledger->status = processing_status;
      ledger->last_update_tick = clock.tick;
      ledger->last_update = clock.timestamp;

      state.store_ledger_record( *ledger );

      ilog( "ledger ${e}/${t} reprocessing, attempt ${a}", ("e",epoch)("t",tier)("a",ledger->attempt_count) );
   } FC_CAPTURE_AND_RETHROW( (*this) ) }

   void finalize_ledger_operation::evaluate( transaction_evaluation_state& eval_state )const
   { try {
      const settings_record settings = eval_state.require_authority();
      pending_chain_state& state = *eval_state.pending_state();

      pool_record pool = get_concluded_pool( state, settings, epoch, tier );

      if( !pool.has_activity() )
         FC_CAPTURE_AND_THROW( no_stakes_to_resolve, (pool.total_count)(pool.total_value) );

      if( is_empty_results_pointer( results_pointer ) )
         FC_CAPTURE_AND_THROW( empty_results_pointer, (epoch)(tier) );

      oledger_record ledger = state.get_ledger_record( ledger_index( epoch, tier ) );
      if( !ledger.valid() )
         FC_CAPTURE_AND_THROW( unknown_ledger, (epoch)(tier) );
      if( ledger->is_resolved() )
         FC_CAPTURE_AND_THROW( ledger_already_resolved, (ledger->index) );
      if( !ledger->is_processing() )
         FC_CAPTURE_AND_THROW( ledger_not_processing, (ledger->status) );

      const bool has_winners = total_winners > 0;
      const fee_breakdown expected = compute_fee_breakdown( pool.total_value, pool.fee_bps, has_winners );

      if( proposed_fee != expected.fee )
         FC_CAPTURE_AND_THROW( invalid_fee, (proposed_fee)(expected) );
      if( proposed_net != expected.net )
         FC_CAPTURE_AND_THROW( invalid_pot_breakdown, (proposed_net)(expected) );
      FC_ASSERT( checked_add( expected.fee, expected.net ) <= expected.gross );

      const claim_bitmap bitmap = claim_bitmap::for_winners( total_winners );

      treasury_record treasury = state.get_treasury();
      if( treasury.custody_balance < expected.fee
          || treasury.custody_balance - expected.fee < expected.net )
         FC_CAPTURE_AND_THROW( insufficient_treasury_balance, (treasury)(expected) );

      if( expected.fee > 0 )
      {
         treasury.withdraw_fee( expected.fee );

         const obalance_record current_vault = state.get_balance_record( settings.fee_vault );
         balance_record vault = current_vault.valid() ? *current_vault : balance_record( settings.fee_vault, 0 );
         vault.credit( expected.fee );
         vault.last_update = state.now();
         state.store_balance_record( vault );
      }

      const pool_carry carry = has_winners ? pool_carry() : pool.as_carry();

      const clock_state clock = state.get_clock();

      ledger->total_count = pool.total_count;
      ledger->carried_count = carry.count;
      ledger->carry_in_value = pool.carried_value;
      ledger->carry_out_value = carry.value;
      ledger->protocol_fee = expected.fee;
      ledger->fee_bps = pool.fee_bps;
      ledger->net_prize_pool = expected.net;
      ledger->total_winners = total_winners;
      ledger->claimed_winners = 0;
      ledger->claimed_value = 0;
      ledger->claim_bitmap_bytes = bitmap.bytes();
      ledger->merkle_root = merkle_root;
      ledger->results_pointer = results_pointer;
      ledger->resolved_at = clock.timestamp;
      ledger->rollover_reason = has_winners ? no_rollover : no_winners_rollover;
      ledger->status = resolved_status;
      ledger->last_update_tick = clock.tick;
      ledger->last_update = clock.timestamp;

      const uint8_t next_blocked = next_blocked_number( ledger->winning_number, pool.blocked_number );
      pool.reset_for_next_epoch( pool.epoch + 1, settings.cutoff_ticks, carry, next_blocked, settings.base_fee_bps );

      state.store_ledger_record( *ledger );
      state.store_pool_record( pool );
      state.store_treasury( treasury );

      ilog( "ledger ${e}/${t} resolved: winners ${w} fee ${f} net ${n} carry ${c}",
            ("e",epoch)("t",tier)("w",total_winners)("f",expected.fee)("n",expected.net)("c",carry.value) );
   } FC_CAPTURE_AND_RETHROW( (*this) ) }

   void rollover_ledger_operation::evaluate( transaction_evaluation_state& eval_state )const
   { try {
      const settings_record settings = eval_state.require_authority();
      pending_chain_state& state = *eval_state.pending_state();

      if( winning_number > PARI_MAX_SELECTABLE_NUMBER )
         FC_CAPTURE_AND_THROW( invalid_winning_number, (winning_number) );

      pool_record pool = get_concluded_pool( state, settings, epoch, tier );

      const bool is_rollover_number = winning_number == settings.primary_rollover_number
                                      || winning_number == pool.blocked_number;
      const bool has_winners = pool.count_per_number.data[ winning_number ] > 0;
      if( !is_rollover_number && has_winners )
         FC_CAPTURE_AND_THROW( carry_not_allowed, (winning_number)(pool.blocked_number)(pool.count_per_number) );

      if( !pool.has_activity() )
         FC_CAPTURE_AND_THROW( no_stakes_to_resolve, (pool.total_count)(pool.total_value) );

      const ledger_index index( epoch, tier );
      if( state.get_ledger_record( index ).valid() )
         FC_CAPTURE_AND_THROW( ledger_already_exists, (index) );

      const fee_breakdown expected = compute_fee_breakdown( pool.total_value, pool.fee_bps, false );

      const treasury_record treasury = state.get_treasury();
      if( treasury.custody_balance < expected.gross )
         FC_CAPTURE_AND_THROW( insufficient_treasury_balance, (treasury)(expected) );

      const pool_carry carry = pool.as_carry();
      const clock_state clock = state.get_clock();

      ledger_record ledger;
      ledger.index = index;
      ledger.chain_start_epoch = pool.chain_start_epoch;
      ledger.status = resolved_status;
      ledger.winning_number = winning_number;
      ledger.rng_tick = rng_tick;
      ledger.rng_seed = rng_seed;
      ledger.attempt_count = 1;
      ledger.last_update_tick = clock.tick;
      ledger.last_update = clock.timestamp;
      ledger.total_count = pool.total_count;
      ledger.carried_count = carry.count;
      ledger.carry_in_value = pool.carried_value;
      ledger.carry_out_value = carry.value;
      ledger.protocol_fee = expected.fee;
      ledger.fee_bps = pool.fee_bps;
      ledger.net_prize_pool = expected.net;
      ledger.total_winners = 0;
      ledger.resolved_at = clock.timestamp;
      ledger.rollover_reason = is_rollover_number ? rollover_number_hit : no_winners_rollover;
      ledger.blocked_number = pool.blocked_number;

      const fee_bps_type next_fee = is_rollover_number
                                    ? next_fee_bps_on_rollover( pool.fee_bps, settings.rollover_fee_step_bps, settings.min_fee_bps )
                                    : next_fee_bps_on_carry( pool.fee_bps, settings.min_fee_bps );
      const uint8_t next_blocked = next_blocked_number( winning_number, pool.blocked_number );
      pool.reset_for_next_epoch( pool.epoch + 1, settings.cutoff_ticks, carry, next_blocked, next_fee );

      state.store_ledger_record( ledger );
      state.store_pool_record( pool );

      ilog( "ledger ${e}/${t} rolled over (${r}): carry ${c} next fee ${f}",
            ("e",epoch)("t",tier)("r",ledger.rollover_reason)("c",carry.value)("f",next_fee) );
   } FC_CAPTURE_AND_RETHROW( (*this) ) }

   void close_ledger_operation::evaluate( transaction_evaluation_state& eval_state )const
   { try {
      eval_state.require_authority();
      pending_chain_state& state = *eval_state.pending_state();

      const ledger_index index( epoch, tier );
      const oledger_record ledger = state.get_ledger_record( index );
      if( !ledger.valid() )
         FC_CAPTURE_AND_THROW( unknown_ledger, (index) );
      if( !ledger->is_resolved() )
         FC_CAPTURE_AND_THROW( ledger_not_resolved, (ledger->status) );

      state.remove<ledger_record>( index );

      ilog( "ledger ${e}/${t} closed", ("e",epoch)("t",tier) );
   } FC_CAPTURE_AND_RETHROW( (*this) ) }

} } // pari::chain
