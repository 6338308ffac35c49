#include <pari/chain/exceptions.hpp>
#include <pari/chain/pending_chain_state.hpp>
#include <pari/chain/settings_operations.hpp>
#include <pari/chain/transaction_evaluation_state.hpp>

#include <fc/log/logger.hpp>

namespace pari { namespace chain {

   void update_settings_operation::evaluate( transaction_evaluation_state& eval_state )const
   { try {
      settings_record settings = eval_state.require_authority();
      pending_chain_state& state = *eval_state.pending_state();

      if( pause_staking.valid() )             settings.pause_staking = *pause_staking;
      if( pause_claims.valid() )              settings.pause_claims = *pause_claims;
      if( new_authority.valid() )             settings.authority = *new_authority;
      if( new_fee_vault.valid() )             settings.fee_vault = *new_fee_vault;
      if( base_fee_bps.valid() )              settings.base_fee_bps = *base_fee_bps;
      if( min_fee_bps.valid() )               settings.min_fee_bps = *min_fee_bps;
      if( rollover_fee_step_bps.valid() )     settings.rollover_fee_step_bps = *rollover_fee_step_bps;
      if( cutoff_ticks.valid() )              settings.cutoff_ticks = *cutoff_ticks;
      if( primary_rollover_number.valid() )   settings.primary_rollover_number = *primary_rollover_number;

      for( const tier_settings_update& update : tier_updates )
      {
         tier_settings& tier = settings.get_tier_ref( update.tier_id );
         if( update.active.valid() )    tier.active = *update.active;
         if( update.min_stake.valid() ) tier.min_stake = *update.min_stake;
         if( update.max_stake.valid() ) tier.max_stake = *update.max_stake;
      }

      settings.validate();
      state.store_settings( settings );

      ilog( "settings updated: ${s}", ("s",settings) );
   } FC_CAPTURE_AND_RETHROW( (*this) ) }

   void update_tier_active_operation::evaluate( transaction_evaluation_state& eval_state )const
   { try {
      settings_record settings = eval_state.require_authority();
      pending_chain_state& state = *eval_state.pending_state();

      settings.get_tier_ref( tier ).active = active;
      settings.validate();
      state.store_settings( settings );

      ilog( "tier ${t} active: ${a}", ("t",tier)("a",active) );
   } FC_CAPTURE_AND_RETHROW( (*this) ) }

} } // pari::chain
