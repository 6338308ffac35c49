#pragma once

#include <pari/chain/operations.hpp>
#include <pari/chain/settings_record.hpp>
#include <pari/chain/types.hpp>

namespace pari { namespace chain {

   struct tier_settings_update
   {
      tier_id_type           tier_id = 0;
      optional<bool>         active;
      optional<share_type>   min_stake;
      optional<share_type>   max_stake;
   };

   /**
    *  authority only: every field that is set replaces the current value.
    *  The resulting settings must pass settings_record::validate().
    */
   struct update_settings_operation
   {
      static const operation_type_enum type;

      optional<bool>                 pause_staking;
      optional<bool>                 pause_claims;
      optional<address_type>         new_authority;
      optional<address_type>         new_fee_vault;
      optional<fee_bps_type>         base_fee_bps;
      optional<fee_bps_type>         min_fee_bps;
      optional<fee_bps_type>         rollover_fee_step_bps;
      optional<uint64_t>             cutoff_ticks;
      optional<uint8_t>              primary_rollover_number;
      vector<tier_settings_update>   tier_updates;

      void evaluate( transaction_evaluation_state& eval_state )const;
   };

   struct update_tier_active_operation
   {
      static const operation_type_enum type;

      update_tier_active_operation(){}
      update_tier_active_operation( const tier_id_type t, const bool a ):tier(t),active(a){}

      tier_id_type   tier = 0;
      bool           active = false;

      void evaluate( transaction_evaluation_state& eval_state )const;
   };

} } // pari::chain

FC_REFLECT( pari::chain::tier_settings_update, (tier_id)(active)(min_stake)(max_stake) )
FC_REFLECT( pari::chain::update_settings_operation,
            (pause_staking)
            (pause_claims)
            (new_authority)
            (new_fee_vault)
            (base_fee_bps)
            (min_fee_bps)
            (rollover_fee_step_bps)
            (cutoff_ticks)
            (primary_rollover_number)
            (tier_updates)
            )
FC_REFLECT( pari::chain::update_tier_active_operation, (tier)(active) )
