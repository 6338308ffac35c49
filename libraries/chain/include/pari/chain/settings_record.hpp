#pragma once

#include <pari/chain/types.hpp>

namespace pari { namespace chain {

   struct tier_settings
   {
      tier_id_type   tier_id = 0;
      bool           active = false;
      share_type     min_stake = 0;
      share_type     max_stake = 0;

      /** true when @p value_per_number lies within [min_stake, max_stake] */
      bool           is_valid_stake( const share_type value_per_number )const
      {
         return value_per_number >= min_stake && value_per_number <= max_stake;
      }
   };

   typedef uint8_t settings_id_type;

   struct settings_record;
   typedef fc::optional<settings_record> osettings_record;

   class chain_interface;

   /**
    *  Protocol wide configuration.  Only the authority may change it, the
    *  settlement engine reads fee bounds, pause flags, the cutoff and the
    *  tier table from here.
    */
   struct settings_record
   {
      settings_id_type        id = PARI_SETTINGS_ID;
      address_type            authority;
      address_type            fee_vault;

      bool                    pause_staking = false;
      bool                    pause_claims = false;

      fee_bps_type            base_fee_bps = PARI_DEFAULT_BASE_FEE_BPS;
      fee_bps_type            min_fee_bps = PARI_DEFAULT_MIN_FEE_BPS;
      fee_bps_type            rollover_fee_step_bps = PARI_DEFAULT_ROLLOVER_FEE_STEP_BPS;
      uint64_t                cutoff_ticks = PARI_DEFAULT_CUTOFF_TICKS;
      uint8_t                 primary_rollover_number = PARI_DEFAULT_PRIMARY_ROLLOVER_NUMBER;

      vector<tier_settings>   tiers;

      time_point_sec          started_at;
      epoch_type              started_epoch = 0;

      optional<tier_settings> get_tier( const tier_id_type tier_id )const;
      tier_settings&          get_tier_ref( const tier_id_type tier_id );
      bool                    is_tier_active( const tier_id_type tier_id )const;

      /** fee bounds, cutoff, rollover number, authority and tier table consistency */
      void                    validate()const;

      void sanity_check( const chain_interface& )const;
      static osettings_record lookup( const chain_interface&, const settings_id_type );
      static void store( chain_interface&, const settings_id_type, const settings_record& );
      static void remove( chain_interface&, const settings_id_type );
   };

   class settings_db_interface
   {
      friend struct settings_record;

      virtual osettings_record settings_lookup_by_id( const settings_id_type )const = 0;
      virtual void settings_insert_into_id_map( const settings_id_type, const settings_record& ) = 0;
      virtual void settings_erase_from_id_map( const settings_id_type ) = 0;
   };

} } // pari::chain

FC_REFLECT( pari::chain::tier_settings, (tier_id)(active)(min_stake)(max_stake) )
FC_REFLECT( pari::chain::settings_record,
        (id)
        (authority)
        (fee_vault)
        (pause_staking)
        (pause_claims)
        (base_fee_bps)
        (min_fee_bps)
        (rollover_fee_step_bps)
        (cutoff_ticks)
        (primary_rollover_number)
        (tiers)
        (started_at)
        (started_epoch)
        )
