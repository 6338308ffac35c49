#include <pari/chain/chain_interface.hpp>
#include <pari/chain/exceptions.hpp>
#include <pari/chain/settings_record.hpp>

namespace pari { namespace chain {

   optional<tier_settings> settings_record::get_tier( const tier_id_type tier_id )const
   {
      for( const tier_settings& tier : tiers )
      {
         if( tier.tier_id == tier_id )
            return tier;
      }
      return optional<tier_settings>();
   }

   tier_settings& settings_record::get_tier_ref( const tier_id_type tier_id )
   { try {
      for( tier_settings& tier : tiers )
      {
         if( tier.tier_id == tier_id )
            return tier;
      }
      FC_CAPTURE_AND_THROW( unknown_tier, (tier_id) );
   } FC_CAPTURE_AND_RETHROW( (tier_id) ) }

   bool settings_record::is_tier_active( const tier_id_type tier_id )const
   {
      const optional<tier_settings> tier = get_tier( tier_id );
      return tier.valid() && tier->active;
   }

   void settings_record::validate()const
   { try {
      if( authority == address_type() )
         FC_CAPTURE_AND_THROW( invalid_authority_target, (authority) );
      if( fee_vault == address_type() )
         FC_CAPTURE_AND_THROW( invalid_fee_vault, (fee_vault) );
      if( authority == fee_vault )
         FC_CAPTURE_AND_THROW( invalid_fee_vault, (authority)(fee_vault) );

      if( base_fee_bps > PARI_FEE_BPS_DENOM || min_fee_bps > PARI_FEE_BPS_DENOM || rollover_fee_step_bps > PARI_FEE_BPS_DENOM )
         FC_CAPTURE_AND_THROW( invalid_settings, (base_fee_bps)(min_fee_bps)(rollover_fee_step_bps) );
      if( min_fee_bps > base_fee_bps )
         FC_CAPTURE_AND_THROW( invalid_settings, (min_fee_bps)(base_fee_bps) );
      if( rollover_fee_step_bps > base_fee_bps )
         FC_CAPTURE_AND_THROW( invalid_settings, (rollover_fee_step_bps)(base_fee_bps) );

      if( cutoff_ticks <= PARI_MIN_CUTOFF_TICKS )
         FC_CAPTURE_AND_THROW( invalid_settings, (cutoff_ticks) );

      if( primary_rollover_number > PARI_MAX_SELECTABLE_NUMBER )
         FC_CAPTURE_AND_THROW( invalid_rollover_number, (primary_rollover_number) );

      if( tiers.size() > PARI_NUM_TIERS )
         FC_CAPTURE_AND_THROW( invalid_settings, (tiers) );

      set<tier_id_type> seen;
      for( const tier_settings& tier : tiers )
      {
         if( tier.tier_id < 1 || tier.tier_id > PARI_NUM_TIERS || !seen.insert( tier.tier_id ).second )
            FC_CAPTURE_AND_THROW( unknown_tier, (tier) );
         if( tier.active && tier.min_stake >= tier.max_stake )
            FC_CAPTURE_AND_THROW( invalid_settings, (tier) );
      }
   } FC_CAPTURE_AND_RETHROW( (*this) ) }

   void settings_record::sanity_check( const chain_interface& db )const
   { try {
      FC_ASSERT( id == PARI_SETTINGS_ID );
      validate();
   } FC_CAPTURE_AND_RETHROW( (*this) ) }

   osettings_record settings_record::lookup( const chain_interface& db, const settings_id_type id )
   { try {
      return db.settings_lookup_by_id( id );
   } FC_CAPTURE_AND_RETHROW( (id) ) }

   void settings_record::store( chain_interface& db, const settings_id_type id, const settings_record& record )
   { try {
      db.settings_insert_into_id_map( id, record );
   } FC_CAPTURE_AND_RETHROW( (id)(record) ) }

   void settings_record::remove( chain_interface& db, const settings_id_type id )
   { try {
      const osettings_record prev_record = db.lookup<settings_record>( id );
      if( prev_record.valid() )
         db.settings_erase_from_id_map( id );
   } FC_CAPTURE_AND_RETHROW( (id) ) }

} } // pari::chain
