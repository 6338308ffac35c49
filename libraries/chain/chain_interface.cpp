#include <pari/chain/chain_interface.hpp>
#include <pari/chain/exceptions.hpp>

namespace pari { namespace chain {

   settings_record chain_interface::get_settings()const
   { try {
      const osettings_record record = lookup<settings_record>( settings_id_type( PARI_SETTINGS_ID ) );
      if( !record.valid() )
         FC_THROW_EXCEPTION( database_not_open, "settings have not been initialized" );
      return *record;
   } FC_CAPTURE_AND_RETHROW() }

   void chain_interface::store_settings( const settings_record& record )
   { try {
      store( record.id, record );
   } FC_CAPTURE_AND_RETHROW( (record) ) }

   treasury_record chain_interface::get_treasury()const
   { try {
      const otreasury_record record = lookup<treasury_record>( treasury_id_type( PARI_GLOBAL_TREASURY_ID ) );
      if( !record.valid() )
         FC_THROW_EXCEPTION( database_not_open, "treasury has not been initialized" );
      return *record;
   } FC_CAPTURE_AND_RETHROW() }

   void chain_interface::store_treasury( const treasury_record& record )
   { try {
      store( record.id, record );
   } FC_CAPTURE_AND_RETHROW( (record) ) }

   obalance_record chain_interface::get_balance_record( const address_type& owner )const
   { try {
      return lookup<balance_record>( owner );
   } FC_CAPTURE_AND_RETHROW( (owner) ) }

   share_type chain_interface::get_balance( const address_type& owner )const
   { try {
      const obalance_record record = get_balance_record( owner );
      if( !record.valid() ) return 0;
      return record->balance;
   } FC_CAPTURE_AND_RETHROW( (owner) ) }

   void chain_interface::store_balance_record( const balance_record& record )
   { try {
      store( record.owner, record );
   } FC_CAPTURE_AND_RETHROW( (record) ) }

   opool_record chain_interface::get_pool_record( const tier_id_type tier )const
   { try {
      return lookup<pool_record>( tier );
   } FC_CAPTURE_AND_RETHROW( (tier) ) }

   void chain_interface::store_pool_record( const pool_record& record )
   { try {
      store( record.tier, record );
   } FC_CAPTURE_AND_RETHROW( (record) ) }

   oprediction_record chain_interface::get_prediction_record( const prediction_index& index )const
   { try {
      return lookup<prediction_record>( index );
   } FC_CAPTURE_AND_RETHROW( (index) ) }

   void chain_interface::store_prediction_record( const prediction_record& record )
   { try {
      store( record.index, record );
   } FC_CAPTURE_AND_RETHROW( (record) ) }

   oledger_record chain_interface::get_ledger_record( const ledger_index& index )const
   { try {
      return lookup<ledger_record>( index );
   } FC_CAPTURE_AND_RETHROW( (index) ) }

   void chain_interface::store_ledger_record( const ledger_record& record )
   { try {
      store( record.index, record );
   } FC_CAPTURE_AND_RETHROW( (record) ) }

} } // pari::chain
