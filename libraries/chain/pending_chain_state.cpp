#include <pari/chain/exceptions.hpp>
#include <pari/chain/pending_chain_state.hpp>

namespace pari { namespace chain {

   pending_chain_state::pending_chain_state( chain_interface_ptr prev_state )
   : _prev_state( prev_state )
   {
   }

   void pending_chain_state::set_prev_state( chain_interface_ptr prev_state )
   {
      _prev_state = prev_state;
   }

   clock_state pending_chain_state::get_clock()const
   {
      const chain_interface_ptr prev_state = _prev_state.lock();
      FC_ASSERT( prev_state );
      return prev_state->get_clock();
   }

   epoch_schedule pending_chain_state::get_epoch_schedule()const
   {
      const chain_interface_ptr prev_state = _prev_state.lock();
      FC_ASSERT( prev_state );
      return prev_state->get_epoch_schedule();
   }

   void pending_chain_state::apply_changes()const
   {
      chain_interface_ptr prev_state = _prev_state.lock();
      if( !prev_state ) return;

      apply_records( prev_state, _settings_id_to_record, _settings_id_remove );
      apply_records( prev_state, _treasury_id_to_record, _treasury_id_remove );
      apply_records( prev_state, _balance_owner_to_record, _balance_owner_remove );
      apply_records( prev_state, _pool_tier_to_record, _pool_tier_remove );
      apply_records( prev_state, _prediction_index_to_record, _prediction_index_remove );
      apply_records( prev_state, _ledger_index_to_record, _ledger_index_remove );
   }

   void pending_chain_state::from_variant( const fc::variant& v )
   {
      fc::from_variant( v, *this );
   }

   fc::variant pending_chain_state::to_variant()const
   {
      fc::variant v;
      fc::to_variant( *this, v );
      return v;
   }

   osettings_record pending_chain_state::settings_lookup_by_id( const settings_id_type id )const
   {
       const auto iter = _settings_id_to_record.find( id );
       if( iter != _settings_id_to_record.end() ) return iter->second;
       if( _settings_id_remove.count( id ) > 0 ) return osettings_record();
       const chain_interface_ptr prev_state = _prev_state.lock();
       if( !prev_state ) return osettings_record();
       return prev_state->lookup<settings_record>( id );
   }

   void pending_chain_state::settings_insert_into_id_map( const settings_id_type id, const settings_record& record )
   {
       _settings_id_remove.erase( id );
       _settings_id_to_record[ id ] = record;
   }

   void pending_chain_state::settings_erase_from_id_map( const settings_id_type id )
   {
       _settings_id_to_record.erase( id );
       _settings_id_remove.insert( id );
   }

   otreasury_record pending_chain_state::treasury_lookup_by_id( const treasury_id_type id )const
   {
       const auto iter = _treasury_id_to_record.find( id );
       if( iter != _treasury_id_to_record.end() ) return iter->second;
       if( _treasury_id_remove.count( id ) > 0 ) return otreasury_record();
       const chain_interface_ptr prev_state = _prev_state.lock();
       if( !prev_state ) return otreasury_record();
       return prev_state->lookup<treasury_record>( id );
   }

   void pending_chain_state::treasury_insert_into_id_map( const treasury_id_type id, const treasury_record& record )
   {
       _treasury_id_remove.erase( id );
       _treasury_id_to_record[ id ] = record;
   }

   void pending_chain_state::treasury_erase_from_id_map( const treasury_id_type id )
   {
       _treasury_id_to_record.erase( id );
       _treasury_id_remove.insert( id );
   }

   obalance_record pending_chain_state::balance_lookup_by_owner( const address_type& owner )const
   {
       const auto iter = _balance_owner_to_record.find( owner );
       if( iter != _balance_owner_to_record.end() ) return iter->second;
       if( _balance_owner_remove.count( owner ) > 0 ) return obalance_record();
       const chain_interface_ptr prev_state = _prev_state.lock();
       if( !prev_state ) return obalance_record();
       return prev_state->lookup<balance_record>( owner );
   }

   void pending_chain_state::balance_insert_into_owner_map( const address_type& owner, const balance_record& record )
   {
       _balance_owner_remove.erase( owner );
       _balance_owner_to_record[ owner ] = record;
   }

   void pending_chain_state::balance_erase_from_owner_map( const address_type& owner )
   {
       _balance_owner_to_record.erase( owner );
       _balance_owner_remove.insert( owner );
   }

   opool_record pending_chain_state::pool_lookup_by_tier( const tier_id_type tier )const
   {
       const auto iter = _pool_tier_to_record.find( tier );
       if( iter != _pool_tier_to_record.end() ) return iter->second;
       if( _pool_tier_remove.count( tier ) > 0 ) return opool_record();
       const chain_interface_ptr prev_state = _prev_state.lock();
       if( !prev_state ) return opool_record();
       return prev_state->lookup<pool_record>( tier );
   }

   void pending_chain_state::pool_insert_into_tier_map( const tier_id_type tier, const pool_record& record )
   {
       _pool_tier_remove.erase( tier );
       _pool_tier_to_record[ tier ] = record;
   }

   void pending_chain_state::pool_erase_from_tier_map( const tier_id_type tier )
   {
       _pool_tier_to_record.erase( tier );
       _pool_tier_remove.insert( tier );
   }

   oprediction_record pending_chain_state::prediction_lookup_by_index( const prediction_index& index )const
   {
       const auto iter = _prediction_index_to_record.find( index );
       if( iter != _prediction_index_to_record.end() ) return iter->second;
       if( _prediction_index_remove.count( index ) > 0 ) return oprediction_record();
       const chain_interface_ptr prev_state = _prev_state.lock();
       if( !prev_state ) return oprediction_record();
       return prev_state->lookup<prediction_record>( index );
   }

   void pending_chain_state::prediction_insert_into_index_map( const prediction_index& index, const prediction_record& record )
   {
       _prediction_index_remove.erase( index );
       _prediction_index_to_record[ index ] = record;
   }

   void pending_chain_state::prediction_erase_from_index_map( const prediction_index& index )
   {
       _prediction_index_to_record.erase( index );
       _prediction_index_remove.insert( index );
   }

   oledger_record pending_chain_state::ledger_lookup_by_index( const ledger_index& index )const
   {
       const auto iter = _ledger_index_to_record.find( index );
       if( iter != _ledger_index_to_record.end() ) return iter->second;
       if( _ledger_index_remove.count( index ) > 0 ) return oledger_record();
       const chain_interface_ptr prev_state = _prev_state.lock();
       if( !prev_state ) return oledger_record();
       return prev_state->lookup<ledger_record>( index );
   }

   void pending_chain_state::ledger_insert_into_index_map( const ledger_index& index, const ledger_record& record )
   {
       _ledger_index_remove.erase( index );
       _ledger_index_to_record[ index ] = record;
   }

   void pending_chain_state::ledger_erase_from_index_map( const ledger_index& index )
   {
       _ledger_index_to_record.erase( index );
       _ledger_index_remove.insert( index );
   }

} } // pari::chain
