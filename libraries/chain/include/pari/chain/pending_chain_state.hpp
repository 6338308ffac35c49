#pragma once

#include <pari/chain/chain_interface.hpp>

#include <fc/reflect/reflect.hpp>

namespace pari { namespace chain {

   /**
    *  Stages every write of a transaction on top of a parent state.  Reads
    *  fall through to the parent for keys that were neither written nor
    *  removed here; nothing reaches the parent until apply_changes().
    */
   class pending_chain_state : public chain_interface, public std::enable_shared_from_this<pending_chain_state>
   {
      public:
                                        pending_chain_state( chain_interface_ptr prev_state = chain_interface_ptr() );

         void                           set_prev_state( chain_interface_ptr prev_state );

         virtual clock_state            get_clock()const override;
         virtual epoch_schedule         get_epoch_schedule()const override;

         void                           apply_changes()const;

         template<typename T, typename U>
         void apply_records( const chain_interface_ptr& prev_state, const T& store_map, const U& remove_set )const
         {
             using V = typename T::mapped_type;
             for( const auto& key : remove_set ) prev_state->remove<V>( key );
             for( const auto& item : store_map ) prev_state->store( item.first, item.second );
         }

         void                           from_variant( const variant& v );
         variant                        to_variant()const;

         map<settings_id_type, settings_record>                             _settings_id_to_record;
         set<settings_id_type>                                              _settings_id_remove;

         map<treasury_id_type, treasury_record>                             _treasury_id_to_record;
         set<treasury_id_type>                                              _treasury_id_remove;

         map<address_type, balance_record>                                  _balance_owner_to_record;
         set<address_type>                                                  _balance_owner_remove;

         map<tier_id_type, pool_record>                                     _pool_tier_to_record;
         set<tier_id_type>                                                  _pool_tier_remove;

         map<prediction_index, prediction_record>                           _prediction_index_to_record;
         set<prediction_index>                                              _prediction_index_remove;

         map<ledger_index, ledger_record>                                   _ledger_index_to_record;
         set<ledger_index>                                                  _ledger_index_remove;

      private:
         // Not serialized
         std::weak_ptr<chain_interface>                                     _prev_state;

         virtual osettings_record settings_lookup_by_id( const settings_id_type )const override;
         virtual void settings_insert_into_id_map( const settings_id_type, const settings_record& )override;
         virtual void settings_erase_from_id_map( const settings_id_type )override;

         virtual otreasury_record treasury_lookup_by_id( const treasury_id_type )const override;
         virtual void treasury_insert_into_id_map( const treasury_id_type, const treasury_record& )override;
         virtual void treasury_erase_from_id_map( const treasury_id_type )override;

         virtual obalance_record balance_lookup_by_owner( const address_type& )const override;
         virtual void balance_insert_into_owner_map( const address_type&, const balance_record& )override;
         virtual void balance_erase_from_owner_map( const address_type& )override;

         virtual opool_record pool_lookup_by_tier( const tier_id_type )const override;
         virtual void pool_insert_into_tier_map( const tier_id_type, const pool_record& )override;
         virtual void pool_erase_from_tier_map( const tier_id_type )override;

         virtual oprediction_record prediction_lookup_by_index( const prediction_index& )const override;
         virtual void prediction_insert_into_index_map( const prediction_index&, const prediction_record& )override;
         virtual void prediction_erase_from_index_map( const prediction_index& )override;

         virtual oledger_record ledger_lookup_by_index( const ledger_index& )const override;
         virtual void ledger_insert_into_index_map( const ledger_index&, const ledger_record& )override;
         virtual void ledger_erase_from_index_map( const ledger_index& )override;
   };
   typedef std::shared_ptr<pending_chain_state> pending_chain_state_ptr;

} } // pari::chain

FC_REFLECT( pari::chain::pending_chain_state,
            (_settings_id_to_record)
            (_settings_id_remove)
            (_treasury_id_to_record)
            (_treasury_id_remove)
            (_balance_owner_to_record)
            (_balance_owner_remove)
            (_pool_tier_to_record)
            (_pool_tier_remove)
            (_prediction_index_to_record)
            (_prediction_index_remove)
            (_ledger_index_to_record)
            (_ledger_index_remove)
            )
