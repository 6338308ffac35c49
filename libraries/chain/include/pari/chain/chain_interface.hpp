#pragma once

#include <pari/chain/balance_record.hpp>
#include <pari/chain/ledger_record.hpp>
#include <pari/chain/pool_record.hpp>
#include <pari/chain/prediction_record.hpp>
#include <pari/chain/settings_record.hpp>
#include <pari/chain/time.hpp>
#include <pari/chain/treasury_record.hpp>
#include <pari/chain/types.hpp>

namespace pari { namespace chain {

   class chain_interface
   : public settings_db_interface,
     public treasury_db_interface,
     public balance_db_interface,
     public pool_db_interface,
     public prediction_db_interface,
     public ledger_db_interface
   {
      public:
         virtual ~chain_interface(){};

         virtual clock_state                get_clock()const = 0;
         virtual epoch_schedule             get_epoch_schedule()const = 0;

         time_point_sec                     now()const { return get_clock().timestamp; }
         epoch_type                         get_current_epoch()const { return get_clock().epoch; }

         /** throws unless settings have been stored by genesis */
         settings_record                    get_settings()const;
         void                               store_settings( const settings_record& record );

         treasury_record                    get_treasury()const;
         void                               store_treasury( const treasury_record& record );

         obalance_record                    get_balance_record( const address_type& owner )const;
         share_type                         get_balance( const address_type& owner )const;
         void                               store_balance_record( const balance_record& record );

         opool_record                       get_pool_record( const tier_id_type tier )const;
         void                               store_pool_record( const pool_record& record );

         oprediction_record                 get_prediction_record( const prediction_index& index )const;
         void                               store_prediction_record( const prediction_record& record );

         oledger_record                     get_ledger_record( const ledger_index& index )const;
         void                               store_ledger_record( const ledger_record& record );

         template<typename T, typename U>
         optional<T> lookup( const U& key )const
         { try {
             return T::lookup( *this, key );
         } FC_CAPTURE_AND_RETHROW( (key) ) }

         template<typename T, typename U>
         void store( const U& key, const T& record )
         { try {
#ifdef PARI_SANITY_CHECKS
             record.sanity_check( *this );
#endif
             T::store( *this, key, record );
         } FC_CAPTURE_AND_RETHROW( (key)(record) ) }

         template<typename T, typename U>
         void remove( const U& key )
         { try {
             T::remove( *this, key );
         } FC_CAPTURE_AND_RETHROW( (key) ) }
   };
   typedef std::shared_ptr<chain_interface> chain_interface_ptr;

} } // pari::chain
