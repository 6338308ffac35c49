#pragma once

#include <pari/chain/types.hpp>

namespace pari { namespace chain {

   struct balance_record;
   typedef fc::optional<balance_record> obalance_record;

   class chain_interface;

   /** spendable value held for one address outside of any pool */
   struct balance_record
   {
      balance_record(){}
      balance_record( const address_type& o, const share_type b ):owner(o),balance(b){}

      address_type       owner;
      share_type         balance = 0;
      time_point_sec     last_update;

      void               credit( const share_type amount );
      /** throws insufficient_funds when the balance does not cover @p amount */
      void               debit( const share_type amount );

      void sanity_check( const chain_interface& )const;
      static obalance_record lookup( const chain_interface&, const address_type& );
      static void store( chain_interface&, const address_type&, const balance_record& );
      static void remove( chain_interface&, const address_type& );
   };

   class balance_db_interface
   {
      friend struct balance_record;

      virtual obalance_record balance_lookup_by_owner( const address_type& )const = 0;
      virtual void balance_insert_into_owner_map( const address_type&, const balance_record& ) = 0;
      virtual void balance_erase_from_owner_map( const address_type& ) = 0;
   };

} } // pari::chain

FC_REFLECT( pari::chain::balance_record, (owner)(balance)(last_update) )
