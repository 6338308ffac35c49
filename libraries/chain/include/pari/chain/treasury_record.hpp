#pragma once

#include <pari/chain/types.hpp>

namespace pari { namespace chain {

   typedef uint8_t treasury_id_type;

   struct treasury_record;
   typedef fc::optional<treasury_record> otreasury_record;

   class chain_interface;

   /**
    *  Custody of every staked value until it is paid out or taken as fee.
    *  The counters only ever grow.
    */
   struct treasury_record
   {
      treasury_id_type   id = PARI_GLOBAL_TREASURY_ID;
      share_type         custody_balance = 0;
      share_type         total_in = 0;
      share_type         total_out = 0;
      share_type         total_fees_withdrawn = 0;

      void               deposit( const share_type amount );
      /** throws insufficient_treasury_balance when custody does not cover @p amount */
      void               pay_out( const share_type amount );
      void               withdraw_fee( const share_type amount );

      void sanity_check( const chain_interface& )const;
      static otreasury_record lookup( const chain_interface&, const treasury_id_type );
      static void store( chain_interface&, const treasury_id_type, const treasury_record& );
      static void remove( chain_interface&, const treasury_id_type );
   };

   class treasury_db_interface
   {
      friend struct treasury_record;

      virtual otreasury_record treasury_lookup_by_id( const treasury_id_type )const = 0;
      virtual void treasury_insert_into_id_map( const treasury_id_type, const treasury_record& ) = 0;
      virtual void treasury_erase_from_id_map( const treasury_id_type ) = 0;
   };

} } // pari::chain

FC_REFLECT( pari::chain::treasury_record,
        (id)
        (custody_balance)
        (total_in)
        (total_out)
        (total_fees_withdrawn)
        )
