#include <pari/chain/chain_interface.hpp>
#include <pari/chain/checked_math.hpp>
#include <pari/chain/exceptions.hpp>
#include <pari/chain/treasury_record.hpp>

namespace pari { namespace chain {

   void treasury_record::deposit( const share_type amount )
   { try {
      custody_balance = checked_add( custody_balance, amount );
      total_in = checked_add( total_in, amount );
   } FC_CAPTURE_AND_RETHROW( (amount) ) }

   void treasury_record::pay_out( const share_type amount )
   { try {
      if( custody_balance < amount )
         FC_CAPTURE_AND_THROW( insufficient_treasury_balance, (custody_balance)(amount) );
      custody_balance -= amount;
      total_out = checked_add( total_out, amount );
   } FC_CAPTURE_AND_RETHROW( (amount) ) }

   void treasury_record::withdraw_fee( const share_type amount )
   { try {
      if( custody_balance < amount )
         FC_CAPTURE_AND_THROW( insufficient_treasury_balance, (custody_balance)(amount) );
      custody_balance -= amount;
      total_fees_withdrawn = checked_add( total_fees_withdrawn, amount );
   } FC_CAPTURE_AND_RETHROW( (amount) ) }

   void treasury_record::sanity_check( const chain_interface& db )const
   { try {
      FC_ASSERT( id == PARI_GLOBAL_TREASURY_ID );
      FC_ASSERT( total_out <= total_in );
      FC_ASSERT( total_fees_withdrawn <= total_in );
   } FC_CAPTURE_AND_RETHROW( (*this) ) }

   otreasury_record treasury_record::lookup( const chain_interface& db, const treasury_id_type id )
   { try {
      return db.treasury_lookup_by_id( id );
   } FC_CAPTURE_AND_RETHROW( (id) ) }

   void treasury_record::store( chain_interface& db, const treasury_id_type id, const treasury_record& record )
   { try {
      db.treasury_insert_into_id_map( id, record );
   } FC_CAPTURE_AND_RETHROW( (id)(record) ) }

   void treasury_record::remove( chain_interface& db, const treasury_id_type id )
   { try {
      const otreasury_record prev_record = db.lookup<treasury_record>( id );
      if( prev_record.valid() )
         db.treasury_erase_from_id_map( id );
   } FC_CAPTURE_AND_RETHROW( (id) ) }

} } // pari::chain
