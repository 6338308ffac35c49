#include <pari/chain/balance_record.hpp>
#include <pari/chain/chain_interface.hpp>
#include <pari/chain/checked_math.hpp>
#include <pari/chain/exceptions.hpp>

namespace pari { namespace chain {

   void balance_record::credit( const share_type amount )
   { try {
      balance = checked_add( balance, amount );
   } FC_CAPTURE_AND_RETHROW( (amount) ) }

   void balance_record::debit( const share_type amount )
   { try {
      if( balance < amount )
         FC_CAPTURE_AND_THROW( insufficient_funds, (owner)(balance)(amount) );
      balance -= amount;
   } FC_CAPTURE_AND_RETHROW( (amount) ) }

   void balance_record::sanity_check( const chain_interface& db )const
   { try {
      FC_ASSERT( owner != address_type() );
   } FC_CAPTURE_AND_RETHROW( (*this) ) }

   obalance_record balance_record::lookup( const chain_interface& db, const address_type& owner )
   { try {
      return db.balance_lookup_by_owner( owner );
   } FC_CAPTURE_AND_RETHROW( (owner) ) }

   void balance_record::store( chain_interface& db, const address_type& owner, const balance_record& record )
   { try {
      db.balance_insert_into_owner_map( owner, record );
   } FC_CAPTURE_AND_RETHROW( (owner)(record) ) }

   void balance_record::remove( chain_interface& db, const address_type& owner )
   { try {
      const obalance_record prev_record = db.lookup<balance_record>( owner );
      if( prev_record.valid() )
         db.balance_erase_from_owner_map( owner );
   } FC_CAPTURE_AND_RETHROW( (owner) ) }

} } // pari::chain
