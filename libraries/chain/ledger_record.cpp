#include <pari/chain/chain_interface.hpp>
#include <pari/chain/exceptions.hpp>
#include <pari/chain/ledger_record.hpp>

namespace pari { namespace chain {

   share_type ledger_record::remaining_prize_pool()const
   {
      if( claimed_value >= net_prize_pool ) return 0;
      return net_prize_pool - claimed_value;
   }

   void ledger_record::sanity_check( const chain_interface& db )const
   { try {
      FC_ASSERT( index.tier >= 1 && index.tier <= PARI_NUM_TIERS );
      FC_ASSERT( chain_start_epoch <= index.epoch );
      FC_ASSERT( winning_number < PARI_NUMBER_COUNT );
      FC_ASSERT( attempt_count >= 1 );
      FC_ASSERT( claimed_winners <= total_winners );
      FC_ASSERT( claimed_value <= net_prize_pool );
      FC_ASSERT( total_winners <= PARI_MAX_WINNERS_PER_LEDGER );
      if( is_resolved() )
      {
         FC_ASSERT( claim_bitmap_bytes.size() == claim_bitmap::bytes_for_winners( total_winners ) );
         FC_ASSERT( total_winners > 0 || protocol_fee == 0 );
      }
   } FC_CAPTURE_AND_RETHROW( (*this) ) }

   oledger_record ledger_record::lookup( const chain_interface& db, const ledger_index& index )
   { try {
      return db.ledger_lookup_by_index( index );
   } FC_CAPTURE_AND_RETHROW( (index) ) }

   void ledger_record::store( chain_interface& db, const ledger_index& index, const ledger_record& record )
   { try {
      db.ledger_insert_into_index_map( index, record );
   } FC_CAPTURE_AND_RETHROW( (index)(record) ) }

   void ledger_record::remove( chain_interface& db, const ledger_index& index )
   { try {
      const oledger_record prev_record = db.lookup<ledger_record>( index );
      if( prev_record.valid() )
         db.ledger_erase_from_index_map( index );
   } FC_CAPTURE_AND_RETHROW( (index) ) }

} } // pari::chain
