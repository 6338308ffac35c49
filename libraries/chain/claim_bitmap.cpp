#include <pari/chain/claim_bitmap.hpp>
#include <pari/chain/exceptions.hpp>

namespace pari { namespace chain {

   uint32_t claim_bitmap::bytes_for_winners( const uint32_t total_winners )
   { try {
      if( total_winners > PARI_MAX_WINNERS_PER_LEDGER )
         FC_CAPTURE_AND_THROW( too_many_winners, (total_winners) );
      return (total_winners + 7) / 8;
   } FC_CAPTURE_AND_RETHROW( (total_winners) ) }

   claim_bitmap claim_bitmap::for_winners( const uint32_t total_winners )
   {
      return claim_bitmap( vector<char>( bytes_for_winners( total_winners ), 0 ) );
   }

   bool claim_bitmap::is_claimed( const uint32_t index )const
   {
      const size_t byte_index = index / 8;
      const uint8_t bit = uint8_t( 1 ) << (index % 8);
      if( byte_index >= _bytes.size() )
         return true;
      return (uint8_t( _bytes[byte_index] ) & bit) != 0;
   }

   void claim_bitmap::set_claimed( const uint32_t index )
   {
      const size_t byte_index = index / 8;
      const uint8_t bit = uint8_t( 1 ) << (index % 8);
      if( byte_index < _bytes.size() )
         _bytes[byte_index] = char( uint8_t( _bytes[byte_index] ) | bit );
   }

   uint32_t claim_bitmap::claimed_count()const
   {
      uint32_t total = 0;
      for( const char c : _bytes )
      {
         uint8_t byte = uint8_t( c );
         while( byte != 0 )
         {
            total += byte & 1;
            byte >>= 1;
         }
      }
      return total;
   }

} } // pari::chain
