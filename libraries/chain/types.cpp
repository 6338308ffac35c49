#include <pari/chain/exceptions.hpp>
#include <pari/chain/types.hpp>

#include <cstring>

namespace pari { namespace chain {

   address_type make_address( const string& owner_name )
   { try {
      FC_ASSERT( !owner_name.empty() );
      return fc::ripemd160::hash( owner_name.c_str(), owner_name.size() );
   } FC_CAPTURE_AND_RETHROW( (owner_name) ) }

   results_pointer_type make_results_pointer( const string& uri )
   { try {
      FC_ASSERT( uri.size() <= PARI_RESULTS_POINTER_SIZE, "results pointer too long", ("size",uri.size()) );
      results_pointer_type pointer;
      memset( pointer.data, 0, sizeof( pointer.data ) );
      memcpy( pointer.data, uri.c_str(), uri.size() );
      return pointer;
   } FC_CAPTURE_AND_RETHROW( (uri) ) }

   string results_pointer_to_string( const results_pointer_type& pointer )
   {
      size_t len = 0;
      while( len < PARI_RESULTS_POINTER_SIZE && pointer.data[len] != 0 ) ++len;
      return string( pointer.data, len );
   }

   bool is_empty_results_pointer( const results_pointer_type& pointer )
   {
      for( size_t i = 0; i < PARI_RESULTS_POINTER_SIZE; ++i )
         if( pointer.data[i] != 0 ) return false;
      return true;
   }

   per_number_values zero_per_number_values()
   {
      per_number_values values;
      for( size_t i = 0; i < PARI_NUMBER_COUNT; ++i ) values.data[i] = 0;
      return values;
   }

   per_number_counts zero_per_number_counts()
   {
      per_number_counts counts;
      for( size_t i = 0; i < PARI_NUMBER_COUNT; ++i ) counts.data[i] = 0;
      return counts;
   }

} } // pari::chain
