#include <pari/chain/chain_interface.hpp>
#include <pari/chain/checked_math.hpp>
#include <pari/chain/exceptions.hpp>
#include <pari/chain/prediction_record.hpp>

namespace pari { namespace chain {

   share_type prediction_record::expected_total()const
   { try {
      return checked_mul<share_type>( value_per_number, numbers.count );
   } FC_CAPTURE_AND_RETHROW( (value_per_number)(numbers) ) }

   void prediction_record::check_invariant()const
   { try {
      if( numbers.count < 1 || numbers.count > PARI_MAX_SELECTIONS || numbers.count != numbers.numbers.size() )
         FC_CAPTURE_AND_THROW( prediction_invariant_violated, (numbers) );

      if( total_value != expected_total() )
         FC_CAPTURE_AND_THROW( prediction_invariant_violated, (total_value)(value_per_number)(numbers.count) );
   } FC_CAPTURE_AND_RETHROW( (index) ) }

   void prediction_record::check_mask()const
   { try {
      if( numbers.compute_mask() != numbers.mask )
         FC_CAPTURE_AND_THROW( prediction_invariant_violated, (numbers) );
   } FC_CAPTURE_AND_RETHROW( (index) ) }

   void prediction_record::sanity_check( const chain_interface& db )const
   { try {
      FC_ASSERT( index.tier >= 1 && index.tier <= PARI_NUM_TIERS );
      FC_ASSERT( index.chain_start_epoch <= placed_epoch );
      FC_ASSERT( value_per_number > 0 );
      numbers.validate();
      check_invariant();
      FC_ASSERT( !claimed || claimed_at >= placed_at );
   } FC_CAPTURE_AND_RETHROW( (*this) ) }

   oprediction_record prediction_record::lookup( const chain_interface& db, const prediction_index& index )
   { try {
      return db.prediction_lookup_by_index( index );
   } FC_CAPTURE_AND_RETHROW( (index) ) }

   void prediction_record::store( chain_interface& db, const prediction_index& index, const prediction_record& record )
   { try {
      db.prediction_insert_into_index_map( index, record );
   } FC_CAPTURE_AND_RETHROW( (index)(record) ) }

   void prediction_record::remove( chain_interface& db, const prediction_index& index )
   { try {
      const oprediction_record prev_record = db.lookup<prediction_record>( index );
      if( prev_record.valid() )
         db.prediction_erase_from_index_map( index );
   } FC_CAPTURE_AND_RETHROW( (index) ) }

} } // pari::chain
