#include <pari/chain/chain_interface.hpp>
#include <pari/chain/checked_math.hpp>
#include <pari/chain/exceptions.hpp>
#include <pari/chain/pool_record.hpp>

namespace pari { namespace chain {

   namespace
   {
      size_t checked_number_index( const uint8_t number )
      {
         if( number < PARI_MIN_SELECTABLE_NUMBER || number > PARI_MAX_SELECTABLE_NUMBER )
            FC_CAPTURE_AND_THROW( invalid_selection, (number) );
         return number;
      }
   }

   pool_record pool_record::open_new_chain( const tier_id_type tier, const epoch_type start_epoch,
                                            const uint64_t cutoff_ticks, const fee_bps_type fee_bps )
   {
      pool_record record;
      record.tier = tier;
      record.epoch = start_epoch;
      record.chain_start_epoch = start_epoch;
      record.cutoff_ticks = cutoff_ticks;
      record.times_carried = 0;
      record.blocked_number = 0;
      record.fee_bps = fee_bps;
      return record;
   }

   bool pool_record::is_empty()const
   {
      return total_value == 0 && total_count == 0 && carried_value == 0 && carried_count == 0;
   }

   void pool_record::apply_value( const vector<uint8_t>& numbers, const share_type amount )
   { try {
      if( amount == 0 )
         FC_CAPTURE_AND_THROW( invalid_amount, (amount) );
      if( numbers.empty() || numbers.size() > PARI_MAX_SELECTIONS )
         FC_CAPTURE_AND_THROW( invalid_selection, (numbers) );

      for( const uint8_t number : numbers )
      {
         const size_t n = checked_number_index( number );
         value_per_number.data[n] = checked_add( value_per_number.data[n], amount );
      }
   } FC_CAPTURE_AND_RETHROW( (numbers)(amount) ) }

   void pool_record::retract_value( const vector<uint8_t>& numbers, const share_type amount )
   { try {
      if( amount == 0 )
         FC_CAPTURE_AND_THROW( invalid_amount, (amount) );
      if( numbers.empty() || numbers.size() > PARI_MAX_SELECTIONS )
         FC_CAPTURE_AND_THROW( invalid_selection, (numbers) );

      for( const uint8_t number : numbers )
      {
         const size_t n = checked_number_index( number );
         if( value_per_number.data[n] < amount )
            FC_CAPTURE_AND_THROW( invalid_pool_state, (number)(amount)(value_per_number.data[n]) );
         value_per_number.data[n] -= amount;
      }
   } FC_CAPTURE_AND_RETHROW( (numbers)(amount) ) }

   void pool_record::increment_counts( const vector<uint8_t>& numbers )
   { try {
      for( const uint8_t number : numbers )
      {
         const size_t n = checked_number_index( number );
         count_per_number.data[n] = checked_add<uint32_t>( count_per_number.data[n], 1 );
      }
   } FC_CAPTURE_AND_RETHROW( (numbers) ) }

   void pool_record::decrement_counts( const vector<uint8_t>& numbers )
   { try {
      for( const uint8_t number : numbers )
      {
         const size_t n = checked_number_index( number );
         if( count_per_number.data[n] < 1 )
            FC_CAPTURE_AND_THROW( invalid_pool_state, (number)(count_per_number.data[n]) );
         count_per_number.data[n] -= 1;
      }
   } FC_CAPTURE_AND_RETHROW( (numbers) ) }

   pool_carry pool_record::as_carry()const
   {
      pool_carry carry;
      carry.value = total_value;
      carry.count = total_count;
      carry.value_per_number = value_per_number;
      carry.count_per_number = count_per_number;
      return carry;
   }

   void pool_record::reset_for_next_epoch( const epoch_type next_epoch,
                                           const uint64_t next_cutoff_ticks,
                                           const pool_carry& carry,
                                           const uint8_t next_blocked_number,
                                           const fee_bps_type next_fee_bps )
   { try {
      if( next_epoch <= epoch )
         FC_CAPTURE_AND_THROW( epoch_not_advanced, (epoch)(next_epoch) );

      epoch = next_epoch;
      cutoff_ticks = next_cutoff_ticks;
      fee_bps = next_fee_bps;

      if( carry.is_carry() )
      {
         total_value = carry.value;
         carried_value = carry.value;
         total_count = carry.count;
         carried_count = carry.count;
         value_per_number = carry.value_per_number;
         count_per_number = carry.count_per_number;

         times_carried = saturating_add<uint8_t>( times_carried, 1 );
      }
      else
      {
         chain_start_epoch = next_epoch;
         times_carried = 0;
         total_value = 0;
         carried_value = 0;
         total_count = 0;
         carried_count = 0;
         value_per_number = zero_per_number_values();
         count_per_number = zero_per_number_counts();
         blocked_number = next_blocked_number;
      }
   } FC_CAPTURE_AND_RETHROW( (next_epoch)(next_cutoff_ticks)(carry)(next_blocked_number)(next_fee_bps) ) }

   void pool_record::sanity_check( const chain_interface& db )const
   { try {
      FC_ASSERT( tier >= 1 && tier <= PARI_NUM_TIERS );
      FC_ASSERT( chain_start_epoch <= epoch );
      FC_ASSERT( blocked_number <= PARI_MAX_SELECTABLE_NUMBER );
      FC_ASSERT( fee_bps <= PARI_FEE_BPS_DENOM );
      FC_ASSERT( carried_value <= total_value );
      FC_ASSERT( carried_count <= total_count );

      share_type value_sum = 0;
      uint64_t count_sum = 0;
      for( size_t n = 0; n < PARI_NUMBER_COUNT; ++n )
      {
         value_sum = checked_add( value_sum, value_per_number.data[n] );
         count_sum += count_per_number.data[n];
      }
      FC_ASSERT( value_sum == total_value, "per number values must sum to the pool total",
                 ("value_sum",value_sum)("total_value",total_value) );
      FC_ASSERT( count_sum >= total_count && count_sum <= uint64_t( total_count ) * PARI_MAX_SELECTIONS,
                 "per number counts must cover every stake", ("count_sum",count_sum)("total_count",total_count) );
   } FC_CAPTURE_AND_RETHROW( (*this) ) }

   opool_record pool_record::lookup( const chain_interface& db, const tier_id_type tier )
   { try {
      return db.pool_lookup_by_tier( tier );
   } FC_CAPTURE_AND_RETHROW( (tier) ) }

   void pool_record::store( chain_interface& db, const tier_id_type tier, const pool_record& record )
   { try {
      db.pool_insert_into_tier_map( tier, record );
   } FC_CAPTURE_AND_RETHROW( (tier)(record) ) }

   void pool_record::remove( chain_interface& db, const tier_id_type tier )
   { try {
      const opool_record prev_record = db.lookup<pool_record>( tier );
      if( prev_record.valid() )
         db.pool_erase_from_tier_map( tier );
   } FC_CAPTURE_AND_RETHROW( (tier) ) }

} } // pari::chain
