#include <pari/chain/checked_math.hpp>
#include <pari/chain/time.hpp>

#include <fc/log/logger.hpp>

namespace pari { namespace chain {

   epoch_type epoch_schedule::get_epoch( const tick_type tick )const
   { try {
      FC_ASSERT( ticks_per_epoch > 0 );
      return tick / ticks_per_epoch;
   } FC_CAPTURE_AND_RETHROW( (tick)(ticks_per_epoch) ) }

   tick_type epoch_schedule::get_first_tick_in_epoch( const epoch_type epoch )const
   { try {
      FC_ASSERT( ticks_per_epoch > 0 );
      return checked_mul<uint64_t>( epoch, ticks_per_epoch );
   } FC_CAPTURE_AND_RETHROW( (epoch)(ticks_per_epoch) ) }

   tick_type epoch_schedule::get_last_tick_in_epoch( const epoch_type epoch )const
   { try {
      return checked_add<uint64_t>( get_first_tick_in_epoch( epoch ), ticks_per_epoch - 1 );
   } FC_CAPTURE_AND_RETHROW( (epoch) ) }

   uint64_t epoch_schedule::remaining_ticks_in_epoch( const epoch_type epoch, const tick_type tick )const
   { try {
      const tick_type last = get_last_tick_in_epoch( epoch );
      if( tick >= last ) return 0;
      return last - tick;
   } FC_CAPTURE_AND_RETHROW( (epoch)(tick) ) }

   bool is_staking_open( const epoch_schedule& schedule, const clock_state& clock, const uint64_t cutoff_ticks )
   { try {
      const epoch_type scheduled_epoch = schedule.get_epoch( clock.tick );
      if( scheduled_epoch != clock.epoch )
      {
         wlog( "epoch schedule disagrees with clock, allowing stake: scheduled ${s} clock ${c} tick ${t}",
               ("s",scheduled_epoch)("c",clock.epoch)("t",clock.tick) );
         return true;
      }
      return schedule.remaining_ticks_in_epoch( clock.epoch, clock.tick ) > cutoff_ticks;
   } FC_CAPTURE_AND_RETHROW( (clock)(cutoff_ticks) ) }

} } // pari::chain
