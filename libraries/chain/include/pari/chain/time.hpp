#pragma once

#include <pari/chain/types.hpp>

namespace pari { namespace chain {

   /**
    *  The host's view of "now": a monotonically increasing tick, the epoch
    *  the host believes that tick belongs to, and the wall clock time.
    */
   struct clock_state
   {
      tick_type        tick = 0;
      epoch_type       epoch = 0;
      time_point_sec   timestamp;
   };

   /** Maps ticks to fixed length epochs */
   struct epoch_schedule
   {
      epoch_schedule(){}
      explicit epoch_schedule( const uint64_t ticks ):ticks_per_epoch( ticks ){}

      uint64_t         ticks_per_epoch = PARI_DEFAULT_TICKS_PER_EPOCH;

      epoch_type       get_epoch( const tick_type tick )const;
      tick_type        get_first_tick_in_epoch( const epoch_type epoch )const;
      tick_type        get_last_tick_in_epoch( const epoch_type epoch )const;

      /** ticks left in @p epoch after @p tick, 0 once the epoch is over */
      uint64_t         remaining_ticks_in_epoch( const epoch_type epoch, const tick_type tick )const;
   };

   /**
    *  Staking is open while more than @p cutoff_ticks remain in the pool's
    *  epoch.  When the schedule places @p clock in a different epoch than
    *  the host reported, the skew is logged and staking stays open.
    */
   bool is_staking_open( const epoch_schedule& schedule, const clock_state& clock, const uint64_t cutoff_ticks );

} } // pari::chain

FC_REFLECT( pari::chain::clock_state, (tick)(epoch)(timestamp) )
FC_REFLECT( pari::chain::epoch_schedule, (ticks_per_epoch) )
