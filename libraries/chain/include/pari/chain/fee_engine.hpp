#pragma once

#include <pari/chain/types.hpp>

namespace pari { namespace chain {

   struct fee_breakdown
   {
      share_type    gross = 0;
      share_type    fee = 0;
      share_type    net = 0;
      fee_bps_type  fee_bps = 0;
   };

   /** floor( gross * fee_bps / 10000 ) computed in 128 bits */
   share_type compute_fee( const share_type gross, const fee_bps_type fee_bps );

   /**
    *  Splits the gross pool.  With no winners the whole pool carries and no
    *  fee is charged.
    */
   fee_breakdown compute_fee_breakdown( const share_type gross, const fee_bps_type fee_bps, const bool has_winners );

   /**
    *  Fee rate after a rollover caused by hitting the rollover number:
    *  max( min, max( current, min ) - step ), never below @p min_fee_bps.
    */
   fee_bps_type next_fee_bps_on_rollover( const fee_bps_type current_fee_bps,
                                          const fee_bps_type rollover_step_bps,
                                          const fee_bps_type min_fee_bps );

   /** Fee rate after a carry caused by nobody staking the winning number */
   fee_bps_type next_fee_bps_on_carry( const fee_bps_type current_fee_bps, const fee_bps_type min_fee_bps );

   /**
    *  The winning number becomes the new blocked number unless it is 0 or
    *  already the blocked number.
    */
   uint8_t next_blocked_number( const uint8_t winning_number, const uint8_t current_blocked_number );

} } // pari::chain

FC_REFLECT( pari::chain::fee_breakdown, (gross)(fee)(net)(fee_bps) )
