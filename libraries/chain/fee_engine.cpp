#include <pari/chain/checked_math.hpp>
#include <pari/chain/exceptions.hpp>
#include <pari/chain/fee_engine.hpp>

#include <fc/uint128.hpp>

#include <algorithm>

namespace pari { namespace chain {

   share_type compute_fee( const share_type gross, const fee_bps_type fee_bps )
   { try {
      if( fee_bps > PARI_FEE_BPS_DENOM )
         FC_CAPTURE_AND_THROW( invalid_fee, (fee_bps) );

      const fc::uint128 numerator = fc::uint128( gross ) * fc::uint128( uint64_t( fee_bps ) );
      return (numerator / fc::uint128( PARI_FEE_BPS_DENOM )).to_uint64();
   } FC_CAPTURE_AND_RETHROW( (gross)(fee_bps) ) }

   fee_breakdown compute_fee_breakdown( const share_type gross, const fee_bps_type fee_bps, const bool has_winners )
   { try {
      fee_breakdown result;
      result.gross = gross;
      result.fee_bps = fee_bps;
      if( has_winners )
      {
         result.fee = compute_fee( gross, fee_bps );
         result.net = checked_sub( gross, result.fee );
      }
      else
      {
         result.fee = 0;
         result.net = gross;
      }
      return result;
   } FC_CAPTURE_AND_RETHROW( (gross)(fee_bps)(has_winners) ) }

   fee_bps_type next_fee_bps_on_rollover( const fee_bps_type current_fee_bps,
                                          const fee_bps_type rollover_step_bps,
                                          const fee_bps_type min_fee_bps )
   {
      if( rollover_step_bps == 0 )
         return std::max( current_fee_bps, min_fee_bps );

      const fee_bps_type current = std::max( current_fee_bps, min_fee_bps );
      const fee_bps_type decreased = current > rollover_step_bps ? fee_bps_type( current - rollover_step_bps ) : 0;
      return std::max( decreased, min_fee_bps );
   }

   fee_bps_type next_fee_bps_on_carry( const fee_bps_type current_fee_bps, const fee_bps_type min_fee_bps )
   {
      return std::max( current_fee_bps, min_fee_bps );
   }

   uint8_t next_blocked_number( const uint8_t winning_number, const uint8_t current_blocked_number )
   {
      if( winning_number == 0 || winning_number == current_blocked_number )
         return current_blocked_number;
      return winning_number;
   }

} } // pari::chain
