#pragma once

#include <pari/chain/claim_bitmap.hpp>
#include <pari/chain/types.hpp>

#include <tuple>

namespace pari { namespace chain {

   enum ledger_status_enum
   {
      failed_status      = 0,
      processing_status  = 1,
      resolved_status    = 2
   };

   enum rollover_reason_enum
   {
      no_rollover            = 0,
      no_winners_rollover    = 1,
      rollover_number_hit    = 2
   };

   struct ledger_index
   {
      ledger_index(){}
      ledger_index( const epoch_type e, const tier_id_type t ):epoch(e),tier(t){}

      epoch_type     epoch = 0;
      tier_id_type   tier = 0;

      friend bool operator < ( const ledger_index& a, const ledger_index& b )
      {
         return std::tie( a.epoch, a.tier ) < std::tie( b.epoch, b.tier );
      }

      friend bool operator == ( const ledger_index& a, const ledger_index& b )
      {
         return std::tie( a.epoch, a.tier ) == std::tie( b.epoch, b.tier );
      }
   };

   struct ledger_record;
   typedef fc::optional<ledger_record> oledger_record;

   class chain_interface;

   /**
    *  The settlement of one concluded epoch of one tier.  Created exactly
    *  once, either Processing (then finalized to Resolved) or directly
    *  Resolved by a rollover.  Once Resolved only the claim counters and the
    *  claim bitmap change.
    */
   struct ledger_record
   {
      ledger_index                                 index;
      uint8_t                                      version = PARI_LEDGER_RECORD_VERSION;
      epoch_type                                   chain_start_epoch = 0;

      fc::enum_type<uint8_t,ledger_status_enum>    status = processing_status;
      uint8_t                                      winning_number = 0;
      tick_type                                    rng_tick = 0;
      digest_type                                  rng_seed;
      uint8_t                                      attempt_count = 0;
      tick_type                                    last_update_tick = 0;
      time_point_sec                               last_update;

      uint32_t                                     total_count = 0;
      uint32_t                                     carried_count = 0;
      share_type                                   carry_in_value = 0;
      share_type                                   carry_out_value = 0;
      share_type                                   protocol_fee = 0;
      fee_bps_type                                 fee_bps = 0;
      share_type                                   net_prize_pool = 0;

      uint32_t                                     total_winners = 0;
      uint32_t                                     claimed_winners = 0;
      share_type                                   claimed_value = 0;
      time_point_sec                               resolved_at;

      digest_type                                  merkle_root;
      results_pointer_type                         results_pointer = make_results_pointer( string() );
      vector<char>                                 claim_bitmap_bytes;

      fc::enum_type<uint8_t,rollover_reason_enum>  rollover_reason = no_rollover;
      uint8_t                                      blocked_number = 0;

      bool           is_processing()const { return status == processing_status; }
      bool           is_resolved()const { return status == resolved_status; }

      claim_bitmap   get_claim_bitmap()const { return claim_bitmap( claim_bitmap_bytes ); }

      /** what is left of the prize pool after the claims paid so far */
      share_type     remaining_prize_pool()const;

      void sanity_check( const chain_interface& )const;
      static oledger_record lookup( const chain_interface&, const ledger_index& );
      static void store( chain_interface&, const ledger_index&, const ledger_record& );
      static void remove( chain_interface&, const ledger_index& );
   };

   class ledger_db_interface
   {
      friend struct ledger_record;

      virtual oledger_record ledger_lookup_by_index( const ledger_index& )const = 0;
      virtual void ledger_insert_into_index_map( const ledger_index&, const ledger_record& ) = 0;
      virtual void ledger_erase_from_index_map( const ledger_index& ) = 0;
   };

} } // pari::chain

FC_REFLECT_ENUM( pari::chain::ledger_status_enum,
        (failed_status)
        (processing_status)
        (resolved_status)
        )
FC_REFLECT_ENUM( pari::chain::rollover_reason_enum,
        (no_rollover)
        (no_winners_rollover)
        (rollover_number_hit)
        )
FC_REFLECT( pari::chain::ledger_index, (epoch)(tier) )
FC_REFLECT( pari::chain::ledger_record,
        (index)
        (version)
        (chain_start_epoch)
        (status)
        (winning_number)
        (rng_tick)
        (rng_seed)
        (attempt_count)
        (last_update_tick)
        (last_update)
        (total_count)
        (carried_count)
        (carry_in_value)
        (carry_out_value)
        (protocol_fee)
        (fee_bps)
        (net_prize_pool)
        (total_winners)
        (claimed_winners)
        (claimed_value)
        (resolved_at)
        (merkle_root)
        (results_pointer)
        (claim_bitmap_bytes)
        (rollover_reason)
        (blocked_number)
        )
