#pragma once

#include <pari/chain/selection.hpp>
#include <pari/chain/types.hpp>

namespace pari { namespace chain {

   /** carry state handed from a concluded epoch to the next */
   struct pool_carry
   {
      share_type          value = 0;
      uint32_t            count = 0;
      per_number_values   value_per_number = zero_per_number_values();
      per_number_counts   count_per_number = zero_per_number_counts();

      bool is_carry()const { return value > 0 || count > 0; }
   };

   struct pool_record;
   typedef fc::optional<pool_record> opool_record;

   class chain_interface;

   /**
    *  The open staking pool of one tier.  There is exactly one per tier; it
    *  accumulates stakes for its epoch and is reset in place when the epoch
    *  is settled, either starting a new chain or carrying forward.
    */
   struct pool_record
   {
      tier_id_type        tier = 0;
      epoch_type          epoch = 0;
      epoch_type          chain_start_epoch = 0;

      share_type          total_value = 0;
      uint32_t            total_count = 0;
      share_type          carried_value = 0;
      uint32_t            carried_count = 0;

      per_number_values   value_per_number = zero_per_number_values();
      per_number_counts   count_per_number = zero_per_number_counts();

      uint64_t            cutoff_ticks = PARI_DEFAULT_CUTOFF_TICKS;
      uint8_t             times_carried = 0;
      uint8_t             blocked_number = 0;
      fee_bps_type        fee_bps = PARI_DEFAULT_BASE_FEE_BPS;

      /** a fresh chain at @p start_epoch with nothing staked and no blocked number */
      static pool_record  open_new_chain( const tier_id_type tier, const epoch_type start_epoch,
                                          const uint64_t cutoff_ticks, const fee_bps_type fee_bps );

      /** value, count and carry all zero */
      bool                is_empty()const;
      bool                has_activity()const { return total_count > 0 && total_value > 0; }

      /** adds @p amount to every selected number, or retracts it */
      void                apply_value( const vector<uint8_t>& numbers, const share_type amount );
      void                retract_value( const vector<uint8_t>& numbers, const share_type amount );

      void                increment_counts( const vector<uint8_t>& numbers );
      void                decrement_counts( const vector<uint8_t>& numbers );

      /** snapshot of the pool as a carry into the next epoch */
      pool_carry          as_carry()const;

      /**
       *  Moves the pool to @p next_epoch.  A non-zero carry continues the
       *  chain with the carried totals and the blocked number unchanged,
       *  otherwise a new chain starts with @p next_blocked_number.
       */
      void                reset_for_next_epoch( const epoch_type next_epoch,
                                                const uint64_t next_cutoff_ticks,
                                                const pool_carry& carry,
                                                const uint8_t next_blocked_number,
                                                const fee_bps_type next_fee_bps );

      void sanity_check( const chain_interface& )const;
      static opool_record lookup( const chain_interface&, const tier_id_type );
      static void store( chain_interface&, const tier_id_type, const pool_record& );
      static void remove( chain_interface&, const tier_id_type );
   };

   class pool_db_interface
   {
      friend struct pool_record;

      virtual opool_record pool_lookup_by_tier( const tier_id_type )const = 0;
      virtual void pool_insert_into_tier_map( const tier_id_type, const pool_record& ) = 0;
      virtual void pool_erase_from_tier_map( const tier_id_type ) = 0;
   };

} } // pari::chain

FC_REFLECT( pari::chain::pool_carry, (value)(count)(value_per_number)(count_per_number) )
FC_REFLECT( pari::chain::pool_record,
        (tier)
        (epoch)
        (chain_start_epoch)
        (total_value)
        (total_count)
        (carried_value)
        (carried_count)
        (value_per_number)
        (count_per_number)
        (cutoff_ticks)
        (times_carried)
        (blocked_number)
        (fee_bps)
        )
