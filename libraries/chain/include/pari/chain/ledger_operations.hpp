#pragma once

#include <pari/chain/operations.hpp>
#include <pari/chain/types.hpp>

namespace pari { namespace chain {

   /** authority only: opens a Processing ledger for a concluded epoch */
   struct init_ledger_operation
   {
      static const operation_type_enum type;

      epoch_type     epoch = 0;
      tier_id_type   tier = 0;
      uint8_t        winning_number = 0;
      tick_type      rng_tick = 0;
      digest_type    rng_seed;

      void evaluate( transaction_evaluation_state& eval_state )const;
   };

   /** authority only: restarts off-core processing of a ledger that is not yet Resolved */
   struct reprocess_ledger_operation
   {
      static const operation_type_enum type;

      epoch_type     epoch = 0;
      tier_id_type   tier = 0;

      void evaluate( transaction_evaluation_state& eval_state )const;
   };

   /**
    *  authority only: commits the resolver's result.  The proposed fee and net
    *  pool are checked against the values recomputed from the pool.
    */
   struct finalize_ledger_operation
   {
      static const operation_type_enum type;

      epoch_type             epoch = 0;
      tier_id_type           tier = 0;
      share_type             proposed_fee = 0;
      share_type             proposed_net = 0;
      uint32_t               total_winners = 0;
      digest_type            merkle_root;
      results_pointer_type   results_pointer = make_results_pointer( string() );

      void evaluate( transaction_evaluation_state& eval_state )const;
   };

   /**
    *  authority only: creates a Resolved ledger with no winners in one step
    *  and carries the whole pool into the next epoch.
    */
   struct rollover_ledger_operation
   {
      static const operation_type_enum type;

      epoch_type     epoch = 0;
      tier_id_type   tier = 0;
      uint8_t        winning_number = 0;
      tick_type      rng_tick = 0;
      digest_type    rng_seed;

      void evaluate( transaction_evaluation_state& eval_state )const;
   };

   /** authority only: drops a Resolved ledger */
   struct close_ledger_operation
   {
      static const operation_type_enum type;

      epoch_type     epoch = 0;
      tier_id_type   tier = 0;

      void evaluate( transaction_evaluation_state& eval_state )const;
   };

} } // pari::chain

FC_REFLECT( pari::chain::init_ledger_operation, (epoch)(tier)(winning_number)(rng_tick)(rng_seed) )
FC_REFLECT( pari::chain::reprocess_ledger_operation, (epoch)(tier) )
FC_REFLECT( pari::chain::finalize_ledger_operation,
            (epoch)
            (tier)
            (proposed_fee)
            (proposed_net)
            (total_winners)
            (merkle_root)
            (results_pointer)
            )
FC_REFLECT( pari::chain::rollover_ledger_operation, (epoch)(tier)(winning_number)(rng_tick)(rng_seed) )
FC_REFLECT( pari::chain::close_ledger_operation, (epoch)(tier) )
