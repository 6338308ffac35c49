#include <pari/chain/checked_math.hpp>
#include <pari/chain/claim_operations.hpp>
#include <pari/chain/exceptions.hpp>
#include <pari/chain/merkle.hpp>
#include <pari/chain/pending_chain_state.hpp>
#include <pari/chain/transaction_evaluation_state.hpp>

#include <fc/log/logger.hpp>

namespace pari { namespace chain {

   void claim_operation::evaluate( transaction_evaluation_state& eval_state )const
   { try {
      eval_state.require_signature( claimer );

      if( proof.size() > PARI_MAX_PROOF_DEPTH )
         FC_CAPTURE_AND_THROW( proof_too_long, (proof.size()) );

      pending_chain_state& state = *eval_state.pending_state();
      const settings_record settings = state.get_settings();
      if( settings.pause_claims )
         FC_CAPTURE_AND_THROW( claims_paused, (epoch)(tier) );

      const ledger_index index_key( epoch, tier );
      oledger_record ledger = state.get_ledger_record( index_key );
      if( !ledger.valid() )
         FC_CAPTURE_AND_THROW( unknown_ledger, (index_key) );
      if( !ledger->is_resolved() )
         FC_CAPTURE_AND_THROW( ledger_not_resolved, (ledger->status) );
      if( ledger->index.epoch != epoch )
         FC_CAPTURE_AND_THROW( epoch_mismatch, (ledger->index.epoch)(epoch) );
      if( ledger->index.tier != tier )
         FC_CAPTURE_AND_THROW( tier_mismatch, (ledger->index.tier)(tier) );

      if( amount == 0 )
         FC_CAPTURE_AND_THROW( invalid_amount, (amount) );
      if( ledger->total_winners == 0 )
         FC_CAPTURE_AND_THROW( claim_not_allowed, (ledger->total_winners) );
      if( index >= ledger->total_winners )
         FC_CAPTURE_AND_THROW( invalid_claim_index, (index)(ledger->total_winners) );
      if( ledger->claimed_winners >= ledger->total_winners )
         FC_CAPTURE_AND_THROW( too_many_claims, (ledger->claimed_winners)(ledger->total_winners) );

      claim_bitmap bitmap = ledger->get_claim_bitmap();
      if( bitmap.size() != claim_bitmap::bytes_for_winners( ledger->total_winners ) )
         FC_CAPTURE_AND_THROW( invalid_bitmap_length, (bitmap.size())(ledger->total_winners) );
      if( bitmap.is_claimed( index ) )
         FC_CAPTURE_AND_THROW( already_claimed, (index_key)(index) );

      const prediction_index prediction_key( claimer, ledger->chain_start_epoch, tier );
      oprediction_record prediction = state.get_prediction_record( prediction_key );
      if( !prediction.valid() )
         FC_CAPTURE_AND_THROW( unknown_prediction, (prediction_key) );

      prediction->check_invariant();
      prediction->check_mask();
      if( prediction->claimed )
         FC_CAPTURE_AND_THROW( already_claimed, (prediction_key) );

      claim_leaf leaf;
      leaf.epoch = epoch;
      leaf.tier = tier;
      leaf.index = index;
      leaf.claimer = claimer;
      leaf.amount = amount;
      leaf.selection_mask = prediction->numbers.mask;

      if( ledger->merkle_root == digest_type() )
         FC_CAPTURE_AND_THROW( empty_merkle_root, (index_key) );
      if( !verify_merkle_proof( leaf.digest(), proof, ledger->merkle_root, index ) )
         FC_CAPTURE_AND_THROW( invalid_merkle_proof, (leaf)(proof)(ledger->merkle_root) );

      if( amount > ledger->remaining_prize_pool() )
         FC_CAPTURE_AND_THROW( insufficient_prize_pool, (amount)(ledger->net_prize_pool)(ledger->claimed_value) );

      treasury_record treasury = state.get_treasury();
      treasury.pay_out( amount );

      const obalance_record current_balance = state.get_balance_record( claimer );
      balance_record balance = current_balance.valid() ? *current_balance : balance_record( claimer, 0 );
      balance.credit( amount );
      balance.last_update = state.now();

      bitmap.set_claimed( index );
      ledger->claim_bitmap_bytes = bitmap.bytes();
      ledger->claimed_value = checked_add( ledger->claimed_value, amount );
      ledger->claimed_winners = checked_add<uint32_t>( ledger->claimed_winners, 1 );

      prediction->claimed = true;
      prediction->claimed_at = state.now();
      prediction->last_update = state.now();

      state.store_treasury( treasury );
      state.store_balance_record( balance );
      state.store_ledger_record( *ledger );
      state.store_prediction_record( *prediction );

      ilog( "claim paid: ledger ${e}/${t} index ${i} amount ${a}", ("e",epoch)("t",tier)("i",index)("a",amount) );
   } FC_CAPTURE_AND_RETHROW( (*this) ) }

} } // pari::chain
