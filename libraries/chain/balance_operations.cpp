#include <pari/chain/balance_operations.hpp>
#include <pari/chain/exceptions.hpp>
#include <pari/chain/pending_chain_state.hpp>
#include <pari/chain/transaction_evaluation_state.hpp>

namespace pari { namespace chain {

   void deposit_operation::evaluate( transaction_evaluation_state& eval_state )const
   { try {
      if( amount == 0 )
         FC_CAPTURE_AND_THROW( invalid_amount, (amount) );

      // the authority attests that the funds arrived in custody
      eval_state.require_authority();

      pending_chain_state& state = *eval_state.pending_state();
      const obalance_record current = state.get_balance_record( owner );
      balance_record record = current.valid() ? *current : balance_record( owner, 0 );
      record.credit( amount );
      record.last_update = state.now();

      state.store_balance_record( record );
   } FC_CAPTURE_AND_RETHROW( (*this) ) }

   void withdraw_operation::evaluate( transaction_evaluation_state& eval_state )const
   { try {
      if( amount == 0 )
         FC_CAPTURE_AND_THROW( invalid_amount, (amount) );

      eval_state.require_signature( owner );

      pending_chain_state& state = *eval_state.pending_state();
      obalance_record record = state.get_balance_record( owner );
      if( !record.valid() )
         FC_CAPTURE_AND_THROW( insufficient_funds, (owner)(amount) );

      record->debit( amount );
      record->last_update = state.now();

      state.store_balance_record( *record );
   } FC_CAPTURE_AND_RETHROW( (*this) ) }

} } // pari::chain
