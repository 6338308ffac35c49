#include <pari/chain/exceptions.hpp>
#include <pari/chain/operation_factory.hpp>
#include <pari/chain/pending_chain_state.hpp>
#include <pari/chain/transaction_evaluation_state.hpp>

namespace pari { namespace chain {

   bool transaction_evaluation_state::check_signature( const address_type& a )const
   { try {
      return _skip_signature_check || signed_addresses.find( a ) != signed_addresses.end();
   } FC_CAPTURE_AND_RETHROW( (a) ) }

   void transaction_evaluation_state::require_signature( const address_type& a )const
   { try {
      if( !check_signature( a ) )
         FC_CAPTURE_AND_THROW( missing_signature, (a) );
   } FC_CAPTURE_AND_RETHROW( (a) ) }

   settings_record transaction_evaluation_state::require_authority()const
   { try {
      const settings_record settings = pending_state()->get_settings();
      if( !check_signature( settings.authority ) )
         FC_CAPTURE_AND_THROW( missing_signature, (settings.authority) );
      return settings;
   } FC_CAPTURE_AND_RETHROW() }

   void transaction_evaluation_state::evaluate( const signed_transaction& trx_arg )
   { try {
      trx = trx_arg;
      try {
        if( trx_arg.operations.empty() )
           FC_THROW_EXCEPTION( evaluation_error, "transaction has no operations" );

        if( !_skip_signature_check )
        {
           for( const auto& signer : trx_arg.signers )
              signed_addresses.insert( signer );
        }

        _current_op_index = 0;
        for( const auto& op : trx_arg.operations )
        {
           evaluate_operation( op );
           ++_current_op_index;
        }
      }
      catch ( const fc::exception& e )
      {
         validation_error = e;
         throw;
      }
   } FC_CAPTURE_AND_RETHROW( (trx_arg) ) }

   void transaction_evaluation_state::evaluate_operation( const operation& op )
   { try {
      operation_factory::instance().evaluate( *this, op );
   } FC_CAPTURE_AND_RETHROW( (op)(_current_op_index) ) }

} } // pari::chain
