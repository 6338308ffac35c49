#pragma once

#include <pari/chain/operations.hpp>
#include <pari/chain/types.hpp>

namespace pari { namespace chain {

   /** authority only: credits value the host has received on behalf of @ref owner */
   struct deposit_operation
   {
      static const operation_type_enum type;

      deposit_operation(){}
      deposit_operation( const address_type& o, const share_type a ):owner(o),amount(a){}

      address_type   owner;
      share_type     amount = 0;

      void evaluate( transaction_evaluation_state& eval_state )const;
   };

   struct withdraw_operation
   {
      static const operation_type_enum type;

      withdraw_operation(){}
      withdraw_operation( const address_type& o, const share_type a ):owner(o),amount(a){}

      address_type   owner;
      share_type     amount = 0;

      void evaluate( transaction_evaluation_state& eval_state )const;
   };

} } // pari::chain

FC_REFLECT( pari::chain::deposit_operation, (owner)(amount) )
FC_REFLECT( pari::chain::withdraw_operation, (owner)(amount) )
