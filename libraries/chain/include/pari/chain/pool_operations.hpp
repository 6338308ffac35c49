#pragma once

#include <pari/chain/operations.hpp>
#include <pari/chain/types.hpp>

namespace pari { namespace chain {

   /** authority only: activates @ref tier and opens its pool at the current epoch */
   struct open_pool_operation
   {
      static const operation_type_enum type;

      open_pool_operation(){}
      explicit open_pool_operation( const tier_id_type t ):tier(t){}

      tier_id_type   tier = 0;

      void evaluate( transaction_evaluation_state& eval_state )const;
   };

   /** authority only: restarts an empty pool as a new chain with a blocked number */
   struct reset_pool_operation
   {
      static const operation_type_enum type;

      reset_pool_operation(){}
      reset_pool_operation( const tier_id_type t, const uint8_t b ):tier(t),blocked_number(b){}

      tier_id_type   tier = 0;
      uint8_t        blocked_number = 0;

      void evaluate( transaction_evaluation_state& eval_state )const;
   };

   /** authority only: removes a pool without stakes and deactivates its tier */
   struct close_pool_operation
   {
      static const operation_type_enum type;

      close_pool_operation(){}
      explicit close_pool_operation( const tier_id_type t ):tier(t){}

      tier_id_type   tier = 0;

      void evaluate( transaction_evaluation_state& eval_state )const;
   };

} } // pari::chain

FC_REFLECT( pari::chain::open_pool_operation, (tier) )
FC_REFLECT( pari::chain::reset_pool_operation, (tier)(blocked_number) )
FC_REFLECT( pari::chain::close_pool_operation, (tier) )
