#pragma once

#include <pari/chain/operations.hpp>
#include <pari/chain/types.hpp>

namespace pari { namespace chain {

   /**
    *  Pays @ref amount to @ref claimer for winner slot @ref index of the
    *  ledger (epoch, tier).  The leaf is rebuilt from these fields and the
    *  claimer's stored selection mask, then checked against the ledger's
    *  Merkle root with @ref proof.
    */
   struct claim_operation
   {
      static const operation_type_enum type;

      address_type          claimer;
      epoch_type            epoch = 0;
      tier_id_type          tier = 0;
      uint32_t              index = 0;
      share_type            amount = 0;
      vector<digest_type>   proof;

      void evaluate( transaction_evaluation_state& eval_state )const;
   };

} } // pari::chain

FC_REFLECT( pari::chain::claim_operation, (claimer)(epoch)(tier)(index)(amount)(proof) )
