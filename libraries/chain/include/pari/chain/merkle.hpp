#pragma once

#include <pari/chain/types.hpp>

namespace pari { namespace chain {

   /** the fields a winner commits to, in hashing order */
   struct claim_leaf
   {
      epoch_type            epoch = 0;
      tier_id_type          tier = 0;
      uint32_t              index = 0;
      address_type          claimer;
      share_type            amount = 0;
      selection_mask_type   selection_mask = 0;

      /**
       *  sha256( "PARI_V2" || epoch u64le || tier u8 || index u32le ||
       *          claimer[20] || amount u64le || mask u16le )
       */
      digest_type digest()const;
   };

   digest_type hash_merkle_pair( const digest_type& left, const digest_type& right );

   /**
    *  Walks @p proof from the leaf upwards.  At each level an even index
    *  hashes (computed || sibling), an odd index (sibling || computed), and
    *  the index is halved.
    */
   bool verify_merkle_proof( const digest_type& leaf,
                             const vector<digest_type>& proof,
                             const digest_type& root,
                             uint32_t index );

   /**
    *  Reference tree builder used by resolvers and tests.  A level with an
    *  odd number of nodes pairs its last node with itself.
    */
   digest_type compute_merkle_root( const vector<digest_type>& leaves );
   vector<digest_type> build_merkle_proof( const vector<digest_type>& leaves, const uint32_t index );

} } // pari::chain

FC_REFLECT( pari::chain::claim_leaf, (epoch)(tier)(index)(claimer)(amount)(selection_mask) )
