#include <pari/chain/exceptions.hpp>
#include <pari/chain/merkle.hpp>

#include <cstring>

namespace pari { namespace chain {

   namespace detail
   {
      template<typename T>
      void write_le( fc::sha256::encoder& enc, T value )
      {
         char bytes[sizeof( T )];
         for( size_t i = 0; i < sizeof( T ); ++i )
         {
            bytes[i] = char( value & 0xff );
            value = T( value >> 8 );
         }
         enc.write( bytes, sizeof( T ) );
      }

      vector<digest_type> next_level( const vector<digest_type>& level )
      {
         vector<digest_type> parents;
         parents.reserve( (level.size() + 1) / 2 );
         for( size_t i = 0; i < level.size(); i += 2 )
         {
            const digest_type& left = level[i];
            const digest_type& right = (i + 1 < level.size()) ? level[i + 1] : level[i];
            parents.push_back( hash_merkle_pair( left, right ) );
         }
         return parents;
      }
   }

   digest_type claim_leaf::digest()const
   {
      static const char tag[] = PARI_CLAIM_LEAF_TAG;

      fc::sha256::encoder enc;
      enc.write( tag, sizeof( tag ) - 1 );
      detail::write_le<uint64_t>( enc, epoch );
      detail::write_le<uint8_t>( enc, tier );
      detail::write_le<uint32_t>( enc, index );
      enc.write( claimer.data(), claimer.data_size() );
      detail::write_le<uint64_t>( enc, amount );
      detail::write_le<uint16_t>( enc, selection_mask );
      return enc.result();
   }

   digest_type hash_merkle_pair( const digest_type& left, const digest_type& right )
   {
      fc::sha256::encoder enc;
      enc.write( left.data(), left.data_size() );
      enc.write( right.data(), right.data_size() );
      return enc.result();
   }

   bool verify_merkle_proof( const digest_type& leaf,
                             const vector<digest_type>& proof,
                             const digest_type& root,
                             uint32_t index )
   {
      digest_type computed = leaf;
      for( const digest_type& sibling : proof )
      {
         if( index % 2 == 0 )
            computed = hash_merkle_pair( computed, sibling );
         else
            computed = hash_merkle_pair( sibling, computed );
         index /= 2;
      }
      return computed == root;
   }

   digest_type compute_merkle_root( const vector<digest_type>& leaves )
   { try {
      FC_ASSERT( !leaves.empty(), "cannot build a merkle tree without leaves" );

      vector<digest_type> level = leaves;
      while( level.size() > 1 )
         level = detail::next_level( level );
      return level.front();
   } FC_CAPTURE_AND_RETHROW( (leaves.size()) ) }

   vector<digest_type> build_merkle_proof( const vector<digest_type>& leaves, const uint32_t index )
   { try {
      FC_ASSERT( index < leaves.size(), "leaf index out of range" );

      vector<digest_type> proof;
      vector<digest_type> level = leaves;
      size_t position = index;
      while( level.size() > 1 )
      {
         const size_t sibling = (position % 2 == 0) ? position + 1 : position - 1;
         proof.push_back( sibling < level.size() ? level[sibling] : level[position] );
         level = detail::next_level( level );
         position /= 2;
      }
      return proof;
   } FC_CAPTURE_AND_RETHROW( (leaves.size())(index) ) }

} } // pari::chain
