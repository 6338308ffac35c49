#pragma once

#include <pari/chain/types.hpp>

namespace pari { namespace chain {

   /**
    *  @class claim_bitmap
    *
    *  One bit per winner index, stored as ceil(winners/8) bytes.  Index N
    *  lives at byte N/8, bit N%8.  Reading an index whose byte is outside
    *  the allocation reports it as already claimed so that it can never be
    *  paid; writing such an index does nothing.
    */
   class claim_bitmap
   {
      public:
         claim_bitmap(){}
         explicit claim_bitmap( const vector<char>& bytes ):_bytes( bytes ){}

         /** bytes needed for @p total_winners, throws too_many_winners past the cap */
         static uint32_t       bytes_for_winners( const uint32_t total_winners );
         static claim_bitmap   for_winners( const uint32_t total_winners );

         bool                  is_claimed( const uint32_t index )const;
         void                  set_claimed( const uint32_t index );

         uint32_t              claimed_count()const;
         size_t                size()const { return _bytes.size(); }
         const vector<char>&   bytes()const { return _bytes; }

      private:
         vector<char>          _bytes;
   };

} } // pari::chain
