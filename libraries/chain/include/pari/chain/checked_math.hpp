#pragma once

#include <pari/chain/exceptions.hpp>

#include <limits>

namespace pari { namespace chain {

   /**
    *  Every accumulation of value or count goes through these helpers so that
    *  an overflow aborts the transaction instead of wrapping.
    */
   template<typename T>
   T checked_add( const T a, const T b )
   {
      if( b > std::numeric_limits<T>::max() - a )
         FC_CAPTURE_AND_THROW( addition_overflow, (a)(b) );
      return a + b;
   }

   template<typename T>
   T checked_sub( const T a, const T b )
   {
      if( b > a )
         FC_CAPTURE_AND_THROW( subtraction_underflow, (a)(b) );
      return a - b;
   }

   template<typename T>
   T checked_mul( const T a, const T b )
   {
      if( a != 0 && b > std::numeric_limits<T>::max() / a )
         FC_CAPTURE_AND_THROW( multiplication_overflow, (a)(b) );
      return a * b;
   }

   /** only for counters that are informational, never for value */
   template<typename T>
   T saturating_add( const T a, const T b )
   {
      if( b > std::numeric_limits<T>::max() - a )
         return std::numeric_limits<T>::max();
      return a + b;
   }

} } // pari::chain
