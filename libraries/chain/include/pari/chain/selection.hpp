#pragma once

#include <pari/chain/types.hpp>

namespace pari { namespace chain {

   enum prediction_type_enum
   {
      single_number_prediction   = 0,
      two_numbers_prediction     = 1,
      high_low_prediction        = 2,
      even_odd_prediction        = 3,
      multi_number_prediction    = 4
   };

   /**
    *  The canonical form of a player's choice: the selected numbers in
    *  ascending order together with the bitmask (bit n set iff n selected).
    *  The mask is the source of truth for equality, the ordered list is what
    *  gets stored and hashed.
    */
   struct selection
   {
      uint8_t                count = 0;
      vector<uint8_t>        numbers;
      selection_mask_type    mask = 0;

      /** appends one number, enforcing range, uniqueness and the size bound */
      void                   push_back( const uint8_t number, const uint8_t blocked_number );

      bool                   contains( const uint8_t number )const;
      selection_mask_type    compute_mask()const;

      /** throws invalid_selection unless count, list and mask agree */
      void                   validate()const;

      friend bool operator == ( const selection& a, const selection& b )
      {
         return a.mask == b.mask;
      }
      friend bool operator != ( const selection& a, const selection& b )
      {
         return !(a == b);
      }
   };

   /**
    *  Maps (prediction type, choice, blocked number) to a canonical selection.
    *
    *  Digit modes read the decimal digits of @p choice as the selected numbers
    *  (37 => {3,7}).  Derived modes treat @p choice as 0 (low/even) or
    *  1 (high/odd) over the 8 numbers of 1..9 that are not blocked.
    *
    *  @throws invalid_selection on any violated rule, no partial result is returned
    */
   selection derive_selection( const prediction_type_enum type, const uint32_t choice, const uint8_t blocked_number );

   selection decode_choice_digits( const uint32_t choice, const uint8_t blocked_number );

   /** 1..9 minus the blocked number, ascending */
   vector<uint8_t> eligible_numbers( const uint8_t blocked_number );

} } // pari::chain

FC_REFLECT_ENUM( pari::chain::prediction_type_enum,
        (single_number_prediction)
        (two_numbers_prediction)
        (high_low_prediction)
        (even_odd_prediction)
        (multi_number_prediction)
        )
FC_REFLECT( pari::chain::selection,
        (count)
        (numbers)
        (mask)
        )
