#include <pari/chain/exceptions.hpp>
#include <pari/chain/selection.hpp>

#include <algorithm>

namespace pari { namespace chain {

   void selection::push_back( const uint8_t number, const uint8_t blocked_number )
   { try {
      if( number < PARI_MIN_SELECTABLE_NUMBER || number > PARI_MAX_SELECTABLE_NUMBER )
         FC_CAPTURE_AND_THROW( invalid_selection, (number) );

      if( number == blocked_number )
         FC_CAPTURE_AND_THROW( invalid_selection, (number)(blocked_number) );

      if( numbers.size() >= PARI_MAX_SELECTIONS )
         FC_CAPTURE_AND_THROW( invalid_selection, (numbers) );

      const selection_mask_type bit = selection_mask_type( 1 ) << number;
      if( (mask & bit) != 0 )
         FC_THROW_EXCEPTION( invalid_selection, "duplicate ${number}", ("number",number) );

      mask |= bit;
      numbers.push_back( number );
      count = uint8_t( numbers.size() );
   } FC_CAPTURE_AND_RETHROW( (number)(blocked_number) ) }

   bool selection::contains( const uint8_t number )const
   {
      if( number >= PARI_NUMBER_COUNT ) return false;
      return (mask & (selection_mask_type( 1 ) << number)) != 0;
   }

   selection_mask_type selection::compute_mask()const
   {
      selection_mask_type result = 0;
      for( const uint8_t number : numbers )
      {
         if( number < PARI_NUMBER_COUNT )
            result |= selection_mask_type( 1 ) << number;
      }
      return result;
   }

   void selection::validate()const
   { try {
      if( count < 1 || count > PARI_MAX_SELECTIONS || count != numbers.size() )
         FC_CAPTURE_AND_THROW( invalid_selection, (count)(numbers) );

      for( size_t i = 0; i < numbers.size(); ++i )
      {
         if( numbers[i] < PARI_MIN_SELECTABLE_NUMBER || numbers[i] > PARI_MAX_SELECTABLE_NUMBER )
            FC_CAPTURE_AND_THROW( invalid_selection, (numbers) );
         if( i > 0 && numbers[i] <= numbers[i-1] )
            FC_THROW_EXCEPTION( invalid_selection, "not canonical ${numbers}", ("numbers",numbers) );
      }

      if( compute_mask() != mask )
         FC_THROW_EXCEPTION( invalid_selection, "mask mismatch ${mask} ${numbers}", ("mask",mask)("numbers",numbers) );
   } FC_CAPTURE_AND_RETHROW( (*this) ) }

   vector<uint8_t> eligible_numbers( const uint8_t blocked_number )
   {
      vector<uint8_t> result;
      result.reserve( PARI_ELIGIBLE_NUMBER_COUNT );
      for( uint8_t n = PARI_MIN_SELECTABLE_NUMBER; n <= PARI_MAX_SELECTABLE_NUMBER; ++n )
      {
         if( n == blocked_number ) continue;
         result.push_back( n );
      }
      return result;
   }

   selection decode_choice_digits( const uint32_t choice, const uint8_t blocked_number )
   { try {
      if( choice == 0 )
         FC_CAPTURE_AND_THROW( invalid_selection, (choice) );

      vector<uint8_t> digits;
      uint32_t remaining = choice;
      while( remaining > 0 )
      {
         const uint8_t digit = uint8_t( remaining % 10 );
         remaining /= 10;

         if( digit == 0 )
            FC_THROW_EXCEPTION( invalid_selection, "zero digit ${choice}", ("choice",choice) );
         if( digit == blocked_number )
            FC_THROW_EXCEPTION( invalid_selection, "blocked digit ${choice} ${blocked_number}", ("choice",choice)("blocked_number",blocked_number) );
         if( std::find( digits.begin(), digits.end(), digit ) != digits.end() )
            FC_THROW_EXCEPTION( invalid_selection, "duplicate digit ${choice}", ("choice",choice) );
         if( digits.size() >= PARI_MAX_SELECTIONS )
            FC_THROW_EXCEPTION( invalid_selection, "too many digits ${choice}", ("choice",choice) );

         digits.push_back( digit );
      }

      std::sort( digits.begin(), digits.end() );

      selection result;
      for( const uint8_t digit : digits )
         result.push_back( digit, blocked_number );

      return result;
   } FC_CAPTURE_AND_RETHROW( (choice)(blocked_number) ) }

   selection derive_selection( const prediction_type_enum type, const uint32_t choice, const uint8_t blocked_number )
   { try {
      if( blocked_number < PARI_MIN_SELECTABLE_NUMBER || blocked_number > PARI_MAX_SELECTABLE_NUMBER )
         FC_THROW_EXCEPTION( invalid_selection, "blocked number not set ${blocked_number}", ("blocked_number",blocked_number) );

      const vector<uint8_t> eligible = eligible_numbers( blocked_number );
      if( eligible.size() != PARI_ELIGIBLE_NUMBER_COUNT )
         FC_CAPTURE_AND_THROW( invalid_selection, (eligible) );

      selection result;
      switch( type )
      {
         case single_number_prediction:
         {
            result = decode_choice_digits( choice, blocked_number );
            if( result.count != 1 )
               FC_THROW_EXCEPTION( invalid_selection, "expected one number ${choice}", ("choice",choice) );
            break;
         }
         case two_numbers_prediction:
         {
            result = decode_choice_digits( choice, blocked_number );
            if( result.count != 2 )
               FC_THROW_EXCEPTION( invalid_selection, "expected two numbers ${choice}", ("choice",choice) );
            break;
         }
         case multi_number_prediction:
         {
            result = decode_choice_digits( choice, blocked_number );
            if( result.count < PARI_MIN_MULTI_SELECTIONS || result.count > PARI_MAX_SELECTIONS )
               FC_THROW_EXCEPTION( invalid_selection, "expected 3 to 8 numbers ${choice}", ("choice",choice) );
            break;
         }
         case high_low_prediction:
         {
            if( choice > 1 )
               FC_THROW_EXCEPTION( invalid_selection, "expected 0 (low) or 1 (high) ${choice}", ("choice",choice) );

            const size_t first = (choice == 0) ? 0 : PARI_HIGH_LOW_SELECTIONS;
            for( size_t i = first; i < first + PARI_HIGH_LOW_SELECTIONS; ++i )
               result.push_back( eligible[i], blocked_number );
            break;
         }
         case even_odd_prediction:
         {
            if( choice > 1 )
               FC_THROW_EXCEPTION( invalid_selection, "expected 0 (even) or 1 (odd) ${choice}", ("choice",choice) );

            const bool want_odd = (choice == 1);
            for( const uint8_t n : eligible )
            {
               if( ((n % 2) == 1) == want_odd )
                  result.push_back( n, blocked_number );
            }
            break;
         }
         default:
            FC_THROW_EXCEPTION( invalid_selection, "unknown prediction type ${type}", ("type",type) );
      }

      result.validate();
      return result;
   } FC_CAPTURE_AND_RETHROW( (type)(choice)(blocked_number) ) }

} } // pari::chain
