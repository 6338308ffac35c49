#pragma once

#include <pari/chain/operations.hpp>
#include <pari/chain/selection.hpp>
#include <pari/chain/types.hpp>

namespace pari { namespace chain {

   /**
    *  Opens a prediction on the current game chain of @ref tier.  Every
    *  selected number receives @ref value_per_number, the player pays
    *  value_per_number * k out of their balance into the treasury.
    */
   struct place_stake_operation
   {
      static const operation_type_enum type;

      place_stake_operation(){}
      place_stake_operation( const address_type& p, const tier_id_type t, const prediction_type_enum pt,
                             const uint32_t c, const share_type v )
      :player(p),tier(t),prediction_type(pt),choice(c),value_per_number(v){}

      address_type                                 player;
      tier_id_type                                 tier = 0;
      fc::enum_type<uint8_t,prediction_type_enum>  prediction_type = single_number_prediction;
      uint32_t                                     choice = 0;
      share_type                                   value_per_number = 0;

      void evaluate( transaction_evaluation_state& eval_state )const;
   };

   /** adds @ref additional_value to every selected number of an existing prediction */
   struct increase_stake_operation
   {
      static const operation_type_enum type;

      increase_stake_operation(){}
      increase_stake_operation( const address_type& p, const tier_id_type t, const share_type a, const uint32_t c )
      :player(p),tier(t),additional_value(a),choice(c){}

      address_type   player;
      tier_id_type   tier = 0;
      share_type     additional_value = 0;
      uint32_t       choice = 0;

      void evaluate( transaction_evaluation_state& eval_state )const;
   };

   /**
    *  Moves an existing prediction to a different set of the same size.
    *  The value staked does not change.
    */
   struct change_selection_operation
   {
      static const operation_type_enum type;

      change_selection_operation(){}
      change_selection_operation( const address_type& p, const tier_id_type t, const prediction_type_enum pt, const uint32_t c )
      :player(p),tier(t),new_prediction_type(pt),new_choice(c){}

      address_type                                 player;
      tier_id_type                                 tier = 0;
      fc::enum_type<uint8_t,prediction_type_enum>  new_prediction_type = single_number_prediction;
      uint32_t                                     new_choice = 0;

      void evaluate( transaction_evaluation_state& eval_state )const;
   };

} } // pari::chain

FC_REFLECT( pari::chain::place_stake_operation, (player)(tier)(prediction_type)(choice)(value_per_number) )
FC_REFLECT( pari::chain::increase_stake_operation, (player)(tier)(additional_value)(choice) )
FC_REFLECT( pari::chain::change_selection_operation, (player)(tier)(new_prediction_type)(new_choice) )
