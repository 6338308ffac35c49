#pragma once

#include <pari/chain/selection.hpp>
#include <pari/chain/types.hpp>

#include <tuple>

namespace pari { namespace chain {

   struct prediction_index
   {
      prediction_index(){}
      prediction_index( const address_type& p, const epoch_type c, const tier_id_type t )
      :player(p),chain_start_epoch(c),tier(t){}

      address_type   player;
      epoch_type     chain_start_epoch = 0;
      tier_id_type   tier = 0;

      friend bool operator < ( const prediction_index& a, const prediction_index& b )
      {
         return std::tie( a.player, a.chain_start_epoch, a.tier ) < std::tie( b.player, b.chain_start_epoch, b.tier );
      }

      friend bool operator == ( const prediction_index& a, const prediction_index& b )
      {
         return std::tie( a.player, a.chain_start_epoch, a.tier ) == std::tie( b.player, b.chain_start_epoch, b.tier );
      }
   };

   struct prediction_record;
   typedef fc::optional<prediction_record> oprediction_record;

   class chain_interface;

   /**
    *  One player's stake on one game chain of one tier.  Created once and
    *  frozen after it has been claimed.
    */
   struct prediction_record
   {
      prediction_index                             index;
      uint8_t                                      version = PARI_PREDICTION_RECORD_VERSION;
      epoch_type                                   placed_epoch = 0;
      fc::enum_type<uint8_t,prediction_type_enum>  prediction_type = single_number_prediction;
      selection                                    numbers;
      share_type                                   value_per_number = 0;
      share_type                                   total_value = 0;
      uint32_t                                     change_count = 0;
      tick_type                                    placed_tick = 0;
      time_point_sec                               placed_at;
      time_point_sec                               last_update;
      bool                                         claimed = false;
      time_point_sec                               claimed_at;

      /** value_per_number * numbers.count with overflow checking */
      share_type  expected_total()const;

      /** throws prediction_invariant_violated unless total == per number value * count */
      void        check_invariant()const;

      /** throws prediction_invariant_violated if the stored mask disagrees with the stored numbers */
      void        check_mask()const;

      void sanity_check( const chain_interface& )const;
      static oprediction_record lookup( const chain_interface&, const prediction_index& );
      static void store( chain_interface&, const prediction_index&, const prediction_record& );
      static void remove( chain_interface&, const prediction_index& );
   };

   class prediction_db_interface
   {
      friend struct prediction_record;

      virtual oprediction_record prediction_lookup_by_index( const prediction_index& )const = 0;
      virtual void prediction_insert_into_index_map( const prediction_index&, const prediction_record& ) = 0;
      virtual void prediction_erase_from_index_map( const prediction_index& ) = 0;
   };

} } // pari::chain

FC_REFLECT( pari::chain::prediction_index, (player)(chain_start_epoch)(tier) )
FC_REFLECT( pari::chain::prediction_record,
        (index)
        (version)
        (placed_epoch)
        (prediction_type)
        (numbers)
        (value_per_number)
        (total_value)
        (change_count)
        (placed_tick)
        (placed_at)
        (last_update)
        (claimed)
        (claimed_at)
        )
