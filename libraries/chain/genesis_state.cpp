#include <pari/chain/genesis_state.hpp>

namespace pari { namespace chain {

   vector<tier_settings> get_default_tier_settings()
   {
      vector<tier_settings> tiers( PARI_NUM_TIERS );
      for( size_t i = 0; i < tiers.size(); ++i )
         tiers[i].tier_id = tier_id_type( i + 1 );

      tiers[0].active = true;
      tiers[0].min_stake = PARI_TIER1_MIN_STAKE;
      tiers[0].max_stake = PARI_TIER1_MAX_STAKE;

      tiers[1].min_stake = PARI_TIER2_MIN_STAKE;
      tiers[1].max_stake = PARI_TIER2_MAX_STAKE;

      tiers[2].min_stake = PARI_TIER3_MIN_STAKE;
      tiers[2].max_stake = PARI_TIER3_MAX_STAKE;

      return tiers;
   }

   genesis_state get_builtin_genesis_state()
   {
      genesis_state config;
      config.timestamp = fc::time_point_sec( 1735689600 );
      config.authority = "authority";
      config.fee_vault = "fee-vault";
      config.tiers = get_default_tier_settings();
      return config;
   }

} } // pari::chain
