#pragma once

#include <pari/chain/settings_record.hpp>
#include <pari/chain/types.hpp>
#include <fc/time.hpp>

namespace pari { namespace chain {

struct genesis_balance
{
   string       owner;
   share_type   balance = 0;
};

/** a pool opened at the start epoch, ready to take stakes */
struct genesis_pool
{
   tier_id_type   tier = 0;
   uint8_t        blocked_number = 0;
};

struct genesis_state
{
   fc::time_point_sec       timestamp;
   tick_type                start_tick = 0;
   uint64_t                 ticks_per_epoch = PARI_DEFAULT_TICKS_PER_EPOCH;

   string                   authority;
   string                   fee_vault;

   fee_bps_type             base_fee_bps = PARI_DEFAULT_BASE_FEE_BPS;
   fee_bps_type             min_fee_bps = PARI_DEFAULT_MIN_FEE_BPS;
   fee_bps_type             rollover_fee_step_bps = PARI_DEFAULT_ROLLOVER_FEE_STEP_BPS;
   uint64_t                 cutoff_ticks = PARI_DEFAULT_CUTOFF_TICKS;
   uint8_t                  primary_rollover_number = PARI_DEFAULT_PRIMARY_ROLLOVER_NUMBER;

   vector<tier_settings>    tiers;
   vector<genesis_pool>     pools;
   vector<genesis_balance>  initial_balances;
};

/** tier 1 active, tiers 2 and 3 configured but inactive, tiers 4 and 5 unconfigured */
vector<tier_settings> get_default_tier_settings();

/** the configuration used when no genesis file is given */
genesis_state get_builtin_genesis_state();

} } // pari::chain

FC_REFLECT( pari::chain::genesis_balance, (owner)(balance) )
FC_REFLECT( pari::chain::genesis_pool, (tier)(blocked_number) )
FC_REFLECT( pari::chain::genesis_state,
            (timestamp)
            (start_tick)
            (ticks_per_epoch)
            (authority)
            (fee_vault)
            (base_fee_bps)
            (min_fee_bps)
            (rollover_fee_step_bps)
            (cutoff_ticks)
            (primary_rollover_number)
            (tiers)
            (pools)
            (initial_balances)
            )
