#pragma once

#include <stdint.h>

/** @file pari/chain/config.hpp
 *  @brief Defines global constants that determine settlement behavior
 */
#define PARI_CHAIN_VERSION                                  2
#define PARI_LEDGER_RECORD_VERSION                          2
#define PARI_PREDICTION_RECORD_VERSION                      2
#define PARI_SNAPSHOT_VERSION                               1

/**
 *  Numbers 0..9 are drawn, only 1..9 may be selected.
 */
#define PARI_NUMBER_COUNT                                   10
#define PARI_MIN_SELECTABLE_NUMBER                          1
#define PARI_MAX_SELECTABLE_NUMBER                          9
#define PARI_MAX_SELECTIONS                                 8
#define PARI_ELIGIBLE_NUMBER_COUNT                          8 // 1..9 minus the blocked number
#define PARI_HIGH_LOW_SELECTIONS                            4
#define PARI_MIN_MULTI_SELECTIONS                           3

#define PARI_FEE_BPS_DENOM                                  uint64_t(10000)

#define PARI_DEFAULT_BASE_FEE_BPS                           500
#define PARI_DEFAULT_MIN_FEE_BPS                            200
#define PARI_DEFAULT_ROLLOVER_FEE_STEP_BPS                  100
#define PARI_DEFAULT_PRIMARY_ROLLOVER_NUMBER                0

/**
 *  Minimum number of ticks that must remain in an epoch for stakes
 *  to be accepted.  Settings updates must keep it above the floor.
 */
#define PARI_DEFAULT_CUTOFF_TICKS                           300
#define PARI_MIN_CUTOFF_TICKS                               20
#define PARI_DEFAULT_TICKS_PER_EPOCH                        432000

#define PARI_NUM_TIERS                                      5

#define PARI_PRECISION                                      uint64_t(1000000000)
#define PARI_TIER1_MIN_STAKE                                (PARI_PRECISION/100)
#define PARI_TIER1_MAX_STAKE                                (PARI_PRECISION)
#define PARI_TIER2_MIN_STAKE                                (PARI_PRECISION)
#define PARI_TIER2_MAX_STAKE                                (PARI_PRECISION*10)
#define PARI_TIER3_MIN_STAKE                                (PARI_PRECISION*10)
#define PARI_TIER3_MAX_STAKE                                (PARI_PRECISION*100)

/**
 *  The claim bitmap holds one bit per winner and is never allowed to
 *  grow beyond this many winners.
 */
#define PARI_MAX_WINNERS_PER_LEDGER                         50000
#define PARI_MAX_BITMAP_BYTES                               ((PARI_MAX_WINNERS_PER_LEDGER + 7) / 8)

#define PARI_MAX_PROOF_DEPTH                                40
#define PARI_RESULTS_POINTER_SIZE                           128

/** prepended to every claim leaf before hashing */
#define PARI_CLAIM_LEAF_TAG                                 "PARI_V2"

#define PARI_GLOBAL_TREASURY_ID                             0
#define PARI_SETTINGS_ID                                    0
