#pragma once

#include <fc/exception/exception.hpp>

namespace pari { namespace chain {

FC_DECLARE_EXCEPTION(         pari_exception,                                                        40000, "Pari Exception" );
FC_DECLARE_DERIVED_EXCEPTION( unsupported_chain_operation,      pari::chain::pari_exception,         40001, "unsupported chain operation" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_snapshot,                 pari::chain::pari_exception,         40002, "invalid snapshot" );
FC_DECLARE_DERIVED_EXCEPTION( database_not_open,                pari::chain::pari_exception,         40003, "database not open" );

FC_DECLARE_EXCEPTION(         evaluation_error,                                                      41000, "Evaluation Error" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_amount,                   pari::chain::evaluation_error,       41001, "invalid amount" );
FC_DECLARE_DERIVED_EXCEPTION( stake_out_of_range,               pari::chain::evaluation_error,       41002, "stake out of tier range" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_settings,                 pari::chain::evaluation_error,       41003, "invalid settings" );

FC_DECLARE_DERIVED_EXCEPTION( authorization_error,              pari::chain::evaluation_error,       41100, "authorization error" );
FC_DECLARE_DERIVED_EXCEPTION( missing_signature,                pari::chain::authorization_error,    41101, "missing signature" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_authority_target,         pari::chain::authorization_error,    41102, "invalid authority target" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_fee_vault,                pari::chain::authorization_error,    41103, "invalid fee vault" );

FC_DECLARE_DERIVED_EXCEPTION( state_mismatch,                   pari::chain::evaluation_error,       41200, "state mismatch" );
FC_DECLARE_DERIVED_EXCEPTION( epoch_mismatch,                   pari::chain::state_mismatch,         41201, "epoch mismatch" );
FC_DECLARE_DERIVED_EXCEPTION( tier_mismatch,                    pari::chain::state_mismatch,         41202, "tier mismatch" );
FC_DECLARE_DERIVED_EXCEPTION( unknown_tier,                     pari::chain::state_mismatch,         41203, "unknown tier" );
FC_DECLARE_DERIVED_EXCEPTION( inactive_tier,                    pari::chain::state_mismatch,         41204, "inactive tier" );
FC_DECLARE_DERIVED_EXCEPTION( unknown_pool,                     pari::chain::state_mismatch,         41205, "unknown pool" );
FC_DECLARE_DERIVED_EXCEPTION( pool_already_open,                pari::chain::state_mismatch,         41206, "pool already open" );
FC_DECLARE_DERIVED_EXCEPTION( pool_not_empty,                   pari::chain::state_mismatch,         41207, "pool not empty" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_pool_state,               pari::chain::state_mismatch,         41208, "invalid pool state" );
FC_DECLARE_DERIVED_EXCEPTION( unknown_prediction,               pari::chain::state_mismatch,         41209, "unknown prediction" );
FC_DECLARE_DERIVED_EXCEPTION( prediction_invariant_violated,    pari::chain::state_mismatch,         41210, "prediction invariant violated" );
FC_DECLARE_DERIVED_EXCEPTION( unknown_ledger,                   pari::chain::state_mismatch,         41211, "unknown ledger" );
FC_DECLARE_DERIVED_EXCEPTION( ledger_not_processing,            pari::chain::state_mismatch,         41212, "ledger not processing" );
FC_DECLARE_DERIVED_EXCEPTION( ledger_not_resolved,              pari::chain::state_mismatch,         41213, "ledger not resolved" );
FC_DECLARE_DERIVED_EXCEPTION( no_stakes_to_resolve,             pari::chain::state_mismatch,         41214, "no stakes to resolve" );
FC_DECLARE_DERIVED_EXCEPTION( empty_results_pointer,            pari::chain::state_mismatch,         41215, "empty results pointer" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_fee,                      pari::chain::state_mismatch,         41216, "proposed fee does not match" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_pot_breakdown,            pari::chain::state_mismatch,         41217, "proposed net pool does not match" );
FC_DECLARE_DERIVED_EXCEPTION( carry_not_allowed,                pari::chain::state_mismatch,         41218, "carry not allowed" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_winning_number,           pari::chain::state_mismatch,         41219, "invalid winning number" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_rollover_number,          pari::chain::state_mismatch,         41220, "invalid rollover number" );
FC_DECLARE_DERIVED_EXCEPTION( claim_not_allowed,                pari::chain::state_mismatch,         41221, "claim not allowed" );

FC_DECLARE_DERIVED_EXCEPTION( timing_error,                     pari::chain::evaluation_error,       41300, "timing error" );
FC_DECLARE_DERIVED_EXCEPTION( epoch_not_complete,               pari::chain::timing_error,           41301, "epoch not complete" );
FC_DECLARE_DERIVED_EXCEPTION( staking_closed,                   pari::chain::timing_error,           41302, "staking closed" );
FC_DECLARE_DERIVED_EXCEPTION( epoch_not_advanced,               pari::chain::timing_error,           41303, "epoch not advanced" );
FC_DECLARE_DERIVED_EXCEPTION( staking_paused,                   pari::chain::timing_error,           41304, "staking paused" );
FC_DECLARE_DERIVED_EXCEPTION( claims_paused,                    pari::chain::timing_error,           41305, "claims paused" );

FC_DECLARE_DERIVED_EXCEPTION( arithmetic_error,                 pari::chain::evaluation_error,       41400, "arithmetic error" );
FC_DECLARE_DERIVED_EXCEPTION( addition_overflow,                pari::chain::arithmetic_error,       41401, "addition overflow" );
FC_DECLARE_DERIVED_EXCEPTION( subtraction_underflow,            pari::chain::arithmetic_error,       41402, "subtraction underflow" );
FC_DECLARE_DERIVED_EXCEPTION( multiplication_overflow,          pari::chain::arithmetic_error,       41403, "multiplication overflow" );

FC_DECLARE_DERIVED_EXCEPTION( invalid_selection,                pari::chain::evaluation_error,       41500, "invalid number selection" );
FC_DECLARE_DERIVED_EXCEPTION( no_op_change,                     pari::chain::invalid_selection,      41501, "selection unchanged" );
FC_DECLARE_DERIVED_EXCEPTION( selection_count_mismatch,         pari::chain::invalid_selection,      41502, "selection count mismatch" );

FC_DECLARE_DERIVED_EXCEPTION( proof_invalid,                    pari::chain::evaluation_error,       41600, "proof invalid" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_merkle_proof,             pari::chain::proof_invalid,          41601, "invalid merkle proof" );
FC_DECLARE_DERIVED_EXCEPTION( empty_merkle_root,                pari::chain::proof_invalid,          41602, "empty merkle root" );
FC_DECLARE_DERIVED_EXCEPTION( proof_too_long,                   pari::chain::proof_invalid,          41603, "proof too long" );

FC_DECLARE_DERIVED_EXCEPTION( double_spend,                     pari::chain::evaluation_error,       41700, "double spend" );
FC_DECLARE_DERIVED_EXCEPTION( already_claimed,                  pari::chain::double_spend,           41701, "already claimed" );
FC_DECLARE_DERIVED_EXCEPTION( already_staked,                   pari::chain::double_spend,           41702, "already staked on this game" );
FC_DECLARE_DERIVED_EXCEPTION( ledger_already_exists,            pari::chain::double_spend,           41703, "ledger already exists" );
FC_DECLARE_DERIVED_EXCEPTION( ledger_already_resolved,          pari::chain::double_spend,           41704, "ledger already resolved" );

FC_DECLARE_DERIVED_EXCEPTION( capacity_error,                   pari::chain::evaluation_error,       41800, "capacity error" );
FC_DECLARE_DERIVED_EXCEPTION( too_many_winners,                 pari::chain::capacity_error,         41801, "too many winners" );
FC_DECLARE_DERIVED_EXCEPTION( too_many_claims,                  pari::chain::capacity_error,         41802, "too many claims" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_claim_index,              pari::chain::capacity_error,         41803, "invalid claim index" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_bitmap_length,            pari::chain::capacity_error,         41804, "invalid bitmap length" );

FC_DECLARE_DERIVED_EXCEPTION( solvency_error,                   pari::chain::evaluation_error,       41900, "solvency error" );
FC_DECLARE_DERIVED_EXCEPTION( insufficient_funds,               pari::chain::solvency_error,         41901, "insufficient funds" );
FC_DECLARE_DERIVED_EXCEPTION( insufficient_prize_pool,          pari::chain::solvency_error,         41902, "insufficient prize pool" );
FC_DECLARE_DERIVED_EXCEPTION( insufficient_treasury_balance,    pari::chain::solvency_error,         41903, "insufficient treasury balance" );

} } // pari::chain
