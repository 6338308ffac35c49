#include <pari/chain/balance_operations.hpp>
#include <pari/chain/claim_operations.hpp>
#include <pari/chain/exceptions.hpp>
#include <pari/chain/ledger_operations.hpp>
#include <pari/chain/pool_operations.hpp>
#include <pari/chain/settings_operations.hpp>
#include <pari/chain/stake_operations.hpp>
#include <pari/chain/transaction.hpp>

#include <fc/io/raw.hpp>

namespace pari { namespace chain {

   digest_type transaction::digest()const
   {
      fc::sha256::encoder enc;
      fc::raw::pack( enc, *this );
      return enc.result();
   }

   transaction_id_type signed_transaction::id()const
   {
      fc::sha256::encoder enc;
      fc::raw::pack( enc, *this );
      return fc::ripemd160::hash( enc.result() );
   }

   size_t signed_transaction::data_size()const
   {
      fc::datastream<size_t> ds;
      fc::raw::pack( ds, *this );
      return ds.tellp();
   }

   void signed_transaction::sign( const address_type& signer )
   {
      signers.insert( signer );
   }

   void transaction::deposit( const address_type& owner, share_type amount )
   { try {
      FC_ASSERT( amount > 0, "amount: ${amount}", ("amount",amount) );
      operations.emplace_back( deposit_operation( owner, amount ) );
   } FC_RETHROW_EXCEPTIONS( warn, "", ("owner",owner)("amount",amount) ) }

   void transaction::withdraw( const address_type& owner, share_type amount )
   { try {
      FC_ASSERT( amount > 0, "amount: ${amount}", ("amount",amount) );
      operations.emplace_back( withdraw_operation( owner, amount ) );
   } FC_RETHROW_EXCEPTIONS( warn, "", ("owner",owner)("amount",amount) ) }

   void transaction::open_pool( const tier_id_type tier )
   {
      operations.emplace_back( open_pool_operation( tier ) );
   }

   void transaction::reset_pool( const tier_id_type tier, const uint8_t blocked_number )
   {
      operations.emplace_back( reset_pool_operation( tier, blocked_number ) );
   }

   void transaction::close_pool( const tier_id_type tier )
   {
      operations.emplace_back( close_pool_operation( tier ) );
   }

   void transaction::update_tier_active( const tier_id_type tier, const bool active )
   {
      operations.emplace_back( update_tier_active_operation( tier, active ) );
   }

   void transaction::place_stake( const address_type& player,
                                  const tier_id_type tier,
                                  const prediction_type_enum prediction_type,
                                  const uint32_t choice,
                                  const share_type value_per_number )
   {
      operations.emplace_back( place_stake_operation( player, tier, prediction_type, choice, value_per_number ) );
   }

   void transaction::increase_stake( const address_type& player,
                                     const tier_id_type tier,
                                     const share_type additional_value,
                                     const uint32_t choice )
   {
      operations.emplace_back( increase_stake_operation( player, tier, additional_value, choice ) );
   }

   void transaction::change_selection( const address_type& player,
                                       const tier_id_type tier,
                                       const prediction_type_enum new_prediction_type,
                                       const uint32_t new_choice )
   {
      operations.emplace_back( change_selection_operation( player, tier, new_prediction_type, new_choice ) );
   }

   void transaction::init_ledger( const epoch_type epoch,
                                  const tier_id_type tier,
                                  const uint8_t winning_number,
                                  const tick_type rng_tick,
                                  const digest_type& rng_seed )
   {
      init_ledger_operation op;
      op.epoch = epoch;
      op.tier = tier;
      op.winning_number = winning_number;
      op.rng_tick = rng_tick;
      op.rng_seed = rng_seed;
      operations.emplace_back( std::move( op ) );
   }

   void transaction::reprocess_ledger( const epoch_type epoch, const tier_id_type tier )
   {
      reprocess_ledger_operation op;
      op.epoch = epoch;
      op.tier = tier;
      operations.emplace_back( std::move( op ) );
   }

   void transaction::finalize_ledger( const epoch_type epoch,
                                      const tier_id_type tier,
                                      const share_type proposed_fee,
                                      const share_type proposed_net,
                                      const uint32_t total_winners,
                                      const digest_type& merkle_root,
                                      const string& results_uri )
   { try {
      finalize_ledger_operation op;
      op.epoch = epoch;
      op.tier = tier;
      op.proposed_fee = proposed_fee;
      op.proposed_net = proposed_net;
      op.total_winners = total_winners;
      op.merkle_root = merkle_root;
      op.results_pointer = make_results_pointer( results_uri );
      operations.emplace_back( std::move( op ) );
   } FC_CAPTURE_AND_RETHROW( (epoch)(tier)(results_uri) ) }

   void transaction::rollover_ledger( const epoch_type epoch,
                                      const tier_id_type tier,
                                      const uint8_t winning_number,
                                      const tick_type rng_tick,
                                      const digest_type& rng_seed )
   {
      rollover_ledger_operation op;
      op.epoch = epoch;
      op.tier = tier;
      op.winning_number = winning_number;
      op.rng_tick = rng_tick;
      op.rng_seed = rng_seed;
      operations.emplace_back( std::move( op ) );
   }

   void transaction::close_ledger( const epoch_type epoch, const tier_id_type tier )
   {
      close_ledger_operation op;
      op.epoch = epoch;
      op.tier = tier;
      operations.emplace_back( std::move( op ) );
   }

   void transaction::claim( const address_type& claimer,
                            const epoch_type epoch,
                            const tier_id_type tier,
                            const uint32_t index,
                            const share_type amount,
                            const vector<digest_type>& proof )
   {
      claim_operation op;
      op.claimer = claimer;
      op.epoch = epoch;
      op.tier = tier;
      op.index = index;
      op.amount = amount;
      op.proof = proof;
      operations.emplace_back( std::move( op ) );
   }

} } // pari::chain
