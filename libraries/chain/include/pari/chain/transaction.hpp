#pragma once

#include <pari/chain/operations.hpp>
#include <pari/chain/selection.hpp>
#include <pari/chain/types.hpp>

#include <fc/reflect/variant.hpp>

namespace pari { namespace chain {

   /** an ordered batch of operations that is applied all or nothing */
   struct transaction
   {
      vector<operation>     operations;

      digest_type digest()const;

      void deposit( const address_type& owner, share_type amount );
      void withdraw( const address_type& owner, share_type amount );

      void open_pool( const tier_id_type tier );
      void reset_pool( const tier_id_type tier, const uint8_t blocked_number );
      void close_pool( const tier_id_type tier );
      void update_tier_active( const tier_id_type tier, const bool active );

      void place_stake( const address_type& player,
                        const tier_id_type tier,
                        const prediction_type_enum prediction_type,
                        const uint32_t choice,
                        const share_type value_per_number );

      void increase_stake( const address_type& player,
                           const tier_id_type tier,
                           const share_type additional_value,
                           const uint32_t choice );

      void change_selection( const address_type& player,
                             const tier_id_type tier,
                             const prediction_type_enum new_prediction_type,
                             const uint32_t new_choice );

      void init_ledger( const epoch_type epoch,
                        const tier_id_type tier,
                        const uint8_t winning_number,
                        const tick_type rng_tick,
                        const digest_type& rng_seed );

      void reprocess_ledger( const epoch_type epoch, const tier_id_type tier );

      void finalize_ledger( const epoch_type epoch,
                            const tier_id_type tier,
                            const share_type proposed_fee,
                            const share_type proposed_net,
                            const uint32_t total_winners,
                            const digest_type& merkle_root,
                            const string& results_uri );

      void rollover_ledger( const epoch_type epoch,
                            const tier_id_type tier,
                            const uint8_t winning_number,
                            const tick_type rng_tick,
                            const digest_type& rng_seed );

      void close_ledger( const epoch_type epoch, const tier_id_type tier );

      void claim( const address_type& claimer,
                  const epoch_type epoch,
                  const tier_id_type tier,
                  const uint32_t index,
                  const share_type amount,
                  const vector<digest_type>& proof );
   }; // transaction

   /**
    *  The host verifies signatures before a transaction reaches the engine
    *  and records the addresses that signed it here.
    */
   struct signed_transaction : public transaction
   {
      transaction_id_type   id()const;
      size_t                data_size()const;
      void                  sign( const address_type& signer );

      set<address_type>     signers;
   };
   typedef vector<signed_transaction> signed_transactions;
   typedef optional<signed_transaction> osigned_transaction;

} } // pari::chain

FC_REFLECT( pari::chain::transaction, (operations) )
FC_REFLECT_DERIVED( pari::chain::signed_transaction, (pari::chain::transaction), (signers) )
