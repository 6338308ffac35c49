#pragma once

#include <pari/chain/chain_interface.hpp>
#include <pari/chain/genesis_state.hpp>
#include <pari/chain/pending_chain_state.hpp>
#include <pari/chain/transaction.hpp>

#include <fc/filesystem.hpp>

namespace pari { namespace chain {

   namespace detail { class chain_database_impl; }

   struct transaction_evaluation_state;
   typedef std::shared_ptr<transaction_evaluation_state> transaction_evaluation_state_ptr;

   /** the complete committed state, as written to and read from disk */
   struct chain_snapshot
   {
      uint32_t                    version = PARI_SNAPSHOT_VERSION;
      clock_state                 clock;
      epoch_schedule              schedule;
      settings_record             settings;
      treasury_record             treasury;
      vector<balance_record>      balances;
      vector<pool_record>         pools;
      vector<prediction_record>   predictions;
      vector<ledger_record>       ledgers;
   };

   /**
    *  The committed settlement state.  Transactions are evaluated against a
    *  pending_chain_state layered on top of it and only merged in when every
    *  operation succeeded.
    */
   class chain_database : public chain_interface, public std::enable_shared_from_this<chain_database>
   {
      public:
         chain_database();
         virtual ~chain_database()override;

         void open( const genesis_state& genesis );
         void open( const chain_snapshot& snapshot );

         /**
          *  Loads data_dir/state.json if present, otherwise initializes from
          *  @p genesis_file or the built-in genesis state.
          */
         void open( const fc::path& data_dir, const fc::optional<fc::path>& genesis_file );
         void save( const fc::path& data_dir )const;
         void close();
         bool is_open()const;

         chain_snapshot                     export_snapshot()const;

         virtual clock_state                get_clock()const override;
         virtual epoch_schedule             get_epoch_schedule()const override;

         /** the host reports a new tick; the epoch comes from the schedule */
         void                               advance_to_tick( const tick_type tick, const time_point_sec& timestamp );
         /** the host reports its own view of the clock, which may disagree with the schedule */
         void                               set_clock( const clock_state& clock );

         transaction_evaluation_state_ptr   evaluate_transaction( const signed_transaction& trx );
         optional<fc::exception>            get_transaction_error( const signed_transaction& trx );

         /** evaluates @p trx without committing, the returned state holds every staged change */
         pending_chain_state_ptr            simulate_transaction( const signed_transaction& trx );

         vector<balance_record>             get_balances()const;
         vector<pool_record>                get_pools()const;
         vector<prediction_record>          get_predictions( const optional<tier_id_type>& tier = optional<tier_id_type>() )const;
         vector<ledger_record>              get_ledgers( const optional<tier_id_type>& tier = optional<tier_id_type>() )const;

      private:
         unique_ptr<detail::chain_database_impl> my;

         /** loads into fresh state, the previous state is kept if @p load throws */
         void replace_state( const function<void( detail::chain_database_impl& )>& load );

         virtual osettings_record settings_lookup_by_id( const settings_id_type )const override;
         virtual void settings_insert_into_id_map( const settings_id_type, const settings_record& )override;
         virtual void settings_erase_from_id_map( const settings_id_type )override;

         virtual otreasury_record treasury_lookup_by_id( const treasury_id_type )const override;
         virtual void treasury_insert_into_id_map( const treasury_id_type, const treasury_record& )override;
         virtual void treasury_erase_from_id_map( const treasury_id_type )override;

         virtual obalance_record balance_lookup_by_owner( const address_type& )const override;
         virtual void balance_insert_into_owner_map( const address_type&, const balance_record& )override;
         virtual void balance_erase_from_owner_map( const address_type& )override;

         virtual opool_record pool_lookup_by_tier( const tier_id_type )const override;
         virtual void pool_insert_into_tier_map( const tier_id_type, const pool_record& )override;
         virtual void pool_erase_from_tier_map( const tier_id_type )override;

         virtual oprediction_record prediction_lookup_by_index( const prediction_index& )const override;
         virtual void prediction_insert_into_index_map( const prediction_index&, const prediction_record& )override;
         virtual void prediction_erase_from_index_map( const prediction_index& )override;

         virtual oledger_record ledger_lookup_by_index( const ledger_index& )const override;
         virtual void ledger_insert_into_index_map( const ledger_index&, const ledger_record& )override;
         virtual void ledger_erase_from_index_map( const ledger_index& )override;
   };
   typedef shared_ptr<chain_database> chain_database_ptr;

} } // pari::chain

FC_REFLECT( pari::chain::chain_snapshot,
            (version)
            (clock)
            (schedule)
            (settings)
            (treasury)
            (balances)
            (pools)
            (predictions)
            (ledgers)
            )
