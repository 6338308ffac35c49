#include <pari/chain/chain_database_impl.hpp>
#include <pari/chain/exceptions.hpp>
#include <pari/chain/transaction_evaluation_state.hpp>

#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>

namespace pari { namespace chain {

   namespace detail
   {
      void chain_database_impl::clear()
      {
         _clock = clock_state();
         _schedule = epoch_schedule();
         _settings_id_to_record.clear();
         _treasury_id_to_record.clear();
         _balance_owner_to_record.clear();
         _pool_tier_to_record.clear();
         _prediction_index_to_record.clear();
         _ledger_index_to_record.clear();
         _is_open = false;
      }

      void chain_database_impl::initialize_genesis( const genesis_state& config )
      { try {
         FC_ASSERT( config.ticks_per_epoch > PARI_MIN_CUTOFF_TICKS, "ticks per epoch must exceed the minimum cutoff",
                    ("ticks_per_epoch",config.ticks_per_epoch) );

         clear();
         _schedule = epoch_schedule( config.ticks_per_epoch );
         _clock.tick = config.start_tick;
         _clock.epoch = _schedule.get_epoch( config.start_tick );
         _clock.timestamp = config.timestamp;
         _is_open = true;

         settings_record settings;
         settings.authority = make_address( config.authority );
         settings.fee_vault = make_address( config.fee_vault );
         settings.base_fee_bps = config.base_fee_bps;
         settings.min_fee_bps = config.min_fee_bps;
         settings.rollover_fee_step_bps = config.rollover_fee_step_bps;
         settings.cutoff_ticks = config.cutoff_ticks;
         settings.primary_rollover_number = config.primary_rollover_number;
         settings.tiers = config.tiers.empty() ? get_default_tier_settings() : config.tiers;
         settings.started_at = config.timestamp;
         settings.started_epoch = _clock.epoch;

         for( const genesis_pool& item : config.pools )
         {
            if( item.blocked_number < PARI_MIN_SELECTABLE_NUMBER || item.blocked_number > PARI_MAX_SELECTABLE_NUMBER )
               FC_CAPTURE_AND_THROW( invalid_rollover_number, (item) );

            settings.get_tier_ref( item.tier ).active = true;

            pool_record pool = pool_record::open_new_chain( item.tier, _clock.epoch, settings.cutoff_ticks, settings.base_fee_bps );
            pool.blocked_number = item.blocked_number;
            self->store_pool_record( pool );
         }

         settings.validate();
         self->store_settings( settings );
         self->store_treasury( treasury_record() );

         for( const genesis_balance& item : config.initial_balances )
         {
            balance_record record( make_address( item.owner ), item.balance );
            record.last_update = config.timestamp;
            self->store_balance_record( record );
         }

         ilog( "initialized genesis state at epoch ${e} with ${b} balances and ${p} pools",
               ("e",_clock.epoch)("b",config.initial_balances.size())("p",config.pools.size()) );
      } FC_CAPTURE_AND_RETHROW( (config) ) }

      void chain_database_impl::load_snapshot( const chain_snapshot& snapshot )
      { try {
         if( snapshot.version != PARI_SNAPSHOT_VERSION )
            FC_CAPTURE_AND_THROW( invalid_snapshot, (snapshot.version) );
         if( snapshot.schedule.ticks_per_epoch == 0 )
            FC_CAPTURE_AND_THROW( invalid_snapshot, (snapshot.schedule) );

         snapshot.settings.validate();

         clear();
         _clock = snapshot.clock;
         _schedule = snapshot.schedule;
         _is_open = true;

         self->store_settings( snapshot.settings );
         self->store_treasury( snapshot.treasury );
         for( const balance_record& record : snapshot.balances )
            self->store_balance_record( record );
         for( const pool_record& record : snapshot.pools )
            self->store_pool_record( record );
         for( const prediction_record& record : snapshot.predictions )
         {
            record.check_invariant();
            self->store_prediction_record( record );
         }
         for( const ledger_record& record : snapshot.ledgers )
            self->store_ledger_record( record );
      } FC_CAPTURE_AND_RETHROW( (snapshot.version) ) }

   } // detail

   chain_database::chain_database()
   :my( new detail::chain_database_impl() )
   {
      my->self = this;
   }

   chain_database::~chain_database()
   {
   }

   void chain_database::replace_state( const function<void( detail::chain_database_impl& )>& load )
   {
      unique_ptr<detail::chain_database_impl> next( new detail::chain_database_impl() );
      next->self = this;
      my.swap( next );
      try
      {
         load( *my );
      }
      catch( const fc::exception& )
      {
         my.swap( next );
         throw;
      }
   }

   void chain_database::open( const genesis_state& genesis )
   { try {
      replace_state( [&]( detail::chain_database_impl& state ) { state.initialize_genesis( genesis ); } );
   } FC_CAPTURE_AND_RETHROW() }

   void chain_database::open( const chain_snapshot& snapshot )
   { try {
      replace_state( [&]( detail::chain_database_impl& state ) { state.load_snapshot( snapshot ); } );
   } FC_CAPTURE_AND_RETHROW() }

   void chain_database::open( const fc::path& data_dir, const fc::optional<fc::path>& genesis_file )
   { try {
      const fc::path state_file = data_dir / "state.json";
      if( fc::exists( state_file ) )
      {
         ilog( "loading state from ${f}", ("f",state_file) );
         open( fc::json::from_file( state_file ).as<chain_snapshot>() );
         return;
      }

      if( !genesis_file.valid() )
      {
         ilog( "initializing state from built-in genesis" );
         open( get_builtin_genesis_state() );
         return;
      }

      FC_ASSERT( fc::exists( *genesis_file ), "Genesis file '${file}' was not found.", ("file", *genesis_file) );
      ilog( "initializing state from genesis file ${f}", ("f",*genesis_file) );
      open( fc::json::from_file( *genesis_file ).as<genesis_state>() );
   } FC_CAPTURE_AND_RETHROW( (data_dir)(genesis_file) ) }

   void chain_database::save( const fc::path& data_dir )const
   { try {
      if( !is_open() )
         FC_THROW_EXCEPTION( database_not_open, "cannot save a closed database" );

      if( !fc::exists( data_dir ) )
         fc::create_directories( data_dir );

      fc::json::save_to_file( export_snapshot(), data_dir / "state.json" );
   } FC_CAPTURE_AND_RETHROW( (data_dir) ) }

   void chain_database::close()
   { try {
      my->clear();
   } FC_CAPTURE_AND_RETHROW() }

   bool chain_database::is_open()const
   {
      return my->_is_open;
   }

   chain_snapshot chain_database::export_snapshot()const
   { try {
      chain_snapshot snapshot;
      snapshot.clock = my->_clock;
      snapshot.schedule = my->_schedule;
      snapshot.settings = get_settings();
      snapshot.treasury = get_treasury();
      snapshot.balances = get_balances();
      snapshot.pools = get_pools();
      snapshot.predictions = get_predictions();
      snapshot.ledgers = get_ledgers();
      return snapshot;
   } FC_CAPTURE_AND_RETHROW() }

   clock_state chain_database::get_clock()const
   {
      return my->_clock;
   }

   epoch_schedule chain_database::get_epoch_schedule()const
   {
      return my->_schedule;
   }

   void chain_database::advance_to_tick( const tick_type tick, const time_point_sec& timestamp )
   { try {
      if( tick < my->_clock.tick )
         FC_CAPTURE_AND_THROW( epoch_not_advanced, (tick)(my->_clock.tick) );

      clock_state clock;
      clock.tick = tick;
      clock.epoch = my->_schedule.get_epoch( tick );
      clock.timestamp = timestamp;
      set_clock( clock );
   } FC_CAPTURE_AND_RETHROW( (tick)(timestamp) ) }

   void chain_database::set_clock( const clock_state& clock )
   {
      if( clock.epoch != my->_clock.epoch )
         ilog( "epoch ${from} -> ${to} at tick ${t}", ("from",my->_clock.epoch)("to",clock.epoch)("t",clock.tick) );
      my->_clock = clock;
   }

   transaction_evaluation_state_ptr chain_database::evaluate_transaction( const signed_transaction& trx )
   { try {
      if( !is_open() )
         FC_THROW_EXCEPTION( database_not_open, "cannot evaluate a transaction against a closed database" );

      pending_chain_state_ptr          pend_state = std::make_shared<pending_chain_state>( shared_from_this() );
      transaction_evaluation_state_ptr trx_eval_state = std::make_shared<transaction_evaluation_state>( pend_state );

      trx_eval_state->evaluate( trx );
      pend_state->apply_changes();

      return trx_eval_state;
   } FC_CAPTURE_AND_RETHROW( (trx) ) }

   optional<fc::exception> chain_database::get_transaction_error( const signed_transaction& transaction )
   { try {
       try
       {
          simulate_transaction( transaction );
       }
       catch( const fc::exception& e )
       {
           return e;
       }
       return optional<fc::exception>();
   } FC_CAPTURE_AND_RETHROW( (transaction) ) }

   pending_chain_state_ptr chain_database::simulate_transaction( const signed_transaction& trx )
   { try {
      if( !is_open() )
         FC_THROW_EXCEPTION( database_not_open, "cannot evaluate a transaction against a closed database" );

      pending_chain_state_ptr          pend_state = std::make_shared<pending_chain_state>( shared_from_this() );
      transaction_evaluation_state_ptr trx_eval_state = std::make_shared<transaction_evaluation_state>( pend_state );

      trx_eval_state->evaluate( trx );
      return pend_state;
   } FC_CAPTURE_AND_RETHROW( (trx) ) }

   vector<balance_record> chain_database::get_balances()const
   {
      vector<balance_record> records;
      records.reserve( my->_balance_owner_to_record.size() );
      for( const auto& item : my->_balance_owner_to_record )
         records.push_back( item.second );
      return records;
   }

   vector<pool_record> chain_database::get_pools()const
   {
      vector<pool_record> records;
      records.reserve( my->_pool_tier_to_record.size() );
      for( const auto& item : my->_pool_tier_to_record )
         records.push_back( item.second );
      return records;
   }

   vector<prediction_record> chain_database::get_predictions( const optional<tier_id_type>& tier )const
   {
      vector<prediction_record> records;
      for( const auto& item : my->_prediction_index_to_record )
      {
         if( tier.valid() && item.first.tier != *tier ) continue;
         records.push_back( item.second );
      }
      return records;
   }

   vector<ledger_record> chain_database::get_ledgers( const optional<tier_id_type>& tier )const
   {
      vector<ledger_record> records;
      for( const auto& item : my->_ledger_index_to_record )
      {
         if( tier.valid() && item.first.tier != *tier ) continue;
         records.push_back( item.second );
      }
      return records;
   }

   osettings_record chain_database::settings_lookup_by_id( const settings_id_type id )const
   {
       const auto iter = my->_settings_id_to_record.find( id );
       if( iter != my->_settings_id_to_record.end() ) return iter->second;
       return osettings_record();
   }

   void chain_database::settings_insert_into_id_map( const settings_id_type id, const settings_record& record )
   {
       my->_settings_id_to_record[ id ] = record;
   }

   void chain_database::settings_erase_from_id_map( const settings_id_type id )
   {
       my->_settings_id_to_record.erase( id );
   }

   otreasury_record chain_database::treasury_lookup_by_id( const treasury_id_type id )const
   {
       const auto iter = my->_treasury_id_to_record.find( id );
       if( iter != my->_treasury_id_to_record.end() ) return iter->second;
       return otreasury_record();
   }

   void chain_database::treasury_insert_into_id_map( const treasury_id_type id, const treasury_record& record )
   {
       my->_treasury_id_to_record[ id ] = record;
   }

   void chain_database::treasury_erase_from_id_map( const treasury_id_type id )
   {
       my->_treasury_id_to_record.erase( id );
   }

   obalance_record chain_database::balance_lookup_by_owner( const address_type& owner )const
   {
       const auto iter = my->_balance_owner_to_record.find( owner );
       if( iter != my->_balance_owner_to_record.end() ) return iter->second;
       return obalance_record();
   }

   void chain_database::balance_insert_into_owner_map( const address_type& owner, const balance_record& record )
   {
       my->_balance_owner_to_record[ owner ] = record;
   }

   void chain_database::balance_erase_from_owner_map( const address_type& owner )
   {
       my->_balance_owner_to_record.erase( owner );
   }

   opool_record chain_database::pool_lookup_by_tier( const tier_id_type tier )const
   {
       const auto iter = my->_pool_tier_to_record.find( tier );
       if( iter != my->_pool_tier_to_record.end() ) return iter->second;
       return opool_record();
   }

   void chain_database::pool_insert_into_tier_map( const tier_id_type tier, const pool_record& record )
   {
       my->_pool_tier_to_record[ tier ] = record;
   }

   void chain_database::pool_erase_from_tier_map( const tier_id_type tier )
   {
       my->_pool_tier_to_record.erase( tier );
   }

   oprediction_record chain_database::prediction_lookup_by_index( const prediction_index& index )const
   {
       const auto iter = my->_prediction_index_to_record.find( index );
       if( iter != my->_prediction_index_to_record.end() ) return iter->second;
       return oprediction_record();
   }

   void chain_database::prediction_insert_into_index_map( const prediction_index& index, const prediction_record& record )
   {
       my->_prediction_index_to_record[ index ] = record;
   }

   void chain_database::prediction_erase_from_index_map( const prediction_index& index )
   {
       my->_prediction_index_to_record.erase( index );
   }

   oledger_record chain_database::ledger_lookup_by_index( const ledger_index& index )const
   {
       const auto iter = my->_ledger_index_to_record.find( index );
       if( iter != my->_ledger_index_to_record.end() ) return iter->second;
       return oledger_record();
   }

   void chain_database::ledger_insert_into_index_map( const ledger_index& index, const ledger_record& record )
   {
       my->_ledger_index_to_record[ index ] = record;
   }

   void chain_database::ledger_erase_from_index_map( const ledger_index& index )
   {
       my->_ledger_index_to_record.erase( index );
   }

} } // pari::chain
