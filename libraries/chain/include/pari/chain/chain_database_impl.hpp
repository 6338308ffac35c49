#pragma once

#include <pari/chain/chain_database.hpp>

namespace pari { namespace chain {

   namespace detail
   {
      class chain_database_impl
      {
         public:
            void                                        initialize_genesis( const genesis_state& config );
            void                                        load_snapshot( const chain_snapshot& snapshot );
            void                                        clear();

            chain_database*                             self = nullptr;
            bool                                        _is_open = false;

            clock_state                                 _clock;
            epoch_schedule                              _schedule;

            map<settings_id_type, settings_record>      _settings_id_to_record;
            map<treasury_id_type, treasury_record>      _treasury_id_to_record;
            map<address_type, balance_record>           _balance_owner_to_record;
            map<tier_id_type, pool_record>              _pool_tier_to_record;
            map<prediction_index, prediction_record>    _prediction_index_to_record;
            map<ledger_index, ledger_record>            _ledger_index_to_record;
      };

   } // detail
} } // pari::chain
