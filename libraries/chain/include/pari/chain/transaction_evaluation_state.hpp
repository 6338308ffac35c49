#pragma once

#include <pari/chain/settings_record.hpp>
#include <pari/chain/transaction.hpp>
#include <pari/chain/types.hpp>

namespace pari { namespace chain {

class pending_chain_state;
typedef std::shared_ptr<pending_chain_state> pending_chain_state_ptr;

/**
*  Everything an operation needs while it is being evaluated: the staged
*  state it writes to, the transaction it belongs to, and the set of
*  addresses the host attested as signers.
*
*  Operations only ever write to the pending state; if any of them throws,
*  the pending state is discarded and nothing reaches the parent.
*/
struct transaction_evaluation_state
{
    transaction_evaluation_state( pending_chain_state_ptr pending_state = nullptr ) : _pending_state( pending_state ) {}

    pending_chain_state* pending_state()const
    {
        const pending_chain_state_ptr ptr = _pending_state.lock();
        FC_ASSERT( ptr );
        return ptr.get();
    }

    void evaluate( const signed_transaction& trx );
    void evaluate_operation( const operation& op );

    bool check_signature( const address_type& a )const;

    /** throws missing_signature unless @p a signed */
    void require_signature( const address_type& a )const;

    /** throws missing_signature unless the settings authority signed, returns the settings */
    settings_record require_authority()const;

    signed_transaction                             trx;
    set<address_type>                              signed_addresses;

    optional<fc::exception>                        validation_error;

    // Below not serialized
    bool                                           _skip_signature_check = false;

private:
    std::weak_ptr<pending_chain_state>             _pending_state;
    uint32_t                                       _current_op_index = 0;
};
typedef shared_ptr<transaction_evaluation_state> transaction_evaluation_state_ptr;

} } // pari::chain

FC_REFLECT( pari::chain::transaction_evaluation_state,
            (trx)
            (signed_addresses)
            (validation_error)
            )
