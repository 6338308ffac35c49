#pragma once

#include <fc/io/enum_type.hpp>
#include <fc/io/raw.hpp>
#include <fc/reflect/reflect.hpp>

namespace pari { namespace chain {

struct transaction_evaluation_state;

// NOTE: Values are part of the serialized transaction format
enum operation_type_enum
{
    null_op_type                        = 0,

    deposit_op_type                     = 1,
    withdraw_op_type                    = 2,

    update_settings_op_type             = 3,
    update_tier_active_op_type          = 4,

    open_pool_op_type                   = 5,
    reset_pool_op_type                  = 6,
    close_pool_op_type                  = 7,

    place_stake_op_type                 = 8,
    increase_stake_op_type              = 9,
    change_selection_op_type            = 10,

    init_ledger_op_type                 = 11,
    reprocess_ledger_op_type            = 12,
    finalize_ledger_op_type             = 13,
    rollover_ledger_op_type             = 14,
    close_ledger_op_type                = 15,

    claim_op_type                       = 16
};

/**
*  A poly-morphic operator that modifies the settlement state
*  in some manner.
*/
struct operation
{
    operation():type(null_op_type){}

    operation( const operation& o )
        :type(o.type),data(o.data){}

    operation( operation&& o )
        :type(o.type),data(std::move(o.data)){}

    template<typename OperationType>
    operation( const OperationType& t )
    {
        type = OperationType::type;
        data = fc::raw::pack( t );
    }

    template<typename OperationType>
    OperationType as()const
    {
        FC_ASSERT( (operation_type_enum)type == OperationType::type, "", ("type",type)("OperationType",OperationType::type) );
        return fc::raw::unpack<OperationType>(data);
    }

    operation& operator=( const operation& o )
    {
        if( this == &o ) return *this;
        type = o.type;
        data = o.data;
        return *this;
    }

    operation& operator=( operation&& o )
    {
        if( this == &o ) return *this;
        type = o.type;
        data = std::move(o.data);
        return *this;
    }

    fc::enum_type<uint8_t,operation_type_enum> type;
    std::vector<char> data;
};

} } // pari::chain

FC_REFLECT_ENUM( pari::chain::operation_type_enum,
        (null_op_type)
        (deposit_op_type)
        (withdraw_op_type)
        (update_settings_op_type)
        (update_tier_active_op_type)
        (open_pool_op_type)
        (reset_pool_op_type)
        (close_pool_op_type)
        (place_stake_op_type)
        (increase_stake_op_type)
        (change_selection_op_type)
        (init_ledger_op_type)
        (reprocess_ledger_op_type)
        (finalize_ledger_op_type)
        (rollover_ledger_op_type)
        (close_ledger_op_type)
        (claim_op_type)
    )

FC_REFLECT( pari::chain::operation, (type)(data) )

namespace fc
{
    void to_variant( const pari::chain::operation& var, variant& vo );
    void from_variant( const variant& var, pari::chain::operation& vo );
}
