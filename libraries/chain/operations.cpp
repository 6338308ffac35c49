#include <pari/chain/balance_operations.hpp>
#include <pari/chain/claim_operations.hpp>
#include <pari/chain/ledger_operations.hpp>
#include <pari/chain/operation_factory.hpp>
#include <pari/chain/operations.hpp>
#include <pari/chain/pool_operations.hpp>
#include <pari/chain/settings_operations.hpp>
#include <pari/chain/stake_operations.hpp>

#include <fc/io/raw_variant.hpp>
#include <fc/reflect/variant.hpp>

namespace pari { namespace chain {

    const operation_type_enum deposit_operation::type                   = deposit_op_type;
    const operation_type_enum withdraw_operation::type                  = withdraw_op_type;

    const operation_type_enum update_settings_operation::type           = update_settings_op_type;
    const operation_type_enum update_tier_active_operation::type        = update_tier_active_op_type;

    const operation_type_enum open_pool_operation::type                 = open_pool_op_type;
    const operation_type_enum reset_pool_operation::type                = reset_pool_op_type;
    const operation_type_enum close_pool_operation::type                = close_pool_op_type;

    const operation_type_enum place_stake_operation::type               = place_stake_op_type;
    const operation_type_enum increase_stake_operation::type            = increase_stake_op_type;
    const operation_type_enum change_selection_operation::type          = change_selection_op_type;

    const operation_type_enum init_ledger_operation::type               = init_ledger_op_type;
    const operation_type_enum reprocess_ledger_operation::type          = reprocess_ledger_op_type;
    const operation_type_enum finalize_ledger_operation::type           = finalize_ledger_op_type;
    const operation_type_enum rollover_ledger_operation::type           = rollover_ledger_op_type;
    const operation_type_enum close_ledger_operation::type              = close_ledger_op_type;

    const operation_type_enum claim_operation::type                     = claim_op_type;

    namespace
    {
        bool register_operations()
        {
            operation_factory& factory = operation_factory::instance();

            factory.register_operation<deposit_operation>();
            factory.register_operation<withdraw_operation>();

            factory.register_operation<update_settings_operation>();
            factory.register_operation<update_tier_active_operation>();

            factory.register_operation<open_pool_operation>();
            factory.register_operation<reset_pool_operation>();
            factory.register_operation<close_pool_operation>();

            factory.register_operation<place_stake_operation>();
            factory.register_operation<increase_stake_operation>();
            factory.register_operation<change_selection_operation>();

            factory.register_operation<init_ledger_operation>();
            factory.register_operation<reprocess_ledger_operation>();
            factory.register_operation<finalize_ledger_operation>();
            factory.register_operation<rollover_ledger_operation>();
            factory.register_operation<close_ledger_operation>();

            factory.register_operation<claim_operation>();
            return true;
        }

        const bool operations_registered = register_operations();
    }

    operation_factory& operation_factory::instance()
    {
        static operation_factory factory;
        return factory;
    }

    const operation_factory::operation_handler_base& operation_factory::get_handler( const operation_type_enum type )const
    {
        const auto itr = _handlers.find( type );
        if( itr == _handlers.end() )
            FC_THROW_EXCEPTION( unsupported_chain_operation, "unknown operation type ${t}", ("t",type) );
        return *itr->second;
    }

    void operation_factory::evaluate( transaction_evaluation_state& eval_state, const operation& op )const
    { try {
        get_handler( op.type ).evaluate( eval_state, op );
    } FC_CAPTURE_AND_RETHROW( (op.type) ) }

    void operation_factory::to_variant( const operation& in, fc::variant& output )const
    { try {
        fc::variant data;
        get_handler( in.type ).unpack_to_variant( in, data );

        fc::mutable_variant_object obj;
        obj( "type", in.type )( "data", data );
        output = fc::variant( obj );
    } FC_CAPTURE_AND_RETHROW( (in.type) ) }

    void operation_factory::from_variant( const fc::variant& in, operation& output )const
    { try {
        const fc::variant_object obj = in.get_object();
        if( !obj.contains( "type" ) || !obj.contains( "data" ) )
            FC_THROW_EXCEPTION( unsupported_chain_operation, "operation needs a type and data", ("op",in) );

        const operation_type_enum type = obj["type"].as<operation_type_enum>();
        get_handler( type ).pack_from_variant( obj["data"], output );
    } FC_CAPTURE_AND_RETHROW( (in) ) }

} } // pari::chain

namespace fc
{
    void to_variant( const pari::chain::operation& var, variant& vo )
    {
        pari::chain::operation_factory::instance().to_variant( var, vo );
    }

    void from_variant( const variant& var, pari::chain::operation& vo )
    {
        pari::chain::operation_factory::instance().from_variant( var, vo );
    }
}
